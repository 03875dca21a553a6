#include "tuya_sidecar.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <utility>

#include <QDateTime>
#include <QJsonDocument>

#include "tuya_schema.h"

namespace phicore::tuya::ipc {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

QString roomLabel(const QString &room)
{
    if (room == QLatin1String("bedroom"))
        return QStringLiteral("Bedroom");
    if (room == QLatin1String("livingroom"))
        return QStringLiteral("Living room");
    if (room == QLatin1String("diningroom"))
        return QStringLiteral("Dining room");
    if (room == QLatin1String("kitchen"))
        return QStringLiteral("Kitchen");
    return room;
}

std::optional<bool> scalarAsBool(const v1::ScalarValue &value)
{
    if (const auto *b = std::get_if<bool>(&value))
        return *b;
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return *i != 0;
    if (const auto *d = std::get_if<double>(&value))
        return *d != 0.0;
    if (const auto *s = std::get_if<std::string>(&value)) {
        const QString text = QString::fromStdString(*s).trimmed().toLower();
        if (text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("on"))
            return true;
        if (text == QLatin1String("0") || text == QLatin1String("false") || text == QLatin1String("off"))
            return false;
    }
    return std::nullopt;
}

bool parseHexColor(const QString &hex, double *r01, double *g01, double *b01)
{
    QString text = hex.trimmed();
    if (text.startsWith(QLatin1Char('#')))
        text.remove(0, 1);
    if (text.size() != 6)
        return false;

    bool ok = false;
    const int value = text.toInt(&ok, 16);
    if (!ok)
        return false;

    *r01 = static_cast<double>((value >> 16) & 0xff) / 255.0;
    *g01 = static_cast<double>((value >> 8) & 0xff) / 255.0;
    *b01 = static_cast<double>(value & 0xff) / 255.0;
    return true;
}

// Accepts {h,s,v} in Tuya ranges, or an RGB value ({r,g,b}, {hex} or a
// "#rrggbb" scalar) that is converted.
bool extractColor(const sdk::ChannelInvokeRequest &request, HsvColor *out, QString *error)
{
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    if (request.hasScalarValue) {
        if (const auto *text = std::get_if<std::string>(&request.value)) {
            if (parseHexColor(QString::fromStdString(*text), &r, &g, &b)) {
                *out = rgbToHsv(r, g, b);
                return true;
            }
        }
    }

    *error = QStringLiteral("Invalid color payload");
    if (request.valueJson.empty())
        return false;

    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(request.valueJson));
    if (!doc.isObject())
        return false;
    const QJsonObject obj = doc.object();

    if (obj.contains(QStringLiteral("h")))
        return parseHsv(obj, out, error);

    if (obj.contains(QStringLiteral("hex"))) {
        if (!parseHexColor(obj.value(QStringLiteral("hex")).toString(), &r, &g, &b))
            return false;
        *out = rgbToHsv(r, g, b);
        return true;
    }

    const double rr = obj.value(QStringLiteral("r")).toDouble(std::numeric_limits<double>::quiet_NaN());
    const double gg = obj.value(QStringLiteral("g")).toDouble(std::numeric_limits<double>::quiet_NaN());
    const double bb = obj.value(QStringLiteral("b")).toDouble(std::numeric_limits<double>::quiet_NaN());
    if (!std::isfinite(rr) || !std::isfinite(gg) || !std::isfinite(bb))
        return false;

    const bool looks255 = (rr > 1.0 || gg > 1.0 || bb > 1.0);
    const double scale = looks255 ? 255.0 : 1.0;
    *out = rgbToHsv(rr / scale, gg / scale, bb / scale);
    return true;
}

v1::Channel makeOnChannel()
{
    v1::Channel channel;
    channel.externalId = "on";
    channel.name = "Power";
    channel.kind = v1::ChannelKind::PowerOnOff;
    channel.dataType = v1::ChannelDataType::Bool;
    channel.flags = v1::kChannelFlagDefaultWrite;
    return channel;
}

v1::Channel makeBrightnessChannel()
{
    v1::Channel channel;
    channel.externalId = "bri";
    channel.name = "Brightness";
    channel.kind = v1::ChannelKind::Brightness;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.minValue = 10.0;
    channel.maxValue = 1000.0;
    channel.stepValue = 1.0;
    return channel;
}

v1::Channel makeCtChannel()
{
    v1::Channel channel;
    channel.externalId = "ct";
    channel.name = "Color temperature";
    channel.kind = v1::ChannelKind::ColorTemperature;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.minValue = 0.0;
    channel.maxValue = 1000.0;
    channel.stepValue = 1.0;
    return channel;
}

v1::Channel makeColorChannel()
{
    v1::Channel channel;
    channel.externalId = "color";
    channel.name = "Color";
    channel.kind = v1::ChannelKind::ColorRGB;
    channel.dataType = v1::ChannelDataType::Color;
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.metaJson = R"({"space":"hsv","h":[0,360],"s":[0,1000],"v":[0,1000]})";
    return channel;
}

QString compactJson(const QJsonObject &obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString deviceIdParam(const QJsonObject &params)
{
    return params.value(QStringLiteral("deviceId")).toString().trimmed();
}

} // namespace

TuyaSidecar::TuyaSidecar()
    : m_http(&m_network)
    , m_client(&m_http)
    , m_baseSettings(settingsFromEnvironment())
    , m_settings(m_baseSettings)
{
}

void TuyaSidecar::tick()
{
    if (!m_hasBootstrap)
        return;

    const std::int64_t now = nowMs();
    if (m_nextPollDueMs > now)
        return;

    QString error;
    const bool ok = pollDevices(&error);
    if (!ok) {
        setConnectionState(false);
        if (!error.isEmpty()) {
            std::cerr << "tuya-ipc poll failed: " << error.toStdString() << '\n';
            sendError(error.toStdString());
        }
        m_nextPollDueMs = now + m_settings.retryIntervalMs;
        return;
    }

    m_nextPollDueMs = now + m_settings.pollIntervalMs;
}

void TuyaSidecar::onConnected()
{
    std::cerr << "tuya-ipc connected" << '\n';
}

void TuyaSidecar::onDisconnected()
{
    setConnectionState(false);
    std::cerr << "tuya-ipc disconnected" << '\n';
}

void TuyaSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);
    applyBootstrapAdapter(request.adapter);
    m_hasBootstrap = true;
    m_nextPollDueMs = 0;

    std::cerr << "tuya-ipc bootstrap adapterId=" << request.adapterId
              << " externalId=" << request.adapter.externalId
              << " baseUrl=" << m_settings.credentials.baseUrl.toStdString()
              << " devices=" << m_settings.roomDevices.size()
              << '\n';

    QString error;
    if (!publishDevices(&error)) {
        std::cerr << "tuya-ipc failed to publish devices: " << error.toStdString() << '\n';
        sendError(error.toStdString());
    }
}

phicore::adapter::v1::CmdResponse TuyaSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_hasBootstrap)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    const QString deviceId = QString::fromStdString(request.deviceExternalId).trimmed();
    const QString channelId = QString::fromStdString(request.channelExternalId);
    if (deviceId.isEmpty())
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("deviceExternalId missing"));

    TuyaError error;
    v1::Utf8String sendError;

    if (channelId == QLatin1String("on")) {
        if (!request.hasScalarValue)
            return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Expected boolean value"));
        const auto on = scalarAsBool(request.value);
        if (!on.has_value())
            return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Invalid boolean value"));

        if (!turnOnOff(m_client, m_settings.credentials, deviceId, *on, nullptr, &error))
            return failureResponse(request.cmdId, statusForError(error), error.toString());

        sendChannelStateUpdated(request.deviceExternalId, request.channelExternalId, *on, nowMs(), &sendError);
        CmdResponse resp = successResponse(request.cmdId);
        resp.finalValue = request.value;
        return resp;
    }

    if (channelId == QLatin1String("color")) {
        HsvColor color;
        QString colorError;
        if (!extractColor(request, &color, &colorError))
            return failureResponse(request.cmdId, CmdStatus::InvalidArgument, colorError);

        if (!changeColor(m_client, m_settings.credentials, deviceId, color, nullptr, &error))
            return failureResponse(request.cmdId, statusForError(error), error.toString());

        const v1::ScalarValue hex = hsvToHex(color).toStdString();
        sendChannelStateUpdated(request.deviceExternalId, request.channelExternalId, hex, nowMs(), &sendError);
        return successResponse(request.cmdId);
    }

    return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unsupported channel"));
}

phicore::adapter::v1::ActionResponse TuyaSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    QJsonObject params;
    if (!request.paramsJson.empty()) {
        const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(request.paramsJson));
        if (!doc.isObject())
            return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Parameters must be a JSON object"));
        params = doc.object();
    }

    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("probe"))
        return invokeProbe(request, params);
    if (actionId == QLatin1String("getDeviceId"))
        return invokeGetDeviceId(request, params);
    if (actionId == QLatin1String("getDeviceStatus"))
        return invokeGetDeviceStatus(request, params);
    if (actionId == QLatin1String("turnOnOff"))
        return invokeTurnOnOff(request, params);
    if (actionId == QLatin1String("changeColor"))
        return invokeChangeColor(request, params);

    return actionFailure(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Unsupported adapter action"));
}

phicore::adapter::v1::Utf8String TuyaSidecar::displayName() const
{
    return phicore::tuya::ipc::displayName();
}

phicore::adapter::v1::Utf8String TuyaSidecar::description() const
{
    return phicore::tuya::ipc::description();
}

phicore::adapter::v1::Utf8String TuyaSidecar::iconSvg() const
{
    return phicore::tuya::ipc::iconSvg();
}

phicore::adapter::v1::Utf8String TuyaSidecar::apiVersion() const
{
    return "1.0.0";
}

int TuyaSidecar::timeoutMs() const
{
    // A signed call is two round trips: token, then the request itself.
    return 2 * m_settings.requestTimeoutMs + 1000;
}

phicore::adapter::v1::AdapterCapabilities TuyaSidecar::capabilities() const
{
    return phicore::tuya::ipc::capabilities();
}

phicore::adapter::v1::JsonText TuyaSidecar::configSchemaJson() const
{
    return phicore::tuya::ipc::configSchemaJson();
}

std::int64_t TuyaSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

phicore::adapter::v1::CmdStatus TuyaSidecar::statusForError(const TuyaError &error)
{
    switch (error.kind) {
    case ErrorKind::Http:
        return CmdStatus::TemporarilyOffline;
    case ErrorKind::None:
        return CmdStatus::Success;
    default:
        return CmdStatus::Failure;
    }
}

void TuyaSidecar::applyBootstrapAdapter(const v1::Adapter &adapter)
{
    m_adapterInfo = adapter;

    m_meta = QJsonObject{};
    const QByteArray metaBytes = QByteArray::fromStdString(adapter.metaJson);
    if (!metaBytes.trimmed().isEmpty()) {
        const QJsonDocument metaDoc = QJsonDocument::fromJson(metaBytes);
        if (metaDoc.isObject())
            m_meta = metaDoc.object();
    }

    m_settings = m_baseSettings;

    const QString host = QString::fromStdString(adapter.host).trimmed();
    if (!host.isEmpty())
        m_settings.credentials.baseUrl = normalizeBaseUrl(host);
    const QString token = QString::fromStdString(adapter.token).trimmed();
    if (!token.isEmpty())
        m_settings.credentials.accessKey = token;

    applyMeta(&m_settings, m_meta);
    m_client.setTimeoutMs(m_settings.requestTimeoutMs);
}

bool TuyaSidecar::publishDevices(QString *error)
{
    v1::Utf8String sendError;

    QHash<QString, QString> nextRoomByDevice;
    for (const QString &room : knownRooms()) {
        const QString deviceId = m_settings.roomDevices.value(room).trimmed();
        if (!deviceId.isEmpty())
            nextRoomByDevice.insert(deviceId, room);
    }

    for (auto it = m_roomByDevice.cbegin(); it != m_roomByDevice.cend(); ++it) {
        if (nextRoomByDevice.contains(it.key()))
            continue;
        if (!sendDeviceRemoved(it.key().toStdString(), &sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }
    }

    QSet<QString> nextRooms;
    for (auto it = nextRoomByDevice.cbegin(); it != nextRoomByDevice.cend(); ++it) {
        const QString &deviceId = it.key();
        const QString &room = it.value();

        v1::Device device;
        device.externalId = deviceId.toStdString();
        device.name = QStringLiteral("%1 light").arg(roomLabel(room)).toStdString();
        device.manufacturer = "Tuya";
        device.deviceClass = v1::DeviceClass::Light;

        v1::ChannelList channels;
        channels.push_back(makeOnChannel());
        channels.push_back(makeBrightnessChannel());
        channels.push_back(makeCtChannel());
        channels.push_back(makeColorChannel());

        if (!sendDeviceUpdated(device, channels, &sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }

        v1::Room phiRoom;
        phiRoom.externalId = room.toStdString();
        phiRoom.name = roomLabel(room).toStdString();
        phiRoom.zone = "room";
        phiRoom.deviceExternalIds.push_back(device.externalId);
        if (!sendRoomUpdated(phiRoom, &sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }
        nextRooms.insert(room);
    }

    for (const QString &oldRoom : std::as_const(m_knownRooms)) {
        if (nextRooms.contains(oldRoom))
            continue;
        if (!sendRoomRemoved(oldRoom.toStdString(), &sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }
    }

    m_roomByDevice = nextRoomByDevice;
    m_knownRooms = nextRooms;
    return true;
}

bool TuyaSidecar::pollDevices(QString *error)
{
    if (m_settings.credentials.accessKey.isEmpty() || m_settings.credentials.secretKey.isEmpty()) {
        if (error)
            *error = QStringLiteral("Tuya access key or secret missing");
        return false;
    }

    const QList<DeviceStatusResult> results =
        pollDeviceStatuses(m_client, m_settings.credentials, m_roomByDevice.keys());

    int failures = 0;
    for (const DeviceStatusResult &result : results) {
        if (result.ok) {
            publishStatus(result.deviceId, result.status);
            continue;
        }
        ++failures;
        const QString message = QStringLiteral("%1: %2")
                                    .arg(roomLabel(m_roomByDevice.value(result.deviceId)), result.error.toString());
        std::cerr << "tuya-ipc poll failed for " << message.toStdString() << '\n';
        sendError(message.toStdString());
    }

    if (!results.isEmpty() && failures == results.size()) {
        if (error)
            *error = QStringLiteral("No Tuya device answered the status poll");
        return false;
    }

    setConnectionState(true);
    v1::Utf8String syncError;
    sendFullSyncCompleted(&syncError);
    return true;
}

void TuyaSidecar::publishStatus(const QString &deviceId, const DeviceStatus &status)
{
    const std::string externalId = deviceId.toStdString();
    const std::int64_t ts = nowMs();
    v1::Utf8String sendError;

    if (status.onOff.has_value())
        sendChannelStateUpdated(externalId, "on", *status.onOff, ts, &sendError);
    if (status.brightness.has_value())
        sendChannelStateUpdated(externalId, "bri", static_cast<std::int64_t>(*status.brightness), ts, &sendError);
    if (status.temp.has_value())
        sendChannelStateUpdated(externalId, "ct", static_cast<std::int64_t>(*status.temp), ts, &sendError);
    if (status.color.has_value()) {
        const v1::ScalarValue hex = hsvToHex(*status.color).toStdString();
        sendChannelStateUpdated(externalId, "color", hex, ts, &sendError);
    }
}

void TuyaSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error)) {
        std::cerr << "tuya-ipc failed to send connectionStateChanged: " << error << '\n';
    }
}

phicore::adapter::v1::ActionResponse TuyaSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request,
                                                              const QJsonObject &params)
{
    TuyaSettings settings = m_settings;
    applyMeta(&settings, params);

    const TokenResult token = m_client.fetchToken(settings.credentials);
    if (!token.ok)
        return actionFailure(request.cmdId, CmdStatus::Failure, token.error.toString());

    return actionSuccess(request.cmdId, QStringLiteral("Credentials valid, token expires in %1 s").arg(token.expireTimeSec));
}

phicore::adapter::v1::ActionResponse TuyaSidecar::invokeGetDeviceId(const sdk::AdapterActionInvokeRequest &request,
                                                                    const QJsonObject &params)
{
    const QString roomName = params.value(QStringLiteral("roomName")).toString();
    const std::optional<QString> deviceId = resolveDeviceId(roomName, m_settings.roomDevices);
    std::cerr << "tuya-ipc room=" << normalizeRoomName(roomName).toStdString()
              << " deviceId=" << (deviceId ? deviceId->toStdString() : std::string("<none>")) << '\n';
    if (!deviceId.has_value())
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unknown room: %1").arg(roomName));

    return actionSuccess(request.cmdId, *deviceId);
}

phicore::adapter::v1::ActionResponse TuyaSidecar::invokeGetDeviceStatus(const sdk::AdapterActionInvokeRequest &request,
                                                                        const QJsonObject &params)
{
    const QString deviceId = deviceIdParam(params);
    if (deviceId.isEmpty())
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("deviceId missing"));

    DeviceStatus status;
    TuyaError error;
    if (!getDeviceStatus(m_client, m_settings.credentials, deviceId, &status, &error))
        return actionFailure(request.cmdId, statusForError(error), error.toString());

    if (m_roomByDevice.contains(deviceId))
        publishStatus(deviceId, status);
    return actionSuccess(request.cmdId, compactJson(status.toJson()));
}

phicore::adapter::v1::ActionResponse TuyaSidecar::invokeTurnOnOff(const sdk::AdapterActionInvokeRequest &request,
                                                                  const QJsonObject &params)
{
    const QString deviceId = deviceIdParam(params);
    if (deviceId.isEmpty())
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("deviceId missing"));
    const QJsonValue onOff = params.value(QStringLiteral("onOff"));
    if (!onOff.isBool())
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("onOff must be a boolean"));

    DeviceActionResult result;
    TuyaError error;
    if (!turnOnOff(m_client, m_settings.credentials, deviceId, onOff.toBool(), &result, &error))
        return actionFailure(request.cmdId, statusForError(error), error.toString());

    v1::Utf8String sendError;
    if (m_roomByDevice.contains(deviceId))
        sendChannelStateUpdated(deviceId.toStdString(), "on", onOff.toBool(), nowMs(), &sendError);
    return actionSuccess(request.cmdId, compactJson(result.toJson()));
}

phicore::adapter::v1::ActionResponse TuyaSidecar::invokeChangeColor(const sdk::AdapterActionInvokeRequest &request,
                                                                    const QJsonObject &params)
{
    const QString deviceId = deviceIdParam(params);
    if (deviceId.isEmpty())
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("deviceId missing"));

    HsvColor color;
    QString colorError;
    if (!parseHsv(params, &color, &colorError))
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, colorError);

    DeviceActionResult result;
    TuyaError error;
    if (!changeColor(m_client, m_settings.credentials, deviceId, color, &result, &error))
        return actionFailure(request.cmdId, statusForError(error), error.toString());

    v1::Utf8String sendError;
    if (m_roomByDevice.contains(deviceId)) {
        const v1::ScalarValue hex = hsvToHex(color).toStdString();
        sendChannelStateUpdated(deviceId.toStdString(), "color", hex, nowMs(), &sendError);
    }
    return actionSuccess(request.cmdId, compactJson(result.toJson()));
}

phicore::adapter::v1::CmdResponse TuyaSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::CmdResponse TuyaSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::ActionResponse TuyaSidecar::actionFailure(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    ActionResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.resultType = v1::ActionResultType::None;
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::ActionResponse TuyaSidecar::actionSuccess(std::uint64_t cmdId, const QString &result) const
{
    ActionResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = result.toStdString();
    response.tsMs = nowMs();
    return response;
}

} // namespace phicore::tuya::ipc
