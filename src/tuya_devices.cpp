#include "tuya_devices.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <QJsonDocument>

#include "tuya_log.h"

namespace phicore::tuya::ipc {

namespace {

QString devicePath(const QString &deviceId, const char *leaf)
{
    return QStringLiteral("/v1.0/devices/%1/%2").arg(deviceId, QLatin1String(leaf));
}

QString toCompactJson(const QJsonObject &obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

// The platform expects the command list itself as a JSON string.
QJsonObject commandBody(const char *code, const QJsonValue &value)
{
    QJsonObject command;
    command.insert(QStringLiteral("code"), QLatin1String(code));
    command.insert(QStringLiteral("value"), value);

    const QJsonArray commands{command};
    QJsonObject body;
    body.insert(QStringLiteral("commands"),
                QString::fromUtf8(QJsonDocument(commands).toJson(QJsonDocument::Compact)));
    return body;
}

bool sendCommand(const TuyaClient &client,
                 const Credentials &creds,
                 const QString &deviceId,
                 const char *code,
                 const QJsonValue &value,
                 TuyaError *error)
{
    Envelope envelope;
    const bool ok = client.call(creds,
                                QByteArrayLiteral("POST"),
                                devicePath(deviceId, "commands"),
                                {},
                                commandBody(code, value),
                                &envelope,
                                error);
    if (ok)
        qCInfo(tuyaLog) << "command" << code << "accepted for device" << deviceId;
    return ok;
}

std::optional<int> jsonInt(const QJsonValue &value)
{
    return jsonIntInRange(value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
}

bool decodeColour(const QJsonValue &value, HsvColor *out, QString *error)
{
    QJsonObject obj;
    if (value.isString()) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(value.toString().toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            *error = QStringLiteral("%1 is not a JSON object: %2")
                         .arg(QLatin1String(kCodeColour), value.toString());
            return false;
        }
        obj = doc.object();
    } else if (value.isObject()) {
        obj = value.toObject();
    } else {
        *error = QStringLiteral("%1 has unexpected type").arg(QLatin1String(kCodeColour));
        return false;
    }

    const auto h = jsonInt(obj.value(QStringLiteral("h")));
    const auto s = jsonInt(obj.value(QStringLiteral("s")));
    const auto v = jsonInt(obj.value(QStringLiteral("v")));
    if (!h || !s || !v) {
        *error = QStringLiteral("%1 lacks integer h/s/v").arg(QLatin1String(kCodeColour));
        return false;
    }

    out->h = *h;
    out->s = *s;
    out->v = *v;
    return true;
}

} // namespace

QJsonObject HsvColor::toJson() const
{
    QJsonObject out;
    out.insert(QStringLiteral("h"), h);
    out.insert(QStringLiteral("s"), s);
    out.insert(QStringLiteral("v"), v);
    return out;
}

QJsonObject DeviceStatus::toJson() const
{
    QJsonObject out;
    if (onOff.has_value())
        out.insert(QStringLiteral("onOff"), *onOff);
    if (brightness.has_value())
        out.insert(QStringLiteral("brightness"), *brightness);
    if (temp.has_value())
        out.insert(QStringLiteral("temp"), *temp);
    if (color.has_value())
        out.insert(QStringLiteral("color"), color->toJson());
    return out;
}

QJsonObject DeviceActionResult::toJson() const
{
    QJsonObject out;
    out.insert(QStringLiteral("message"), message);
    out.insert(QStringLiteral("deviceId"), deviceId);
    out.insert(QStringLiteral("currentState"), currentState);
    return out;
}

std::optional<int> jsonIntInRange(const QJsonValue &value, int minValue, int maxValue)
{
    if (!value.isDouble())
        return std::nullopt;
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::trunc(d) != d)
        return std::nullopt;
    if (d < static_cast<double>(minValue) || d > static_cast<double>(maxValue))
        return std::nullopt;
    return static_cast<int>(d);
}

bool parseHsv(const QJsonObject &obj, HsvColor *out, QString *error)
{
    struct Component {
        const char *key;
        int maxValue;
        int *target;
    };

    HsvColor color;
    const Component components[] = {
        {"h", 360, &color.h},
        {"s", 1000, &color.s},
        {"v", 1000, &color.v},
    };

    for (const Component &component : components) {
        const QString key = QLatin1String(component.key);
        const QJsonValue value = obj.value(key);
        if (!value.isDouble()) {
            if (error)
                *error = QStringLiteral("%1 must be a number").arg(key);
            return false;
        }
        const auto number = jsonIntInRange(value, 0, component.maxValue);
        if (!number.has_value()) {
            if (error)
                *error = QStringLiteral("%1 must be a whole number between 0 and %2").arg(key).arg(component.maxValue);
            return false;
        }
        *component.target = *number;
    }

    if (out)
        *out = color;
    return true;
}

const QStringList &knownRooms()
{
    static const QStringList rooms{
        QStringLiteral("bedroom"),
        QStringLiteral("livingroom"),
        QStringLiteral("diningroom"),
        QStringLiteral("kitchen"),
    };
    return rooms;
}

bool decodeDeviceStatus(const QJsonArray &result, DeviceStatus *out, TuyaError *error)
{
    DeviceStatus status;

    for (const QJsonValue &entry : result) {
        if (!entry.isObject())
            continue;
        const QJsonObject obj = entry.toObject();
        const QString code = obj.value(QStringLiteral("code")).toString();
        const QJsonValue value = obj.value(QStringLiteral("value"));

        QString decodeError;
        if (code == QLatin1String(kCodeSwitch)) {
            if (!value.isBool())
                decodeError = QStringLiteral("%1 is not a boolean").arg(code);
            else
                status.onOff = value.toBool();
        } else if (code == QLatin1String(kCodeBrightness) || code == QLatin1String(kCodeTemperature)) {
            const auto number = jsonInt(value);
            if (!number.has_value())
                decodeError = QStringLiteral("%1 is not an integer").arg(code);
            else if (code == QLatin1String(kCodeBrightness))
                status.brightness = number;
            else
                status.temp = number;
        } else if (code == QLatin1String(kCodeColour)) {
            HsvColor color;
            if (decodeColour(value, &color, &decodeError))
                status.color = color;
        }

        if (!decodeError.isEmpty()) {
            if (error)
                *error = TuyaError::decode(decodeError);
            return false;
        }
    }

    if (out)
        *out = status;
    return true;
}

bool getDeviceStatus(const TuyaClient &client,
                     const Credentials &creds,
                     const QString &deviceId,
                     DeviceStatus *out,
                     TuyaError *error)
{
    Envelope envelope;
    if (!client.call(creds, QByteArrayLiteral("GET"), devicePath(deviceId, "status"), {}, {}, &envelope, error))
        return false;

    if (!envelope.result.isArray()) {
        if (error)
            *error = TuyaError::decode(QStringLiteral("Device status result is not an array"));
        return false;
    }

    return decodeDeviceStatus(envelope.result.toArray(), out, error);
}

QList<DeviceStatusResult> pollDeviceStatuses(const TuyaClient &client,
                                             const Credentials &creds,
                                             const QStringList &deviceIds)
{
    QList<DeviceStatusResult> results;
    results.reserve(deviceIds.size());
    for (const QString &deviceId : deviceIds) {
        DeviceStatusResult result;
        result.deviceId = deviceId;
        result.ok = getDeviceStatus(client, creds, deviceId, &result.status, &result.error);
        if (!result.ok)
            qCWarning(tuyaLog) << "status poll failed for device" << deviceId;
        results.append(result);
    }
    return results;
}

bool turnOnOff(const TuyaClient &client,
               const Credentials &creds,
               const QString &deviceId,
               bool onOff,
               DeviceActionResult *out,
               TuyaError *error)
{
    if (!sendCommand(client, creds, deviceId, kCodeSwitch, onOff, error))
        return false;

    if (out) {
        out->message = onOff ? QStringLiteral("The light is now on") : QStringLiteral("The light is now off");
        out->deviceId = deviceId;
        out->currentState = onOff;
    }
    return true;
}

bool changeColor(const TuyaClient &client,
                 const Credentials &creds,
                 const QString &deviceId,
                 const HsvColor &color,
                 DeviceActionResult *out,
                 TuyaError *error)
{
    if (!sendCommand(client, creds, deviceId, kCodeColour, toCompactJson(color.toJson()), error))
        return false;

    if (out) {
        out->message = QStringLiteral("The color has changed");
        out->deviceId = deviceId;
        out->currentState = QStringLiteral("h: %1, s: %2, v: %3").arg(color.h).arg(color.s).arg(color.v);
    }
    return true;
}

QString normalizeRoomName(const QString &roomName)
{
    QString out;
    out.reserve(roomName.size());
    for (const QChar c : roomName) {
        if (!c.isSpace())
            out.append(c.toLower());
    }
    return out;
}

std::optional<QString> resolveDeviceId(const QString &roomName, const RoomDeviceTable &table)
{
    const QString room = normalizeRoomName(roomName);
    if (!knownRooms().contains(room))
        return std::nullopt;

    const QString deviceId = table.value(room).trimmed();
    if (deviceId.isEmpty())
        return std::nullopt;
    return deviceId;
}

HsvColor rgbToHsv(double r01, double g01, double b01)
{
    const double r = std::clamp(r01, 0.0, 1.0);
    const double g = std::clamp(g01, 0.0, 1.0);
    const double b = std::clamp(b01, 0.0, 1.0);

    const double maxC = std::max({r, g, b});
    const double minC = std::min({r, g, b});
    const double delta = maxC - minC;

    double hue = 0.0;
    if (delta > 0.0) {
        if (maxC == r)
            hue = 60.0 * std::fmod((g - b) / delta, 6.0);
        else if (maxC == g)
            hue = 60.0 * ((b - r) / delta + 2.0);
        else
            hue = 60.0 * ((r - g) / delta + 4.0);
    }
    if (hue < 0.0)
        hue += 360.0;

    HsvColor out;
    out.h = std::clamp(static_cast<int>(std::lround(hue)), 0, 360);
    out.s = maxC > 0.0 ? static_cast<int>(std::lround(delta / maxC * 1000.0)) : 0;
    out.v = static_cast<int>(std::lround(maxC * 1000.0));
    return out;
}

QString hsvToHex(const HsvColor &color)
{
    const double h = std::clamp(color.h, 0, 360) % 360;
    const double s = std::clamp(color.s, 0, 1000) / 1000.0;
    const double v = std::clamp(color.v, 0, 1000) / 1000.0;

    const double c = v * s;
    const double x = c * (1.0 - std::fabs(std::fmod(h / 60.0, 2.0) - 1.0));
    const double m = v - c;

    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    if (h < 60.0) {
        r = c;
        g = x;
    } else if (h < 120.0) {
        r = x;
        g = c;
    } else if (h < 180.0) {
        g = c;
        b = x;
    } else if (h < 240.0) {
        g = x;
        b = c;
    } else if (h < 300.0) {
        r = x;
        b = c;
    } else {
        r = c;
        b = x;
    }

    auto channel = [m](double value) {
        return static_cast<int>(std::lround((value + m) * 255.0));
    };
    return QStringLiteral("#%1%2%3")
        .arg(channel(r), 2, 16, QLatin1Char('0'))
        .arg(channel(g), 2, 16, QLatin1Char('0'))
        .arg(channel(b), 2, 16, QLatin1Char('0'));
}

} // namespace phicore::tuya::ipc
