#include "tuya_config.h"

#include <algorithm>

#include <QVariant>
#include <QtGlobal>

namespace phicore::tuya::ipc {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

void readString(const QJsonObject &obj, const QString &key, QString *target)
{
    if (!obj.contains(key))
        return;
    *target = obj.value(key).toString().trimmed();
}

QString envValue(const char *name)
{
    return qEnvironmentVariable(name).trimmed();
}

} // namespace

QString normalizeBaseUrl(const QString &hostOrUrl)
{
    QString url = hostOrUrl.trimmed();
    if (url.isEmpty())
        return url;
    if (!url.contains(QStringLiteral("://")))
        url.prepend(QStringLiteral("https://"));
    while (url.endsWith(QLatin1Char('/')))
        url.chop(1);
    return url;
}

TuyaSettings settingsFromEnvironment()
{
    TuyaSettings settings;

    const QString baseUrl = envValue("TUYA_BASE_URL");
    if (!baseUrl.isEmpty())
        settings.credentials.baseUrl = normalizeBaseUrl(baseUrl);
    settings.credentials.accessKey = envValue("TUYA_ACCESS_KEY");
    settings.credentials.secretKey = envValue("TUYA_SECRET_KEY");

    const QString bedroom = envValue("TUYA_BEDROOM_DEVICE_ID");
    const QString livingroom = envValue("TUYA_LIVINGROOM_DEVICE_ID");
    const QString diningroom = envValue("TUYA_DININGROOM_DEVICE_ID");
    const QString kitchen = envValue("TUYA_KITCHEN_DEVICE_ID");
    if (!bedroom.isEmpty())
        settings.roomDevices.insert(QStringLiteral("bedroom"), bedroom);
    if (!livingroom.isEmpty())
        settings.roomDevices.insert(QStringLiteral("livingroom"), livingroom);
    if (!diningroom.isEmpty())
        settings.roomDevices.insert(QStringLiteral("diningroom"), diningroom);
    if (!kitchen.isEmpty())
        settings.roomDevices.insert(QStringLiteral("kitchen"), kitchen);

    return settings;
}

void applyMeta(TuyaSettings *settings, const QJsonObject &meta)
{
    if (!settings)
        return;

    if (meta.contains(QStringLiteral("baseUrl")))
        settings->credentials.baseUrl = normalizeBaseUrl(meta.value(QStringLiteral("baseUrl")).toString());
    readString(meta, QStringLiteral("accessKey"), &settings->credentials.accessKey);
    readString(meta, QStringLiteral("secretKey"), &settings->credentials.secretKey);

    for (const QString &room : knownRooms()) {
        const QString key = room + QStringLiteral("DeviceId");
        if (!meta.contains(key))
            continue;
        const QString deviceId = meta.value(key).toString().trimmed();
        if (deviceId.isEmpty())
            settings->roomDevices.remove(room);
        else
            settings->roomDevices.insert(room, deviceId);
    }

    settings->pollIntervalMs = readInt(meta, QStringLiteral("pollIntervalMs"), settings->pollIntervalMs);
    settings->retryIntervalMs = readInt(meta, QStringLiteral("retryIntervalMs"), settings->retryIntervalMs);
    settings->requestTimeoutMs = readInt(meta, QStringLiteral("requestTimeoutMs"), settings->requestTimeoutMs);
    clampIntervals(settings);
}

void clampIntervals(TuyaSettings *settings)
{
    settings->pollIntervalMs = std::clamp(settings->pollIntervalMs, 1000, 600000);
    settings->retryIntervalMs = std::clamp(settings->retryIntervalMs, 1000, 600000);
    settings->requestTimeoutMs = std::clamp(settings->requestTimeoutMs, 1000, 60000);
}

QString socketPathFromEnvironment()
{
    const QString tuyaPath = envValue("TUYA_IPC_SOCKET_PATH");
    if (!tuyaPath.isEmpty())
        return tuyaPath;
    const QString phiPath = envValue("PHI_ADAPTER_SOCKET_PATH");
    if (!phiPath.isEmpty())
        return phiPath;
    return QString::fromLatin1(kDefaultSocketPath);
}

} // namespace phicore::tuya::ipc
