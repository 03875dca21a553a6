#pragma once

#include <QJsonObject>
#include <QString>

#include "tuya_devices.h"
#include "tuya_types.h"

namespace phicore::tuya::ipc {

inline constexpr const char kDefaultBaseUrl[] = "https://openapi.tuyaeu.com";
inline constexpr const char kDefaultSocketPath[] = "/tmp/phi-adapter-tuya-ipc.sock";

struct TuyaSettings {
    Credentials credentials{QString(), QString(), QString::fromLatin1(kDefaultBaseUrl)};
    RoomDeviceTable roomDevices;
    int pollIntervalMs = 30000;
    int retryIntervalMs = 10000;
    int requestTimeoutMs = 10000;
};

// Adds "https://" when no scheme is given and drops trailing slashes.
QString normalizeBaseUrl(const QString &hostOrUrl);

// Reads TUYA_* environment variables on top of the defaults.
TuyaSettings settingsFromEnvironment();

// Applies adapter meta keys (baseUrl, accessKey, secretKey, <room>DeviceId,
// pollIntervalMs, retryIntervalMs, requestTimeoutMs) and clamps intervals.
void applyMeta(TuyaSettings *settings, const QJsonObject &meta);

void clampIntervals(TuyaSettings *settings);

// IPC socket: TUYA_IPC_SOCKET_PATH, then PHI_ADAPTER_SOCKET_PATH, then the
// default.
QString socketPathFromEnvironment();

} // namespace phicore::tuya::ipc
