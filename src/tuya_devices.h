#pragma once

#include <optional>

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>

#include "tuya_client.h"
#include "tuya_types.h"

namespace phicore::tuya::ipc {

inline constexpr const char kCodeSwitch[] = "switch_led";
inline constexpr const char kCodeBrightness[] = "bright_value_v2";
inline constexpr const char kCodeTemperature[] = "temp_value_v2";
inline constexpr const char kCodeColour[] = "colour_data_v2";

// h in [0, 360], s and v in [0, 1000].
struct HsvColor {
    int h = 0;
    int s = 0;
    int v = 0;

    bool isValid() const noexcept
    {
        return h >= 0 && h <= 360 && s >= 0 && s <= 1000 && v >= 0 && v <= 1000;
    }
    QJsonObject toJson() const;
};

struct DeviceStatus {
    std::optional<bool> onOff;
    std::optional<int> brightness;
    std::optional<int> temp;
    std::optional<HsvColor> color;

    QJsonObject toJson() const;
};

struct DeviceActionResult {
    QString message;
    QString deviceId;
    QJsonValue currentState;

    QJsonObject toJson() const;
};

struct DeviceStatusResult {
    QString deviceId;
    bool ok = false;
    DeviceStatus status;
    TuyaError error;
};

// Normalized room name -> Tuya device id.
using RoomDeviceTable = QHash<QString, QString>;

const QStringList &knownRooms();

// Integral JSON number within [minValue, maxValue]. Fractions, non-finite
// values and anything outside the range give nullopt.
std::optional<int> jsonIntInRange(const QJsonValue &value, int minValue, int maxValue);

// Reads {h, s, v} as whole numbers in Tuya ranges.
bool parseHsv(const QJsonObject &obj, HsvColor *out, QString *error = nullptr);

bool decodeDeviceStatus(const QJsonArray &result, DeviceStatus *out, TuyaError *error = nullptr);

bool getDeviceStatus(const TuyaClient &client,
                     const Credentials &creds,
                     const QString &deviceId,
                     DeviceStatus *out,
                     TuyaError *error = nullptr);

// Reads every device in order. A failing device does not stop the others.
QList<DeviceStatusResult> pollDeviceStatuses(const TuyaClient &client,
                                             const Credentials &creds,
                                             const QStringList &deviceIds);

bool turnOnOff(const TuyaClient &client,
               const Credentials &creds,
               const QString &deviceId,
               bool onOff,
               DeviceActionResult *out,
               TuyaError *error = nullptr);

// The HSV range is not checked here.
bool changeColor(const TuyaClient &client,
                 const Credentials &creds,
                 const QString &deviceId,
                 const HsvColor &color,
                 DeviceActionResult *out,
                 TuyaError *error = nullptr);

// Trimmed, lower-cased, all whitespace removed.
QString normalizeRoomName(const QString &roomName);

std::optional<QString> resolveDeviceId(const QString &roomName, const RoomDeviceTable &table);

HsvColor rgbToHsv(double r01, double g01, double b01);

// "#rrggbb" rendering of an HSV color.
QString hsvToHex(const HsvColor &color);

} // namespace phicore::tuya::ipc
