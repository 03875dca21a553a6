#pragma once

#include <cstdint>

#include <QHash>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QSet>
#include <QString>

#include "tuya_client.h"
#include "tuya_config.h"
#include "tuya_devices.h"
#include "tuya_http.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::tuya::ipc {

class TuyaSidecar final : public phicore::adapter::sdk::AdapterSidecar
{
public:
    TuyaSidecar();

    void tick();

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;

    phicore::adapter::v1::Utf8String displayName() const override;
    phicore::adapter::v1::Utf8String description() const override;
    phicore::adapter::v1::Utf8String iconSvg() const override;
    phicore::adapter::v1::Utf8String apiVersion() const override;
    int timeoutMs() const override;
    phicore::adapter::v1::AdapterCapabilities capabilities() const override;
    phicore::adapter::v1::JsonText configSchemaJson() const override;

private:
    using CmdResponse = phicore::adapter::v1::CmdResponse;
    using ActionResponse = phicore::adapter::v1::ActionResponse;
    using CmdStatus = phicore::adapter::v1::CmdStatus;

    static std::int64_t nowMs();
    static CmdStatus statusForError(const TuyaError &error);

    void applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter);

    bool publishDevices(QString *error = nullptr);
    bool pollDevices(QString *error = nullptr);
    void publishStatus(const QString &deviceId, const DeviceStatus &status);
    void setConnectionState(bool connected);

    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request,
                               const QJsonObject &params);
    ActionResponse invokeGetDeviceId(const phicore::adapter::sdk::AdapterActionInvokeRequest &request,
                                     const QJsonObject &params);
    ActionResponse invokeGetDeviceStatus(const phicore::adapter::sdk::AdapterActionInvokeRequest &request,
                                         const QJsonObject &params);
    ActionResponse invokeTurnOnOff(const phicore::adapter::sdk::AdapterActionInvokeRequest &request,
                                   const QJsonObject &params);
    ActionResponse invokeChangeColor(const phicore::adapter::sdk::AdapterActionInvokeRequest &request,
                                     const QJsonObject &params);

    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;
    ActionResponse actionFailure(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    ActionResponse actionSuccess(std::uint64_t cmdId, const QString &result) const;

    QNetworkAccessManager m_network;
    HttpClient m_http;
    TuyaClient m_client;

    phicore::adapter::v1::Adapter m_adapterInfo;
    TuyaSettings m_baseSettings;
    TuyaSettings m_settings;
    QJsonObject m_meta;

    bool m_connected = false;
    bool m_hasBootstrap = false;
    std::int64_t m_nextPollDueMs = 0;

    // Tuya device id -> normalized room name.
    QHash<QString, QString> m_roomByDevice;
    QSet<QString> m_knownRooms;
};

} // namespace phicore::tuya::ipc
