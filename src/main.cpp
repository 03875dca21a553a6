#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <QCoreApplication>
#include <QEventLoop>

#include "tuya_config.h"
#include "tuya_schema.h"
#include "tuya_sidecar.h"
#include "phi/adapter/sdk/sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

class TuyaFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override
    {
        return phicore::tuya::ipc::kPluginType;
    }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<phicore::tuya::ipc::TuyaSidecar>();
    }
};

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const v1::Utf8String socketPath = (argc > 1)
        ? v1::Utf8String(argv[1])
        : phicore::tuya::ipc::socketPathFromEnvironment().toStdString();

    // Environment defaults only; bootstrap meta may still override them.
    const phicore::tuya::ipc::TuyaSettings envSettings = phicore::tuya::ipc::settingsFromEnvironment();
    std::cerr << "starting phi_adapter_tuya_ipc for pluginType=" << phicore::tuya::ipc::kPluginType
              << " socket=" << socketPath
              << " baseUrl=" << envSettings.credentials.baseUrl.toStdString()
              << " accessKey=" << (envSettings.credentials.accessKey.isEmpty() ? "unset" : "set")
              << " rooms=" << envSettings.roomDevices.size()
              << '\n';

    TuyaFactory factory;
    sdk::SidecarHost host(socketPath, factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        std::cerr << "failed to start sidecar host: " << error << '\n';
        return 1;
    }

    while (g_running.load()) {
        if (!host.pollOnce(std::chrono::milliseconds(250), &error)) {
            std::cerr << "poll failed: " << error << '\n';
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        if (auto *adapter = dynamic_cast<phicore::tuya::ipc::TuyaSidecar *>(host.adapter()))
            adapter->tick();

        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }

    host.stop();
    std::cerr << "stopping phi_adapter_tuya_ipc" << '\n';
    return 0;
}
