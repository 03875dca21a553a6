#include <gtest/gtest.h>

#include <QJsonObject>
#include <QtGlobal>

#include "tuya_config.h"

using namespace phicore::tuya::ipc;

namespace {

class EnvGuard
{
public:
    EnvGuard(const char *name, const QByteArray &value)
        : m_name(name)
    {
        qputenv(m_name, value);
    }
    ~EnvGuard() { qunsetenv(m_name); }

private:
    const char *m_name;
};

} // namespace

TEST(Config, Defaults)
{
    const TuyaSettings settings;
    EXPECT_EQ(settings.credentials.baseUrl, QStringLiteral("https://openapi.tuyaeu.com"));
    EXPECT_EQ(settings.pollIntervalMs, 30000);
    EXPECT_EQ(settings.retryIntervalMs, 10000);
    EXPECT_EQ(settings.requestTimeoutMs, 10000);
    EXPECT_TRUE(settings.roomDevices.isEmpty());
}

TEST(Config, NormalizeBaseUrl)
{
    EXPECT_EQ(normalizeBaseUrl(QStringLiteral("openapi.tuyaus.com")), QStringLiteral("https://openapi.tuyaus.com"));
    EXPECT_EQ(normalizeBaseUrl(QStringLiteral(" https://openapi.tuyacn.com// ")), QStringLiteral("https://openapi.tuyacn.com"));
    EXPECT_EQ(normalizeBaseUrl(QStringLiteral("http://localhost:8080/")), QStringLiteral("http://localhost:8080"));
    EXPECT_TRUE(normalizeBaseUrl(QString()).isEmpty());
}

TEST(Config, ReadsEnvironment)
{
    const EnvGuard base("TUYA_BASE_URL", "openapi.tuyaus.com/");
    const EnvGuard access("TUYA_ACCESS_KEY", "ak");
    const EnvGuard secret("TUYA_SECRET_KEY", " sk ");
    const EnvGuard kitchen("TUYA_KITCHEN_DEVICE_ID", "dev-kitchen");

    const TuyaSettings settings = settingsFromEnvironment();
    EXPECT_EQ(settings.credentials.baseUrl, QStringLiteral("https://openapi.tuyaus.com"));
    EXPECT_EQ(settings.credentials.accessKey, QStringLiteral("ak"));
    EXPECT_EQ(settings.credentials.secretKey, QStringLiteral("sk"));
    EXPECT_EQ(settings.roomDevices.value(QStringLiteral("kitchen")), QStringLiteral("dev-kitchen"));
    EXPECT_FALSE(settings.roomDevices.contains(QStringLiteral("bedroom")));
}

TEST(Config, MetaOverridesAndRemoves)
{
    TuyaSettings settings;
    settings.credentials.accessKey = QStringLiteral("env-key");
    settings.roomDevices.insert(QStringLiteral("bedroom"), QStringLiteral("dev-bed"));

    QJsonObject meta;
    meta.insert(QStringLiteral("accessKey"), QStringLiteral("meta-key"));
    meta.insert(QStringLiteral("baseUrl"), QStringLiteral("openapi.tuyain.com"));
    meta.insert(QStringLiteral("bedroomDeviceId"), QString());
    meta.insert(QStringLiteral("livingroomDeviceId"), QStringLiteral(" dev-living "));
    meta.insert(QStringLiteral("pollIntervalMs"), 5000);

    applyMeta(&settings, meta);
    EXPECT_EQ(settings.credentials.accessKey, QStringLiteral("meta-key"));
    EXPECT_EQ(settings.credentials.baseUrl, QStringLiteral("https://openapi.tuyain.com"));
    EXPECT_FALSE(settings.roomDevices.contains(QStringLiteral("bedroom")));
    EXPECT_EQ(settings.roomDevices.value(QStringLiteral("livingroom")), QStringLiteral("dev-living"));
    EXPECT_EQ(settings.pollIntervalMs, 5000);
    EXPECT_EQ(settings.retryIntervalMs, 10000);
}

TEST(Config, IntervalsAreClamped)
{
    TuyaSettings settings;
    QJsonObject meta;
    meta.insert(QStringLiteral("pollIntervalMs"), 10);
    meta.insert(QStringLiteral("retryIntervalMs"), 10000000);
    meta.insert(QStringLiteral("requestTimeoutMs"), 120000);

    applyMeta(&settings, meta);
    EXPECT_EQ(settings.pollIntervalMs, 1000);
    EXPECT_EQ(settings.retryIntervalMs, 600000);
    EXPECT_EQ(settings.requestTimeoutMs, 60000);
}

TEST(Config, NonNumericIntervalKeepsPrevious)
{
    TuyaSettings settings;
    settings.pollIntervalMs = 45000;
    QJsonObject meta;
    meta.insert(QStringLiteral("pollIntervalMs"), QStringLiteral("soon"));

    applyMeta(&settings, meta);
    EXPECT_EQ(settings.pollIntervalMs, 45000);
}

TEST(Config, SocketPathDefault)
{
    qunsetenv("TUYA_IPC_SOCKET_PATH");
    qunsetenv("PHI_ADAPTER_SOCKET_PATH");
    EXPECT_EQ(socketPathFromEnvironment(), QStringLiteral("/tmp/phi-adapter-tuya-ipc.sock"));
}

TEST(Config, SocketPathPrefersTuyaOverride)
{
    const EnvGuard phi("PHI_ADAPTER_SOCKET_PATH", "/run/phi/adapter.sock");
    EXPECT_EQ(socketPathFromEnvironment(), QStringLiteral("/run/phi/adapter.sock"));

    const EnvGuard tuya("TUYA_IPC_SOCKET_PATH", "/run/phi/tuya.sock");
    EXPECT_EQ(socketPathFromEnvironment(), QStringLiteral("/run/phi/tuya.sock"));
}
