#include <gtest/gtest.h>

#include "fake_network.h"
#include "tuya_sign.h"
#include "tuya_token.h"

using namespace phicore::tuya::ipc;
using phicore::tuya::ipc::test::FakeNetworkManager;
using phicore::tuya::ipc::test::tokenOk;

namespace {

constexpr qint64 kNow = 1700000000000;

Credentials testCreds()
{
    return Credentials{QStringLiteral("access-id"), QStringLiteral("secret"), QStringLiteral("https://openapi.example.com")};
}

} // namespace

TEST(Token, SignsTheFixedTokenRequest)
{
    FakeNetworkManager network;
    HttpClient http(&network);
    network.enqueueJson(tokenOk());

    const TokenResult token = acquireToken(http, testCreds(), kNow);
    ASSERT_TRUE(token.ok) << token.error.toString().toStdString();
    EXPECT_EQ(token.accessToken, QStringLiteral("tok-123"));
    EXPECT_EQ(token.refreshToken, QStringLiteral("ref-1"));
    EXPECT_EQ(token.uid, QStringLiteral("uid-1"));
    EXPECT_EQ(token.expireTimeSec, 7200);

    ASSERT_EQ(network.requests().size(), 1);
    const auto &request = network.requests().first();
    EXPECT_EQ(request.method, QByteArrayLiteral("GET"));
    EXPECT_EQ(request.url.host(), QStringLiteral("openapi.example.com"));
    EXPECT_EQ(request.url.path(), QStringLiteral("/v1.0/token"));
    EXPECT_EQ(request.url.query(), QStringLiteral("grant_type=1"));
    EXPECT_TRUE(request.body.isEmpty());

    EXPECT_EQ(request.headers.value("t"), QByteArrayLiteral("1700000000000"));
    EXPECT_EQ(request.headers.value("sign_method"), QByteArrayLiteral("HMAC-SHA256"));
    EXPECT_EQ(request.headers.value("client_id"), QByteArrayLiteral("access-id"));
    EXPECT_FALSE(request.headers.contains("access_token"));

    const QString expected = sign(QByteArrayLiteral("access-id1700000000000GET\n")
                                      + sha256Hex(QByteArray()).toLatin1()
                                      + QByteArrayLiteral("\n\n/v1.0/token?grant_type=1"),
                                  QByteArrayLiteral("secret"));
    EXPECT_EQ(request.headers.value("sign"), expected.toLatin1());
}

TEST(Token, PlatformFailureIsAuthError)
{
    FakeNetworkManager network;
    HttpClient http(&network);
    network.enqueueJson(R"({"success":false,"code":1004,"msg":"sign invalid","t":1,"tid":"x"})");

    const TokenResult token = acquireToken(http, testCreds(), kNow);
    EXPECT_FALSE(token.ok);
    EXPECT_EQ(token.error.kind, ErrorKind::Auth);
    EXPECT_EQ(token.error.code, 1004);
    EXPECT_EQ(token.error.message, QStringLiteral("sign invalid"));
}

TEST(Token, MissingAccessTokenIsAuthError)
{
    FakeNetworkManager network;
    HttpClient http(&network);
    network.enqueueJson(R"({"success":true,"result":{"expire_time":7200}})");

    const TokenResult token = acquireToken(http, testCreds(), kNow);
    EXPECT_FALSE(token.ok);
    EXPECT_EQ(token.error.kind, ErrorKind::Auth);
    EXPECT_TRUE(token.accessToken.isEmpty());
}

TEST(Token, MalformedBodyIsDecodeError)
{
    FakeNetworkManager network;
    HttpClient http(&network);
    network.enqueueJson("<html>gateway</html>");

    const TokenResult token = acquireToken(http, testCreds(), kNow);
    EXPECT_FALSE(token.ok);
    EXPECT_EQ(token.error.kind, ErrorKind::Decode);
}

TEST(Token, HttpFailureIsAuthErrorWithStatus)
{
    FakeNetworkManager network;
    HttpClient http(&network);
    network.enqueue(503, "unavailable");

    const TokenResult token = acquireToken(http, testCreds(), kNow);
    EXPECT_FALSE(token.ok);
    EXPECT_EQ(token.error.kind, ErrorKind::Auth);
    EXPECT_EQ(token.error.httpStatus, 503);
}

TEST(Token, MissingSecretFailsWithoutRequest)
{
    FakeNetworkManager network;
    HttpClient http(&network);

    Credentials creds = testCreds();
    creds.secretKey.clear();
    const TokenResult token = acquireToken(http, creds, kNow);
    EXPECT_FALSE(token.ok);
    EXPECT_EQ(token.error.kind, ErrorKind::Auth);
    EXPECT_TRUE(network.requests().isEmpty());
}
