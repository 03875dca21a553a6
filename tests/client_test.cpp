#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>

#include "fake_network.h"
#include "tuya_client.h"
#include "tuya_sign.h"

using namespace phicore::tuya::ipc;
using phicore::tuya::ipc::test::FakeNetworkManager;
using phicore::tuya::ipc::test::tokenOk;

namespace {

class ClientTest : public ::testing::Test
{
protected:
    ClientTest()
        : http(&network)
        , client(&http)
    {
        client.setClock([]() { return qint64(1700000000000); });
    }

    Credentials creds{QStringLiteral("access-id"), QStringLiteral("secret"), QStringLiteral("https://openapi.example.com/")};
    FakeNetworkManager network;
    HttpClient http;
    TuyaClient client;
};

} // namespace

TEST_F(ClientTest, GetSendsSignedHeaders)
{
    network.enqueueJson(tokenOk());
    network.enqueueJson(R"({"success":true,"result":[],"t":1700000000123,"tid":"abc"})");

    Envelope envelope;
    TuyaError error;
    ASSERT_TRUE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, &envelope, &error));
    EXPECT_TRUE(envelope.success);
    EXPECT_TRUE(envelope.result.isArray());
    EXPECT_EQ(envelope.t, 1700000000123);
    EXPECT_EQ(envelope.tid, QStringLiteral("abc"));
    EXPECT_FALSE(error.isError());

    ASSERT_EQ(network.requests().size(), 2);
    const auto &request = network.requests().at(1);
    EXPECT_EQ(request.method, QByteArrayLiteral("GET"));
    EXPECT_EQ(request.url.toString(), QStringLiteral("https://openapi.example.com/v1.0/devices/dev1/status"));
    EXPECT_TRUE(request.body.isEmpty());
    EXPECT_EQ(request.headers.value("t"), QByteArrayLiteral("1700000000000"));
    EXPECT_EQ(request.headers.value("path"), QByteArrayLiteral("/v1.0/devices/dev1/status"));
    EXPECT_EQ(request.headers.value("client_id"), QByteArrayLiteral("access-id"));
    EXPECT_EQ(request.headers.value("sign_method"), QByteArrayLiteral("HMAC-SHA256"));
    EXPECT_EQ(request.headers.value("access_token"), QByteArrayLiteral("tok-123"));

    SignatureInput input;
    input.method = "GET";
    input.contentHash = sha256Hex(QByteArray());
    input.canonicalUrl = QStringLiteral("/v1.0/devices/dev1/status");
    input.timestamp = QStringLiteral("1700000000000");
    input.token = QStringLiteral("tok-123");
    EXPECT_EQ(request.headers.value("sign"), signRequest(creds, input).toLatin1());
}

TEST_F(ClientTest, PostAttachesBodyAndHashesIt)
{
    network.enqueueJson(tokenOk());
    network.enqueueJson(R"({"success":true,"result":true})");

    QJsonObject body;
    body.insert(QStringLiteral("commands"), QStringLiteral("[]"));

    ASSERT_TRUE(client.call(creds, "POST", QStringLiteral("/v1.0/devices/dev1/commands"), {}, body, nullptr));

    const auto &request = network.requests().at(1);
    const QByteArray expectedBody = QByteArrayLiteral(R"({"commands":"[]"})");
    EXPECT_EQ(request.method, QByteArrayLiteral("POST"));
    EXPECT_EQ(request.body, expectedBody);
    EXPECT_EQ(request.headers.value("Content-Type"), QByteArrayLiteral("application/json"));

    SignatureInput input;
    input.method = "POST";
    input.contentHash = sha256Hex(expectedBody);
    input.canonicalUrl = QStringLiteral("/v1.0/devices/dev1/commands");
    input.timestamp = QStringLiteral("1700000000000");
    input.token = QStringLiteral("tok-123");
    EXPECT_EQ(request.headers.value("sign"), signRequest(creds, input).toLatin1());
}

TEST_F(ClientTest, PostWithEmptyBodySendsNoPayload)
{
    network.enqueueJson(tokenOk());
    network.enqueueJson(R"({"success":true})");

    ASSERT_TRUE(client.call(creds, "POST", QStringLiteral("/v1.0/devices/dev1/commands"), {}, {}, nullptr));
    EXPECT_TRUE(network.requests().at(1).body.isEmpty());
}

TEST_F(ClientTest, QueryIsCanonicalizedIntoPathHeader)
{
    network.enqueueJson(tokenOk());
    network.enqueueJson(R"({"success":true})");

    const QueryMap query{{QStringLiteral("b"), QStringLiteral("2")}, {QStringLiteral("a"), QStringLiteral("1")}};
    ASSERT_TRUE(client.call(creds, "GET", QStringLiteral("/v1.0/devices?c=3"), query, {}, nullptr));
    EXPECT_EQ(network.requests().at(1).headers.value("path"), QByteArrayLiteral("/v1.0/devices?a=1&b=2&c=3"));
}

TEST_F(ClientTest, TokenFailureStopsBeforeMainRequest)
{
    network.enqueueJson(R"({"success":false,"code":1004,"msg":"invalid signature"})");

    TuyaError error;
    EXPECT_FALSE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::Auth);
    EXPECT_EQ(error.message, QStringLiteral("invalid signature"));
    EXPECT_EQ(network.requests().size(), 1);
}

TEST_F(ClientTest, HttpErrorStatusWinsOverBody)
{
    network.enqueueJson(tokenOk());
    network.enqueue(500, R"({"success":true})");

    TuyaError error;
    EXPECT_FALSE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::Http);
    EXPECT_EQ(error.httpStatus, 500);
    EXPECT_EQ(error.toString(), QStringLiteral("HTTP Error. Status 500"));
}

TEST_F(ClientTest, TransportFailureIsHttpErrorWithoutStatus)
{
    network.enqueueJson(tokenOk());

    TuyaError error;
    EXPECT_FALSE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::Http);
    EXPECT_EQ(error.httpStatus, 0);
    EXPECT_FALSE(error.message.isEmpty());
}

TEST_F(ClientTest, PlatformFailureIsApiError)
{
    network.enqueueJson(tokenOk());
    network.enqueueJson(R"({"success":false,"code":2017,"msg":"device is offline"})");

    TuyaError error;
    EXPECT_FALSE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::Api);
    EXPECT_EQ(error.code, 2017);
    EXPECT_EQ(error.message, QStringLiteral("device is offline"));
    EXPECT_EQ(error.toString(), QStringLiteral("Error message: device is offline. Error code: 2017"));
}

TEST_F(ClientTest, MalformedBodyIsDecodeError)
{
    network.enqueueJson(tokenOk());
    network.enqueueJson("{\"success\":");

    TuyaError error;
    EXPECT_FALSE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::Decode);
}

TEST_F(ClientTest, EveryCallFetchesItsOwnToken)
{
    network.enqueueJson(tokenOk("first"));
    network.enqueueJson(R"({"success":true})");
    network.enqueueJson(tokenOk("second"));
    network.enqueueJson(R"({"success":true})");

    ASSERT_TRUE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, nullptr));
    ASSERT_TRUE(client.call(creds, "GET", QStringLiteral("/v1.0/devices/dev1/status"), {}, {}, nullptr));

    ASSERT_EQ(network.requests().size(), 4);
    EXPECT_EQ(network.requests().at(1).headers.value("access_token"), QByteArrayLiteral("first"));
    EXPECT_EQ(network.requests().at(3).headers.value("access_token"), QByteArrayLiteral("second"));
}
