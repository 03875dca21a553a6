#include "tuya_client.h"

#include <utility>

#include <QDateTime>
#include <QJsonDocument>

#include "tuya_canonical.h"
#include "tuya_log.h"
#include "tuya_sign.h"

namespace phicore::tuya::ipc {

namespace {

bool fail(TuyaError *error, const TuyaError &value)
{
    qCWarning(tuyaLog).noquote() << errorKindName(value.kind) << value.toString();
    if (error)
        *error = value;
    return false;
}

} // namespace

TuyaClient::TuyaClient(HttpClient *http)
    : m_http(http)
{
}

void TuyaClient::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

void TuyaClient::setTimeoutMs(int timeoutMs)
{
    m_timeoutMs = timeoutMs > 0 ? timeoutMs : 10000;
}

qint64 TuyaClient::now() const
{
    if (m_clock)
        return m_clock();
    return QDateTime::currentMSecsSinceEpoch();
}

TokenResult TuyaClient::fetchToken(const Credentials &creds) const
{
    if (!m_http) {
        TokenResult out;
        out.error = TuyaError::auth(QStringLiteral("HTTP client unavailable"));
        return out;
    }
    return acquireToken(*m_http, creds, now(), m_timeoutMs);
}

bool TuyaClient::call(const Credentials &creds,
                      const QByteArray &method,
                      const QString &endpoint,
                      const QueryMap &query,
                      const QJsonObject &body,
                      Envelope *out,
                      TuyaError *error) const
{
    if (!m_http)
        return fail(error, TuyaError::http(0, QStringLiteral("HTTP client unavailable")));

    const TokenResult token = fetchToken(creds);
    if (!token.ok)
        return fail(error, token.error);

    const CanonicalRequest canonical = canonicalize(endpoint, query);
    const QByteArray bodyJson = QJsonDocument(body).toJson(QJsonDocument::Compact);

    SignatureInput input;
    input.method = method;
    input.contentHash = contentHash(method, bodyJson);
    input.canonicalUrl = canonical.url();
    input.timestamp = QString::number(now());
    input.token = token.accessToken;

    const HeaderList headers{
        {QByteArrayLiteral("t"), input.timestamp.toLatin1()},
        {QByteArrayLiteral("path"), input.canonicalUrl.toUtf8()},
        {QByteArrayLiteral("client_id"), creds.accessKey.toUtf8()},
        {QByteArrayLiteral("sign"), signRequest(creds, input).toLatin1()},
        {QByteArrayLiteral("sign_method"), QByteArrayLiteral("HMAC-SHA256")},
        {QByteArrayLiteral("access_token"), token.accessToken.toUtf8()},
    };

    const bool attachBody = method == QByteArrayLiteral("POST") && !body.isEmpty();

    qCDebug(tuyaLog).noquote() << "dispatching" << method << canonical.url();

    const HttpResult response = m_http->send(creds.baseUrl,
                                             method,
                                             endpoint,
                                             attachBody ? bodyJson : QByteArray(),
                                             headers,
                                             m_timeoutMs);
    // Non-2xx bodies are never parsed.
    if (!response.ok)
        return fail(error, TuyaError::http(response.statusCode, response.error));

    Envelope envelope;
    QString parseError;
    if (!parseEnvelope(response.payload, &envelope, &parseError))
        return fail(error, TuyaError::decode(parseError));

    if (!envelope.success)
        return fail(error, TuyaError::api(envelope.code, envelope.msg));

    if (out)
        *out = envelope;
    if (error)
        *error = TuyaError();
    return true;
}

} // namespace phicore::tuya::ipc
