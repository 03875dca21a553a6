#include "tuya_token.h"

#include <QJsonObject>

#include "tuya_log.h"
#include "tuya_sign.h"

namespace phicore::tuya::ipc {

TokenResult acquireToken(HttpClient &http, const Credentials &creds, qint64 timestampMs, int timeoutMs)
{
    TokenResult out;

    if (creds.accessKey.isEmpty() || creds.secretKey.isEmpty()) {
        out.error = TuyaError::auth(QStringLiteral("Access key or secret key missing"));
        return out;
    }

    const QByteArray method = QByteArrayLiteral("GET");
    const QString signUrl = QString::fromLatin1(kTokenPath);

    SignatureInput input;
    input.method = method;
    input.contentHash = contentHash(method, QByteArray());
    input.canonicalUrl = signUrl;
    input.timestamp = QString::number(timestampMs);

    const HeaderList headers{
        {QByteArrayLiteral("t"), input.timestamp.toLatin1()},
        {QByteArrayLiteral("sign_method"), QByteArrayLiteral("HMAC-SHA256")},
        {QByteArrayLiteral("client_id"), creds.accessKey.toUtf8()},
        {QByteArrayLiteral("sign"), signRequest(creds, input).toLatin1()},
    };

    qCDebug(tuyaLog) << "requesting access token from" << creds.baseUrl;

    const HttpResult response = http.get(creds.baseUrl, signUrl, headers, timeoutMs);
    if (!response.ok) {
        const QString detail = response.error.isEmpty() ? QStringLiteral("No response") : response.error;
        out.error = TuyaError::auth(detail);
        out.error.httpStatus = response.statusCode;
        qCWarning(tuyaLog) << "token request failed:" << detail;
        return out;
    }

    Envelope envelope;
    QString parseError;
    if (!parseEnvelope(response.payload, &envelope, &parseError)) {
        out.error = TuyaError::decode(QStringLiteral("Token response: %1").arg(parseError));
        qCWarning(tuyaLog) << "token response is not valid JSON:" << parseError;
        return out;
    }

    if (!envelope.success) {
        out.error = TuyaError::auth(envelope.msg, envelope.code);
        qCWarning(tuyaLog) << "token request rejected:" << envelope.msg << "code" << envelope.code;
        return out;
    }

    const QJsonObject result = envelope.result.toObject();
    out.accessToken = result.value(QStringLiteral("access_token")).toString();
    out.refreshToken = result.value(QStringLiteral("refresh_token")).toString();
    out.uid = result.value(QStringLiteral("uid")).toString();
    out.expireTimeSec = result.value(QStringLiteral("expire_time")).toInt(0);

    if (out.accessToken.isEmpty()) {
        out.error = TuyaError::auth(QStringLiteral("Token response has no access_token"));
        qCWarning(tuyaLog) << "token response has no access_token";
        return out;
    }

    out.ok = true;
    return out;
}

} // namespace phicore::tuya::ipc
