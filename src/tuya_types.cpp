#include "tuya_types.h"

#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::tuya::ipc {

const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Auth:
        return "AuthError";
    case ErrorKind::Http:
        return "HttpError";
    case ErrorKind::Api:
        return "ApiError";
    case ErrorKind::Decode:
        return "DecodeError";
    }
    return "Unknown";
}

QString TuyaError::toString() const
{
    switch (kind) {
    case ErrorKind::None:
        return {};
    case ErrorKind::Auth:
        return QStringLiteral("Token request failed: %1").arg(message);
    case ErrorKind::Http:
        if (httpStatus <= 0)
            return QStringLiteral("HTTP Error. %1").arg(message.isEmpty() ? QStringLiteral("No response") : message);
        return QStringLiteral("HTTP Error. Status %1").arg(httpStatus);
    case ErrorKind::Api:
        return QStringLiteral("Error message: %1. Error code: %2").arg(message).arg(code);
    case ErrorKind::Decode:
        return QStringLiteral("Malformed response: %1").arg(message);
    }
    return message;
}

TuyaError TuyaError::auth(const QString &message, int code)
{
    TuyaError error;
    error.kind = ErrorKind::Auth;
    error.code = code;
    error.message = message;
    return error;
}

TuyaError TuyaError::http(int status, const QString &message)
{
    TuyaError error;
    error.kind = ErrorKind::Http;
    error.httpStatus = status;
    error.message = message;
    return error;
}

TuyaError TuyaError::api(int code, const QString &message)
{
    TuyaError error;
    error.kind = ErrorKind::Api;
    error.code = code;
    error.message = message;
    return error;
}

TuyaError TuyaError::decode(const QString &message)
{
    TuyaError error;
    error.kind = ErrorKind::Decode;
    error.message = message;
    return error;
}

bool parseEnvelope(const QByteArray &payload, Envelope *out, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Response is not a JSON object");
        return false;
    }

    const QJsonObject root = doc.object();
    if (out) {
        out->success = root.value(QStringLiteral("success")).toBool(false);
        out->code = root.value(QStringLiteral("code")).toInt(0);
        out->msg = root.value(QStringLiteral("msg")).toString();
        out->result = root.value(QStringLiteral("result"));
        out->t = static_cast<qint64>(root.value(QStringLiteral("t")).toDouble(0.0));
        out->tid = root.value(QStringLiteral("tid")).toString();
    }
    return true;
}

} // namespace phicore::tuya::ipc
