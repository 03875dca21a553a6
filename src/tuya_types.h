#pragma once

#include <QByteArray>
#include <QJsonValue>
#include <QMap>
#include <QString>

namespace phicore::tuya::ipc {

// Cloud project credentials. Passed into every core call, never cached.
struct Credentials {
    QString accessKey;
    QString secretKey;
    QString baseUrl;
};

enum class ErrorKind {
    None,
    Auth,
    Http,
    Api,
    Decode
};

const char *errorKindName(ErrorKind kind);

struct TuyaError {
    ErrorKind kind = ErrorKind::None;
    int httpStatus = 0;
    int code = 0;
    QString message;

    bool isError() const noexcept { return kind != ErrorKind::None; }
    QString toString() const;

    static TuyaError auth(const QString &message, int code = 0);
    static TuyaError http(int status, const QString &message = QString());
    static TuyaError api(int code, const QString &message);
    static TuyaError decode(const QString &message);
};

// Standard response wrapper of the Tuya OpenAPI.
struct Envelope {
    bool success = false;
    int code = 0;
    QString msg;
    QJsonValue result;
    qint64 t = 0;
    QString tid;
};

using QueryMap = QMap<QString, QString>;

bool parseEnvelope(const QByteArray &payload, Envelope *out, QString *error = nullptr);

} // namespace phicore::tuya::ipc
