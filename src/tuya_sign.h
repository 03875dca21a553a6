#pragma once

#include <QByteArray>
#include <QString>

#include "tuya_types.h"

namespace phicore::tuya::ipc {

inline constexpr const char kSignMethod[] = "HMAC-SHA256";

struct SignatureInput {
    QByteArray method;
    QString contentHash;
    QString canonicalUrl;
    QString timestamp;
    QString token;
};

// HMAC-SHA256 of message keyed by secret, uppercase hex.
QString sign(const QByteArray &message, const QByteArray &secret);

QString sha256Hex(const QByteArray &data);

// GET requests always hash the empty string, whatever body is passed.
QString contentHash(const QByteArray &method, const QByteArray &body);

QString stringToSign(const QByteArray &method, const QString &contentHash, const QString &canonicalUrl);

// Signs accessKey + token + t + stringToSign. The token request passes an
// empty token.
QString signRequest(const Credentials &creds, const SignatureInput &input);

} // namespace phicore::tuya::ipc
