#include "tuya_sign.h"

#include <QCryptographicHash>
#include <QMessageAuthenticationCode>
#include <QStringList>

namespace phicore::tuya::ipc {

QString sign(const QByteArray &message, const QByteArray &secret)
{
    const QByteArray mac = QMessageAuthenticationCode::hash(message, secret, QCryptographicHash::Sha256);
    return QString::fromLatin1(mac.toHex().toUpper());
}

QString sha256Hex(const QByteArray &data)
{
    return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex());
}

QString contentHash(const QByteArray &method, const QByteArray &body)
{
    if (method == QByteArrayLiteral("GET"))
        return sha256Hex(QByteArray());
    return sha256Hex(body);
}

QString stringToSign(const QByteArray &method, const QString &contentHash, const QString &canonicalUrl)
{
    const QStringList fields{QString::fromLatin1(method), contentHash, QString(), canonicalUrl};
    return fields.join(QLatin1Char('\n'));
}

QString signRequest(const Credentials &creds, const SignatureInput &input)
{
    const QString message = creds.accessKey
        + input.token
        + input.timestamp
        + stringToSign(input.method, input.contentHash, input.canonicalUrl);
    return sign(message.toUtf8(), creds.secretKey.toUtf8());
}

} // namespace phicore::tuya::ipc
