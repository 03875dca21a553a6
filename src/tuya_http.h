#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkRequest;

namespace phicore::tuya::ipc {

using HeaderList = QList<QPair<QByteArray, QByteArray>>;

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const QString &baseUrl,
                   const QString &path,
                   const HeaderList &headers,
                   int timeoutMs = 10000) const;

    HttpResult send(const QString &baseUrl,
                    const QByteArray &method,
                    const QString &path,
                    const QByteArray &payload,
                    const HeaderList &headers,
                    int timeoutMs = 10000) const;

    // baseUrl + path, with a trailing '/' on the base dropped.
    static QUrl resolveUrl(const QString &baseUrl, const QString &path);

private:
    bool buildRequest(const QString &baseUrl,
                      const QString &path,
                      const HeaderList &headers,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace phicore::tuya::ipc
