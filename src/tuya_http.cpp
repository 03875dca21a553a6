#include "tuya_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace phicore::tuya::ipc {

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QUrl HttpClient::resolveUrl(const QString &baseUrl, const QString &path)
{
    QString base = baseUrl.trimmed();
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);
    if (path.startsWith(QLatin1Char('/')))
        return QUrl(base + path);
    return QUrl(base + QLatin1Char('/') + path);
}

HttpResult HttpClient::get(const QString &baseUrl,
                           const QString &path,
                           const HeaderList &headers,
                           int timeoutMs) const
{
    return send(baseUrl, QByteArrayLiteral("GET"), path, {}, headers, timeoutMs);
}

bool HttpClient::buildRequest(const QString &baseUrl,
                              const QString &path,
                              const HeaderList &headers,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    if (baseUrl.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("API base URL is empty");
        return false;
    }

    const QUrl url = resolveUrl(baseUrl, path);
    if (!url.isValid() || url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid API URL: %1").arg(url.toString());
        return false;
    }

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "phi-adapter-tuya-ipc/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    for (const auto &header : headers)
        out.setRawHeader(header.first, header.second);

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::send(const QString &baseUrl,
                            const QByteArray &method,
                            const QString &path,
                            const QByteArray &payload,
                            const HeaderList &headers,
                            int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(baseUrl, path, headers, !payload.isEmpty(), &requestObj, &result.error))
        return result;

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET")) {
        reply = m_manager->get(requestObj);
    } else if (method == QByteArrayLiteral("POST")) {
        reply = m_manager->post(requestObj, payload);
    } else {
        reply = m_manager->sendCustomRequest(requestObj, method, payload);
    }

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : 10000);
    if (!reply->isFinished())
        loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (result.statusCode >= 200 && result.statusCode < 300 && reply->error() == QNetworkReply::NoError) {
        result.ok = true;
    } else if (result.statusCode > 0) {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    } else {
        result.error = reply->errorString();
    }

    reply->deleteLater();
    return result;
}

} // namespace phicore::tuya::ipc
