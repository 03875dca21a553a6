#pragma once

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QQueue>
#include <QUrl>

namespace phicore::tuya::ipc::test {

struct RecordedRequest {
    QByteArray method;
    QUrl url;
    QHash<QByteArray, QByteArray> headers;
    QByteArray body;
};

struct CannedResponse {
    int statusCode = 200;
    QByteArray body;
};

class FakeReply : public QNetworkReply
{
    Q_OBJECT
public:
    FakeReply(QNetworkAccessManager::Operation operation,
              const QNetworkRequest &request,
              const CannedResponse &response,
              QObject *parent = nullptr);

    void abort() override;
    qint64 bytesAvailable() const override;
    bool isSequential() const override { return true; }

protected:
    qint64 readData(char *data, qint64 maxSize) override;

private:
    QByteArray m_body;
    qint64 m_offset = 0;
};

// Serves queued responses in order and records every request. When the queue
// is empty the request fails like a refused connection.
class FakeNetworkManager : public QNetworkAccessManager
{
    Q_OBJECT
public:
    using QNetworkAccessManager::QNetworkAccessManager;

    void enqueue(int statusCode, const QByteArray &body);
    void enqueueJson(const QByteArray &json) { enqueue(200, json); }

    const QList<RecordedRequest> &requests() const { return m_requests; }

protected:
    QNetworkReply *createRequest(Operation op,
                                 const QNetworkRequest &request,
                                 QIODevice *outgoingData = nullptr) override;

private:
    QQueue<CannedResponse> m_responses;
    QList<RecordedRequest> m_requests;
};

QByteArray tokenOk(const QByteArray &accessToken = QByteArrayLiteral("tok-123"));

} // namespace phicore::tuya::ipc::test
