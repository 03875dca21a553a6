#pragma once

#include <functional>

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "tuya_http.h"
#include "tuya_token.h"
#include "tuya_types.h"

namespace phicore::tuya::ipc {

// Signed calls against the Tuya OpenAPI. Every call fetches its own token,
// so independent calls share no state.
class TuyaClient
{
public:
    using Clock = std::function<qint64()>;

    explicit TuyaClient(HttpClient *http);

    void setClock(Clock clock);
    void setTimeoutMs(int timeoutMs);
    int timeoutMs() const { return m_timeoutMs; }

    TokenResult fetchToken(const Credentials &creds) const;

    // Returns false and fills error on token, transport, HTTP, decode or
    // platform failure. On success out holds the decoded envelope.
    bool call(const Credentials &creds,
              const QByteArray &method,
              const QString &endpoint,
              const QueryMap &query,
              const QJsonObject &body,
              Envelope *out,
              TuyaError *error = nullptr) const;

private:
    qint64 now() const;

    HttpClient *m_http = nullptr;
    Clock m_clock;
    int m_timeoutMs = 10000;
};

} // namespace phicore::tuya::ipc
