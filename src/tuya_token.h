#pragma once

#include <QString>

#include "tuya_http.h"
#include "tuya_types.h"

namespace phicore::tuya::ipc {

inline constexpr const char kTokenPath[] = "/v1.0/token?grant_type=1";

struct TokenResult {
    bool ok = false;
    QString accessToken;
    QString refreshToken;
    QString uid;
    int expireTimeSec = 0;
    TuyaError error;
};

// Requests a fresh access token. Nothing is cached between calls.
TokenResult acquireToken(HttpClient &http,
                         const Credentials &creds,
                         qint64 timestampMs,
                         int timeoutMs = 10000);

} // namespace phicore::tuya::ipc
