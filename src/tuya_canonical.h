#pragma once

#include <QString>

#include "tuya_types.h"

namespace phicore::tuya::ipc {

struct CanonicalRequest {
    QString uri;
    QString queryString;

    QString url() const;
};

// Parses "a=1&b=2" style query strings. '+' decodes to a space and a bare key
// yields an empty value. The last occurrence of a repeated key wins.
QueryMap parseQueryString(const QString &query);

// Builds the canonical URL used in the string-to-sign. Parameters from the
// path's own query string override explicit ones with the same key; the
// merged set is emitted sorted by key, unencoded.
CanonicalRequest canonicalize(const QString &path, const QueryMap &explicitQuery = {});

} // namespace phicore::tuya::ipc
