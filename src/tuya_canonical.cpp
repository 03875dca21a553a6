#include "tuya_canonical.h"

#include <QStringList>
#include <QUrl>

namespace phicore::tuya::ipc {

namespace {

QString decodeComponent(QString text)
{
    text.replace(QLatin1Char('+'), QLatin1Char(' '));
    return QUrl::fromPercentEncoding(text.toUtf8());
}

} // namespace

QString CanonicalRequest::url() const
{
    if (queryString.isEmpty())
        return uri;
    return uri + QLatin1Char('?') + queryString;
}

QueryMap parseQueryString(const QString &query)
{
    QueryMap out;
    const QStringList pairs = query.split(QLatin1Char('&'), Qt::SkipEmptyParts);
    for (const QString &pair : pairs) {
        const int eq = pair.indexOf(QLatin1Char('='));
        const QString key = decodeComponent(eq < 0 ? pair : pair.left(eq));
        if (key.isEmpty())
            continue;
        out.insert(key, eq < 0 ? QString() : decodeComponent(pair.mid(eq + 1)));
    }
    return out;
}

CanonicalRequest canonicalize(const QString &path, const QueryMap &explicitQuery)
{
    CanonicalRequest out;
    out.uri = path.section(QLatin1Char('?'), 0, 0);
    const QString pathQuery = path.section(QLatin1Char('?'), 1, 1);

    // QMap keeps keys ordered by UTF-16 code unit, the same order a plain
    // lexicographic key sort produces.
    QueryMap merged = explicitQuery;
    const QueryMap fromPath = parseQueryString(pathQuery);
    for (auto it = fromPath.cbegin(); it != fromPath.cend(); ++it)
        merged.insert(it.key(), it.value());

    QStringList parts;
    parts.reserve(merged.size());
    for (auto it = merged.cbegin(); it != merged.cend(); ++it)
        parts.append(it.key() + QLatin1Char('=') + it.value());
    out.queryString = parts.join(QLatin1Char('&'));
    return out;
}

} // namespace phicore::tuya::ipc
