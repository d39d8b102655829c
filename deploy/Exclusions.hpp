// Paths protected from deletion on the server and skipped on upload.
#pragma once
#include <QString>
#include <QStringList>

namespace sitepush {

// Comma separated list; segments are trimmed and empty ones dropped.
QStringList parseExclusions(const QString &raw);

// True when path equals a rule or lies beneath it ("rule/..."). Literal,
// case-sensitive comparison; no wildcards.
bool isExcluded(const QString &path, const QStringList &exclusions);

} // namespace sitepush
