#include "Exclusions.hpp"

namespace sitepush {

QStringList parseExclusions(const QString &raw) {
    QStringList out;
    const QStringList parts = raw.split(QLatin1Char(','));
    for (const QString &part : parts) {
        const QString rule = part.trimmed();
        if (!rule.isEmpty())
            out << rule;
    }
    return out;
}

bool isExcluded(const QString &path, const QStringList &exclusions) {
    for (const QString &rule : exclusions) {
        if (path == rule)
            return true;
        if (path.size() > rule.size() && path.startsWith(rule) &&
            path.at(rule.size()) == QLatin1Char('/'))
            return true;
    }
    return false;
}

} // namespace sitepush
