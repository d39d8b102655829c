#include "LocalScanner.hpp"
#include "Exclusions.hpp"
#include "Logging.hpp"

#include <QDir>
#include <QFileInfo>

namespace sitepush {

bool QtLocalFileSystem::listDir(const QString &absPath,
                                QVector<LocalDirEntry> &out, QString &err) {
    QDir dir(absPath);
    if (!dir.exists() || !dir.isReadable()) {
        err = QStringLiteral("Cannot read directory: %1").arg(absPath);
        return false;
    }
    const QFileInfoList infos =
        dir.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System |
                              QDir::NoDotAndDotDot,
                          QDir::Name);
    out.clear();
    out.reserve(infos.size());
    for (const QFileInfo &fi : infos) {
        LocalDirEntry e;
        e.name = fi.fileName();
        if (fi.isDir())
            e.kind = LocalDirEntry::Kind::Dir;
        else if (fi.isFile())
            e.kind = LocalDirEntry::Kind::File;
        out.push_back(e);
    }
    return true;
}

bool QtLocalFileSystem::isDir(const QString &absPath) const {
    return QFileInfo(absPath).isDir();
}

bool QtLocalFileSystem::isFile(const QString &absPath) const {
    return QFileInfo(absPath).isFile();
}

namespace {

bool scanDir(LocalFileSystem &fs, const QString &root, const QString &rel,
             const QStringList &exclusions, QStringList &out, QString &err) {
    QString abs = root;
    if (!rel.isEmpty())
        abs += root.endsWith(QLatin1Char('/')) ? rel : QStringLiteral("/") + rel;
    QVector<LocalDirEntry> entries;
    if (!fs.listDir(abs, entries, err))
        return false;
    for (const LocalDirEntry &e : entries) {
        const QString childRel =
            rel.isEmpty() ? e.name : rel + QLatin1Char('/') + e.name;
        if (isExcluded(childRel, exclusions)) {
            qCDebug(spDeploy) << "Skipping excluded path" << childRel;
            continue;
        }
        switch (e.kind) {
        case LocalDirEntry::Kind::File:
            out << childRel;
            break;
        case LocalDirEntry::Kind::Dir:
            if (!scanDir(fs, root, childRel, exclusions, out, err))
                return false;
            break;
        case LocalDirEntry::Kind::Other:
            qCDebug(spDeploy) << "Ignoring special file" << childRel;
            break;
        }
    }
    return true;
}

} // namespace

bool scanLocalTree(LocalFileSystem &fs, const QString &root,
                   const QStringList &exclusions, QStringList &out,
                   QString &err) {
    QString base = root;
    while (base.size() > 1 && base.endsWith(QLatin1Char('/')))
        base.chop(1);
    return scanDir(fs, base, QString(), exclusions, out, err);
}

} // namespace sitepush
