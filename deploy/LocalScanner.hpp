// Recursive enumeration of the local build tree.
#pragma once
#include <QString>
#include <QStringList>
#include <QVector>

namespace sitepush {

struct LocalDirEntry {
    enum class Kind { File, Dir, Other };
    QString name;
    Kind kind = Kind::Other;
};

// Minimal filesystem surface needed by the scanner and the deployer.
class LocalFileSystem {
public:
    virtual ~LocalFileSystem() = default;

    // Immediate children of absPath, "." and ".." excluded.
    virtual bool listDir(const QString &absPath, QVector<LocalDirEntry> &out,
                         QString &err) = 0;
    virtual bool isDir(const QString &absPath) const = 0;
    virtual bool isFile(const QString &absPath) const = 0;
};

// QDir backed implementation. Hidden files are included, symlinks are
// followed, entries are listed by name.
class QtLocalFileSystem : public LocalFileSystem {
public:
    bool listDir(const QString &absPath, QVector<LocalDirEntry> &out,
                 QString &err) override;
    bool isDir(const QString &absPath) const override;
    bool isFile(const QString &absPath) const override;
};

// Appends to out the posix path, relative to root, of every regular file
// under root. Each candidate is tested against the exclusions before it is
// descended into, so excluded directories are never listed. Fails when
// root or any directory beneath it cannot be listed.
bool scanLocalTree(LocalFileSystem &fs, const QString &root,
                   const QStringList &exclusions, QStringList &out,
                   QString &err);

} // namespace sitepush
