#include "RemoteReconciler.hpp"
#include "Exclusions.hpp"
#include "Logging.hpp"
#include "ResilientSession.hpp"
#include "sitepush/RemoteTree.hpp"

namespace sitepush {

ReconcileReport cleanupRemoteDirectory(ResilientSession &session,
                                       const QString &remoteDir,
                                       const QStringList &exclusions) {
    ReconcileReport report;
    const std::string dir = remoteDir.toStdString();

    RemoteError err;
    if (!session.changeDir(dir, err)) {
        report.error = QStringLiteral("Cannot enter remote directory %1: %2")
                           .arg(remoteDir, QString::fromStdString(err.message));
        return report;
    }
    std::vector<RemoteEntry> entries;
    if (!session.list(dir, entries, err)) {
        report.error = QStringLiteral("Cannot list remote directory %1: %2")
                           .arg(remoteDir, QString::fromStdString(err.message));
        return report;
    }
    report.ok = true;

    for (const RemoteEntry &e : entries) {
        const QString name = QString::fromStdString(e.name);
        if (isExcluded(name, exclusions)) {
            qCInfo(spXfer) << "Preserving excluded remote entry" << name;
            report.preserved << name;
            continue;
        }
        const std::string path = joinRemotePath(dir, e.name);
        RemoteError delErr;
        const bool removed = e.is_dir ? session.removeTree(path, delErr)
                                      : session.removeFile(path, delErr);
        const QString qpath = QString::fromStdString(path);
        if (!removed) {
            qCWarning(spXfer) << "Could not delete" << qpath
                              << QString::fromStdString(delErr.message);
            report.failures.push_back(
                {qpath, QString::fromStdString(delErr.message)});
            continue;
        }
        qCInfo(spXfer) << "Deleted" << qpath;
        report.deleted << qpath;
    }
    return report;
}

} // namespace sitepush
