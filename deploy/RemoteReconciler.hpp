// Removes stale remote content before a deployment uploads new files.
#pragma once
#include "DeployTypes.hpp"

#include <QStringList>

namespace sitepush {

class ResilientSession;

struct ReconcileReport {
    bool ok = false;     // false only when the directory could not be entered or listed
    QString error;
    QStringList deleted;   // absolute remote paths
    QStringList preserved; // names kept because of an exclusion
    QVector<ItemFailure> failures;
};

// Enters remoteDir, lists its immediate children and deletes every one not
// covered by the exclusions (directories recursively). Individual delete
// failures are logged and collected; the loop carries on.
ReconcileReport cleanupRemoteDirectory(ResilientSession &session,
                                       const QString &remoteDir,
                                       const QStringList &exclusions);

} // namespace sitepush
