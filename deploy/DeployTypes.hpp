// Values reported by a deployment run.
#pragma once
#include <QString>
#include <QVector>

namespace sitepush {

// Progress of Deployer::run(). Failed is terminal and reachable from any
// state before Done.
enum class DeployState {
    Disconnected,
    Connected,
    RootEnsured,
    Cleaned,
    BulkUploaded,
    EntryUploaded,
    Done,
    Failed
};

const char *deployStateName(DeployState state);

// A non-fatal failure on a single remote path (delete or upload).
struct ItemFailure {
    QString path;
    QString error;
};

struct DeployReport {
    bool ok = false;
    DeployState state = DeployState::Disconnected;
    // State in which a fatal error occurred (meaningful only when !ok).
    DeployState failedIn = DeployState::Disconnected;
    QString error;
    int uploaded = 0;
    int skipped = 0;
    int deleted = 0;
    int preserved = 0;
    int reconnects = 0;
    QVector<ItemFailure> failures;
};

} // namespace sitepush
