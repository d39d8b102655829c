#include "Deployer.hpp"
#include "LocalScanner.hpp"
#include "Logging.hpp"
#include "RemoteReconciler.hpp"
#include "sitepush/RemoteTree.hpp"

#include <QElapsedTimer>
#include <QSet>

namespace sitepush {

const char *deployStateName(DeployState state) {
    switch (state) {
    case DeployState::Disconnected:
        return "Disconnected";
    case DeployState::Connected:
        return "Connected";
    case DeployState::RootEnsured:
        return "RootEnsured";
    case DeployState::Cleaned:
        return "Cleaned";
    case DeployState::BulkUploaded:
        return "BulkUploaded";
    case DeployState::EntryUploaded:
        return "EntryUploaded";
    case DeployState::Done:
        return "Done";
    case DeployState::Failed:
        return "Failed";
    }
    return "Unknown";
}

namespace {

QString errorText(const RemoteError &err) {
    return QString::fromStdString(err.message);
}

QString localPath(const QString &root, const QString &rel) {
    if (root.endsWith(QLatin1Char('/')))
        return root + rel;
    return root + QLatin1Char('/') + rel;
}

} // namespace

Deployer::Deployer(DeployConfig config, std::unique_ptr<RemoteClient> client,
                   QObject *parent)
    : QObject(parent), config_(std::move(config)), client_(std::move(client)),
      fs_(std::make_shared<QtLocalFileSystem>()) {}

Deployer::~Deployer() = default;

void Deployer::setLocalFileSystem(std::shared_ptr<LocalFileSystem> fs) {
    if (fs)
        fs_ = std::move(fs);
}

void Deployer::advance(DeployState next) {
    state_ = next;
    qCDebug(spDeploy) << "State" << deployStateName(next);
}

DeployReport Deployer::run() {
    DeployReport report;
    state_ = DeployState::Disconnected;

    auto fail = [&](const QString &msg) {
        report.ok = false;
        report.failedIn = state_;
        report.error = msg;
        state_ = DeployState::Failed;
        report.state = state_;
        qCCritical(spDeploy).noquote() << "Deployment failed:" << msg;
        if (config_.verbose) {
            qCCritical(spDeploy) << "Failed in state"
                                 << deployStateName(report.failedIn);
            for (const ItemFailure &f : report.failures)
                qCCritical(spDeploy) << "  item" << f.path << f.error;
        }
        return report;
    };

    if (!client_)
        return fail(QStringLiteral("Deployer has no remote client (run() may only be called once)"));

    // Nothing touches the server unless the build exists.
    if (!fs_->isDir(config_.buildDir))
        return fail(QStringLiteral("Local build directory does not exist: %1")
                        .arg(config_.buildDir));

    SessionOptions opt = config_.toSessionOptions();
    if (config_.verbose) {
        opt.trace_cb = [](const std::string &line) {
            qCDebug(spProto).noquote() << QString::fromStdString(line);
        };
    }
    ResilientSession session(std::move(client_), opt,
                             config_.remoteDir.toStdString(), policy_);

    emit phaseStarted(QStringLiteral("connect"));
    qCInfo(spDeploy) << "Connecting to" << config_.host << "port" << config_.port;
    RemoteError err;
    if (!session.connect(err))
        return fail(QStringLiteral("Connection to %1 failed: %2")
                        .arg(config_.host, errorText(err)));
    advance(DeployState::Connected);

    emit phaseStarted(QStringLiteral("ensure-root"));
    QString msg;
    if (!ensureRemoteRoot(session, msg))
        return fail(msg);
    advance(DeployState::RootEnsured);

    emit phaseStarted(QStringLiteral("cleanup"));
    qCInfo(spDeploy) << "Cleaning remote directory" << config_.remoteDir;
    const ReconcileReport rr =
        cleanupRemoteDirectory(session, config_.remoteDir, config_.exclusions);
    if (!rr.ok)
        return fail(rr.error);
    report.deleted = rr.deleted.size();
    report.preserved = rr.preserved.size();
    for (const QString &path : rr.deleted)
        emit itemDeleted(path);
    for (const ItemFailure &f : rr.failures) {
        report.failures.push_back(f);
        emit itemFailed(f.path, f.error);
    }
    advance(DeployState::Cleaned);

    emit phaseStarted(QStringLiteral("upload"));
    QStringList files;
    if (!scanLocalTree(*fs_, config_.buildDir, config_.exclusions, files, msg))
        return fail(QStringLiteral("Scanning %1 failed: %2")
                        .arg(config_.buildDir, msg));

    // Only a root level file can be the entry document.
    const bool hasEntry = files.removeAll(config_.entryDocument) > 0;
    qCInfo(spDeploy) << "Uploading" << files.size() << "file(s)"
                     << (hasEntry ? "plus entry document" : "without entry document");
    createParentDirs(session, files);

    QElapsedTimer sinceKeepalive;
    sinceKeepalive.start();
    auto sendKeepalive = [&]() {
        RemoteError kaErr;
        if (!session.keepalive(kaErr))
            qCDebug(spXfer) << "Keepalive failed" << errorText(kaErr);
        sinceKeepalive.restart();
    };

    for (const QString &rel : files) {
        if (sinceKeepalive.elapsed() > policy_.keepaliveIntervalMs)
            sendKeepalive();
        const int before = report.uploaded;
        uploadBestEffort(session, rel, report);
        if (report.uploaded != before && policy_.keepaliveEveryNUploads > 0 &&
            report.uploaded % policy_.keepaliveEveryNUploads == 0)
            sendKeepalive();
    }
    advance(DeployState::BulkUploaded);

    emit phaseStarted(QStringLiteral("entry-document"));
    if (!hasEntry) {
        qCInfo(spDeploy) << "No" << config_.entryDocument
                         << "in the build; nothing to publish last";
    } else if (!uploadEntryDocument(session, report, msg)) {
        report.reconnects = session.reconnectCount();
        return fail(msg);
    }
    advance(DeployState::EntryUploaded);

    report.reconnects = session.reconnectCount();
    session.close();
    advance(DeployState::Done);
    report.ok = true;
    report.state = state_;
    qCInfo(spDeploy) << "Deployment finished:" << report.uploaded << "uploaded,"
                     << report.deleted << "deleted," << report.preserved
                     << "preserved," << report.skipped << "skipped,"
                     << report.failures.size() << "failure(s)";
    return report;
}

bool Deployer::ensureRemoteRoot(ResilientSession &session, QString &err) {
    RemoteError e;
    if (!session.changeDir("/", e)) {
        err = QStringLiteral("Cannot enter remote /: %1").arg(errorText(e));
        return false;
    }
    std::string current = "/";
    for (const std::string &part : splitRemotePath(session.remoteRoot())) {
        current = joinRemotePath(current, part);
        if (session.changeDir(current, e))
            continue;
        if (e.isConnectionClass()) {
            err = QStringLiteral("Connection lost while entering %1: %2")
                      .arg(QString::fromStdString(current), errorText(e));
            return false;
        }
        RemoteError mk;
        if (session.makeDir(current, mk))
            qCInfo(spXfer) << "Created remote directory"
                           << QString::fromStdString(current);
        else
            qCDebug(spXfer) << "Create" << QString::fromStdString(current)
                            << "failed, entering anyway:" << errorText(mk);
        if (!session.changeDir(current, e)) {
            err = QStringLiteral("Cannot create or enter remote directory %1: %2")
                      .arg(QString::fromStdString(current), errorText(e));
            return false;
        }
    }
    return true;
}

void Deployer::createParentDirs(ResilientSession &session,
                                const QStringList &files) {
    QSet<QString> seen;
    for (const QString &rel : files) {
        const int slash = rel.lastIndexOf(QLatin1Char('/'));
        if (slash <= 0)
            continue;
        const QString parent = rel.left(slash);
        if (seen.contains(parent))
            continue;
        seen.insert(parent);
        const std::string remote =
            joinRemotePath(session.remoteRoot(), parent.toStdString());
        RemoteError e;
        // Components that already exist are tolerated inside makeDirRecursive;
        // only a lost connection gets here.
        if (!session.makeDirRecursive(remote, e))
            qCWarning(spXfer) << "Could not create remote directory"
                              << QString::fromStdString(remote) << errorText(e);
    }
}

Deployer::UploadOutcome Deployer::uploadFile(ResilientSession &session,
                                             const QString &rel,
                                             DeployReport &report,
                                             QString &remotePath,
                                             QString &err) {
    const QString local = localPath(config_.buildDir, rel);
    const std::string remote =
        joinRemotePath(session.remoteRoot(), rel.toStdString());
    remotePath = QString::fromStdString(remote);

    if (!fs_->isFile(local)) {
        err = QStringLiteral("%1 disappeared before it could be uploaded").arg(local);
        return UploadOutcome::Vanished;
    }
    RemoteError e;
    if (!session.upload(local.toStdString(), remote, e)) {
        err = errorText(e);
        return UploadOutcome::Failed;
    }
    ++report.uploaded;
    qCInfo(spXfer) << "Uploaded" << remotePath;
    emit itemUploaded(remotePath);
    return UploadOutcome::Uploaded;
}

void Deployer::uploadBestEffort(ResilientSession &session, const QString &rel,
                                DeployReport &report) {
    QString remotePath;
    QString err;
    switch (uploadFile(session, rel, report, remotePath, err)) {
    case UploadOutcome::Uploaded:
        break;
    case UploadOutcome::Vanished:
        qCWarning(spXfer) << "Skipping" << rel << "(removed since the scan)";
        ++report.skipped;
        emit itemSkipped(rel, QStringLiteral("removed since the scan"));
        break;
    case UploadOutcome::Failed:
        qCWarning(spXfer) << "Upload failed" << remotePath << err;
        report.failures.push_back({remotePath, err});
        emit itemFailed(remotePath, err);
        break;
    }
}

bool Deployer::uploadEntryDocument(ResilientSession &session,
                                   DeployReport &report, QString &err) {
    QString remotePath;
    QString why;
    switch (uploadFile(session, config_.entryDocument, report, remotePath, why)) {
    case UploadOutcome::Uploaded:
        return true;
    case UploadOutcome::Vanished:
        err = why;
        return false;
    case UploadOutcome::Failed:
        err = QStringLiteral("Upload of %1 failed: %2").arg(remotePath, why);
        return false;
    }
    return false;
}

} // namespace sitepush
