// End-to-end deployment: clean the remote directory, upload the build and
// publish the entry document last.
#pragma once
#include "DeployConfig.hpp"
#include "DeployTypes.hpp"
#include "ResilientSession.hpp"

#include <QObject>
#include <memory>

namespace sitepush {

class LocalFileSystem;

class Deployer : public QObject {
    Q_OBJECT
public:
    // client is an unconnected backend matching config.protocol.
    Deployer(DeployConfig config, std::unique_ptr<RemoteClient> client,
             QObject *parent = nullptr);
    ~Deployer() override;

    // Defaults to QtLocalFileSystem.
    void setLocalFileSystem(std::shared_ptr<LocalFileSystem> fs);
    void setRetryPolicy(const RetryPolicy &policy) { policy_ = policy; }

    // Runs the whole sequence once. The connection is released before
    // returning, whatever the outcome.
    DeployReport run();

    DeployState state() const { return state_; }

signals:
    void phaseStarted(const QString &phase);
    void itemUploaded(const QString &remotePath);
    void itemSkipped(const QString &relativePath, const QString &reason);
    void itemFailed(const QString &path, const QString &error);
    void itemDeleted(const QString &remotePath);

private:
    DeployConfig config_;
    std::unique_ptr<RemoteClient> client_;
    std::shared_ptr<LocalFileSystem> fs_;
    RetryPolicy policy_;
    DeployState state_ = DeployState::Disconnected;

    bool ensureRemoteRoot(ResilientSession &session, QString &err);
    void createParentDirs(ResilientSession &session, const QStringList &files);
    enum class UploadOutcome { Uploaded, Vanished, Failed };

    UploadOutcome uploadFile(ResilientSession &session, const QString &rel,
                             DeployReport &report, QString &remotePath,
                             QString &err);
    // Skips and failures are recorded in the report; the run goes on.
    void uploadBestEffort(ResilientSession &session, const QString &rel,
                          DeployReport &report);
    bool uploadEntryDocument(ResilientSession &session, DeployReport &report,
                             QString &err);
    void advance(DeployState next);
};

} // namespace sitepush
