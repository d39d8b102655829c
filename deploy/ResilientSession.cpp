#include "ResilientSession.hpp"
#include "Logging.hpp"
#include "sitepush/RemoteTree.hpp"

#include <QString>
#include <QThread>

namespace sitepush {

namespace {

QString describe(const RemoteError &err) {
    return QStringLiteral("%1: %2")
        .arg(QString::fromLatin1(remoteErrorKindName(err.kind)),
             QString::fromStdString(err.message));
}

} // namespace

ResilientSession::ResilientSession(std::unique_ptr<RemoteClient> client,
                                   SessionOptions opt, std::string remoteRoot,
                                   RetryPolicy policy)
    : client_(std::move(client)), opt_(std::move(opt)),
      root_(std::move(remoteRoot)), policy_(policy) {
    if (policy_.maxAttempts < 1)
        policy_.maxAttempts = 1;
}

ResilientSession::~ResilientSession() { close(); }

bool ResilientSession::connect(RemoteError &err) {
    if (!client_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "no client");
        return false;
    }
    return client_->connect(opt_, err);
}

void ResilientSession::close() {
    if (client_ && client_->isConnected())
        client_->disconnect();
}

bool ResilientSession::isConnected() const {
    return client_ && client_->isConnected();
}

bool ResilientSession::reconnect(RemoteError &err) {
    close();
    if (policy_.backoffMs > 0)
        QThread::msleep(static_cast<unsigned long>(policy_.backoffMs));

    RemoteError connErr;
    std::unique_ptr<RemoteClient> fresh =
        client_->newConnectionLike(opt_, connErr);
    if (!fresh) {
        err = connErr;
        qCWarning(spXfer) << "Reconnect failed" << describe(connErr);
        return false;
    }
    client_ = std::move(fresh);
    ++reconnects_;
    qCInfo(spXfer) << "Reconnected to" << QString::fromStdString(opt_.host);

    RemoteError cdErr;
    if (!client_->changeDir(root_, cdErr)) {
        qCWarning(spXfer) << "Could not restore working directory"
                          << QString::fromStdString(root_) << describe(cdErr);
    }
    return true;
}

bool ResilientSession::upload(const std::string &local,
                              const std::string &remote, RemoteError &err) {
    int attempt = 1;
    for (;;) {
        if (client_->put(local, remote, err)) {
            err.clear();
            return true;
        }
        if (!err.isConnectionClass() || attempt >= policy_.maxAttempts)
            return false;

        qCWarning(spXfer) << "Connection lost while uploading"
                          << QString::fromStdString(remote) << describe(err)
                          << "attempt" << attempt << "of" << policy_.maxAttempts;
        // A failed reconnect consumes the attempt it was made for.
        bool reconnected = false;
        while (!reconnected && attempt < policy_.maxAttempts) {
            ++attempt;
            reconnected = reconnect(err);
        }
        if (!reconnected)
            return false;
    }
}

bool ResilientSession::list(const std::string &path,
                            std::vector<RemoteEntry> &out, RemoteError &err) {
    return client_->list(path, out, err);
}

bool ResilientSession::changeDir(const std::string &path, RemoteError &err) {
    if (!client_->changeDir(path, err))
        return false;
    knownDirs_.insert(path);
    return true;
}

bool ResilientSession::makeDir(const std::string &path, RemoteError &err) {
    if (!client_->mkdir(path, err))
        return false;
    knownDirs_.insert(path);
    return true;
}

bool ResilientSession::makeDirRecursive(const std::string &path,
                                        RemoteError &err) {
    return makeDirs(*client_, path, err, &knownDirs_);
}

bool ResilientSession::removeFile(const std::string &path, RemoteError &err) {
    return client_->removeFile(path, err);
}

bool ResilientSession::removeTree(const std::string &path, RemoteError &err) {
    return sitepush::removeTree(*client_, path, err);
}

bool ResilientSession::keepalive(RemoteError &err) {
    return client_->keepalive(err);
}

} // namespace sitepush
