// Owns the live remote connection and rebuilds it when the link drops.
#pragma once
#include "sitepush/RemoteClient.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sitepush {

struct RetryPolicy {
    int maxAttempts = 3;             // per upload, reconnects included
    int backoffMs = 2000;            // wait before each reconnect
    int keepaliveIntervalMs = 30000; // idle time that triggers a keepalive
    int keepaliveEveryNUploads = 10; // keepalive after every Nth upload
};

// All remote operations of a run go through this class. Callers never keep
// the RemoteClient pointer: a reconnect replaces it.
class ResilientSession {
public:
    ResilientSession(std::unique_ptr<RemoteClient> client, SessionOptions opt,
                     std::string remoteRoot, RetryPolicy policy = RetryPolicy());
    ~ResilientSession();

    ResilientSession(const ResilientSession &) = delete;
    ResilientSession &operator=(const ResilientSession &) = delete;

    bool connect(RemoteError &err);
    void close();
    bool isConnected() const;

    // Uploads with reconnect-and-retry on connection-class failures. Any
    // other failure, or the last attempt's failure, is returned as is.
    bool upload(const std::string &local, const std::string &remote,
                RemoteError &err);

    bool list(const std::string &path, std::vector<RemoteEntry> &out,
              RemoteError &err);
    bool changeDir(const std::string &path, RemoteError &err);
    bool makeDir(const std::string &path, RemoteError &err);
    // Creates every missing component of path. Directories this session has
    // already entered, created or attempted are not sent again.
    bool makeDirRecursive(const std::string &path, RemoteError &err);
    bool removeFile(const std::string &path, RemoteError &err);
    bool removeTree(const std::string &path, RemoteError &err);
    bool keepalive(RemoteError &err);

    const std::string &remoteRoot() const { return root_; }
    int reconnectCount() const { return reconnects_; }

private:
    std::unique_ptr<RemoteClient> client_;
    SessionOptions opt_;
    std::string root_;
    RetryPolicy policy_;
    int reconnects_ = 0;
    std::set<std::string> knownDirs_;

    // Drops the current connection, waits the backoff and replaces it with
    // a fresh one positioned at the remote root.
    bool reconnect(RemoteError &err);
};

} // namespace sitepush
