// Abstract interface for remote file operations. Concrete backends (libcurl
// FTP, libssh2 SFTP, the in-memory mock) implement this API so the deploy
// engine stays independent of the protocol in use.
#pragma once
#include "RemoteTypes.hpp"
#include <memory>

namespace sitepush {

class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, RemoteError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // One level of a remote directory. Relative paths resolve against the
    // working directory set by changeDir.
    virtual bool list(const std::string& remote_path,
                      std::vector<RemoteEntry>& out,
                      RemoteError& err) = 0;

    // Upload a local file, creating or truncating the remote one.
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     RemoteError& err) = 0;

    virtual bool changeDir(const std::string& remote_dir,
                           RemoteError& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       RemoteError& err) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            RemoteError& err) = 0;

    // Removes an empty directory. See removeTree() for the recursive form.
    virtual bool removeDir(const std::string& remote_dir,
                           RemoteError& err) = 0;

    // No-op round trip that keeps the control connection alive.
    virtual bool keepalive(RemoteError& err) = 0;

    // Create a new, connected client of the same kind with the given options.
    virtual std::unique_ptr<RemoteClient> newConnectionLike(const SessionOptions& opt,
                                                            RemoteError& err) = 0;
};

} // namespace sitepush
