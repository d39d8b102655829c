#pragma once
#include "RemoteClient.hpp"
#include <string>
#include <vector>

// Forward declarations of the libssh2 internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sitepush {

class Libssh2SftpClient : public RemoteClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

  Libssh2SftpClient(const Libssh2SftpClient&) = delete;
  Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

  bool connect(const SessionOptions& opt, RemoteError& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }

  bool list(const std::string& remote_path,
            std::vector<RemoteEntry>& out,
            RemoteError& err) override;

  bool put(const std::string& local,
           const std::string& remote,
           RemoteError& err) override;

  bool changeDir(const std::string& remote_dir, RemoteError& err) override;
  bool mkdir(const std::string& remote_dir, RemoteError& err) override;
  bool removeFile(const std::string& remote_path, RemoteError& err) override;
  bool removeDir(const std::string& remote_dir, RemoteError& err) override;
  bool keepalive(RemoteError& err) override;

  std::unique_ptr<RemoteClient> newConnectionLike(const SessionOptions& opt,
                                                  RemoteError& err) override;

private:
  bool connected_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;
  std::string cwd_ = "/";
  SessionOptions opt_{};

  bool tcpConnect(const std::string& host, uint16_t port, RemoteError& err);
  bool sshHandshakeAuth(const SessionOptions& opt, RemoteError& err);
  bool verifyHostKey(const SessionOptions& opt, RemoteError& err);
  std::string absolutePath(const std::string& path) const;
  // Builds an error from the session's last libssh2/SFTP status.
  RemoteError lastError(const std::string& what) const;
};

} // namespace sitepush
