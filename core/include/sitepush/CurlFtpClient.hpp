#pragma once
#include "RemoteClient.hpp"
#include <curl/curl.h>
#include <string>
#include <vector>

namespace sitepush {

// FTP / explicit FTPS backend. One libcurl easy handle is kept for the whole
// session so the control connection is reused between operations.
class CurlFtpClient : public RemoteClient {
public:
  CurlFtpClient();
  ~CurlFtpClient() override;

  CurlFtpClient(const CurlFtpClient&) = delete;
  CurlFtpClient& operator=(const CurlFtpClient&) = delete;

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

  // Listing parsers, exposed for tests.
  static std::vector<RemoteEntry> parseMlsd(const std::string& raw);
  static std::vector<RemoteEntry> parseList(const std::string& raw);
  // True for the replies that mean a command argument is not understood.
  static bool isOptionRejected(long reply);

private:
  CURL* easy_ = nullptr;
  bool connected_ = false;
  bool mlsd_ = false;        // server advertised MLST in FEAT
  bool listDashA_ = true;    // cleared once the server rejects "LIST -a"
  std::string cwd_ = "/";
  SessionOptions opt_{};

  std::string absolutePath(const std::string& path) const;
  std::string urlFor(const std::string& absPath, bool isDir) const;

  // Runs one request on the shared handle. "setup" adds request specific
  // options after the session defaults; server replies land in "replies".
  template <class SetupFn>
  bool perform(const std::string& absPath, bool isDir, curl_ftpmethod method,
               SetupFn&& setup, std::string& replies, RemoteError& err);

  // Sends a raw command (MKD, DELE, RMD, NOOP...) through CURLOPT_QUOTE.
  bool runCommand(const std::string& cmd, std::string& replies, RemoteError& err);
};

} // namespace sitepush
