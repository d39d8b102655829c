#pragma once
#include "RemoteClient.hpp"
#include <map>
#include <memory>
#include <set>

namespace sitepush {

struct MockOp {
  enum class Type { Connect, List, Put, ChangeDir, Mkdir, RemoveFile, RemoveDir, Keepalive };
  Type type;
  std::string path;
  bool ok = true;
};

// In-memory "remote server". Shared by every MockRemoteClient created from
// it (including newConnectionLike clones), so its contents survive
// reconnects the way a real server's would.
class MockRemoteFs {
public:
  void addDir(const std::string& path);  // creates missing parents
  void addFile(const std::string& path, const std::string& content = {});

  bool hasDir(const std::string& path) const { return dirs_.count(path) > 0; }
  bool hasFile(const std::string& path) const { return files_.count(path) > 0; }
  std::string content(const std::string& path) const;
  std::vector<std::string> files() const;

  // The next "times" calls of "op" on "path" fail with "err". An empty path
  // matches any path. A connection-class error also drops the client.
  void failNext(MockOp::Type op, const std::string& path, RemoteError err, int times = 1);

  const std::vector<MockOp>& ops() const { return ops_; }
  int count(MockOp::Type type, bool okOnly = true) const;
  // Paths of successful uploads, in order.
  std::vector<std::string> uploads() const;

private:
  friend class MockRemoteClient;

  struct Failure {
    MockOp::Type op;
    std::string path;
    RemoteError err;
    int remaining;
  };

  std::set<std::string> dirs_ = {"/"};
  std::map<std::string, std::string> files_;
  std::vector<MockOp> ops_;
  std::vector<Failure> failures_;

  bool takeFailure(MockOp::Type op, const std::string& path, RemoteError& err);
  void record(MockOp::Type op, const std::string& path, bool ok);
  bool hasChildren(const std::string& dir) const;
};

class MockRemoteClient : public RemoteClient {
public:
  MockRemoteClient();
  explicit MockRemoteClient(std::shared_ptr<MockRemoteFs> fs);

  const std::shared_ptr<MockRemoteFs>& fs() const { return fs_; }

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
  std::shared_ptr<MockRemoteFs> fs_;
  bool connected_ = false;
  SessionOptions lastOpt_{};
  std::string cwd_ = "/";

  std::string resolve(const std::string& path) const;
  // Common prologue: connection check, failure injection, op logging.
  bool begin(MockOp::Type op, const std::string& path, RemoteError& err);
};

} // namespace sitepush
