#include "sitepush/MockRemoteClient.hpp"
#include "sitepush/RemoteTree.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace sitepush {

namespace {

std::string normalize(const std::string& path) {
  std::vector<std::string> out;
  for (const auto& part : splitRemotePath(path)) {
    if (part == ".") continue;
    if (part == "..") {
      if (!out.empty()) out.pop_back();
      continue;
    }
    out.push_back(part);
  }
  std::string result;
  for (const auto& part : out) result += "/" + part;
  return result.empty() ? "/" : result;
}

RemoteError replyError(long code, const std::string& msg) {
  return makeRemoteError(RemoteErrorKind::Protocol, std::to_string(code) + " " + msg, code);
}

} // namespace

// ---- MockRemoteFs ----

void MockRemoteFs::addDir(const std::string& path) {
  std::string current = "/";
  for (const auto& part : splitRemotePath(path)) {
    current = joinRemotePath(current, part);
    dirs_.insert(current);
  }
}

void MockRemoteFs::addFile(const std::string& path, const std::string& content) {
  const std::string p = normalize(path);
  addDir(remoteDirName(p));
  files_[p] = content;
}

std::string MockRemoteFs::content(const std::string& path) const {
  auto it = files_.find(path);
  return it == files_.end() ? std::string() : it->second;
}

std::vector<std::string> MockRemoteFs::files() const {
  std::vector<std::string> out;
  for (const auto& kv : files_) out.push_back(kv.first);
  return out;
}

void MockRemoteFs::failNext(MockOp::Type op, const std::string& path, RemoteError err, int times) {
  failures_.push_back({op, path.empty() ? std::string() : normalize(path), std::move(err), times});
}

int MockRemoteFs::count(MockOp::Type type, bool okOnly) const {
  return static_cast<int>(std::count_if(ops_.begin(), ops_.end(), [&](const MockOp& o) {
    return o.type == type && (o.ok || !okOnly);
  }));
}

std::vector<std::string> MockRemoteFs::uploads() const {
  std::vector<std::string> out;
  for (const auto& o : ops_)
    if (o.type == MockOp::Type::Put && o.ok) out.push_back(o.path);
  return out;
}

bool MockRemoteFs::takeFailure(MockOp::Type op, const std::string& path, RemoteError& err) {
  for (auto& f : failures_) {
    if (f.op != op || f.remaining <= 0) continue;
    if (!f.path.empty() && f.path != path) continue;
    --f.remaining;
    err = f.err;
    return true;
  }
  return false;
}

void MockRemoteFs::record(MockOp::Type op, const std::string& path, bool ok) {
  ops_.push_back({op, path, ok});
}

bool MockRemoteFs::hasChildren(const std::string& dir) const {
  const std::string prefix = dir == "/" ? dir : dir + "/";
  auto startsWithPrefix = [&prefix](const std::string& p) {
    return p.size() > prefix.size() && p.compare(0, prefix.size(), prefix) == 0;
  };
  return std::any_of(dirs_.begin(), dirs_.end(), startsWithPrefix) ||
         std::any_of(files_.begin(), files_.end(),
                     [&](const std::pair<const std::string, std::string>& kv) {
                       return startsWithPrefix(kv.first);
                     });
}

// ---- MockRemoteClient ----

MockRemoteClient::MockRemoteClient() : fs_(std::make_shared<MockRemoteFs>()) {}

MockRemoteClient::MockRemoteClient(std::shared_ptr<MockRemoteFs> fs) : fs_(std::move(fs)) {}

std::string MockRemoteClient::resolve(const std::string& path) const {
  if (!path.empty() && path.front() == '/') return normalize(path);
  return normalize(joinRemotePath(cwd_, path));
}

bool MockRemoteClient::begin(MockOp::Type op, const std::string& path, RemoteError& err) {
  if (!connected_) {
    fs_->record(op, path, false);
    err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
    return false;
  }
  if (fs_->takeFailure(op, path, err)) {
    fs_->record(op, path, false);
    if (err.isConnectionClass()) connected_ = false;
    return false;
  }
  return true;
}

bool MockRemoteClient::connect(const SessionOptions& opt, RemoteError& err) {
  if (opt.host.empty() || opt.username.empty()) {
    err = makeRemoteError(RemoteErrorKind::Auth, "host and username are required");
    return false;
  }
  if (fs_->takeFailure(MockOp::Type::Connect, std::string(), err)) {
    fs_->record(MockOp::Type::Connect, opt.host, false);
    return false;
  }
  fs_->record(MockOp::Type::Connect, opt.host, true);
  connected_ = true;
  lastOpt_ = opt;
  cwd_ = "/";
  return true;
}

void MockRemoteClient::disconnect() {
  connected_ = false;
}

bool MockRemoteClient::list(const std::string& remote_path,
                            std::vector<RemoteEntry>& out,
                            RemoteError& err) {
  const std::string dir = resolve(remote_path);
  if (!begin(MockOp::Type::List, dir, err)) return false;
  if (!fs_->hasDir(dir)) {
    fs_->record(MockOp::Type::List, dir, false);
    err = replyError(550, "No such directory: " + dir);
    return false;
  }
  out.clear();
  for (const auto& d : fs_->dirs_) {
    if (d != "/" && remoteDirName(d) == dir)
      out.push_back({d.substr(d.rfind('/') + 1), true, 0, 0});
  }
  for (const auto& kv : fs_->files_) {
    if (remoteDirName(kv.first) == dir)
      out.push_back({kv.first.substr(kv.first.rfind('/') + 1), false, kv.second.size(), 0});
  }
  std::sort(out.begin(), out.end(), [](const RemoteEntry& a, const RemoteEntry& b) {
    if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
    return a.name < b.name;
  });
  fs_->record(MockOp::Type::List, dir, true);
  return true;
}

bool MockRemoteClient::put(const std::string& local,
                           const std::string& remote,
                           RemoteError& err) {
  const std::string path = resolve(remote);
  if (!begin(MockOp::Type::Put, path, err)) return false;
  std::ifstream in(local, std::ios::binary);
  if (!in.is_open()) {
    fs_->record(MockOp::Type::Put, path, false);
    err = makeRemoteError(RemoteErrorKind::LocalIo, "cannot open local file: " + local);
    return false;
  }
  if (!fs_->hasDir(remoteDirName(path)) || fs_->hasDir(path)) {
    fs_->record(MockOp::Type::Put, path, false);
    err = replyError(553, "Could not create file: " + path);
    return false;
  }
  fs_->files_[path].assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  fs_->record(MockOp::Type::Put, path, true);
  return true;
}

bool MockRemoteClient::changeDir(const std::string& remote_dir, RemoteError& err) {
  const std::string dir = resolve(remote_dir);
  if (!begin(MockOp::Type::ChangeDir, dir, err)) return false;
  if (!fs_->hasDir(dir)) {
    fs_->record(MockOp::Type::ChangeDir, dir, false);
    err = replyError(550, "Failed to change directory: " + dir);
    return false;
  }
  cwd_ = dir;
  fs_->record(MockOp::Type::ChangeDir, dir, true);
  return true;
}

bool MockRemoteClient::mkdir(const std::string& remote_dir, RemoteError& err) {
  const std::string dir = resolve(remote_dir);
  if (!begin(MockOp::Type::Mkdir, dir, err)) return false;
  if (fs_->hasDir(dir) || fs_->hasFile(dir) || !fs_->hasDir(remoteDirName(dir))) {
    fs_->record(MockOp::Type::Mkdir, dir, false);
    err = replyError(550, "Create directory operation failed: " + dir);
    return false;
  }
  fs_->dirs_.insert(dir);
  fs_->record(MockOp::Type::Mkdir, dir, true);
  return true;
}

bool MockRemoteClient::removeFile(const std::string& remote_path, RemoteError& err) {
  const std::string path = resolve(remote_path);
  if (!begin(MockOp::Type::RemoveFile, path, err)) return false;
  if (fs_->files_.erase(path) == 0) {
    fs_->record(MockOp::Type::RemoveFile, path, false);
    err = replyError(550, "Delete operation failed: " + path);
    return false;
  }
  fs_->record(MockOp::Type::RemoveFile, path, true);
  return true;
}

bool MockRemoteClient::removeDir(const std::string& remote_dir, RemoteError& err) {
  const std::string dir = resolve(remote_dir);
  if (!begin(MockOp::Type::RemoveDir, dir, err)) return false;
  if (dir == "/" || !fs_->hasDir(dir) || fs_->hasChildren(dir)) {
    fs_->record(MockOp::Type::RemoveDir, dir, false);
    err = replyError(550, "Remove directory operation failed: " + dir);
    return false;
  }
  fs_->dirs_.erase(dir);
  fs_->record(MockOp::Type::RemoveDir, dir, true);
  return true;
}

bool MockRemoteClient::keepalive(RemoteError& err) {
  if (!begin(MockOp::Type::Keepalive, std::string(), err)) return false;
  fs_->record(MockOp::Type::Keepalive, std::string(), true);
  return true;
}

std::unique_ptr<RemoteClient> MockRemoteClient::newConnectionLike(const SessionOptions& opt,
                                                                  RemoteError& err) {
  auto ptr = std::make_unique<MockRemoteClient>(fs_);
  if (!ptr->connect(opt, err)) return nullptr;
  return ptr;
}

} // namespace sitepush
