// Posix path helpers and multi-call operations built on RemoteClient.
#pragma once
#include "RemoteClient.hpp"
#include <set>
#include <string>
#include <vector>

namespace sitepush {

// "a", "b" -> "a/b"; never doubles the separator. Empty base yields "/name".
std::string joinRemotePath(const std::string& base, const std::string& name);

// Parent of a posix path: "/a/b" -> "/a", "a/b" -> "a", "a" -> "".
std::string remoteDirName(const std::string& path);

// Non-empty components of a posix path: "/a//b/" -> {"a", "b"}.
std::vector<std::string> splitRemotePath(const std::string& path);

// Create every component of an absolute path with MKD-like calls, starting
// from "/". Failures on individual components are ignored because the
// component usually exists already; only a lost connection makes this
// return false. When "known" is given, prefixes already in it are skipped
// and every prefix attempted is added, so repeated calls issue each MKD once.
bool makeDirs(RemoteClient& client, const std::string& remote_dir, RemoteError& err,
              std::set<std::string>* known = nullptr);

// Depth-first removal of a directory and everything beneath it. Stops at
// the first failure and reports it.
bool removeTree(RemoteClient& client, const std::string& remote_dir, RemoteError& err);

} // namespace sitepush
