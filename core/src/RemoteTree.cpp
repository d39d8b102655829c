#include "sitepush/RemoteTree.hpp"

namespace sitepush {

const char* remoteErrorKindName(RemoteErrorKind kind) {
    switch (kind) {
    case RemoteErrorKind::None:
        return "none";
    case RemoteErrorKind::NotConnected:
        return "not-connected";
    case RemoteErrorKind::Connection:
        return "connection";
    case RemoteErrorKind::Auth:
        return "auth";
    case RemoteErrorKind::Protocol:
        return "protocol";
    case RemoteErrorKind::LocalIo:
        return "local-io";
    case RemoteErrorKind::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

std::string joinRemotePath(const std::string& base, const std::string& name) {
    std::string tail = name;
    while (!tail.empty() && tail.front() == '/')
        tail.erase(tail.begin());
    if (base.empty())
        return std::string("/") + tail;
    if (tail.empty())
        return base;
    if (base.back() == '/')
        return base + tail;
    return base + "/" + tail;
}

std::string remoteDirName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.rfind('/');
    if (pos == std::string::npos)
        return {};
    if (pos == 0)
        return "/";
    return p.substr(0, pos);
}

std::vector<std::string> splitRemotePath(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty())
                parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        parts.push_back(cur);
    return parts;
}

bool makeDirs(RemoteClient& client, const std::string& remote_dir, RemoteError& err,
              std::set<std::string>* known) {
    if (!client.isConnected()) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    std::string current = "/";
    for (const auto& part : splitRemotePath(remote_dir)) {
        current = joinRemotePath(current, part);
        if (known && known->count(current) > 0)
            continue;
        RemoteError ignored;
        if (!client.mkdir(current, ignored) && ignored.isConnectionClass()) {
            err = ignored;
            return false;
        }
        if (known)
            known->insert(current);
    }
    return true;
}

bool removeTree(RemoteClient& client, const std::string& remote_dir, RemoteError& err) {
    std::vector<RemoteEntry> children;
    if (!client.list(remote_dir, children, err))
        return false;
    for (const auto& child : children) {
        const std::string path = joinRemotePath(remote_dir, child.name);
        const bool ok = child.is_dir ? removeTree(client, path, err)
                                     : client.removeFile(path, err);
        if (!ok)
            return false;
    }
    return client.removeDir(remote_dir, err);
}

} // namespace sitepush
