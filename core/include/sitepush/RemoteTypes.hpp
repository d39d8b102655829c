// Basic types shared between the protocol backends and the deploy engine.
// Keep these structures plain so the deploy layer can copy them freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sitepush {

enum class Protocol {
    Ftp,  // FTP, optionally upgraded with AUTH TLS (see SessionOptions::secure)
    Sftp  // SSH File Transfer Protocol
};

// Host key validation policy for SFTP sessions.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: stores unknown hosts, rejects changed keys.
    Off         // No verification.
};

struct RemoteEntry {
    std::string   name;     // base name, never "." or ".."
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (when reported)
    std::uint64_t mtime = 0;  // epoch seconds (when reported)
};

// Classification used by the retry policy. Anything that means "the link
// itself is gone" must map to Connection or NotConnected.
enum class RemoteErrorKind {
    None,
    NotConnected,
    Connection,   // reset, closed, timed out, FTP 421
    Auth,         // login rejected
    Protocol,     // server answered with a failure reply
    LocalIo,      // local file could not be read
    Unsupported
};

struct RemoteError {
    RemoteErrorKind kind = RemoteErrorKind::None;
    long code = 0;  // FTP reply, CURLcode or libssh2 error code
    std::string message;

    void clear() {
        kind = RemoteErrorKind::None;
        code = 0;
        message.clear();
    }

    bool isConnectionClass() const {
        return kind == RemoteErrorKind::Connection ||
               kind == RemoteErrorKind::NotConnected;
    }
};

inline RemoteError makeRemoteError(RemoteErrorKind kind, std::string message,
                                   long code = 0) {
    RemoteError e;
    e.kind = kind;
    e.code = code;
    e.message = std::move(message);
    return e;
}

const char* remoteErrorKindName(RemoteErrorKind kind);

// Receives one line of protocol traffic when SessionOptions::verbose is set.
using TraceCB = std::function<void(const std::string& line)>;

struct SessionOptions {
    Protocol protocol = Protocol::Ftp;
    std::string host;
    std::uint16_t port = 21;
    std::string username;
    std::optional<std::string> password;

    // FTP only: require TLS on control and data channels (explicit FTPS).
    bool secure = false;

    // Per-operation timeout; expiry is reported as a Connection error.
    int timeout_sec = 60;

    // SFTP only
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;

    // Diagnostics: forward protocol traffic to trace_cb.
    bool verbose = false;
    TraceCB trace_cb;
};

} // namespace sitepush
