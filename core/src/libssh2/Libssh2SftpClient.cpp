// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes SSH keepalive, known_hosts validation and password /
// keyboard-interactive authentication.
#include "sitepush/Libssh2SftpClient.hpp"
#include "sitepush/RemoteTree.hpp"
#include "sitepush/RuntimeLogging.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace sitepush {

// Process-wide libssh2 initialization (once per process)
static bool g_libssh2_inited = false;

// Context for keyboard-interactive: answers user and password prompts
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

static char* dupResponse(const char* s, std::size_t len) {
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Prompts mentioning "user" or "name" get the username, everything else the password.
static void kbint_password_callback(const char*, int, const char*, int,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char*>(prompts[i].text),
                                               prompts[i].length)
                                 : std::string();
        for (char& c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

static void onLibssh2Trace(LIBSSH2_SESSION*, void* context, const char* data, size_t length) {
    const auto* opt = static_cast<const SessionOptions*>(context);
    if (opt && data && length)
        traceProtocol(*opt, "* " + std::string(data, length));
}

Libssh2SftpClient::Libssh2SftpClient() {
    if (!g_libssh2_inited) {
        g_libssh2_inited = (libssh2_init(0) == 0);
    }
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

RemoteError Libssh2SftpClient::lastError(const std::string& what) const {
    if (!session_)
        return makeRemoteError(RemoteErrorKind::NotConnected, what + ": not connected");

    char* emsg = nullptr;
    int emlen = 0;
    const int rc = libssh2_session_last_error(session_, &emsg, &emlen, 0);
    std::string detail = (emsg && emlen > 0) ? std::string(emsg, static_cast<std::size_t>(emlen))
                                             : std::string();

    RemoteErrorKind kind = RemoteErrorKind::Protocol;
    long code = rc;
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
    case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
        kind = RemoteErrorKind::Connection;
        break;
    case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
    case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        kind = RemoteErrorKind::Auth;
        break;
    case LIBSSH2_ERROR_SFTP_PROTOCOL:
        if (sftp_) {
            code = static_cast<long>(libssh2_sftp_last_error(sftp_));
            if (code == LIBSSH2_FX_NO_CONNECTION || code == LIBSSH2_FX_CONNECTION_LOST)
                kind = RemoteErrorKind::Connection;
            detail += " (SFTP status " + std::to_string(code) + ")";
        }
        break;
    default:
        break;
    }
    return makeRemoteError(kind, detail.empty() ? what : what + ": " + detail, code);
}

std::string Libssh2SftpClient::absolutePath(const std::string& path) const {
    if (!path.empty() && path.front() == '/')
        return path;
    if (path.empty() || path == ".")
        return cwd_;
    return joinRemotePath(cwd_, path);
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, RemoteError& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = makeRemoteError(RemoteErrorKind::Connection,
                              std::string("getaddrinfo: ") + gai_strerror(gai), gai);
        return false;
    }

    int s = -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive on top of the SSH keepalive
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    err = makeRemoteError(RemoteErrorKind::Connection,
                          "could not connect to " + host + ":" + portStr, errno);
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, RemoteError& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = makeRemoteError(RemoteErrorKind::LocalIo, "could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = makeRemoteError(RemoteErrorKind::Auth, "known_hosts missing or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = makeRemoteError(RemoteErrorKind::Auth, "could not obtain host key");
        return false;
    }

    int alg = 0;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; break;
        case LIBSSH2_HOSTKEY_TYPE_DSS: alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: alg = LIBSSH2_KNOWNHOST_KEY_ED25519; break;
#endif
        default: alg = 0; break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: non-interactive, the first key seen is stored
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = makeRemoteError(RemoteErrorKind::LocalIo, "known_hosts path is not defined");
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                                 hostkey, keylen,
                                                 nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = makeRemoteError(RemoteErrorKind::LocalIo, "could not write host to known_hosts");
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }
    libssh2_knownhost_free(nh);
    err = makeRemoteError(RemoteErrorKind::Auth,
                          (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
                              ? "host key does not match known_hosts"
                              : "host not found in known_hosts");
    return false;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, RemoteError& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = makeRemoteError(RemoteErrorKind::LocalIo, "libssh2_session_init failed");
        return false;
    }
    if (opt.verbose && opt.trace_cb) {
        libssh2_trace(session_, LIBSSH2_TRACE_SFTP | LIBSSH2_TRACE_ERROR | LIBSSH2_TRACE_AUTH);
        libssh2_trace_sethandler(session_, &opt_, onLibssh2Trace);
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = lastError("SSH handshake failed");
        err.kind = RemoteErrorKind::Connection;
        return false;
    }

    // Blocking mode with a bounded per-operation timeout
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(opt.timeout_sec > 0 ? opt.timeout_sec : 60) * 1000);
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err))
        return false;

    const char* pass = opt.password ? opt.password->c_str() : "";
    int rc_pw = -1;
    for (;;) {
        rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), pass);
        if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = makeRemoteError(RemoteErrorKind::Connection,
                              "server closed the connection after the password attempt", rc_pw);
        return false;
    }
    if (rc_pw != 0) {
        // Password rejected but the session is alive: try keyboard-interactive.
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                              static_cast<unsigned>(opt.username.size()));
        const std::string authlist = methods ? std::string(methods) : std::string();
        int rc_kbd = -1;
        if (authlist.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{opt.username.c_str(), pass};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(),
                                                               kbint_password_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
        }
        if (rc_kbd != 0) {
            err = lastError("password/keyboard-interactive authentication failed" +
                            (authlist.empty() ? std::string() : " (methods: " + authlist + ")"));
            err.kind = RemoteErrorKind::Auth;
            return false;
        }
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = lastError("could not initialize SFTP");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, RemoteError& err) {
    if (connected_) {
        err = makeRemoteError(RemoteErrorKind::Unsupported, "already connected");
        return false;
    }
    if (!g_libssh2_inited) {
        err = makeRemoteError(RemoteErrorKind::Unsupported, "libssh2_init failed");
        return false;
    }
    opt_ = opt;
    traceProtocol(opt_, "* connecting to " + opt.host + ":" + std::to_string(opt.port));
    if (!tcpConnect(opt.host, opt.port, err) || !sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    cwd_ = "/";
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<RemoteEntry>& out,
                             RemoteError& err) {
    if (!connected_ || !sftp_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }

    const std::string path = absolutePath(remote_path);
    traceProtocol(opt_, "> OPENDIR " + path);
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = lastError("sftp_opendir failed for " + path);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            RemoteEntry e{};
            e.name = std::string(filename, static_cast<std::size_t>(rc));
            if (e.name == "." || e.name == "..") continue;
            e.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                           ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                           : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.mtime = attrs.mtime;
            out.push_back(std::move(e));
        } else if (rc == 0) {
            break;
        } else {
            err = lastError("sftp_readdir_ex failed for " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

// Uploads a local file, creating or truncating the remote one.
bool Libssh2SftpClient::put(const std::string& local,
                            const std::string& remote,
                            RemoteError& err) {
    if (!connected_ || !sftp_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = makeRemoteError(RemoteErrorKind::LocalIo, "cannot open local file: " + local, errno);
        return false;
    }

    const std::string path = absolutePath(remote);
    traceProtocol(opt_, "> OPEN " + path + " (write)");
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = lastError("cannot open remote file for writing: " + path);
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);

    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n > 0) {
            char* p = buf.data();
            size_t remain = n;
            while (remain > 0) {
                ssize_t w = libssh2_sftp_write(wh, p, remain);
                if (w < 0) {
                    err = lastError("remote write failed: " + path);
                    libssh2_sftp_close(wh);
                    std::fclose(lf);
                    return false;
                }
                remain -= static_cast<size_t>(w);
                p += w;
            }
        } else {
            if (std::ferror(lf)) {
                err = makeRemoteError(RemoteErrorKind::LocalIo, "local read failed: " + local);
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            break; // EOF
        }
    }

    const int closeRc = libssh2_sftp_close(wh);
    std::fclose(lf);
    if (closeRc != 0) {
        err = lastError("closing remote file failed: " + path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::changeDir(const std::string& remote_dir, RemoteError& err) {
    if (!connected_ || !sftp_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    const std::string path = absolutePath(remote_dir);
    traceProtocol(opt_, "> STAT " + path);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = lastError("cannot enter " + path);
        return false;
    }
    const bool isDir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                       ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
    if (!isDir) {
        err = makeRemoteError(RemoteErrorKind::Protocol, "not a directory: " + path);
        return false;
    }
    cwd_ = path;
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir, RemoteError& err) {
    if (!connected_ || !sftp_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    const std::string path = absolutePath(remote_dir);
    traceProtocol(opt_, "> MKDIR " + path);
    if (libssh2_sftp_mkdir(sftp_, path.c_str(), 0755) != 0) {
        err = lastError("sftp_mkdir failed for " + path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path, RemoteError& err) {
    if (!connected_ || !sftp_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    const std::string path = absolutePath(remote_path);
    traceProtocol(opt_, "> REMOVE " + path);
    if (libssh2_sftp_unlink(sftp_, path.c_str()) != 0) {
        err = lastError("sftp_unlink failed for " + path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir, RemoteError& err) {
    if (!connected_ || !sftp_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    const std::string path = absolutePath(remote_dir);
    traceProtocol(opt_, "> RMDIR " + path);
    if (libssh2_sftp_rmdir(sftp_, path.c_str()) != 0) {
        err = lastError("sftp_rmdir failed for " + path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::keepalive(RemoteError& err) {
    if (!connected_ || !session_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    int nextSec = 0;
    if (libssh2_keepalive_send(session_, &nextSec) != 0) {
        err = lastError("keepalive failed");
        return false;
    }
    return true;
}

std::unique_ptr<RemoteClient> Libssh2SftpClient::newConnectionLike(const SessionOptions& opt,
                                                                   RemoteError& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace sitepush
