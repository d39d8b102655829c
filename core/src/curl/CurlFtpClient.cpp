// libcurl backend: FTP and explicit FTPS on a single reused easy handle.
// libcurl has no notion of a working directory, so changeDir validates the
// target with a CWD round trip and relative paths are resolved locally.
#include "sitepush/CurlFtpClient.hpp"
#include "sitepush/RemoteTree.hpp"
#include "sitepush/RuntimeLogging.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sstream>

namespace sitepush {

// Process-wide libcurl initialization (once per process)
static bool g_curl_inited = false;

namespace {

// Applies options in order and remembers the first failure.
class OptionSetter {
public:
    explicit OptionSetter(CURL* h) : h_(h) {}

    template <class T>
    OptionSetter& operator()(CURLoption opt, T value) {
        if (rc_ == CURLE_OK)
            rc_ = curl_easy_setopt(h_, opt, value);
        return *this;
    }

    CURLcode result() const { return rc_; }

private:
    CURL* h_;
    CURLcode rc_ = CURLE_OK;
};

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t readFromFile(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* f = static_cast<FILE*>(userdata);
    const size_t n = std::fread(buffer, 1, size * nitems, f);
    if (n == 0 && std::ferror(f))
        return CURL_READFUNC_ABORT;
    return n;
}

int onDebug(CURL*, curl_infotype type, char* data, size_t size, void* userptr) {
    const auto* opt = static_cast<const SessionOptions*>(userptr);
    const char* prefix = nullptr;
    switch (type) {
    case CURLINFO_TEXT:
        prefix = "* ";
        break;
    case CURLINFO_HEADER_IN:
        prefix = "< ";
        break;
    case CURLINFO_HEADER_OUT:
        prefix = "> ";
        break;
    default:
        return 0; // payload bytes are not traced
    }
    std::istringstream in(std::string(data, size));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            traceProtocol(*opt, prefix + redactProtocolLine(line));
    }
    return 0;
}

std::string lastReplyLine(const std::string& replies) {
    std::istringstream in(replies);
    std::string line, last;
    while (std::getline(in, line)) {
        const std::string t = trimmedLine(line);
        if (!t.empty())
            last = t;
    }
    return last;
}

RemoteError curlError(CURLcode rc, long reply, const char* errorBuf,
                      const std::string& replies) {
    RemoteErrorKind kind = RemoteErrorKind::Protocol;
    switch (rc) {
    case CURLE_LOGIN_DENIED:
        kind = RemoteErrorKind::Auth;
        break;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_FTP_ACCEPT_TIMEOUT:
    case CURLE_FTP_CANT_GET_HOST:
    case CURLE_SSL_CONNECT_ERROR:
        kind = RemoteErrorKind::Connection;
        break;
    case CURLE_READ_ERROR:
    case CURLE_ABORTED_BY_CALLBACK:
        kind = RemoteErrorKind::LocalIo;
        break;
    case CURLE_UNSUPPORTED_PROTOCOL:
        kind = RemoteErrorKind::Unsupported;
        break;
    default:
        break;
    }
    // 421 Service not available, closing control connection
    if (reply == 421)
        kind = RemoteErrorKind::Connection;

    std::string msg = curl_easy_strerror(rc);
    if (errorBuf && *errorBuf)
        msg += std::string(": ") + trimmedLine(errorBuf);
    const std::string last = lastReplyLine(replies);
    if (!last.empty() && reply >= 400)
        msg += " [" + last + "]";
    return makeRemoteError(kind, msg, reply != 0 ? reply : static_cast<long>(rc));
}

std::uint64_t parseMlsdTime(const std::string& v) {
    // YYYYMMDDHHMMSS[.sss], always UTC
    if (v.size() < 14)
        return 0;
    std::tm tm{};
    tm.tm_year = std::atoi(v.substr(0, 4).c_str()) - 1900;
    tm.tm_mon = std::atoi(v.substr(4, 2).c_str()) - 1;
    tm.tm_mday = std::atoi(v.substr(6, 2).c_str());
    tm.tm_hour = std::atoi(v.substr(8, 2).c_str());
    tm.tm_min = std::atoi(v.substr(10, 2).c_str());
    tm.tm_sec = std::atoi(v.substr(12, 2).c_str());
    const time_t t = timegm(&tm);
    return t > 0 ? static_cast<std::uint64_t>(t) : 0;
}

std::vector<std::string> splitFields(const std::string& line, std::size_t maxFields,
                                     std::string& rest) {
    std::vector<std::string> fields;
    std::size_t i = 0;
    while (fields.size() < maxFields) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
            ++i;
        if (i >= line.size())
            break;
        std::size_t j = i;
        while (j < line.size() && line[j] != ' ' && line[j] != '\t')
            ++j;
        fields.push_back(line.substr(i, j - i));
        i = j;
    }
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
        ++i;
    rest = i < line.size() ? line.substr(i) : std::string();
    return fields;
}

} // namespace

CurlFtpClient::CurlFtpClient() {
    if (!g_curl_inited) {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        g_curl_inited = (rc == CURLE_OK);
    }
}

CurlFtpClient::~CurlFtpClient() {
    disconnect();
}

std::string CurlFtpClient::absolutePath(const std::string& path) const {
    if (!path.empty() && path.front() == '/')
        return path;
    if (path.empty() || path == ".")
        return cwd_;
    return joinRemotePath(cwd_, path);
}

std::string CurlFtpClient::urlFor(const std::string& absPath, bool isDir) const {
    std::string host = opt_.host;
    if (host.find(':') != std::string::npos && host.front() != '[')
        host = "[" + host + "]"; // IPv6 literal

    // "//" makes libcurl treat the path as absolute instead of relative to
    // the login directory.
    std::string url = "ftp://" + host + "/";
    for (const auto& part : splitRemotePath(absPath)) {
        char* escaped = curl_easy_escape(easy_, part.c_str(), static_cast<int>(part.size()));
        url += '/';
        if (escaped) {
            url += escaped;
            curl_free(escaped);
        } else {
            url += part;
        }
    }
    if (isDir)
        url += '/';
    return url;
}

template <class SetupFn>
bool CurlFtpClient::perform(const std::string& absPath, bool isDir, curl_ftpmethod method,
                            SetupFn&& setup, std::string& replies, RemoteError& err) {
    if (!easy_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    ::curl_easy_reset(easy_);

    char errorBuf[CURL_ERROR_SIZE] = {};
    const std::string url = urlFor(absPath, isDir);
    const long timeout = opt_.timeout_sec > 0 ? opt_.timeout_sec : 60;

    OptionSetter set(easy_);
    set(CURLOPT_ERRORBUFFER, errorBuf)
       (CURLOPT_URL, url.c_str())
       (CURLOPT_PORT, static_cast<long>(opt_.port))
       (CURLOPT_FTP_FILEMETHOD, static_cast<long>(method))
       (CURLOPT_HEADERFUNCTION, appendToString)
       (CURLOPT_HEADERDATA, &replies)
       (CURLOPT_NOSIGNAL, 1L)
       (CURLOPT_FTP_SKIP_PASV_IP, 0L)
       (CURLOPT_CONNECTTIMEOUT, timeout)
       (CURLOPT_SERVER_RESPONSE_TIMEOUT, timeout)
       (CURLOPT_LOW_SPEED_TIME, timeout)
       (CURLOPT_LOW_SPEED_LIMIT, 1L)
       (CURLOPT_TCP_KEEPALIVE, 1L);
    if (!opt_.username.empty()) {
        set(CURLOPT_USERNAME, opt_.username.c_str());
        set(CURLOPT_PASSWORD, opt_.password ? opt_.password->c_str() : "");
    }
    if (opt_.secure) {
        // RFC 4217: TLS on both control and data channels
        set(CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL))
           (CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS))
           (CURLOPT_SSL_VERIFYPEER, 0L)
           (CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (opt_.verbose && opt_.trace_cb) {
        set(CURLOPT_VERBOSE, 1L)
           (CURLOPT_DEBUGFUNCTION, onDebug)
           (CURLOPT_DEBUGDATA, static_cast<void*>(&opt_));
    }
    setup(set);
    if (set.result() != CURLE_OK) {
        err = makeRemoteError(RemoteErrorKind::Unsupported,
                              std::string("curl_easy_setopt: ") + curl_easy_strerror(set.result()),
                              static_cast<long>(set.result()));
        ::curl_easy_reset(easy_);
        return false;
    }

    const CURLcode rc = ::curl_easy_perform(easy_);
    long reply = 0;
    if (::curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &reply) != CURLE_OK)
        reply = 0;
    if (rc != CURLE_OK)
        err = curlError(rc, reply, errorBuf, replies);
    // Drop pointers into this stack frame before it unwinds.
    ::curl_easy_reset(easy_);
    return rc == CURLE_OK;
}

bool CurlFtpClient::runCommand(const std::string& cmd, std::string& replies, RemoteError& err) {
    curl_slist* quote = ::curl_slist_append(nullptr, cmd.c_str());
    if (!quote) {
        err = makeRemoteError(RemoteErrorKind::LocalIo, "curl_slist_append failed");
        return false;
    }
    const bool ok = perform("/", true, CURLFTPMETHOD_NOCWD, [quote](OptionSetter& set) {
        set(CURLOPT_NOBODY, 1L)(CURLOPT_QUOTE, quote);
    }, replies, err);
    ::curl_slist_free_all(quote);
    return ok;
}

bool CurlFtpClient::connect(const SessionOptions& opt, RemoteError& err) {
    if (connected_) {
        err = makeRemoteError(RemoteErrorKind::Unsupported, "already connected");
        return false;
    }
    if (opt.host.empty()) {
        err = makeRemoteError(RemoteErrorKind::Unsupported, "host is required");
        return false;
    }
    if (!g_curl_inited) {
        err = makeRemoteError(RemoteErrorKind::Unsupported, "curl_global_init failed");
        return false;
    }
    opt_ = opt;
    easy_ = ::curl_easy_init();
    if (!easy_) {
        err = makeRemoteError(RemoteErrorKind::LocalIo, "curl_easy_init failed");
        return false;
    }

    // Logs in and asks for the feature list in one go. The '*' prefix keeps
    // servers without FEAT from failing the login.
    std::string replies;
    if (!runCommand("*FEAT", replies, err)) {
        ::curl_easy_cleanup(easy_);
        easy_ = nullptr;
        return false;
    }
    mlsd_ = false;
    std::istringstream in(replies);
    std::string line;
    while (std::getline(in, line)) {
        if (startsWithNoCase(trimmedLine(line), "MLST")) {
            mlsd_ = true;
            break;
        }
    }
    listDashA_ = true;
    cwd_ = "/";
    connected_ = true;
    return true;
}

void CurlFtpClient::disconnect() {
    if (easy_) {
        ::curl_easy_reset(easy_);
        ::curl_easy_cleanup(easy_); // sends QUIT on the cached connection
        easy_ = nullptr;
    }
    connected_ = false;
}

bool CurlFtpClient::list(const std::string& remote_path,
                         std::vector<RemoteEntry>& out,
                         RemoteError& err) {
    if (!connected_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    const std::string path = absolutePath(remote_path);
    const bool useMlsd = mlsd_;
    // Plain LIST hides dot-files on many servers; ask for them with "-a"
    // and fall back once to plain LIST if the server rejects the option.
    std::string raw;
    for (;;) {
        const char* command = useMlsd ? "MLSD" : (listDashA_ ? "LIST -a" : "LIST");
        std::string replies;
        raw.clear();
        const bool ok = perform(path, true,
                                useMlsd ? CURLFTPMETHOD_NOCWD : CURLFTPMETHOD_SINGLECWD,
                                [&raw, command](OptionSetter& set) {
            set(CURLOPT_WRITEFUNCTION, appendToString)
               (CURLOPT_WRITEDATA, &raw)
               (CURLOPT_CUSTOMREQUEST, command);
        }, replies, err);
        if (ok)
            break;
        if (useMlsd || !listDashA_ || !isOptionRejected(err.code))
            return false;
        listDashA_ = false;
    }
    out = useMlsd ? parseMlsd(raw) : parseList(raw);
    return true;
}

bool CurlFtpClient::isOptionRejected(long reply) {
    // 500 unrecognized, 501 bad arguments, 502 not implemented
    return reply == 500 || reply == 501 || reply == 502;
}

bool CurlFtpClient::put(const std::string& local,
                        const std::string& remote,
                        RemoteError& err) {
    if (!connected_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = makeRemoteError(RemoteErrorKind::LocalIo,
                              "cannot open local file: " + local, errno);
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const curl_off_t total = fsz > 0 ? static_cast<curl_off_t>(fsz) : 0;

    std::string replies;
    const bool ok = perform(absolutePath(remote), false, CURLFTPMETHOD_SINGLECWD,
                            [lf, total](OptionSetter& set) {
        set(CURLOPT_UPLOAD, 1L)
           (CURLOPT_READFUNCTION, readFromFile)
           (CURLOPT_READDATA, static_cast<void*>(lf))
           (CURLOPT_INFILESIZE_LARGE, total);
    }, replies, err);
    std::fclose(lf);
    return ok;
}

bool CurlFtpClient::changeDir(const std::string& remote_dir, RemoteError& err) {
    if (!connected_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    const std::string path = absolutePath(remote_dir);
    std::string replies;
    // NOBODY on a directory URL makes libcurl CWD into it and stop there.
    if (!perform(path, true, CURLFTPMETHOD_SINGLECWD, [](OptionSetter& set) {
            set(CURLOPT_NOBODY, 1L);
        }, replies, err))
        return false;
    cwd_ = path;
    return true;
}

bool CurlFtpClient::mkdir(const std::string& remote_dir, RemoteError& err) {
    if (!connected_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    std::string replies;
    return runCommand("MKD " + absolutePath(remote_dir), replies, err);
}

bool CurlFtpClient::removeFile(const std::string& remote_path, RemoteError& err) {
    if (!connected_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    std::string replies;
    return runCommand("DELE " + absolutePath(remote_path), replies, err);
}

bool CurlFtpClient::removeDir(const std::string& remote_dir, RemoteError& err) {
    if (!connected_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    std::string replies;
    return runCommand("RMD " + absolutePath(remote_dir), replies, err);
}

bool CurlFtpClient::keepalive(RemoteError& err) {
    if (!connected_) {
        err = makeRemoteError(RemoteErrorKind::NotConnected, "not connected");
        return false;
    }
    std::string replies;
    return runCommand("NOOP", replies, err);
}

std::unique_ptr<RemoteClient> CurlFtpClient::newConnectionLike(const SessionOptions& opt,
                                                               RemoteError& err) {
    auto ptr = std::make_unique<CurlFtpClient>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

// RFC 3659 MLSD: "fact=value;fact=value; name"
std::vector<RemoteEntry> CurlFtpClient::parseMlsd(const std::string& raw) {
    std::vector<RemoteEntry> out;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        const auto sp = line.find(' ');
        if (sp == std::string::npos || sp + 1 >= line.size())
            continue;
        RemoteEntry e;
        e.name = line.substr(sp + 1);
        const std::string facts = line.substr(0, sp);
        std::string type;
        std::size_t pos = 0;
        while (pos < facts.size()) {
            auto end = facts.find(';', pos);
            if (end == std::string::npos)
                end = facts.size();
            const std::string fact = facts.substr(pos, end - pos);
            const auto eq = fact.find('=');
            if (eq != std::string::npos) {
                const std::string key = fact.substr(0, eq);
                const std::string value = fact.substr(eq + 1);
                if (startsWithNoCase(key, "type") && key.size() == 4) {
                    type = value;
                    for (char& c : type)
                        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                } else if (startsWithNoCase(key, "size") && key.size() == 4) {
                    e.size = std::strtoull(value.c_str(), nullptr, 10);
                } else if (startsWithNoCase(key, "modify") && key.size() == 6) {
                    e.mtime = parseMlsdTime(value);
                }
            }
            pos = end + 1;
        }
        if (type == "cdir" || type == "pdir" || e.name == "." || e.name == "..")
            continue;
        e.is_dir = (type == "dir");
        out.push_back(std::move(e));
    }
    return out;
}

// LIST output: unix "ls -l" style or the DOS style used by IIS.
std::vector<RemoteEntry> CurlFtpClient::parseList(const std::string& raw) {
    std::vector<RemoteEntry> out;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || startsWithNoCase(line, "total "))
            continue;

        RemoteEntry e;
        std::string rest;
        if (std::isdigit(static_cast<unsigned char>(line[0]))) {
            // 01-31-24  10:00AM       <DIR>          assets
            const auto f = splitFields(line, 3, rest);
            if (f.size() < 3 || rest.empty())
                continue;
            e.is_dir = (f[2] == "<DIR>");
            if (!e.is_dir)
                e.size = std::strtoull(f[2].c_str(), nullptr, 10);
            e.name = rest;
        } else {
            // drwxr-xr-x 2 user group 4096 Jan 31 10:00 assets
            const auto f = splitFields(line, 8, rest);
            if (f.size() < 8 || rest.empty())
                continue;
            e.is_dir = (f[0][0] == 'd');
            e.size = std::strtoull(f[4].c_str(), nullptr, 10);
            e.name = rest;
            if (f[0][0] == 'l') {
                const auto arrow = e.name.find(" -> ");
                if (arrow != std::string::npos)
                    e.name = e.name.substr(0, arrow);
            }
        }
        if (e.name == "." || e.name == "..")
            continue;
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace sitepush
