#include "DeployConfig.hpp"
#include "Exclusions.hpp"

#include <QCommandLineParser>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QSettings>

namespace sitepush {

SessionOptions DeployConfig::toSessionOptions() const {
    SessionOptions opt;
    opt.protocol = protocol;
    opt.host = host.toStdString();
    opt.port = static_cast<std::uint16_t>(port);
    opt.username = username.toStdString();
    if (!password.isEmpty())
        opt.password = password.toStdString();
    opt.secure = secure;
    opt.timeout_sec = timeoutSec;
    if (!knownHostsPath.isEmpty())
        opt.known_hosts_path = knownHostsPath.toStdString();
    opt.known_hosts_policy = knownHostsPolicy;
    opt.verbose = verbose;
    return opt;
}

bool parseProtocol(const QString &text, Protocol &out) {
    const QString v = text.trimmed().toLower();
    if (v == QLatin1String("ftp")) {
        out = Protocol::Ftp;
        return true;
    }
    if (v == QLatin1String("sftp")) {
        out = Protocol::Sftp;
        return true;
    }
    return false;
}

bool parseKnownHostsPolicy(const QString &text, KnownHostsPolicy &out) {
    const QString v = text.trimmed().toLower();
    if (v == QLatin1String("strict")) {
        out = KnownHostsPolicy::Strict;
    } else if (v == QLatin1String("accept-new")) {
        out = KnownHostsPolicy::AcceptNew;
    } else if (v == QLatin1String("off") || v == QLatin1String("no")) {
        out = KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

bool parseBool(const QString &text, bool &out) {
    const QString v = text.trimmed().toLower();
    if (v == QLatin1String("1") || v == QLatin1String("true") ||
        v == QLatin1String("yes") || v == QLatin1String("on")) {
        out = true;
        return true;
    }
    if (v == QLatin1String("0") || v == QLatin1String("false") ||
        v == QLatin1String("no") || v == QLatin1String("off")) {
        out = false;
        return true;
    }
    return false;
}

namespace {

// One named source of raw string values. Keys are the INI key names.
class ValueSource {
public:
    virtual ~ValueSource() = default;
    virtual bool value(const char *key, QString &out) const = 0;
    virtual QString describe(const char *key) const = 0;
};

class IniSource : public ValueSource {
public:
    explicit IniSource(QSettings &s) : s_(s) {}

    bool value(const char *key, QString &out) const override {
        const QString k = QLatin1String(groupOf(key)) + QLatin1Char('/') +
                          QLatin1String(key);
        if (!s_.contains(k))
            return false;
        const QVariant v = s_.value(k);
        // QSettings splits unquoted comma separated values into a list.
        if (v.typeId() == QMetaType::QStringList)
            out = v.toStringList().join(QLatin1Char(','));
        else
            out = v.toString();
        return true;
    }

    QString describe(const char *key) const override {
        return QStringLiteral("%1/%2 in %3")
            .arg(QLatin1String(groupOf(key)), QLatin1String(key),
                 s_.fileName());
    }

private:
    QSettings &s_;

    static const char *groupOf(const char *key) {
        static const char *const deployKeys[] = {
            "remote_dir", "build_dir", "exclusions", "entry_document",
            "verbose"};
        for (const char *k : deployKeys) {
            if (qstrcmp(k, key) == 0)
                return "deploy";
        }
        return "server";
    }
};

class EnvSource : public ValueSource {
public:
    explicit EnvSource(const QProcessEnvironment &env) : env_(env) {}

    bool value(const char *key, QString &out) const override {
        const QString name = envName(key);
        if (!env_.contains(name))
            return false;
        out = env_.value(name);
        return true;
    }

    QString describe(const char *key) const override { return envName(key); }

private:
    const QProcessEnvironment &env_;

    static QString envName(const char *key) {
        return QStringLiteral("SITEPUSH_") + QString::fromLatin1(key).toUpper();
    }
};

class CliSource : public ValueSource {
public:
    explicit CliSource(const QCommandLineParser &p) : p_(p) {}

    bool value(const char *key, QString &out) const override {
        const QString name = optionName(key);
        if (!p_.isSet(name))
            return false;
        // Flags carry no value.
        if (qstrcmp(key, "secure") == 0 || qstrcmp(key, "verbose") == 0)
            out = QStringLiteral("true");
        else
            out = p_.value(name);
        return true;
    }

    QString describe(const char *key) const override {
        return QStringLiteral("--") + optionName(key);
    }

private:
    const QCommandLineParser &p_;

    static QString optionName(const char *key) {
        return QString::fromLatin1(key).replace(QLatin1Char('_'),
                                                QLatin1Char('-'));
    }
};

bool applySource(const ValueSource &src, DeployConfig &cfg, QString &err) {
    QString v;
    if (src.value("protocol", v) && !parseProtocol(v, cfg.protocol)) {
        err = QStringLiteral("Unknown protocol '%1' (%2); expected ftp or sftp")
                  .arg(v, src.describe("protocol"));
        return false;
    }
    if (src.value("host", v))
        cfg.host = v.trimmed();
    if (src.value("port", v)) {
        bool ok = false;
        const int port = v.trimmed().toInt(&ok);
        if (!ok) {
            err = QStringLiteral("Invalid port '%1' (%2)")
                      .arg(v, src.describe("port"));
            return false;
        }
        cfg.port = port;
    }
    if (src.value("username", v))
        cfg.username = v;
    if (src.value("password", v))
        cfg.password = v;
    if (src.value("secure", v) && !parseBool(v, cfg.secure)) {
        err = QStringLiteral("Invalid boolean '%1' (%2)")
                  .arg(v, src.describe("secure"));
        return false;
    }
    if (src.value("timeout", v)) {
        bool ok = false;
        const int t = v.trimmed().toInt(&ok);
        if (!ok) {
            err = QStringLiteral("Invalid timeout '%1' (%2)")
                      .arg(v, src.describe("timeout"));
            return false;
        }
        cfg.timeoutSec = t;
    }
    if (src.value("known_hosts", v))
        cfg.knownHostsPath = v.trimmed();
    if (src.value("known_hosts_policy", v) &&
        !parseKnownHostsPolicy(v, cfg.knownHostsPolicy)) {
        err = QStringLiteral("Unknown known_hosts policy '%1' (%2)")
                  .arg(v, src.describe("known_hosts_policy"));
        return false;
    }
    if (src.value("remote_dir", v))
        cfg.remoteDir = v.trimmed();
    if (src.value("build_dir", v))
        cfg.buildDir = v.trimmed();
    if (src.value("exclusions", v))
        cfg.exclusions = parseExclusions(v);
    if (src.value("entry_document", v))
        cfg.entryDocument = v.trimmed();
    if (src.value("verbose", v) && !parseBool(v, cfg.verbose)) {
        err = QStringLiteral("Invalid boolean '%1' (%2)")
                  .arg(v, src.describe("verbose"));
        return false;
    }
    return true;
}

} // namespace

bool applyIniFile(const QString &path, DeployConfig &cfg, QString &err) {
    if (!QFileInfo(path).isFile()) {
        err = QStringLiteral("Configuration file not found: %1").arg(path);
        return false;
    }
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("Cannot parse configuration file: %1").arg(path);
        return false;
    }
    return applySource(IniSource(s), cfg, err);
}

bool applyEnvironment(const QProcessEnvironment &env, DeployConfig &cfg,
                      QString &err) {
    return applySource(EnvSource(env), cfg, err);
}

void addCommandLineOptions(QCommandLineParser &parser) {
    parser.addOptions({
        {QStringLiteral("config"),
         QStringLiteral("INI file with [server] and [deploy] groups."),
         QStringLiteral("file")},
        {QStringLiteral("protocol"), QStringLiteral("ftp (default) or sftp."),
         QStringLiteral("name")},
        {QStringLiteral("host"), QStringLiteral("Server host name."),
         QStringLiteral("host")},
        {QStringLiteral("port"),
         QStringLiteral("Server port (21 for ftp, 22 for sftp)."),
         QStringLiteral("port")},
        {QStringLiteral("username"), QStringLiteral("Login name."),
         QStringLiteral("user")},
        {QStringLiteral("password"),
         QStringLiteral("Password (prefer SITEPUSH_PASSWORD)."),
         QStringLiteral("password")},
        {QStringLiteral("secure"),
         QStringLiteral("Use explicit FTPS (AUTH TLS).")},
        {QStringLiteral("timeout"),
         QStringLiteral("Per-operation timeout in seconds (default 60)."),
         QStringLiteral("seconds")},
        {QStringLiteral("known-hosts"),
         QStringLiteral("SFTP known_hosts file."), QStringLiteral("file")},
        {QStringLiteral("known-hosts-policy"),
         QStringLiteral("strict, accept-new (default) or off."),
         QStringLiteral("policy")},
        {QStringLiteral("remote-dir"),
         QStringLiteral("Remote directory to deploy into."),
         QStringLiteral("path")},
        {QStringLiteral("build-dir"),
         QStringLiteral("Local directory with the built site."),
         QStringLiteral("path")},
        {QStringLiteral("exclusions"),
         QStringLiteral("Comma separated paths to keep on the server."),
         QStringLiteral("list")},
        {QStringLiteral("entry-document"),
         QStringLiteral("File uploaded last (default index.html)."),
         QStringLiteral("name")},
        {{QStringLiteral("v"), QStringLiteral("verbose")},
         QStringLiteral("Log protocol traffic.")},
    });
}

bool applyCommandLine(const QCommandLineParser &parser, DeployConfig &cfg,
                      QString &err) {
    return applySource(CliSource(parser), cfg, err);
}

bool validateConfig(DeployConfig &cfg, QString &err) {
    QStringList missing;
    if (cfg.host.isEmpty())
        missing << QStringLiteral("host");
    if (cfg.username.isEmpty())
        missing << QStringLiteral("username");
    if (cfg.remoteDir.isEmpty())
        missing << QStringLiteral("remote_dir");
    if (cfg.buildDir.isEmpty())
        missing << QStringLiteral("build_dir");
    if (!missing.isEmpty()) {
        err = QStringLiteral("Missing required setting(s): %1")
                  .arg(missing.join(QStringLiteral(", ")));
        return false;
    }
    if (cfg.port == 0)
        cfg.port = cfg.protocol == Protocol::Sftp ? 22 : 21;
    if (cfg.port < 1 || cfg.port > 65535) {
        err = QStringLiteral("Port out of range: %1").arg(cfg.port);
        return false;
    }
    if (cfg.timeoutSec <= 0) {
        err = QStringLiteral("Timeout must be positive: %1").arg(cfg.timeoutSec);
        return false;
    }
    if (cfg.entryDocument.isEmpty() ||
        cfg.entryDocument.contains(QLatin1Char('/'))) {
        err = QStringLiteral("Entry document must be a plain file name: '%1'")
                  .arg(cfg.entryDocument);
        return false;
    }
    if (cfg.secure && cfg.protocol == Protocol::Sftp) {
        err = QStringLiteral("--secure applies to ftp only");
        return false;
    }
    if (!cfg.remoteDir.startsWith(QLatin1Char('/')))
        cfg.remoteDir.prepend(QLatin1Char('/'));
    while (cfg.remoteDir.size() > 1 && cfg.remoteDir.endsWith(QLatin1Char('/')))
        cfg.remoteDir.chop(1);
    return true;
}

bool loadDeployConfig(const QCommandLineParser &parser,
                      const QProcessEnvironment &env, DeployConfig &cfg,
                      QString &err) {
    if (parser.isSet(QStringLiteral("config")) &&
        !applyIniFile(parser.value(QStringLiteral("config")), cfg, err))
        return false;
    if (!applyEnvironment(env, cfg, err))
        return false;
    if (!applyCommandLine(parser, cfg, err))
        return false;
    return validateConfig(cfg, err);
}

} // namespace sitepush
