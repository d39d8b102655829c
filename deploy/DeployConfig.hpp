// Deployment settings and the sources they are assembled from.
#pragma once
#include "sitepush/RemoteTypes.hpp"

#include <QString>
#include <QStringList>

class QCommandLineParser;
class QProcessEnvironment;

namespace sitepush {

struct DeployConfig {
    Protocol protocol = Protocol::Ftp;
    QString host;
    int port = 0; // 0 = protocol default, resolved by validateConfig()
    QString username;
    QString password;
    bool secure = false;
    QString remoteDir;
    QString buildDir;
    QStringList exclusions;
    QString entryDocument = QStringLiteral("index.html");
    int timeoutSec = 60;
    bool verbose = false;
    QString knownHostsPath;
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::AcceptNew;

    // Session parameters for the protocol backends. trace_cb is left unset.
    SessionOptions toSessionOptions() const;
};

// Each layer overwrites only the values it sets.
bool applyIniFile(const QString &path, DeployConfig &cfg, QString &err);
bool applyEnvironment(const QProcessEnvironment &env, DeployConfig &cfg,
                      QString &err);
void addCommandLineOptions(QCommandLineParser &parser);
bool applyCommandLine(const QCommandLineParser &parser, DeployConfig &cfg,
                      QString &err);

// Checks required values and ranges, and fills in the default port.
bool validateConfig(DeployConfig &cfg, QString &err);

// defaults < --config INI < SITEPUSH_* environment < command line, then
// validateConfig().
bool loadDeployConfig(const QCommandLineParser &parser,
                      const QProcessEnvironment &env, DeployConfig &cfg,
                      QString &err);

bool parseProtocol(const QString &text, Protocol &out);
bool parseKnownHostsPolicy(const QString &text, KnownHostsPolicy &out);
bool parseBool(const QString &text, bool &out);

} // namespace sitepush
