// sitepush command line: deploy a built static site to an FTP/SFTP server.
#include "DeployConfig.hpp"
#include "Deployer.hpp"
#include "Logging.hpp"
#include "sitepush/CurlFtpClient.hpp"
#include "sitepush/Libssh2SftpClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QProcessEnvironment>

#include <memory>

namespace {

enum ExitCode { ExitOk = 0, ExitDeployFailed = 1, ExitBadConfig = 2 };

std::unique_ptr<sitepush::RemoteClient> makeClient(sitepush::Protocol p) {
    if (p == sitepush::Protocol::Sftp)
        return std::make_unique<sitepush::Libssh2SftpClient>();
    return std::make_unique<sitepush::CurlFtpClient>();
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sitepush"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));
    sitepush::installLogging(false);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Replace the contents of a remote directory with a local build, "
        "publishing the entry document last."));
    parser.addHelpOption();
    parser.addVersionOption();
    sitepush::addCommandLineOptions(parser);
    parser.process(app);

    sitepush::DeployConfig cfg;
    QString err;
    if (!sitepush::loadDeployConfig(parser,
                                    QProcessEnvironment::systemEnvironment(),
                                    cfg, err)) {
        qCCritical(spDeploy).noquote() << err;
        return ExitBadConfig;
    }
    sitepush::installLogging(cfg.verbose);

    sitepush::Deployer deployer(cfg, makeClient(cfg.protocol));
    const sitepush::DeployReport report = deployer.run();
    return report.ok ? ExitOk : ExitDeployFailed;
}
