#include "Logging.hpp"

Q_LOGGING_CATEGORY(spDeploy, "sitepush.deploy")
Q_LOGGING_CATEGORY(spXfer, "sitepush.transfer")
Q_LOGGING_CATEGORY(spProto, "sitepush.protocol", QtInfoMsg)

namespace sitepush {

void installLogging(bool verbose) {
    qSetMessagePattern(QStringLiteral(
        "%{time hh:mm:ss.zzz} "
        "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
        "%{if-critical}E%{endif}%{if-fatal}F%{endif} "
        "[%{category}] %{message}"));
    if (verbose) {
        QLoggingCategory::setFilterRules(
            QStringLiteral("sitepush.*.debug=true\n"
                           "sitepush.protocol.debug=true"));
    } else {
        QLoggingCategory::setFilterRules(
            QStringLiteral("sitepush.*.debug=false"));
    }
}

} // namespace sitepush
