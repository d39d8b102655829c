// Logging categories of the deploy layer.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(spDeploy)
Q_DECLARE_LOGGING_CATEGORY(spXfer)
Q_DECLARE_LOGGING_CATEGORY(spProto)

namespace sitepush {

// Installs the message pattern and category filter rules. Protocol traffic
// (sitepush.protocol, debug level) and debug output of the other categories
// are only enabled when verbose is set.
void installLogging(bool verbose);

} // namespace sitepush
