#include "tinytask/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcStore, "tinytask.store", QtWarningMsg)
Q_LOGGING_CATEGORY(lcEngine, "tinytask.engine", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCli, "tinytask.cli", QtWarningMsg)

namespace tinytask {
namespace core {

void enableVerboseLogging()
{
    QLoggingCategory::setFilterRules(QStringLiteral("tinytask.*.debug=true\ntinytask.*.info=true"));
}

} // namespace core
} // namespace tinytask
