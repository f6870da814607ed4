#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcEngine)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

namespace tinytask {
namespace core {

void enableVerboseLogging();

} // namespace core
} // namespace tinytask
