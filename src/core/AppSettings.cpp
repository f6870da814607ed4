#include "tinytask/core/AppSettings.hpp"

#include "tinytask/core/TaskQuery.hpp"

#include <QDir>
#include <QtGlobal>

namespace tinytask {
namespace core {

namespace {
const QString DataDirectoryKey = QStringLiteral("storage/dataDirectory");
const QString UpcomingDaysKey = QStringLiteral("query/upcomingDays");
const QString HomeVariable = QStringLiteral("TINYTASK_HOME");
constexpr int MaxUpcomingDays = 365;
} // namespace

AppSettings AppSettings::load(const QSettings &settings, const QProcessEnvironment &environment)
{
    AppSettings result;

    result.dataDirectory = settings.value(DataDirectoryKey).toString();
    const QString fromEnvironment = environment.value(HomeVariable);
    if (!fromEnvironment.isEmpty()) {
        result.dataDirectory = fromEnvironment;
    }
    if (result.dataDirectory.isEmpty()) {
        result.dataDirectory = defaultDataDirectory();
    }

    bool ok = false;
    const int days = settings.value(UpcomingDaysKey, DefaultUpcomingDays).toInt(&ok);
    result.upcomingDays = ok ? qBound(1, days, MaxUpcomingDays) : DefaultUpcomingDays;
    return result;
}

QString AppSettings::defaultDataDirectory()
{
    return QDir::home().filePath(QStringLiteral(".tinytask"));
}

} // namespace core
} // namespace tinytask
