#pragma once

#include <QProcessEnvironment>
#include <QSettings>
#include <QString>

namespace tinytask {
namespace core {

struct AppSettings
{
    QString dataDirectory;
    int upcomingDays = 7;

    static AppSettings load(const QSettings &settings,
                            const QProcessEnvironment &environment = QProcessEnvironment::systemEnvironment());

    static QString defaultDataDirectory();
};

} // namespace core
} // namespace tinytask
