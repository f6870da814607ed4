#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

#include "tinytask/core/AppContext.hpp"
#include "tinytask/core/AppSettings.hpp"
#include "tinytask/core/Errors.hpp"
#include "tinytask/data/TaskStore.hpp"

#include <memory>

using namespace tinytask;
using namespace tinytask::core;

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void settingsUseDefaults();
    void settingsReadConfiguredValues();
    void environmentOverridesDataDirectory();
    void createsDataDirectory();
    void disableAndEnable();
    void unreadableMarkerStillDisables();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    QString settingsPath() const { return m_dir->filePath(QStringLiteral("tinytask.ini")); }
};

void AppContextTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void AppContextTest::settingsUseDefaults()
{
    QSettings settings(settingsPath(), QSettings::IniFormat);
    const AppSettings loaded = AppSettings::load(settings, QProcessEnvironment());
    QCOMPARE(loaded.dataDirectory, AppSettings::defaultDataDirectory());
    QCOMPARE(loaded.upcomingDays, DefaultUpcomingDays);
    QVERIFY(AppSettings::defaultDataDirectory().endsWith(QStringLiteral(".tinytask")));
}

void AppContextTest::settingsReadConfiguredValues()
{
    QSettings settings(settingsPath(), QSettings::IniFormat);
    settings.setValue(QStringLiteral("storage/dataDirectory"), m_dir->filePath(QStringLiteral("data")));
    settings.setValue(QStringLiteral("query/upcomingDays"), 14);

    AppSettings loaded = AppSettings::load(settings, QProcessEnvironment());
    QCOMPARE(loaded.dataDirectory, m_dir->filePath(QStringLiteral("data")));
    QCOMPARE(loaded.upcomingDays, 14);

    settings.setValue(QStringLiteral("query/upcomingDays"), 5000);
    QCOMPARE(AppSettings::load(settings, QProcessEnvironment()).upcomingDays, 365);
    settings.setValue(QStringLiteral("query/upcomingDays"), QStringLiteral("soon"));
    QCOMPARE(AppSettings::load(settings, QProcessEnvironment()).upcomingDays, DefaultUpcomingDays);
}

void AppContextTest::environmentOverridesDataDirectory()
{
    QSettings settings(settingsPath(), QSettings::IniFormat);
    settings.setValue(QStringLiteral("storage/dataDirectory"), m_dir->filePath(QStringLiteral("configured")));

    QProcessEnvironment environment;
    environment.insert(QStringLiteral("TINYTASK_HOME"), m_dir->filePath(QStringLiteral("from-env")));
    QCOMPARE(AppSettings::load(settings, environment).dataDirectory, m_dir->filePath(QStringLiteral("from-env")));

    environment.insert(QStringLiteral("TINYTASK_HOME"), QString());
    QCOMPARE(AppSettings::load(settings, environment).dataDirectory,
             m_dir->filePath(QStringLiteral("configured")));
}

void AppContextTest::createsDataDirectory()
{
    AppSettings settings;
    settings.dataDirectory = m_dir->filePath(QStringLiteral("nested/data"));

    AppContext context(settings);
    QVERIFY(QDir(settings.dataDirectory).exists());
    QVERIFY(context.taskStore().load().active.empty());
    QVERIFY(!context.isDisabled());
}

void AppContextTest::disableAndEnable()
{
    AppSettings settings;
    settings.dataDirectory = m_dir->path();
    AppContext context(settings);

    const QDateTime now(QDate(2025, 1, 5), QTime(12, 0), Qt::UTC);
    context.disable(QStringLiteral("on holiday"), now);
    QVERIFY(context.isDisabled());
    const auto state = context.disabledState();
    QVERIFY(state.has_value());
    QCOMPARE(state->reason, QStringLiteral("on holiday"));
    QCOMPARE(state->disabledAt, now);

    try {
        context.ensureEnabled();
        QFAIL("expected DisabledError");
    } catch (const DisabledError &error) {
        QVERIFY(error.message().contains(QStringLiteral("on holiday")));
    }

    context.enable();
    QVERIFY(!context.isDisabled());
    context.ensureEnabled();
    context.enable();

    context.disable(QString(), now);
    QCOMPARE(context.disabledState()->reason, QStringLiteral("manually disabled"));
}

void AppContextTest::unreadableMarkerStillDisables()
{
    AppSettings settings;
    settings.dataDirectory = m_dir->path();
    AppContext context(settings);

    QFile marker(m_dir->filePath(QStringLiteral(".disabled")));
    QVERIFY(marker.open(QIODevice::WriteOnly));
    marker.write("not json");
    marker.close();

    QVERIFY(context.isDisabled());
    QCOMPARE(context.disabledState()->reason, QStringLiteral("manually disabled"));
    QVERIFY_EXCEPTION_THROWN(context.ensureEnabled(), DisabledError);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
