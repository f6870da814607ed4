#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "tinytask/cli/CommandRunner.hpp"
#include "tinytask/core/AppContext.hpp"
#include "tinytask/core/AppSettings.hpp"
#include "tinytask/core/Errors.hpp"
#include "tinytask/core/Logging.hpp"

using namespace tinytask;

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("tinytask"));
    QCoreApplication::setApplicationName(QStringLiteral("tinytask"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTinyTaskVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    QTextStream in(stdin);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("A tiny task manager for personal productivity.\n\n")
                                     + cli::CommandRunner::commandSummary());
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    const QCommandLineOption help = parser.addHelpOption();
    const QCommandLineOption version = parser.addVersionOption();
    const QCommandLineOption dataDir(QStringLiteral("data-dir"),
                                     QStringLiteral("Directory holding tasks.json and archive.json."),
                                     QStringLiteral("dir"));
    const QCommandLineOption verbose(QStringLiteral("verbose"), QStringLiteral("Print debug output."));
    parser.addOptions({dataDir, verbose});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."),
                                 QStringLiteral("<command> [args...]"));

    if (!parser.parse(app.arguments())) {
        err << parser.errorText() << '\n';
        return cli::ExitUsage;
    }
    if (parser.isSet(help)) {
        out << parser.helpText();
        return cli::ExitSuccess;
    }
    if (parser.isSet(version)) {
        out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        return cli::ExitSuccess;
    }
    if (parser.isSet(verbose)) {
        core::enableVerboseLogging();
    }

    QStringList positionals = parser.positionalArguments();
    if (positionals.isEmpty()) {
        err << parser.helpText();
        return cli::ExitUsage;
    }
    const QString command = positionals.takeFirst();

    QSettings settings;
    core::AppSettings appSettings = core::AppSettings::load(settings);
    if (parser.isSet(dataDir)) {
        appSettings.dataDirectory = parser.value(dataDir);
    }

    try {
        core::AppContext context(appSettings);
        cli::CommandRunner runner(context, out, err, in);
        return runner.run(command, positionals);
    } catch (const core::TaskError &error) {
        err << QStringLiteral("Error: ") << error.message() << '\n';
        return cli::ExitFailure;
    }
}
