#pragma once

#include <QCommandLineParser>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include <functional>
#include <vector>

#include "tinytask/core/Errors.hpp"
#include "tinytask/core/TaskQuery.hpp"

namespace tinytask {
namespace core {
class AppContext;
}

namespace cli {

enum ExitCode
{
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2,
    ExitCancelled = 3,
};

class UsageError : public core::TaskError
{
public:
    explicit UsageError(const QString &message);
};

class CommandRunner
{
public:
    using Clock = std::function<QDateTime()>;

    CommandRunner(core::AppContext &context, QTextStream &out, QTextStream &err, QTextStream &in);

    void setClock(Clock clock);

    int run(const QString &command, const QStringList &arguments);

    static QStringList commandNames();
    static QString commandSummary();

private:
    using Handler = int (CommandRunner::*)(const QStringList &);

    struct CommandEntry
    {
        const char *name;
        Handler handler;
        const char *summary;
    };

    static const std::vector<CommandEntry> &commandTable();

    int runAdd(const QStringList &arguments);
    int runList(const QStringList &arguments);
    int runShow(const QStringList &arguments);
    int runEdit(const QStringList &arguments);
    int runDone(const QStringList &arguments);
    int runUndone(const QStringList &arguments);
    int runDelete(const QStringList &arguments);
    int runTag(const QStringList &arguments);
    int runSearch(const QStringList &arguments);
    int runArchive(const QStringList &arguments);
    int runClear(const QStringList &arguments);
    int runStats(const QStringList &arguments);
    int runExport(const QStringList &arguments);
    int runDisable(const QStringList &arguments);
    int runEnable(const QStringList &arguments);
    int runStatus(const QStringList &arguments);

    int runSetDone(const QStringList &arguments, bool done);

    bool parse(QCommandLineParser &parser, const QString &command, const QStringList &arguments);
    bool confirm(const QString &question);
    core::DueContext dueContext() const;

    static int parseId(const QString &value);

    core::AppContext &m_context;
    QTextStream &m_out;
    QTextStream &m_err;
    QTextStream &m_in;
    Clock m_clock;
};

} // namespace cli
} // namespace tinytask
