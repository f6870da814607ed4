#include "tinytask/cli/CommandRunner.hpp"

#include "tinytask/cli/TaskFormatter.hpp"
#include "tinytask/core/AppContext.hpp"
#include "tinytask/core/Logging.hpp"
#include "tinytask/core/TaskEngine.hpp"
#include "tinytask/core/TaskExport.hpp"
#include "tinytask/data/TaskStore.hpp"

#include <QDir>

#include <algorithm>

namespace tinytask {
namespace cli {

namespace {

QCommandLineOption forceOption()
{
    return QCommandLineOption({QStringLiteral("f"), QStringLiteral("force")},
                              QStringLiteral("Do not ask for confirmation."));
}

QCommandLineOption allOption()
{
    return QCommandLineOption({QStringLiteral("a"), QStringLiteral("all")},
                              QStringLiteral("Include completed tasks."));
}

QCommandLineOption tagOption(const QString &description)
{
    return QCommandLineOption({QStringLiteral("t"), QStringLiteral("tag")}, description, QStringLiteral("tag"));
}

QCommandLineOption priorityOption(const QString &description)
{
    return QCommandLineOption({QStringLiteral("p"), QStringLiteral("priority")}, description,
                              QStringLiteral("priority"));
}

QCommandLineOption dueOption()
{
    return QCommandLineOption({QStringLiteral("d"), QStringLiteral("due")},
                              QStringLiteral("Due date (YYYY-MM-DD)."), QStringLiteral("date"));
}

QCommandLineOption noteOption()
{
    return QCommandLineOption({QStringLiteral("n"), QStringLiteral("note")}, QStringLiteral("Free-form note."),
                              QStringLiteral("text"));
}

void requirePositionals(const QCommandLineParser &parser, int minimum, const QString &usage)
{
    if (parser.positionalArguments().size() < minimum) {
        throw UsageError(QStringLiteral("Usage: tinytask %1").arg(usage));
    }
}

} // namespace

UsageError::UsageError(const QString &message)
    : core::TaskError(message)
{
}

CommandRunner::CommandRunner(core::AppContext &context, QTextStream &out, QTextStream &err, QTextStream &in)
    : m_context(context)
    , m_out(out)
    , m_err(err)
    , m_in(in)
    , m_clock([]() { return QDateTime::currentDateTime(); })
{
}

void CommandRunner::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

const std::vector<CommandRunner::CommandEntry> &CommandRunner::commandTable()
{
    static const std::vector<CommandEntry> commands = {
        {"add", &CommandRunner::runAdd, "Add a new task"},
        {"list", &CommandRunner::runList, "List tasks with optional filters"},
        {"show", &CommandRunner::runShow, "Show one task in detail"},
        {"edit", &CommandRunner::runEdit, "Change fields of a task"},
        {"done", &CommandRunner::runDone, "Mark a task as completed"},
        {"undone", &CommandRunner::runUndone, "Reopen a completed task"},
        {"delete", &CommandRunner::runDelete, "Delete a task permanently"},
        {"tag", &CommandRunner::runTag, "Replace the tags of a task"},
        {"search", &CommandRunner::runSearch, "Search titles and notes"},
        {"archive", &CommandRunner::runArchive, "Move completed tasks to the archive"},
        {"clear", &CommandRunner::runClear, "Delete all tasks, or only completed ones"},
        {"stats", &CommandRunner::runStats, "Show task statistics"},
        {"export", &CommandRunner::runExport, "Export tasks as JSON or CSV"},
        {"disable", &CommandRunner::runDisable, "Disable tinytask until enabled again"},
        {"enable", &CommandRunner::runEnable, "Re-enable tinytask"},
        {"status", &CommandRunner::runStatus, "Show whether tinytask is enabled"},
    };
    return commands;
}

QStringList CommandRunner::commandNames()
{
    QStringList names;
    for (const auto &entry : commandTable()) {
        names << QString::fromLatin1(entry.name);
    }
    return names;
}

QString CommandRunner::commandSummary()
{
    QString summary = QStringLiteral("Commands:\n");
    for (const auto &entry : commandTable()) {
        summary += QStringLiteral("  %1 %2\n")
                       .arg(QString::fromLatin1(entry.name), -9)
                       .arg(QString::fromLatin1(entry.summary));
    }
    return summary;
}

int CommandRunner::run(const QString &command, const QStringList &arguments)
{
    const CommandEntry *entry = nullptr;
    for (const auto &candidate : commandTable()) {
        if (command == QLatin1String(candidate.name)) {
            entry = &candidate;
            break;
        }
    }
    if (!entry) {
        m_err << QStringLiteral("Unknown command '%1'\n\n").arg(command) << commandSummary();
        m_err.flush();
        return ExitUsage;
    }

    qCDebug(lcCli) << "running" << command << arguments;
    int status = ExitFailure;
    try {
        if (command != QLatin1String("enable") && command != QLatin1String("status")) {
            m_context.ensureEnabled();
        }
        status = (this->*(entry->handler))(arguments);
    } catch (const UsageError &error) {
        m_err << error.message() << '\n';
        status = ExitUsage;
    } catch (const core::TaskError &error) {
        m_err << QStringLiteral("Error: ") << error.message() << '\n';
        status = ExitFailure;
    }
    m_out.flush();
    m_err.flush();
    return status;
}

int CommandRunner::runAdd(const QStringList &arguments)
{
    QCommandLineParser parser;
    const QCommandLineOption tag = tagOption(QStringLiteral("Tag the task (repeatable)."));
    const QCommandLineOption priority = priorityOption(QStringLiteral("low, medium (default) or high."));
    const QCommandLineOption due = dueOption();
    const QCommandLineOption note = noteOption();
    parser.addOptions({tag, priority, due, note});
    parser.addPositionalArgument(QStringLiteral("title"), QStringLiteral("Task title."));
    if (!parse(parser, QStringLiteral("add"), arguments)) {
        return ExitSuccess;
    }
    requirePositionals(parser, 1, QStringLiteral("add <title> [options]"));

    core::NewTask input;
    input.title = parser.positionalArguments().join(QLatin1Char(' '));
    input.tags = parser.values(tag);
    if (parser.isSet(priority)) {
        input.priority = parser.value(priority);
    }
    if (parser.isSet(due)) {
        input.dueDate = parser.value(due);
    }
    if (parser.isSet(note)) {
        input.note = parser.value(note);
    }

    auto &store = m_context.taskStore();
    const auto result = core::addTask(store.load(), input, m_clock());
    store.save(result.collection);

    m_out << QStringLiteral("Task added with ID %1\n").arg(result.task.id);
    m_out << TaskFormatter::formatDetails(result.task);
    return ExitSuccess;
}

int CommandRunner::runList(const QStringList &arguments)
{
    QCommandLineParser parser;
    const QCommandLineOption all = allOption();
    const QCommandLineOption tag = tagOption(QStringLiteral("Only tasks with this tag."));
    const QCommandLineOption priority = priorityOption(QStringLiteral("Only tasks with this priority."));
    const QCommandLineOption due(QStringLiteral("due"), QStringLiteral("overdue, today, upcoming or none."),
                                 QStringLiteral("window"));
    parser.addOptions({all, tag, priority, due});
    if (!parse(parser, QStringLiteral("list"), arguments)) {
        return ExitSuccess;
    }

    core::TaskFilter filter;
    filter.includeDone = parser.isSet(all);
    if (parser.isSet(tag)) {
        filter.tag = parser.value(tag);
    }
    if (parser.isSet(priority)) {
        filter.priority = data::priorityFromString(parser.value(priority));
        if (!filter.priority) {
            throw core::ValidationError(
                QStringLiteral("Invalid priority '%1': use low, medium or high").arg(parser.value(priority)));
        }
    }
    if (parser.isSet(due)) {
        filter.dueWindow = core::dueWindowFromString(parser.value(due));
    }

    const auto tasks = core::filterTasks(m_context.taskStore().load(), filter, dueContext());
    if (tasks.empty()) {
        m_out << QStringLiteral("No tasks found.\n");
        if (!filter.includeDone) {
            m_out << QStringLiteral("Use --all to include completed tasks.\n");
        }
        return ExitSuccess;
    }

    m_out << TaskFormatter::formatList(tasks);
    if (filter.includeDone) {
        const auto done = std::count_if(tasks.cbegin(), tasks.cend(), [](const data::TaskItem &task) {
            return task.done;
        });
        m_out << QStringLiteral("\nTotal: %1 | Done: %2 | Pending: %3\n")
                     .arg(tasks.size())
                     .arg(done)
                     .arg(static_cast<qint64>(tasks.size()) - done);
    }
    return ExitSuccess;
}

int CommandRunner::runShow(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Task id."));
    if (!parse(parser, QStringLiteral("show"), arguments)) {
        return ExitSuccess;
    }
    requirePositionals(parser, 1, QStringLiteral("show <id>"));

    const int id = parseId(parser.positionalArguments().first());
    const auto collection = m_context.taskStore().load();
    const data::TaskItem *task = collection.findById(id);
    if (!task) {
        throw core::NotFoundError(id);
    }
    m_out << TaskFormatter::formatDetails(*task);
    return ExitSuccess;
}

int CommandRunner::runEdit(const QStringList &arguments)
{
    QCommandLineParser parser;
    const QCommandLineOption title(QStringLiteral("title"), QStringLiteral("New title."), QStringLiteral("title"));
    const QCommandLineOption tag = tagOption(QStringLiteral("Replace tags (repeatable)."));
    const QCommandLineOption clearTags(QStringLiteral("clear-tags"), QStringLiteral("Remove all tags."));
    const QCommandLineOption priority = priorityOption(QStringLiteral("low, medium or high."));
    const QCommandLineOption due(
        {QStringLiteral("d"), QStringLiteral("due")},
        QStringLiteral("New due date (YYYY-MM-DD); an empty value removes it."), QStringLiteral("date"));
    const QCommandLineOption note(
        {QStringLiteral("n"), QStringLiteral("note")}, QStringLiteral("New note; an empty value removes it."),
        QStringLiteral("text"));
    parser.addOptions({title, tag, clearTags, priority, due, note});
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Task id."));
    if (!parse(parser, QStringLiteral("edit"), arguments)) {
        return ExitSuccess;
    }
    requirePositionals(parser, 1, QStringLiteral("edit <id> [options]"));
    if (parser.isSet(tag) && parser.isSet(clearTags)) {
        throw UsageError(QStringLiteral("--tag and --clear-tags cannot be combined"));
    }

    const int id = parseId(parser.positionalArguments().first());
    core::TaskEdit edit;
    if (parser.isSet(title)) {
        edit.title = parser.value(title);
    }
    if (parser.isSet(tag)) {
        edit.tags = parser.values(tag);
    } else if (parser.isSet(clearTags)) {
        edit.tags = QStringList();
    }
    if (parser.isSet(priority)) {
        edit.priority = parser.value(priority);
    }
    if (parser.isSet(due)) {
        edit.dueDate = parser.value(due);
    }
    if (parser.isSet(note)) {
        edit.note = parser.value(note);
    }

    auto &store = m_context.taskStore();
    const auto collection = core::editTask(store.load(), id, edit);
    store.save(collection);

    m_out << QStringLiteral("Task %1 updated\n").arg(id);
    m_out << TaskFormatter::formatDetails(*collection.findById(id));
    return ExitSuccess;
}

int CommandRunner::runDone(const QStringList &arguments)
{
    return runSetDone(arguments, true);
}

int CommandRunner::runUndone(const QStringList &arguments)
{
    return runSetDone(arguments, false);
}

int CommandRunner::runSetDone(const QStringList &arguments, bool done)
{
    const QString command = done ? QStringLiteral("done") : QStringLiteral("undone");
    QCommandLineParser parser;
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Task id."));
    if (!parse(parser, command, arguments)) {
        return ExitSuccess;
    }
    requirePositionals(parser, 1, command + QStringLiteral(" <id>"));

    const int id = parseId(parser.positionalArguments().first());
    auto &store = m_context.taskStore();
    const auto collection = core::setDone(store.load(), id, done, m_clock());
    store.save(collection);

    m_out << QStringLiteral("Task %1 marked as %2\n").arg(id).arg(done ? QStringLiteral("done")
                                                                        : QStringLiteral("not done"));
    return ExitSuccess;
}

int CommandRunner::runDelete(const QStringList &arguments)
{
    QCommandLineParser parser;
    const QCommandLineOption force = forceOption();
    parser.addOption(force);
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Task id."));
    if (!parse(parser, QStringLiteral("delete"), arguments)) {
        return ExitSuccess;
    }
    requirePositionals(parser, 1, QStringLiteral("delete <id> [--force]"));

    const int id = parseId(parser.positionalArguments().first());
    auto &store = m_context.taskStore();
    const auto collection = store.load();
    if (!collection.contains(id)) {
        throw core::NotFoundError(id);
    }
    if (!parser.isSet(force) && !confirm(QStringLiteral("Delete task %1?").arg(id))) {
        m_out << QStringLiteral("Cancelled\n");
        return ExitCancelled;
    }

    store.save(core::deleteTask(collection, id));
    m_out << QStringLiteral("Task %1 deleted\n").arg(id);
    return ExitSuccess;
}

int CommandRunner::runTag(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Task id."));
    parser.addPositionalArgument(QStringLiteral("tags"), QStringLiteral("New tags; none clears them."),
                                 QStringLiteral("[tags...]"));
    if (!parse(parser, QStringLiteral("tag"), arguments)) {
        return ExitSuccess;
    }
    requirePositionals(parser, 1, QStringLiteral("tag <id> [tags...]"));

    QStringList positionals = parser.positionalArguments();
    const int id = parseId(positionals.takeFirst());
    auto &store = m_context.taskStore();
    const auto collection = core::setTags(store.load(), id, positionals);
    store.save(collection);

    m_out << QStringLiteral("Tags updated for task %1\n").arg(id);
    m_out << TaskFormatter::formatRow(*collection.findById(id)) << '\n';
    return ExitSuccess;
}

int CommandRunner::runSearch(const QStringList &arguments)
{
    QCommandLineParser parser;
    const QCommandLineOption all = allOption();
    parser.addOption(all);
    parser.addPositionalArgument(QStringLiteral("keyword"), QStringLiteral("Text to look for."));
    if (!parse(parser, QStringLiteral("search"), arguments)) {
        return ExitSuccess;
    }
    requirePositionals(parser, 1, QStringLiteral("search <keyword> [--all]"));

    const QString keyword = parser.positionalArguments().join(QLatin1Char(' '));
    const auto tasks = core::searchTasks(m_context.taskStore().load(), keyword, parser.isSet(all));
    if (tasks.empty()) {
        m_out << QStringLiteral("No tasks match '%1'.\n").arg(keyword);
        return ExitSuccess;
    }
    m_out << TaskFormatter::formatList(tasks);
    return ExitSuccess;
}

int CommandRunner::runArchive(const QStringList &arguments)
{
    QCommandLineParser parser;
    if (!parse(parser, QStringLiteral("archive"), arguments)) {
        return ExitSuccess;
    }

    auto &store = m_context.taskStore();
    const auto result = core::archiveCompleted(store.load(), m_clock());
    if (result.archived.empty()) {
        m_out << QStringLiteral("No completed tasks to archive.\n");
        return ExitSuccess;
    }
    store.save(store.appendArchive(result.collection, result.archived));
    m_out << QStringLiteral("Archived %1 completed task(s).\n").arg(result.archived.size());
    return ExitSuccess;
}

int CommandRunner::runClear(const QStringList &arguments)
{
    QCommandLineParser parser;
    const QCommandLineOption doneOnly(QStringLiteral("done"), QStringLiteral("Only clear completed tasks."));
    const QCommandLineOption force = forceOption();
    parser.addOptions({doneOnly, force});
    if (!parse(parser, QStringLiteral("clear"), arguments)) {
        return ExitSuccess;
    }

    auto &store = m_context.taskStore();
    const auto collection = store.load();
    const bool onlyDone = parser.isSet(doneOnly);
    const auto cleared = core::clearTasks(collection, onlyDone);
    const auto removed = collection.active.size() - cleared.active.size();
    const QString what = onlyDone ? QStringLiteral("completed tasks") : QStringLiteral("ALL tasks");

    if (removed == 0) {
        m_out << QStringLiteral("No %1 to clear.\n").arg(what);
        return ExitSuccess;
    }
    if (!parser.isSet(force) && !confirm(QStringLiteral("Delete %1 %2?").arg(removed).arg(what))) {
        m_out << QStringLiteral("Cancelled\n");
        return ExitCancelled;
    }

    store.save(cleared);
    m_out << QStringLiteral("Cleared %1 %2.\n").arg(removed).arg(what);
    return ExitSuccess;
}

int CommandRunner::runStats(const QStringList &arguments)
{
    QCommandLineParser parser;
    if (!parse(parser, QStringLiteral("stats"), arguments)) {
        return ExitSuccess;
    }

    const auto stats = core::computeStats(m_context.taskStore().load(), dueContext());
    if (stats.total == 0) {
        m_out << QStringLiteral("No tasks yet.\n");
        return ExitSuccess;
    }
    m_out << TaskFormatter::formatStats(stats);
    return ExitSuccess;
}

int CommandRunner::runExport(const QStringList &arguments)
{
    QCommandLineParser parser;
    const QCommandLineOption format({QStringLiteral("F"), QStringLiteral("format")},
                                    QStringLiteral("json (default) or csv."), QStringLiteral("format"),
                                    QStringLiteral("json"));
    const QCommandLineOption output({QStringLiteral("o"), QStringLiteral("output")},
                                    QStringLiteral("Output file; defaults to tasks_<timestamp>.<format>."),
                                    QStringLiteral("path"));
    const QCommandLineOption all = allOption();
    parser.addOptions({format, output, all});
    if (!parse(parser, QStringLiteral("export"), arguments)) {
        return ExitSuccess;
    }

    const core::ExportFormat exportFormat = core::exportFormatFromString(parser.value(format));
    core::TaskFilter filter;
    filter.includeDone = parser.isSet(all);
    const auto tasks = core::filterTasks(m_context.taskStore().load(), filter, dueContext());
    if (tasks.empty()) {
        m_out << QStringLiteral("No tasks to export.\n");
        return ExitSuccess;
    }

    QString path = parser.value(output);
    if (path.isEmpty()) {
        path = QStringLiteral("tasks_%1.%2")
                   .arg(m_clock().toString(QStringLiteral("yyyyMMdd_HHmmss")))
                   .arg(core::exportFormatExtension(exportFormat));
    }
    core::writeExportFile(path, core::exportTasks(tasks, exportFormat));
    m_out << QStringLiteral("Exported %1 task(s) to %2\n").arg(tasks.size()).arg(QDir::toNativeSeparators(path));
    return ExitSuccess;
}

int CommandRunner::runDisable(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addPositionalArgument(QStringLiteral("reason"), QStringLiteral("Why tinytask is disabled."),
                                 QStringLiteral("[reason...]"));
    if (!parse(parser, QStringLiteral("disable"), arguments)) {
        return ExitSuccess;
    }

    m_context.disable(parser.positionalArguments().join(QLatin1Char(' ')), m_clock());
    m_out << QStringLiteral("tinytask disabled. Run 'tinytask enable' to turn it back on.\n");
    return ExitSuccess;
}

int CommandRunner::runEnable(const QStringList &arguments)
{
    QCommandLineParser parser;
    if (!parse(parser, QStringLiteral("enable"), arguments)) {
        return ExitSuccess;
    }

    m_context.enable();
    m_out << QStringLiteral("tinytask enabled.\n");
    return ExitSuccess;
}

int CommandRunner::runStatus(const QStringList &arguments)
{
    QCommandLineParser parser;
    if (!parse(parser, QStringLiteral("status"), arguments)) {
        return ExitSuccess;
    }

    const auto state = m_context.disabledState();
    if (!state) {
        m_out << QStringLiteral("tinytask is enabled.\n");
        return ExitSuccess;
    }
    m_out << QStringLiteral("tinytask is disabled: %1\n").arg(state->reason);
    if (state->disabledAt.isValid()) {
        m_out << QStringLiteral("Disabled since %1\n")
                     .arg(state->disabledAt.toLocalTime().toString(QStringLiteral("yyyy-MM-dd HH:mm")));
    }
    return ExitSuccess;
}

bool CommandRunner::parse(QCommandLineParser &parser, const QString &command, const QStringList &arguments)
{
    const QCommandLineOption help = parser.addHelpOption();
    parser.setApplicationDescription(QStringLiteral("tinytask %1").arg(command));

    QStringList argv = arguments;
    argv.prepend(QStringLiteral("tinytask %1").arg(command));
    if (!parser.parse(argv)) {
        throw UsageError(parser.errorText());
    }
    if (parser.isSet(help)) {
        m_out << parser.helpText();
        return false;
    }
    return true;
}

bool CommandRunner::confirm(const QString &question)
{
    m_out << question << QStringLiteral(" [y/N] ");
    m_out.flush();
    const QString answer = m_in.readLine().trimmed().toLower();
    return answer == QLatin1String("y") || answer == QLatin1String("yes");
}

core::DueContext CommandRunner::dueContext() const
{
    core::DueContext context;
    context.today = m_clock().date();
    context.upcomingDays = m_context.settings().upcomingDays;
    return context;
}

int CommandRunner::parseId(const QString &value)
{
    bool ok = false;
    const int id = value.toInt(&ok);
    if (!ok || id <= 0) {
        throw core::ValidationError(QStringLiteral("Invalid task id '%1': expected a positive number").arg(value));
    }
    return id;
}

} // namespace cli
} // namespace tinytask
