#include "tinytask/cli/TaskFormatter.hpp"

#include <QLocale>
#include <QStringList>

namespace tinytask {
namespace cli {

namespace {
constexpr int IdWidth = 4;
constexpr int PriorityWidth = 6;

QString formatTags(const QStringList &tags)
{
    QStringList prefixed;
    prefixed.reserve(tags.size());
    for (const QString &tag : tags) {
        prefixed << QStringLiteral("#") + tag;
    }
    return prefixed.join(QStringLiteral(", "));
}

QString formatTimestamp(const QDateTime &timestamp)
{
    return timestamp.toLocalTime().toString(QStringLiteral("yyyy-MM-dd HH:mm"));
}
} // namespace

QString TaskFormatter::formatList(const std::vector<data::TaskItem> &tasks)
{
    QString out;
    out += QStringLiteral("%1  %2  %3  %4\n")
               .arg(QStringLiteral("ID"), IdWidth)
               .arg(QStringLiteral("[ ]"))
               .arg(QStringLiteral("PRIO"), -PriorityWidth)
               .arg(QStringLiteral("TITLE"));
    for (const auto &task : tasks) {
        out += formatRow(task) + QLatin1Char('\n');
    }
    return out;
}

QString TaskFormatter::formatRow(const data::TaskItem &task)
{
    QString row = QStringLiteral("%1  %2  %3  %4")
                      .arg(task.id, IdWidth)
                      .arg(task.done ? QStringLiteral("[x]") : QStringLiteral("[ ]"))
                      .arg(data::priorityToString(task.priority), -PriorityWidth)
                      .arg(task.title);
    if (!task.tags.isEmpty()) {
        row += QStringLiteral("  ") + formatTags(task.tags);
    }
    if (task.dueDate.isValid()) {
        row += QStringLiteral("  (due %1)").arg(data::dueDateToString(task.dueDate));
    }
    return row;
}

QString TaskFormatter::formatDetails(const data::TaskItem &task)
{
    QStringList lines;
    lines << QStringLiteral("ID:        %1").arg(task.id)
          << QStringLiteral("Title:     %1").arg(task.title)
          << QStringLiteral("Status:    %1").arg(task.done ? QStringLiteral("done") : QStringLiteral("pending"))
          << QStringLiteral("Priority:  %1").arg(data::priorityToString(task.priority))
          << QStringLiteral("Tags:      %1")
                 .arg(task.tags.isEmpty() ? QStringLiteral("none") : formatTags(task.tags));
    if (task.dueDate.isValid()) {
        lines << QStringLiteral("Due:       %1").arg(data::dueDateToString(task.dueDate));
    }
    if (task.note) {
        lines << QStringLiteral("Note:      %1").arg(*task.note);
    }
    lines << QStringLiteral("Created:   %1").arg(formatTimestamp(task.createdAt));
    if (task.completedAt.isValid()) {
        lines << QStringLiteral("Completed: %1").arg(formatTimestamp(task.completedAt));
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString TaskFormatter::formatStats(const core::StatsSummary &stats)
{
    const QLocale c = QLocale::c();
    QStringList lines;
    lines << QStringLiteral("Total tasks: %1").arg(stats.total)
          << QStringLiteral("Completed:   %1 (%2%)").arg(stats.done).arg(c.toString(stats.completionPercent, 'f', 1))
          << QStringLiteral("Pending:     %1").arg(stats.pending)
          << QString()
          << QStringLiteral("Pending by priority:")
          << QStringLiteral("  high:   %1").arg(stats.pendingByPriority.value(data::Priority::High))
          << QStringLiteral("  medium: %1").arg(stats.pendingByPriority.value(data::Priority::Medium))
          << QStringLiteral("  low:    %1").arg(stats.pendingByPriority.value(data::Priority::Low))
          << QString()
          << QStringLiteral("Due:")
          << QStringLiteral("  overdue:  %1").arg(stats.overdue)
          << QStringLiteral("  today:    %1").arg(stats.dueToday)
          << QStringLiteral("  upcoming: %1").arg(stats.upcoming)
          << QString()
          << QStringLiteral("Tags (%1): %2")
                 .arg(stats.tags.size())
                 .arg(stats.tags.isEmpty() ? QStringLiteral("none") : formatTags(stats.tags));
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace cli
} // namespace tinytask
