#include "tinytask/core/TaskQuery.hpp"

#include "tinytask/core/Errors.hpp"

#include <QSet>

#include <algorithm>
#include <cmath>

namespace tinytask {
namespace core {

namespace {

void sortById(std::vector<data::TaskItem> &tasks)
{
    std::sort(tasks.begin(), tasks.end(), [](const data::TaskItem &lhs, const data::TaskItem &rhs) {
        return lhs.id < rhs.id;
    });
}

} // namespace

QString dueWindowToString(DueWindow window)
{
    switch (window) {
    case DueWindow::None:
        return QStringLiteral("none");
    case DueWindow::Overdue:
        return QStringLiteral("overdue");
    case DueWindow::Today:
        return QStringLiteral("today");
    case DueWindow::Upcoming:
        return QStringLiteral("upcoming");
    }
    return QStringLiteral("none");
}

DueWindow dueWindowFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("none")) {
        return DueWindow::None;
    }
    if (normalized == QLatin1String("overdue")) {
        return DueWindow::Overdue;
    }
    if (normalized == QLatin1String("today")) {
        return DueWindow::Today;
    }
    if (normalized == QLatin1String("upcoming")) {
        return DueWindow::Upcoming;
    }
    throw ValidationError(
        QStringLiteral("Invalid due window '%1': use overdue, today, upcoming or none").arg(value));
}

bool matchesDueWindow(const data::TaskItem &task, DueWindow window, const DueContext &context)
{
    if (window == DueWindow::None) {
        return true;
    }
    if (!task.dueDate.isValid()) {
        return false;
    }
    switch (window) {
    case DueWindow::Overdue:
        return task.dueDate < context.today && !task.done;
    case DueWindow::Today:
        return task.dueDate == context.today;
    case DueWindow::Upcoming:
        return task.dueDate > context.today && task.dueDate <= context.today.addDays(context.upcomingDays);
    case DueWindow::None:
        break;
    }
    return true;
}

std::vector<data::TaskItem> filterTasks(const data::TaskCollection &collection,
                                        const TaskFilter &filter,
                                        const DueContext &context)
{
    std::vector<data::TaskItem> result;
    for (const auto &task : collection.active) {
        if (!filter.includeDone && task.done) {
            continue;
        }
        if (filter.tag && !task.tags.contains(*filter.tag)) {
            continue;
        }
        if (filter.priority && task.priority != *filter.priority) {
            continue;
        }
        if (!matchesDueWindow(task, filter.dueWindow, context)) {
            continue;
        }
        result.push_back(task);
    }
    sortById(result);
    return result;
}

std::vector<data::TaskItem> searchTasks(const data::TaskCollection &collection,
                                        const QString &keyword,
                                        bool includeDone)
{
    std::vector<data::TaskItem> result;
    for (const auto &task : collection.active) {
        if (!includeDone && task.done) {
            continue;
        }
        if (task.title.contains(keyword, Qt::CaseInsensitive)
            || (task.note && task.note->contains(keyword, Qt::CaseInsensitive))) {
            result.push_back(task);
        }
    }
    sortById(result);
    return result;
}

StatsSummary computeStats(const data::TaskCollection &collection, const DueContext &context)
{
    StatsSummary stats;
    stats.pendingByPriority.insert(data::Priority::Low, 0);
    stats.pendingByPriority.insert(data::Priority::Medium, 0);
    stats.pendingByPriority.insert(data::Priority::High, 0);

    QSet<QString> tags;
    for (const auto &task : collection.active) {
        ++stats.total;
        for (const QString &tag : task.tags) {
            tags.insert(tag);
        }
        if (task.done) {
            ++stats.done;
            continue;
        }
        ++stats.pending;
        ++stats.pendingByPriority[task.priority];
        if (matchesDueWindow(task, DueWindow::Overdue, context)) {
            ++stats.overdue;
        } else if (matchesDueWindow(task, DueWindow::Today, context)) {
            ++stats.dueToday;
        } else if (matchesDueWindow(task, DueWindow::Upcoming, context)) {
            ++stats.upcoming;
        }
    }

    if (stats.total > 0) {
        stats.completionPercent = std::round(stats.done * 1000.0 / stats.total) / 10.0;
    }

    stats.tags = QStringList(tags.cbegin(), tags.cend());
    stats.tags.sort();
    return stats;
}

} // namespace core
} // namespace tinytask
