#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QStringList>

#include <optional>

namespace tinytask {
namespace data {

enum class Priority
{
    Low,
    Medium,
    High,
};

struct TaskItem
{
    int id = 0;
    QString title;
    bool done = false;
    QStringList tags;
    Priority priority = Priority::Medium;
    QDate dueDate;
    std::optional<QString> note;
    QDateTime createdAt;
    QDateTime completedAt; // valid iff done
    QDateTime archivedAt;
};

bool operator==(const TaskItem &lhs, const TaskItem &rhs);
bool operator!=(const TaskItem &lhs, const TaskItem &rhs);

QString priorityToString(Priority priority);

std::optional<Priority> priorityFromString(const QString &value);

QString dueDateToString(const QDate &date);

QDate dueDateFromString(const QString &value);

/// Returns std::nullopt when a label is empty after trimming.
std::optional<QStringList> normalizeTags(const QStringList &tags);

} // namespace data
} // namespace tinytask
