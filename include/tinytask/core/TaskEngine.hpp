#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include "tinytask/data/TaskCollection.hpp"

namespace tinytask {
namespace core {

struct NewTask
{
    QString title;
    QStringList tags;
    QString priority = QStringLiteral("medium");
    std::optional<QString> dueDate;
    std::optional<QString> note;
};

// Unset members are left untouched; an empty dueDate or note clears the field.
struct TaskEdit
{
    std::optional<QString> title;
    std::optional<QStringList> tags;
    std::optional<QString> priority;
    std::optional<QString> dueDate;
    std::optional<QString> note;

    bool isEmpty() const;
};

struct AddResult
{
    data::TaskCollection collection;
    data::TaskItem task;
};

struct ArchiveResult
{
    data::TaskCollection collection;
    std::vector<data::TaskItem> archived;
};

AddResult addTask(data::TaskCollection collection, const NewTask &input, const QDateTime &now);

data::TaskCollection editTask(data::TaskCollection collection, int id, const TaskEdit &edit);

data::TaskCollection setDone(data::TaskCollection collection, int id, bool done, const QDateTime &now);

data::TaskCollection setTags(data::TaskCollection collection, int id, const QStringList &tags);

data::TaskCollection deleteTask(data::TaskCollection collection, int id);

data::TaskCollection clearTasks(data::TaskCollection collection, bool doneOnly);

ArchiveResult archiveCompleted(data::TaskCollection collection, const QDateTime &now);

} // namespace core
} // namespace tinytask
