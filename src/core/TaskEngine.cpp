#include "tinytask/core/TaskEngine.hpp"

#include "tinytask/core/Errors.hpp"
#include "tinytask/core/Logging.hpp"
#include "tinytask/data/TaskStore.hpp"

#include <algorithm>

namespace tinytask {
namespace core {

namespace {

QString validateTitle(const QString &title)
{
    const QString trimmed = title.trimmed();
    if (trimmed.isEmpty()) {
        throw ValidationError(QStringLiteral("Task title must not be empty"));
    }
    return trimmed;
}

data::Priority validatePriority(const QString &priority)
{
    const auto parsed = data::priorityFromString(priority);
    if (!parsed) {
        throw ValidationError(QStringLiteral("Invalid priority '%1': use low, medium or high").arg(priority));
    }
    return *parsed;
}

QDate validateDueDate(const QString &dueDate)
{
    const QDate parsed = data::dueDateFromString(dueDate);
    if (!parsed.isValid()) {
        throw ValidationError(QStringLiteral("Invalid due date '%1': expected YYYY-MM-DD").arg(dueDate));
    }
    return parsed;
}

QStringList validateTags(const QStringList &tags)
{
    const auto normalized = data::normalizeTags(tags);
    if (!normalized) {
        throw ValidationError(QStringLiteral("Tags must not be empty"));
    }
    return *normalized;
}

std::optional<QString> normalizeNote(const QString &note)
{
    if (note.isEmpty()) {
        return std::nullopt;
    }
    return note;
}

data::TaskItem &requireTask(data::TaskCollection &collection, int id)
{
    data::TaskItem *task = collection.findById(id);
    if (!task) {
        throw NotFoundError(id);
    }
    return *task;
}

} // namespace

bool TaskEdit::isEmpty() const
{
    return !title && !tags && !priority && !dueDate && !note;
}

AddResult addTask(data::TaskCollection collection, const NewTask &input, const QDateTime &now)
{
    data::TaskItem task;
    task.title = validateTitle(input.title);
    task.tags = validateTags(input.tags);
    task.priority = validatePriority(input.priority);
    if (input.dueDate && !input.dueDate->trimmed().isEmpty()) {
        task.dueDate = validateDueDate(*input.dueDate);
    }
    if (input.note) {
        task.note = normalizeNote(*input.note);
    }
    task.id = data::TaskStore::nextId(collection);
    task.createdAt = now;

    collection.active.push_back(task);
    qCDebug(lcEngine) << "added task" << task.id;
    return {std::move(collection), std::move(task)};
}

data::TaskCollection editTask(data::TaskCollection collection, int id, const TaskEdit &edit)
{
    data::TaskItem &task = requireTask(collection, id);
    if (edit.isEmpty()) {
        throw ValidationError(QStringLiteral("Nothing to change for task %1").arg(id));
    }

    data::TaskItem updated = task;
    if (edit.title) {
        updated.title = validateTitle(*edit.title);
    }
    if (edit.tags) {
        updated.tags = validateTags(*edit.tags);
    }
    if (edit.priority) {
        updated.priority = validatePriority(*edit.priority);
    }
    if (edit.dueDate) {
        updated.dueDate = edit.dueDate->trimmed().isEmpty() ? QDate() : validateDueDate(*edit.dueDate);
    }
    if (edit.note) {
        updated.note = normalizeNote(*edit.note);
    }

    task = std::move(updated);
    qCDebug(lcEngine) << "edited task" << id;
    return collection;
}

data::TaskCollection setDone(data::TaskCollection collection, int id, bool done, const QDateTime &now)
{
    data::TaskItem &task = requireTask(collection, id);
    if (task.done == done) {
        return collection;
    }
    task.done = done;
    task.completedAt = done ? now : QDateTime();
    qCDebug(lcEngine) << "task" << id << (done ? "completed" : "reopened");
    return collection;
}

data::TaskCollection setTags(data::TaskCollection collection, int id, const QStringList &tags)
{
    data::TaskItem &task = requireTask(collection, id);
    task.tags = validateTags(tags);
    return collection;
}

data::TaskCollection deleteTask(data::TaskCollection collection, int id)
{
    auto &active = collection.active;
    const auto it = std::find_if(active.begin(), active.end(), [id](const data::TaskItem &task) {
        return task.id == id;
    });
    if (it == active.end()) {
        throw NotFoundError(id);
    }
    active.erase(it);
    qCDebug(lcEngine) << "deleted task" << id;
    return collection;
}

data::TaskCollection clearTasks(data::TaskCollection collection, bool doneOnly)
{
    auto &active = collection.active;
    if (doneOnly) {
        active.erase(std::remove_if(active.begin(), active.end(),
                                    [](const data::TaskItem &task) { return task.done; }),
                     active.end());
    } else {
        active.clear();
    }
    return collection;
}

ArchiveResult archiveCompleted(data::TaskCollection collection, const QDateTime &now)
{
    ArchiveResult result;
    std::vector<data::TaskItem> pending;
    pending.reserve(collection.active.size());
    for (auto &task : collection.active) {
        if (task.done) {
            task.archivedAt = now;
            result.archived.push_back(std::move(task));
        } else {
            pending.push_back(std::move(task));
        }
    }
    collection.active = std::move(pending);
    result.collection = std::move(collection);
    qCDebug(lcEngine) << "archived" << result.archived.size() << "tasks";
    return result;
}

} // namespace core
} // namespace tinytask
