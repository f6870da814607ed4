#include "tinytask/data/TaskCodec.hpp"

#include "tinytask/core/Errors.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSet>

namespace tinytask {
namespace data {

namespace {
const QString KeyId = QStringLiteral("id");
const QString KeyTitle = QStringLiteral("title");
const QString KeyDone = QStringLiteral("done");
const QString KeyTags = QStringLiteral("tags");
const QString KeyPriority = QStringLiteral("priority");
const QString KeyDueDate = QStringLiteral("due_date");
const QString KeyNote = QStringLiteral("note");
const QString KeyCreatedAt = QStringLiteral("created_at");
const QString KeyCompletedAt = QStringLiteral("completed_at");
const QString KeyArchivedAt = QStringLiteral("archived_at");

QJsonValue optionalTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return TaskCodec::formatTimestamp(timestamp);
}

bool isAbsent(const QJsonValue &value)
{
    return value.isUndefined() || value.isNull();
}
} // namespace

QJsonObject TaskCodec::encodeTask(const TaskItem &task)
{
    QJsonObject object;
    object.insert(KeyId, task.id);
    object.insert(KeyTitle, task.title);
    object.insert(KeyDone, task.done);
    object.insert(KeyTags, QJsonArray::fromStringList(task.tags));
    object.insert(KeyPriority, priorityToString(task.priority));
    object.insert(KeyDueDate, task.dueDate.isValid() ? QJsonValue(dueDateToString(task.dueDate))
                                                     : QJsonValue(QJsonValue::Null));
    object.insert(KeyNote, task.note ? QJsonValue(*task.note) : QJsonValue(QJsonValue::Null));
    object.insert(KeyCreatedAt, formatTimestamp(task.createdAt));
    object.insert(KeyCompletedAt, optionalTimestamp(task.completedAt));
    if (task.archivedAt.isValid()) {
        object.insert(KeyArchivedAt, formatTimestamp(task.archivedAt));
    }
    return object;
}

QByteArray TaskCodec::encodeDocument(const std::vector<TaskItem> &tasks)
{
    QJsonArray array;
    for (const TaskItem &task : tasks) {
        array.append(encodeTask(task));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

std::vector<TaskItem> TaskCodec::decodeDocument(const QByteArray &payload, const QString &sourcePath,
                                                DuplicateIds duplicates)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw core::CorruptDataError(sourcePath,
                                     QStringLiteral("%1 at offset %2")
                                         .arg(parseError.errorString())
                                         .arg(parseError.offset));
    }
    if (!document.isArray()) {
        throw core::CorruptDataError(sourcePath, QStringLiteral("expected a JSON array of tasks"));
    }

    const QJsonArray array = document.array();
    std::vector<TaskItem> tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    QSet<int> seenIds;
    for (int i = 0; i < array.size(); ++i) {
        const QJsonValue value = array.at(i);
        if (!value.isObject()) {
            throw core::CorruptDataError(sourcePath, QStringLiteral("entry %1 is not an object").arg(i));
        }
        TaskItem task = decodeTask(value.toObject(), i, sourcePath);
        if (duplicates == DuplicateIds::Reject && seenIds.contains(task.id)) {
            throw core::CorruptDataError(sourcePath, QStringLiteral("duplicate task id %1").arg(task.id));
        }
        seenIds.insert(task.id);
        tasks.push_back(std::move(task));
    }
    return tasks;
}

TaskItem TaskCodec::decodeTask(const QJsonObject &object, int index, const QString &sourcePath)
{
    auto fail = [&](const QString &reason) {
        return core::CorruptDataError(sourcePath, QStringLiteral("entry %1: %2").arg(index).arg(reason));
    };

    TaskItem task;

    const QJsonValue id = object.value(KeyId);
    if (!id.isDouble() || id.toDouble() != static_cast<double>(id.toInt()) || id.toInt() <= 0) {
        throw fail(QStringLiteral("'id' must be a positive integer"));
    }
    task.id = id.toInt();

    const QJsonValue title = object.value(KeyTitle);
    if (!title.isString() || title.toString().trimmed().isEmpty()) {
        throw fail(QStringLiteral("'title' must be a non-empty string"));
    }
    task.title = title.toString();

    const QJsonValue done = object.value(KeyDone);
    if (!done.isBool()) {
        throw fail(QStringLiteral("'done' must be a boolean"));
    }
    task.done = done.toBool();

    const QJsonValue tags = object.value(KeyTags);
    if (!isAbsent(tags)) {
        if (!tags.isArray()) {
            throw fail(QStringLiteral("'tags' must be an array"));
        }
        QStringList labels;
        for (const QJsonValue &tag : tags.toArray()) {
            if (!tag.isString()) {
                throw fail(QStringLiteral("'tags' must contain strings only"));
            }
            labels << tag.toString();
        }
        const auto normalized = normalizeTags(labels);
        if (!normalized) {
            throw fail(QStringLiteral("'tags' contains an empty label"));
        }
        task.tags = *normalized;
    }

    const QJsonValue priority = object.value(KeyPriority);
    if (!isAbsent(priority)) {
        const auto parsed = priority.isString() ? priorityFromString(priority.toString()) : std::nullopt;
        if (!parsed) {
            throw fail(QStringLiteral("invalid priority"));
        }
        task.priority = *parsed;
    }

    const QJsonValue dueDate = object.value(KeyDueDate);
    if (!isAbsent(dueDate)) {
        task.dueDate = dueDate.isString() ? dueDateFromString(dueDate.toString()) : QDate();
        if (!task.dueDate.isValid()) {
            throw fail(QStringLiteral("invalid due_date"));
        }
    }

    const QJsonValue note = object.value(KeyNote);
    if (!isAbsent(note)) {
        if (!note.isString()) {
            throw fail(QStringLiteral("'note' must be a string"));
        }
        task.note = note.toString();
    }

    const QJsonValue createdAt = object.value(KeyCreatedAt);
    task.createdAt = createdAt.isString() ? parseTimestamp(createdAt.toString()) : QDateTime();
    if (!task.createdAt.isValid()) {
        throw fail(QStringLiteral("invalid created_at"));
    }

    const QJsonValue completedAt = object.value(KeyCompletedAt);
    if (!isAbsent(completedAt)) {
        task.completedAt = completedAt.isString() ? parseTimestamp(completedAt.toString()) : QDateTime();
        if (!task.completedAt.isValid()) {
            throw fail(QStringLiteral("invalid completed_at"));
        }
    }
    if (task.done != task.completedAt.isValid()) {
        throw fail(QStringLiteral("'done' and 'completed_at' disagree"));
    }

    const QJsonValue archivedAt = object.value(KeyArchivedAt);
    if (!isAbsent(archivedAt)) {
        task.archivedAt = archivedAt.isString() ? parseTimestamp(archivedAt.toString()) : QDateTime();
        if (!task.archivedAt.isValid()) {
            throw fail(QStringLiteral("invalid archived_at"));
        }
    }

    return task;
}

QString TaskCodec::formatTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) {
        return {};
    }
    return timestamp.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime TaskCodec::parseTimestamp(const QString &value)
{
    QDateTime parsed = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(value, Qt::ISODate);
    }
    return parsed;
}

} // namespace data
} // namespace tinytask
