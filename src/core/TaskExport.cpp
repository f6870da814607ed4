#include "tinytask/core/TaskExport.hpp"

#include "tinytask/core/Errors.hpp"
#include "tinytask/data/TaskCodec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace tinytask {
namespace core {

namespace {
const QChar TagDelimiter = QLatin1Char(',');

QJsonValue optionalValue(const std::optional<QString> &value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QString csvField(const QString &value)
{
    if (!value.contains(QLatin1Char(',')) && !value.contains(QLatin1Char('"'))
        && !value.contains(QLatin1Char('\n')) && !value.contains(QLatin1Char('\r'))) {
        return value;
    }
    QString escaped = value;
    escaped.replace(QLatin1String("\""), QLatin1String("\"\""));
    return QStringLiteral("\"%1\"").arg(escaped);
}

QString csvField(const std::optional<QString> &value)
{
    return value ? csvField(*value) : QString();
}
} // namespace

QString exportFormatExtension(ExportFormat format)
{
    return format == ExportFormat::Csv ? QStringLiteral("csv") : QStringLiteral("json");
}

ExportFormat exportFormatFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("json")) {
        return ExportFormat::Json;
    }
    if (normalized == QLatin1String("csv")) {
        return ExportFormat::Csv;
    }
    throw ValidationError(QStringLiteral("Unsupported export format '%1': use json or csv").arg(value));
}

QStringList exportColumns()
{
    return {QStringLiteral("id"),       QStringLiteral("title"),    QStringLiteral("done"),
            QStringLiteral("tags"),     QStringLiteral("priority"), QStringLiteral("due_date"),
            QStringLiteral("note"),     QStringLiteral("created_at"), QStringLiteral("completed_at")};
}

ExportRow toExportRow(const data::TaskItem &task)
{
    ExportRow row;
    row.id = task.id;
    row.title = task.title;
    row.done = task.done;
    row.tags = task.tags.join(TagDelimiter);
    row.priority = data::priorityToString(task.priority);
    if (task.dueDate.isValid()) {
        row.dueDate = data::dueDateToString(task.dueDate);
    }
    row.note = task.note;
    row.createdAt = data::TaskCodec::formatTimestamp(task.createdAt);
    if (task.completedAt.isValid()) {
        row.completedAt = data::TaskCodec::formatTimestamp(task.completedAt);
    }
    return row;
}

QByteArray exportJson(const std::vector<data::TaskItem> &tasks)
{
    QJsonArray array;
    for (const auto &task : tasks) {
        const ExportRow row = toExportRow(task);
        QJsonObject object;
        object.insert(QStringLiteral("id"), row.id);
        object.insert(QStringLiteral("title"), row.title);
        object.insert(QStringLiteral("done"), row.done);
        object.insert(QStringLiteral("tags"), row.tags);
        object.insert(QStringLiteral("priority"), row.priority);
        object.insert(QStringLiteral("due_date"), optionalValue(row.dueDate));
        object.insert(QStringLiteral("note"), optionalValue(row.note));
        object.insert(QStringLiteral("created_at"), row.createdAt);
        object.insert(QStringLiteral("completed_at"), optionalValue(row.completedAt));
        array.append(object);
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

QByteArray exportCsv(const std::vector<data::TaskItem> &tasks)
{
    QString out = exportColumns().join(QLatin1Char(',')) + QLatin1Char('\n');
    for (const auto &task : tasks) {
        const ExportRow row = toExportRow(task);
        const QStringList fields = {
            QString::number(row.id),
            csvField(row.title),
            row.done ? QStringLiteral("true") : QStringLiteral("false"),
            csvField(row.tags),
            row.priority,
            csvField(row.dueDate),
            csvField(row.note),
            row.createdAt,
            csvField(row.completedAt),
        };
        out += fields.join(QLatin1Char(',')) + QLatin1Char('\n');
    }
    return out.toUtf8();
}

QByteArray exportTasks(const std::vector<data::TaskItem> &tasks, ExportFormat format)
{
    return format == ExportFormat::Csv ? exportCsv(tasks) : exportJson(tasks);
}

void writeExportFile(const QString &filePath, const QByteArray &payload)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw StorageIoError(filePath, file.errorString());
    }
    if (file.write(payload) != payload.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        throw StorageIoError(filePath, reason);
    }
    if (!file.commit()) {
        throw StorageIoError(filePath, file.errorString());
    }
}

} // namespace core
} // namespace tinytask
