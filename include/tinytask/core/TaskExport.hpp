#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include "tinytask/data/Task.hpp"

namespace tinytask {
namespace core {

enum class ExportFormat
{
    Json,
    Csv,
};

QString exportFormatExtension(ExportFormat format);
ExportFormat exportFormatFromString(const QString &value);

struct ExportRow
{
    int id = 0;
    QString title;
    bool done = false;
    QString tags;
    QString priority;
    std::optional<QString> dueDate;
    std::optional<QString> note;
    QString createdAt;
    std::optional<QString> completedAt;
};

QStringList exportColumns();
ExportRow toExportRow(const data::TaskItem &task);

QByteArray exportJson(const std::vector<data::TaskItem> &tasks);
QByteArray exportCsv(const std::vector<data::TaskItem> &tasks);
QByteArray exportTasks(const std::vector<data::TaskItem> &tasks, ExportFormat format);

void writeExportFile(const QString &filePath, const QByteArray &payload);

} // namespace core
} // namespace tinytask
