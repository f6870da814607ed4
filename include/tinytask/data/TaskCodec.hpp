#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <vector>

#include "tinytask/data/Task.hpp"

namespace tinytask {
namespace data {

enum class DuplicateIds
{
    Reject,
    Allow,
};

class TaskCodec
{
public:
    static QJsonObject encodeTask(const TaskItem &task);
    static QByteArray encodeDocument(const std::vector<TaskItem> &tasks);

    static std::vector<TaskItem> decodeDocument(const QByteArray &payload, const QString &sourcePath,
                                                DuplicateIds duplicates = DuplicateIds::Reject);

    static QString formatTimestamp(const QDateTime &timestamp);
    static QDateTime parseTimestamp(const QString &value);

private:
    static TaskItem decodeTask(const QJsonObject &object, int index, const QString &sourcePath);
};

} // namespace data
} // namespace tinytask
