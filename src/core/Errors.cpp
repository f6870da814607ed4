#include "tinytask/core/Errors.hpp"

namespace tinytask {
namespace core {

TaskError::TaskError(const QString &message)
    : std::runtime_error(message.toStdString())
{
}

QString TaskError::message() const
{
    return QString::fromStdString(what());
}

ValidationError::ValidationError(const QString &message)
    : TaskError(message)
{
}

NotFoundError::NotFoundError(int id)
    : TaskError(QStringLiteral("No such task: %1").arg(id))
    , m_id(id)
{
}

CorruptDataError::CorruptDataError(const QString &filePath, const QString &reason)
    : TaskError(QStringLiteral("Task file %1 is corrupt: %2. "
                               "Inspect the file or restore it from a backup; it has not been modified.")
                    .arg(filePath, reason))
    , m_filePath(filePath)
{
}

StorageIoError::StorageIoError(const QString &filePath, const QString &reason)
    : TaskError(QStringLiteral("Could not write %1: %2").arg(filePath, reason))
    , m_filePath(filePath)
{
}

DisabledError::DisabledError(const QString &reason)
    : TaskError(QStringLiteral("tinytask is disabled (%1). Run 'tinytask enable' to turn it back on.")
                    .arg(reason))
{
}

} // namespace core
} // namespace tinytask
