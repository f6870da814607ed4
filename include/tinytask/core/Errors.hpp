#pragma once

#include <QString>

#include <stdexcept>

namespace tinytask {
namespace core {

class TaskError : public std::runtime_error
{
public:
    explicit TaskError(const QString &message);

    QString message() const;
};

class ValidationError : public TaskError
{
public:
    explicit ValidationError(const QString &message);
};

class NotFoundError : public TaskError
{
public:
    explicit NotFoundError(int id);

    int id() const noexcept { return m_id; }

private:
    int m_id = 0;
};

class CorruptDataError : public TaskError
{
public:
    CorruptDataError(const QString &filePath, const QString &reason);

    const QString &filePath() const noexcept { return m_filePath; }

private:
    QString m_filePath;
};

class StorageIoError : public TaskError
{
public:
    StorageIoError(const QString &filePath, const QString &reason);

    const QString &filePath() const noexcept { return m_filePath; }

private:
    QString m_filePath;
};

class DisabledError : public TaskError
{
public:
    explicit DisabledError(const QString &reason);
};

} // namespace core
} // namespace tinytask
