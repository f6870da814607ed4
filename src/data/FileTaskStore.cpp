#include "tinytask/data/FileTaskStore.hpp"

#include "tinytask/core/Errors.hpp"
#include "tinytask/core/Logging.hpp"
#include "tinytask/data/TaskCodec.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace tinytask {
namespace data {

FileTaskStore::FileTaskStore(QString activePath, QString archivePath)
    : m_activePath(std::move(activePath))
    , m_archivePath(std::move(archivePath))
{
}

TaskCollection FileTaskStore::load(LoadScope scope) const
{
    TaskCollection collection;
    collection.active = readDocument(m_activePath, DuplicateIds::Reject);
    if (scope == LoadScope::WithArchive) {
        collection.archived = readDocument(m_archivePath, DuplicateIds::Allow);
        collection.archiveLoaded = true;
    }
    return collection;
}

void FileTaskStore::save(const TaskCollection &collection)
{
    // Archive first: a crash in between leaves a task in both files rather than in neither.
    if (collection.archiveLoaded) {
        writeDocument(m_archivePath, collection.archived);
    }
    writeDocument(m_activePath, collection.active);
}

const QString &FileTaskStore::activePath() const
{
    return m_activePath;
}

const QString &FileTaskStore::archivePath() const
{
    return m_archivePath;
}

std::vector<TaskItem> FileTaskStore::loadArchive() const
{
    return readDocument(m_archivePath, DuplicateIds::Allow);
}

std::vector<TaskItem> FileTaskStore::readDocument(const QString &filePath, DuplicateIds duplicates)
{
    QFile file(filePath);
    if (!file.exists()) {
        qCDebug(lcStore) << "no task file at" << filePath << "- starting empty";
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw core::CorruptDataError(filePath, file.errorString());
    }
    const QByteArray payload = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        throw core::CorruptDataError(filePath, file.errorString());
    }

    auto tasks = TaskCodec::decodeDocument(payload, filePath, duplicates);
    qCDebug(lcStore) << "loaded" << tasks.size() << "tasks from" << filePath;
    return tasks;
}

void FileTaskStore::writeDocument(const QString &filePath, const std::vector<TaskItem> &tasks)
{
    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw core::StorageIoError(filePath, QStringLiteral("cannot create directory %1").arg(dir.path()));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw core::StorageIoError(filePath, file.errorString());
    }

    const QByteArray payload = TaskCodec::encodeDocument(tasks);
    if (file.write(payload) != payload.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        throw core::StorageIoError(filePath, reason);
    }
    if (!file.commit()) {
        throw core::StorageIoError(filePath, file.errorString());
    }
    qCDebug(lcStore) << "saved" << tasks.size() << "tasks to" << filePath;
}

} // namespace data
} // namespace tinytask
