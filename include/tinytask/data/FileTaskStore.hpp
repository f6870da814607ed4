#pragma once

#include <QString>

#include "tinytask/data/TaskCodec.hpp"
#include "tinytask/data/TaskStore.hpp"

namespace tinytask {
namespace data {

class FileTaskStore : public TaskStore
{
public:
    FileTaskStore(QString activePath, QString archivePath);
    ~FileTaskStore() override = default;

    TaskCollection load(LoadScope scope = LoadScope::ActiveOnly) const override;
    void save(const TaskCollection &collection) override;

    const QString &activePath() const;
    const QString &archivePath() const;

protected:
    std::vector<TaskItem> loadArchive() const override;

private:
    static std::vector<TaskItem> readDocument(const QString &filePath, DuplicateIds duplicates);
    static void writeDocument(const QString &filePath, const std::vector<TaskItem> &tasks);

    QString m_activePath;
    QString m_archivePath;
};

} // namespace data
} // namespace tinytask
