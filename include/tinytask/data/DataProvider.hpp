#pragma once

#include <memory>
#include <QString>

namespace tinytask {
namespace data {

class TaskStore;

class DataProvider
{
public:
    explicit DataProvider(QString dataDirectory);
    ~DataProvider();

    TaskStore &taskStore();
    const QString &dataDirectory() const;
    QString filePath(const QString &fileName) const;

private:
    QString m_dataDirectory;
    std::unique_ptr<TaskStore> m_taskStore;
};

} // namespace data
} // namespace tinytask
