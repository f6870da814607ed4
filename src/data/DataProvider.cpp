#include "tinytask/data/DataProvider.hpp"

#include "tinytask/core/Errors.hpp"
#include "tinytask/core/Logging.hpp"
#include "tinytask/data/FileTaskStore.hpp"

#include <QDir>

namespace tinytask {
namespace data {

namespace {
const QString ActiveFileName = QStringLiteral("tasks.json");
const QString ArchiveFileName = QStringLiteral("archive.json");
} // namespace

DataProvider::DataProvider(QString dataDirectory)
    : m_dataDirectory(QDir::cleanPath(std::move(dataDirectory)))
{
    QDir dir(m_dataDirectory);
    if (!dir.exists()) {
        if (!dir.mkpath(QStringLiteral("."))) {
            throw core::StorageIoError(m_dataDirectory, QStringLiteral("cannot create data directory"));
        }
        qCDebug(lcStore) << "created data directory" << m_dataDirectory;
    }

    m_taskStore = std::make_unique<FileTaskStore>(filePath(ActiveFileName), filePath(ArchiveFileName));
}

DataProvider::~DataProvider() = default;

TaskStore &DataProvider::taskStore()
{
    return *m_taskStore;
}

const QString &DataProvider::dataDirectory() const
{
    return m_dataDirectory;
}

QString DataProvider::filePath(const QString &fileName) const
{
    return QDir(m_dataDirectory).filePath(fileName);
}

} // namespace data
} // namespace tinytask
