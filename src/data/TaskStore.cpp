#include "tinytask/data/TaskStore.hpp"

#include "tinytask/core/Errors.hpp"

#include <algorithm>
#include <limits>

namespace tinytask {
namespace data {

TaskCollection TaskStore::appendArchive(TaskCollection collection, const std::vector<TaskItem> &tasks) const
{
    if (!collection.archiveLoaded) {
        collection.archived = loadArchive();
        collection.archiveLoaded = true;
    }
    collection.archived.insert(collection.archived.end(), tasks.begin(), tasks.end());
    return collection;
}

int TaskStore::nextId(const TaskCollection &collection)
{
    const auto it = std::max_element(collection.active.cbegin(), collection.active.cend(),
                                     [](const TaskItem &lhs, const TaskItem &rhs) {
                                         return lhs.id < rhs.id;
                                     });
    if (it == collection.active.cend()) {
        return 1;
    }
    if (it->id == std::numeric_limits<int>::max()) {
        throw core::ValidationError(QStringLiteral("No task id left after %1").arg(it->id));
    }
    return it->id + 1;
}

} // namespace data
} // namespace tinytask
