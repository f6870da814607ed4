#include "tinytask/data/InMemoryTaskStore.hpp"

namespace tinytask {
namespace data {

InMemoryTaskStore::InMemoryTaskStore() = default;
InMemoryTaskStore::~InMemoryTaskStore() = default;

TaskCollection InMemoryTaskStore::load(LoadScope scope) const
{
    TaskCollection collection;
    collection.active = m_active;
    if (scope == LoadScope::WithArchive) {
        collection.archived = m_archived;
        collection.archiveLoaded = true;
    }
    return collection;
}

void InMemoryTaskStore::save(const TaskCollection &collection)
{
    if (collection.archiveLoaded) {
        m_archived = collection.archived;
    }
    m_active = collection.active;
    ++m_saveCount;
}

int InMemoryTaskStore::saveCount() const
{
    return m_saveCount;
}

std::vector<TaskItem> InMemoryTaskStore::loadArchive() const
{
    return m_archived;
}

} // namespace data
} // namespace tinytask
