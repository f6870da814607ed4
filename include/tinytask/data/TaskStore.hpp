#pragma once

#include <vector>

#include "tinytask/data/TaskCollection.hpp"

namespace tinytask {
namespace data {

enum class LoadScope
{
    ActiveOnly,
    WithArchive,
};

class TaskStore
{
public:
    virtual ~TaskStore() = default;

    /// Throws core::CorruptDataError; a missing file loads as empty.
    virtual TaskCollection load(LoadScope scope = LoadScope::ActiveOnly) const = 0;

    /// Writes the archive only when it was loaded. Throws core::StorageIoError.
    virtual void save(const TaskCollection &collection) = 0;

    TaskCollection appendArchive(TaskCollection collection, const std::vector<TaskItem> &tasks) const;

    /// Throws core::ValidationError when the largest active id is INT_MAX.
    static int nextId(const TaskCollection &collection);

protected:
    virtual std::vector<TaskItem> loadArchive() const = 0;
};

} // namespace data
} // namespace tinytask
