#include "tinytask/data/TaskCollection.hpp"

#include <algorithm>

namespace tinytask {
namespace data {

const TaskItem *TaskCollection::findById(int id) const
{
    const auto it = std::find_if(active.cbegin(), active.cend(), [id](const TaskItem &task) {
        return task.id == id;
    });
    return it == active.cend() ? nullptr : &*it;
}

TaskItem *TaskCollection::findById(int id)
{
    const auto it = std::find_if(active.begin(), active.end(), [id](const TaskItem &task) {
        return task.id == id;
    });
    return it == active.end() ? nullptr : &*it;
}

bool TaskCollection::contains(int id) const
{
    return findById(id) != nullptr;
}

} // namespace data
} // namespace tinytask
