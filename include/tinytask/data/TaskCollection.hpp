#pragma once

#include <vector>

#include "tinytask/data/Task.hpp"

namespace tinytask {
namespace data {

struct TaskCollection
{
    std::vector<TaskItem> active;
    std::vector<TaskItem> archived;
    bool archiveLoaded = false;

    const TaskItem *findById(int id) const;
    TaskItem *findById(int id);
    bool contains(int id) const;
};

} // namespace data
} // namespace tinytask
