#pragma once

#include <QString>

#include <vector>

#include "tinytask/core/TaskQuery.hpp"
#include "tinytask/data/Task.hpp"

namespace tinytask {
namespace cli {

class TaskFormatter
{
public:
    static QString formatList(const std::vector<data::TaskItem> &tasks);
    static QString formatRow(const data::TaskItem &task);
    static QString formatDetails(const data::TaskItem &task);
    static QString formatStats(const core::StatsSummary &stats);
};

} // namespace cli
} // namespace tinytask
