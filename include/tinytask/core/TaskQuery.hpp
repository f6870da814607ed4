#pragma once

#include <QDate>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include "tinytask/data/TaskCollection.hpp"

namespace tinytask {
namespace core {

constexpr int DefaultUpcomingDays = 7;

enum class DueWindow
{
    None,
    Overdue,
    Today,
    Upcoming,
};

QString dueWindowToString(DueWindow window);
DueWindow dueWindowFromString(const QString &value);

struct TaskFilter
{
    std::optional<QString> tag;
    std::optional<data::Priority> priority;
    DueWindow dueWindow = DueWindow::None;
    bool includeDone = false;
};

struct DueContext
{
    QDate today;
    int upcomingDays = DefaultUpcomingDays;
};

bool matchesDueWindow(const data::TaskItem &task, DueWindow window, const DueContext &context);

std::vector<data::TaskItem> filterTasks(const data::TaskCollection &collection,
                                        const TaskFilter &filter,
                                        const DueContext &context);

std::vector<data::TaskItem> searchTasks(const data::TaskCollection &collection,
                                        const QString &keyword,
                                        bool includeDone = false);

struct StatsSummary
{
    int total = 0;
    int done = 0;
    int pending = 0;
    double completionPercent = 0.0;
    QMap<data::Priority, int> pendingByPriority;
    int overdue = 0;
    int dueToday = 0;
    int upcoming = 0;
    QStringList tags;
};

StatsSummary computeStats(const data::TaskCollection &collection, const DueContext &context);

} // namespace core
} // namespace tinytask
