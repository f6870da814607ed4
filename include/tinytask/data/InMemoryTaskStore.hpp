#pragma once

#include "tinytask/data/TaskStore.hpp"

namespace tinytask {
namespace data {

class InMemoryTaskStore : public TaskStore
{
public:
    InMemoryTaskStore();
    ~InMemoryTaskStore() override;

    TaskCollection load(LoadScope scope = LoadScope::ActiveOnly) const override;
    void save(const TaskCollection &collection) override;

    int saveCount() const;

protected:
    std::vector<TaskItem> loadArchive() const override;

private:
    std::vector<TaskItem> m_active;
    std::vector<TaskItem> m_archived;
    int m_saveCount = 0;
};

} // namespace data
} // namespace tinytask
