#pragma once

#include "nullus/data/TaskRepository.hpp"

namespace nullus {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    explicit InMemoryTaskRepository(std::vector<TaskItem> tasks);
    ~InMemoryTaskRepository() override;

    std::vector<TaskItem> load() override;
    void save(const std::vector<TaskItem> &tasks) override;

    int loadCount() const;
    int saveCount() const;

private:
    std::vector<TaskItem> m_items;
    int m_loadCount = 0;
    int m_saveCount = 0;
};

} // namespace data
} // namespace nullus
