#pragma once

#include <vector>

#include "nullus/data/Task.hpp"

namespace nullus {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<TaskItem> load() = 0;
    virtual void save(const std::vector<TaskItem> &tasks) = 0;
};

} // namespace data
} // namespace nullus
