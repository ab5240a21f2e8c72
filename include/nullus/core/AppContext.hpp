#pragma once

#include <functional>
#include <vector>

#include "nullus/core/TaskCommands.hpp"
#include "nullus/data/Task.hpp"

namespace nullus {
namespace data {
class TaskRepository;
}

namespace core {

// One invocation's view of the store: loaded once on construction, written
// back only after a command reports a mutation.
class AppContext
{
public:
    using Command = std::function<CommandResult(const std::vector<data::TaskItem> &)>;

    explicit AppContext(data::TaskRepository &repository);
    ~AppContext();

    const std::vector<data::TaskItem> &tasks() const;
    CommandResult execute(const Command &command);

private:
    data::TaskRepository &m_repository;
    std::vector<data::TaskItem> m_tasks;
};

} // namespace core
} // namespace nullus
