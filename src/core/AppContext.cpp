#include "nullus/core/AppContext.hpp"

#include "nullus/Logging.hpp"
#include "nullus/data/TaskRepository.hpp"

namespace nullus {
namespace core {

AppContext::AppContext(data::TaskRepository &repository)
    : m_repository(repository)
    , m_tasks(repository.load())
{
}

AppContext::~AppContext() = default;

const std::vector<data::TaskItem> &AppContext::tasks() const
{
    return m_tasks;
}

CommandResult AppContext::execute(const Command &command)
{
    CommandResult result = command(m_tasks);
    if (result.mutated) {
        m_repository.save(result.tasks);
        m_tasks = result.tasks;
    } else {
        qCDebug(lcCore) << "nothing changed, store left untouched";
    }
    return result;
}

} // namespace core
} // namespace nullus
