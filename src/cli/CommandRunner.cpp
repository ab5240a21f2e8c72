#include "nullus/cli/CommandRunner.hpp"

#include "nullus/Logging.hpp"
#include "nullus/TaskError.hpp"
#include "nullus/cli/TaskPrinter.hpp"

namespace nullus {
namespace cli {

using data::TaskItem;
using Tasks = std::vector<TaskItem>;

core::AppContext::Command commandFor(const ParsedCommand &command)
{
    switch (command.action) {
    case Action::List:
        return [pattern = command.pattern](const Tasks &tasks) { return core::listTasks(tasks, pattern); };
    case Action::Add:
        return [descriptions = command.descriptions](const Tasks &tasks) {
            return core::addTasks(tasks, descriptions);
        };
    case Action::Update:
        if (command.ids.empty() || command.descriptions.isEmpty()) {
            throw ValidationError(QStringLiteral("--update needs ID and DESC"));
        }
        return [id = command.ids.front(), description = command.descriptions.front()](const Tasks &tasks) {
            return core::updateTask(tasks, id, description);
        };
    case Action::Done:
        return [ids = command.ids](const Tasks &tasks) { return core::toggleDone(tasks, ids); };
    case Action::Schedule:
        return [date = command.date, ids = command.ids](const Tasks &tasks) {
            return core::scheduleTasks(tasks, date, ids);
        };
    case Action::Deadline:
        return [date = command.date, ids = command.ids](const Tasks &tasks) {
            return core::setDeadline(tasks, date, ids);
        };
    case Action::Pin:
        return [ids = command.ids](const Tasks &tasks) { return core::togglePin(tasks, ids); };
    case Action::Delete:
        return [ids = command.ids](const Tasks &tasks) { return core::deleteTasks(tasks, ids); };
    case Action::Prune:
        return [](const Tasks &tasks) { return core::pruneDone(tasks); };
    case Action::Purge:
        return [ids = command.ids](const Tasks &tasks) { return core::purgeTasks(tasks, ids); };
    case Action::Dump:
        return [](const Tasks &tasks) { return core::dumpTasks(tasks); };
    case Action::DumpMatching:
        return [pattern = command.pattern](const Tasks &tasks) { return core::dumpMatching(tasks, pattern); };
    case Action::None:
        break;
    }
    throw ValidationError(QStringLiteral("no action given"));
}

QString runCommand(core::AppContext &context, const ParsedCommand &command)
{
    const core::CommandResult result = context.execute(commandFor(command));

    switch (command.action) {
    case Action::List:
        return TaskPrinter::formatListing(result.view);
    case Action::Dump:
    case Action::DumpMatching:
        return TaskPrinter::formatDump(result.view);
    default:
        break;
    }
    qCDebug(lcCli) << result.message;
    return result.message.isEmpty() ? QString() : result.message + QLatin1Char('\n');
}

} // namespace cli
} // namespace nullus
