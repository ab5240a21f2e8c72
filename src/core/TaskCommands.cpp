#include "nullus/core/TaskCommands.hpp"

#include "nullus/Logging.hpp"
#include "nullus/TaskError.hpp"
#include "nullus/data/TaskOrdering.hpp"

#include <QRegularExpression>
#include <QSet>
#include <QTime>
#include <algorithm>
#include <iterator>

namespace nullus {
namespace core {

using data::TaskItem;
using data::TaskStatus;

namespace {

QRegularExpression compilePattern(const QString &pattern)
{
    QRegularExpression regex(pattern,
                             QRegularExpression::CaseInsensitiveOption
                                 | QRegularExpression::UseUnicodePropertiesOption);
    if (!regex.isValid()) {
        throw ValidationError(QStringLiteral("invalid pattern '%1': %2").arg(pattern, regex.errorString()));
    }
    return regex;
}

std::vector<TaskItem> filterByDescription(const std::vector<TaskItem> &tasks,
                                          const QString &pattern,
                                          bool visibleOnly)
{
    std::vector<TaskItem> matches;
    const bool matchAll = pattern.isEmpty();
    const QRegularExpression regex = matchAll ? QRegularExpression() : compilePattern(pattern);
    for (const TaskItem &task : tasks) {
        if (visibleOnly && !task.visible) {
            continue;
        }
        if (matchAll || regex.match(task.description).hasMatch()) {
            matches.push_back(task);
        }
    }
    return matches;
}

QString requireDescription(const QString &description)
{
    const QString trimmed = description.trimmed();
    if (trimmed.isEmpty()) {
        throw ValidationError(QStringLiteral("task description must not be empty"));
    }
    return trimmed;
}

QDate requireDate(const QString &text)
{
    const QDate date = data::parseTaskDate(text);
    if (!date.isValid()) {
        throw ValidationError(QStringLiteral("invalid date '%1', expected YYYY-MM-DD").arg(text));
    }
    return date;
}

void requireIds(const std::vector<int> &ids)
{
    if (ids.empty()) {
        throw ValidationError(QStringLiteral("no task id given"));
    }
}

// Resolves displayed ids to indexes of visible tasks, duplicates collapsed.
std::vector<std::size_t> resolveActive(const std::vector<TaskItem> &tasks, const std::vector<int> &ids)
{
    std::vector<std::size_t> indexes;
    QSet<int> seen;
    const int active = data::activeCount(tasks);
    for (int id : ids) {
        if (seen.contains(id)) {
            continue;
        }
        seen.insert(id);
        const auto it = std::find_if(tasks.begin(), tasks.end(), [id](const TaskItem &task) {
            return task.visible && task.id == id;
        });
        if (id < 1 || id > active || it == tasks.end()) {
            throw NotFoundError(QStringLiteral("no active task with id %1 (%2 active)").arg(id).arg(active));
        }
        indexes.push_back(static_cast<std::size_t>(it - tasks.begin()));
    }
    return indexes;
}

CommandResult unchanged(const std::vector<TaskItem> &tasks, QString message = QString())
{
    CommandResult result;
    result.tasks = tasks;
    result.message = std::move(message);
    return result;
}

CommandResult changed(std::vector<TaskItem> tasks, QString message)
{
    CommandResult result;
    result.tasks = std::move(tasks);
    result.mutated = true;
    result.message = std::move(message);
    return result;
}

CommandResult assignDate(const std::vector<TaskItem> &tasks,
                         const QString &text,
                         const std::vector<int> &ids,
                         QDate TaskItem::*field,
                         const QString &summary)
{
    const QDate date = requireDate(text);
    if (ids.empty()) {
        qCWarning(lcCore) << "no task id given for" << text;
        return unchanged(tasks, QStringLiteral("No task id given, nothing changed."));
    }
    const auto indexes = resolveActive(tasks, ids);

    std::vector<TaskItem> next = tasks;
    for (std::size_t index : indexes) {
        next[index].*field = date;
    }
    return changed(std::move(next), summary.arg(indexes.size()).arg(data::formatTaskDate(date)));
}

} // namespace

CommandResult listTasks(const std::vector<TaskItem> &tasks, const QString &pattern)
{
    CommandResult result = unchanged(tasks);
    result.view = data::listingOrder(filterByDescription(tasks, pattern, true));
    return result;
}

CommandResult addTasks(const std::vector<TaskItem> &tasks, const QStringList &descriptions, const QDateTime &now)
{
    if (descriptions.isEmpty()) {
        throw ValidationError(QStringLiteral("no task description given"));
    }
    QStringList cleaned;
    for (const QString &description : descriptions) {
        cleaned << requireDescription(description);
    }

    QDateTime created = now;
    created.setTime(QTime(now.time().hour(), now.time().minute(), now.time().second()));

    int nextId = 0;
    for (const TaskItem &task : tasks) {
        nextId = std::max(nextId, task.id);
    }

    std::vector<TaskItem> next = tasks;
    for (const QString &description : cleaned) {
        TaskItem task;
        task.id = ++nextId;
        task.description = description;
        task.created = created;
        next.push_back(std::move(task));
    }
    qCDebug(lcCore) << "added" << cleaned.size() << "task(s)";
    return changed(data::renumber(std::move(next)), QStringLiteral("Added %1 task(s).").arg(cleaned.size()));
}

CommandResult updateTask(const std::vector<TaskItem> &tasks, int id, const QString &description)
{
    const QString cleaned = requireDescription(description);
    const auto indexes = resolveActive(tasks, { id });

    std::vector<TaskItem> next = tasks;
    next[indexes.front()].description = cleaned;
    return changed(std::move(next), QStringLiteral("Updated task %1.").arg(id));
}

CommandResult toggleDone(const std::vector<TaskItem> &tasks, const std::vector<int> &ids, const QDate &today)
{
    requireIds(ids);
    const auto indexes = resolveActive(tasks, ids);

    std::vector<TaskItem> next = tasks;
    int completed = 0;
    for (std::size_t index : indexes) {
        TaskItem &task = next[index];
        if (task.isDone()) {
            task.status = TaskStatus::Todo;
            task.doneDate = QDate();
        } else {
            task.status = TaskStatus::Done;
            task.doneDate = today;
            ++completed;
        }
    }
    qCDebug(lcCore) << "done toggled on" << indexes.size() << "task(s)," << completed << "now done";
    return changed(data::renumber(std::move(next)),
                   QStringLiteral("Marked %1 task(s) done, %2 reopened.")
                       .arg(completed)
                       .arg(static_cast<int>(indexes.size()) - completed));
}

CommandResult scheduleTasks(const std::vector<TaskItem> &tasks, const QString &date, const std::vector<int> &ids)
{
    return assignDate(tasks, date, ids, &TaskItem::scheduled, QStringLiteral("Scheduled %1 task(s) for %2."));
}

CommandResult setDeadline(const std::vector<TaskItem> &tasks, const QString &date, const std::vector<int> &ids)
{
    return assignDate(tasks, date, ids, &TaskItem::deadline, QStringLiteral("Set deadline of %1 task(s) to %2."));
}

CommandResult togglePin(const std::vector<TaskItem> &tasks, const std::vector<int> &ids)
{
    requireIds(ids);
    const auto indexes = resolveActive(tasks, ids);

    std::vector<TaskItem> next = tasks;
    int pinned = 0;
    for (std::size_t index : indexes) {
        next[index].pinned = !next[index].pinned;
        if (next[index].pinned) {
            ++pinned;
        }
    }
    return changed(std::move(next),
                   QStringLiteral("Pinned %1 task(s), unpinned %2.")
                       .arg(pinned)
                       .arg(static_cast<int>(indexes.size()) - pinned));
}

CommandResult deleteTasks(const std::vector<TaskItem> &tasks, const std::vector<int> &ids)
{
    requireIds(ids);
    const auto indexes = resolveActive(tasks, ids);

    std::vector<TaskItem> next = tasks;
    for (std::size_t index : indexes) {
        next[index].visible = false;
    }
    return changed(data::renumber(std::move(next)), QStringLiteral("Deleted %1 task(s).").arg(indexes.size()));
}

CommandResult pruneDone(const std::vector<TaskItem> &tasks)
{
    std::vector<TaskItem> next = tasks;
    int pruned = 0;
    for (TaskItem &task : next) {
        if (task.visible && task.isDone()) {
            task.visible = false;
            ++pruned;
        }
    }
    if (pruned == 0) {
        qCDebug(lcCore) << "prune found no done tasks";
    }
    return changed(data::renumber(std::move(next)), QStringLiteral("Pruned %1 done task(s).").arg(pruned));
}

CommandResult purgeTasks(const std::vector<TaskItem> &tasks, const std::vector<int> &ids)
{
    requireIds(ids);
    QSet<int> targets;
    for (int id : ids) {
        const bool known = std::any_of(tasks.begin(), tasks.end(), [id](const TaskItem &task) {
            return task.id == id;
        });
        if (!known) {
            throw NotFoundError(QStringLiteral("no stored task with id %1").arg(id));
        }
        targets.insert(id);
    }

    const bool anyVisible = std::any_of(tasks.begin(), tasks.end(), [&targets](const TaskItem &task) {
        return task.visible && targets.contains(task.id);
    });

    std::vector<TaskItem> next;
    next.reserve(tasks.size());
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(next), [&targets](const TaskItem &task) {
        return !targets.contains(task.id);
    });
    qCDebug(lcCore) << "purged" << targets.size() << "row(s)";
    // Removing an active row leaves a gap in 1..N_active.
    if (anyVisible) {
        next = data::renumber(std::move(next));
    }
    return changed(std::move(next), QStringLiteral("Purged %1 task(s).").arg(targets.size()));
}

CommandResult dumpTasks(const std::vector<TaskItem> &tasks)
{
    CommandResult result = unchanged(tasks);
    result.view = data::storageOrder(tasks);
    return result;
}

CommandResult dumpMatching(const std::vector<TaskItem> &tasks, const QString &pattern)
{
    CommandResult result = unchanged(tasks);
    result.view = data::storageOrder(filterByDescription(tasks, pattern, false));
    return result;
}

} // namespace core
} // namespace nullus
