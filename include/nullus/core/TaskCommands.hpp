#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <vector>

#include "nullus/data/Task.hpp"

namespace nullus {
namespace core {

struct CommandResult
{
    // Collection after the command; equal to the input when nothing changed.
    std::vector<data::TaskItem> tasks;
    // Rows to display, already in display order.
    std::vector<data::TaskItem> view;
    bool mutated = false;
    QString message;
};

// Every command validates all of its arguments before touching the
// collection. On ValidationError or NotFoundError the input is unchanged.

CommandResult listTasks(const std::vector<data::TaskItem> &tasks, const QString &pattern);

CommandResult addTasks(const std::vector<data::TaskItem> &tasks,
                       const QStringList &descriptions,
                       const QDateTime &now = QDateTime::currentDateTime());

CommandResult updateTask(const std::vector<data::TaskItem> &tasks, int id, const QString &description);

// Toggles; a task that becomes done records today as its done date.
CommandResult toggleDone(const std::vector<data::TaskItem> &tasks,
                         const std::vector<int> &ids,
                         const QDate &today = QDate::currentDate());

// An empty id list is accepted and changes nothing.
CommandResult scheduleTasks(const std::vector<data::TaskItem> &tasks, const QString &date, const std::vector<int> &ids);
CommandResult setDeadline(const std::vector<data::TaskItem> &tasks, const QString &date, const std::vector<int> &ids);

CommandResult togglePin(const std::vector<data::TaskItem> &tasks, const std::vector<int> &ids);

// Hides tasks. Hidden tasks are outside the active id range, so they can
// not be addressed again.
CommandResult deleteTasks(const std::vector<data::TaskItem> &tasks, const std::vector<int> &ids);

CommandResult pruneDone(const std::vector<data::TaskItem> &tasks);

// Removes rows by storage id regardless of visibility. Purging only hidden
// rows keeps the remaining ids; purging an active row renumbers.
CommandResult purgeTasks(const std::vector<data::TaskItem> &tasks, const std::vector<int> &ids);

CommandResult dumpTasks(const std::vector<data::TaskItem> &tasks);
CommandResult dumpMatching(const std::vector<data::TaskItem> &tasks, const QString &pattern);

} // namespace core
} // namespace nullus
