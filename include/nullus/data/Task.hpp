#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

namespace nullus {
namespace data {

enum class TaskStatus
{
    Todo,
    Done,
};

struct TaskItem
{
    int id = 0;
    QString description;
    TaskStatus status = TaskStatus::Todo;
    QDate scheduled;
    QDate deadline;
    QDateTime created;
    bool visible = true;
    bool pinned = false;
    QDate doneDate;

    bool isDone() const { return status == TaskStatus::Done; }
};

bool operator==(const TaskItem &lhs, const TaskItem &rhs);
bool operator!=(const TaskItem &lhs, const TaskItem &rhs);

// Strict YYYY-MM-DD; returns a null QDate for anything else.
QDate parseTaskDate(const QString &text);
QString formatTaskDate(const QDate &date);

QString statusToString(TaskStatus status);

} // namespace data
} // namespace nullus
