#include "nullus/data/Task.hpp"

#include <QRegularExpression>

namespace nullus {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
} // namespace

bool operator==(const TaskItem &lhs, const TaskItem &rhs)
{
    return lhs.id == rhs.id
        && lhs.description == rhs.description
        && lhs.status == rhs.status
        && lhs.scheduled == rhs.scheduled
        && lhs.deadline == rhs.deadline
        && lhs.created == rhs.created
        && lhs.visible == rhs.visible
        && lhs.pinned == rhs.pinned
        && lhs.doneDate == rhs.doneDate;
}

bool operator!=(const TaskItem &lhs, const TaskItem &rhs)
{
    return !(lhs == rhs);
}

QDate parseTaskDate(const QString &text)
{
    static const QRegularExpression shape(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    if (!shape.match(text).hasMatch()) {
        return {};
    }
    return QDate::fromString(text, QLatin1String(DATE_FORMAT));
}

QString formatTaskDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(DATE_FORMAT));
}

QString statusToString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Done:
        return QStringLiteral("DONE");
    case TaskStatus::Todo:
    default:
        return QStringLiteral("TODO");
    }
}

} // namespace data
} // namespace nullus
