#include "nullus/cli/TaskPrinter.hpp"

#include <QVector>
#include <algorithm>

namespace nullus {
namespace cli {

using data::TaskItem;

QString TaskPrinter::formatListing(const std::vector<TaskItem> &view)
{
    if (view.empty()) {
        return QStringLiteral("No active tasks found.\n");
    }

    const bool anyPinned = std::any_of(view.begin(), view.end(), [](const TaskItem &task) {
        return task.pinned;
    });
    const bool anyScheduled = std::any_of(view.begin(), view.end(), [](const TaskItem &task) {
        return task.scheduled.isValid();
    });
    const bool anyDeadline = std::any_of(view.begin(), view.end(), [](const TaskItem &task) {
        return task.deadline.isValid();
    });

    QStringList headers;
    if (anyPinned) {
        headers << QStringLiteral("pin");
    }
    headers << QStringLiteral("id") << QStringLiteral("status") << QStringLiteral("desc");
    if (anyScheduled) {
        headers << QStringLiteral("scheduled");
    }
    if (anyDeadline) {
        headers << QStringLiteral("deadline");
    }

    QList<QStringList> rows;
    for (const TaskItem &task : view) {
        QStringList row;
        if (anyPinned) {
            row << (task.pinned ? QStringLiteral("*") : QString());
        }
        row << QString::number(task.id) << data::statusToString(task.status) << singleLine(task.description);
        if (anyScheduled) {
            row << data::formatTaskDate(task.scheduled);
        }
        if (anyDeadline) {
            row << data::formatTaskDate(task.deadline);
        }
        rows << row;
    }
    return formatTable(headers, rows);
}

QString TaskPrinter::formatDump(const std::vector<TaskItem> &view)
{
    if (view.empty()) {
        return QStringLiteral("No tasks stored.\n");
    }

    const QStringList headers = {
        QStringLiteral("id"),
        QStringLiteral("status"),
        QStringLiteral("desc"),
        QStringLiteral("scheduled"),
        QStringLiteral("deadline"),
        QStringLiteral("created"),
        QStringLiteral("is_visible"),
        QStringLiteral("is_pin"),
        QStringLiteral("done_date"),
    };
    QList<QStringList> rows;
    for (const TaskItem &task : view) {
        rows << QStringList{
            QString::number(task.id),
            data::statusToString(task.status),
            singleLine(task.description),
            data::formatTaskDate(task.scheduled),
            data::formatTaskDate(task.deadline),
            task.created.isValid() ? task.created.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss")) : QString(),
            task.visible ? QStringLiteral("true") : QStringLiteral("false"),
            task.pinned ? QStringLiteral("true") : QStringLiteral("false"),
            data::formatTaskDate(task.doneDate),
        };
    }
    return formatTable(headers, rows);
}

QString TaskPrinter::formatTable(const QStringList &headers, const QList<QStringList> &rows)
{
    QVector<int> widths(headers.size(), 0);
    for (int column = 0; column < headers.size(); ++column) {
        widths[column] = headers.at(column).size();
    }
    for (const QStringList &row : rows) {
        for (int column = 0; column < row.size() && column < widths.size(); ++column) {
            widths[column] = std::max(widths[column], row.at(column).size());
        }
    }

    auto renderRow = [&widths](const QStringList &cells) {
        QString line;
        for (int column = 0; column < widths.size(); ++column) {
            if (column > 0) {
                line += QStringLiteral("  ");
            }
            line += cells.value(column).leftJustified(widths.at(column));
        }
        // Trailing padding of the last column is noise.
        int end = line.size();
        while (end > 0 && line.at(end - 1) == QLatin1Char(' ')) {
            --end;
        }
        line.truncate(end);
        return line + QLatin1Char('\n');
    };

    QString out = renderRow(headers);
    QStringList rules;
    for (int width : widths) {
        rules << QString(width, QLatin1Char('-'));
    }
    out += renderRow(rules);
    for (const QStringList &row : rows) {
        out += renderRow(row);
    }
    return out;
}

QString TaskPrinter::singleLine(const QString &text)
{
    QString line = text;
    line.replace(QLatin1String("\r\n"), QLatin1String(" "));
    line.replace(QLatin1Char('\n'), QLatin1Char(' '));
    line.replace(QLatin1Char('\r'), QLatin1Char(' '));
    return line;
}

} // namespace cli
} // namespace nullus
