#include "nullus/data/TaskCsvCodec.hpp"

#include "nullus/Logging.hpp"
#include "nullus/TaskError.hpp"

#include <QSet>

namespace nullus {
namespace data {

namespace {
const QStringList COLUMNS = {
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

enum Column
{
    IdColumn,
    StatusColumn,
    DescColumn,
    ScheduledColumn,
    DeadlineColumn,
    CreatedColumn,
    VisibleColumn,
    PinColumn,
    DoneDateColumn,
};

[[noreturn]] void fail(const QString &sourceName, int line, const QString &what)
{
    throw StorageError(QStringLiteral("%1:%2: %3").arg(sourceName).arg(line).arg(what));
}

bool parseBool(const QString &value, bool *ok)
{
    *ok = true;
    if (value == QLatin1String("true")) {
        return true;
    }
    if (value == QLatin1String("false")) {
        return false;
    }
    *ok = false;
    return false;
}

QDate parseOptionalDate(const QString &value, const QString &column, const QString &sourceName, int line)
{
    if (value.isEmpty()) {
        return {};
    }
    const QDate date = parseTaskDate(value);
    if (!date.isValid()) {
        fail(sourceName, line, QStringLiteral("invalid %1 date '%2'").arg(column, value));
    }
    return date;
}
} // namespace

QString TaskCsvCodec::header()
{
    return COLUMNS.join(QLatin1Char(','));
}

QString TaskCsvCodec::encode(const std::vector<TaskItem> &tasks)
{
    QString out = header();
    out += QLatin1Char('\n');
    for (const TaskItem &task : tasks) {
        out += encodeRecord(task);
        out += QLatin1Char('\n');
    }
    return out;
}

std::vector<TaskItem> TaskCsvCodec::decode(const QString &content, const QString &sourceName)
{
    std::vector<TaskItem> tasks;
    const std::vector<Record> records = splitRecords(content, sourceName);
    if (records.empty()) {
        return tasks;
    }

    const Record &head = records.front();
    if (head.fields != COLUMNS) {
        fail(sourceName, head.line, QStringLiteral("unexpected header '%1'").arg(head.fields.join(QLatin1Char(','))));
    }

    QSet<int> seenIds;
    tasks.reserve(records.size() - 1);
    for (auto it = records.begin() + 1; it != records.end(); ++it) {
        TaskItem task = decodeRecord(*it, sourceName);
        if (seenIds.contains(task.id)) {
            fail(sourceName, it->line, QStringLiteral("duplicate id %1").arg(task.id));
        }
        seenIds.insert(task.id);
        tasks.push_back(std::move(task));
    }
    qCDebug(lcData) << "decoded" << tasks.size() << "task(s) from" << sourceName;
    return tasks;
}

QString TaskCsvCodec::encodeField(const QString &value)
{
    const bool needsQuotes = value.contains(QLatin1Char(','))
        || value.contains(QLatin1Char('"'))
        || value.contains(QLatin1Char('\n'))
        || value.contains(QLatin1Char('\r'));
    if (!needsQuotes) {
        return value;
    }
    QString quoted = value;
    quoted.replace(QLatin1Char('"'), QLatin1String("\"\""));
    return QLatin1Char('"') + quoted + QLatin1Char('"');
}

std::vector<TaskCsvCodec::Record> TaskCsvCodec::splitRecords(const QString &content, const QString &sourceName)
{
    std::vector<Record> records;
    Record current;
    QString field;
    bool inQuotes = false;
    bool fieldWasQuoted = false;
    int line = 1;
    current.line = line;

    auto finishField = [&]() {
        current.fields << field;
        field.clear();
        fieldWasQuoted = false;
    };
    auto finishRecord = [&]() {
        const bool blank = current.fields.isEmpty() && field.isEmpty() && !fieldWasQuoted;
        finishField();
        // Blank lines carry no data; a lone "" is a row and must fail the field count.
        if (!blank) {
            records.push_back(current);
        }
        current = Record{};
        current.line = line;
    };

    const int length = content.size();
    for (int i = 0; i < length; ++i) {
        const QChar ch = content.at(i);
        if (inQuotes) {
            if (ch == QLatin1Char('"')) {
                if (i + 1 < length && content.at(i + 1) == QLatin1Char('"')) {
                    field += QLatin1Char('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (ch == QLatin1Char('\n')) {
                    ++line;
                }
                field += ch;
            }
            continue;
        }

        if (ch == QLatin1Char('"')) {
            if (!field.isEmpty() || fieldWasQuoted) {
                fail(sourceName, line, QStringLiteral("stray quote in field"));
            }
            inQuotes = true;
            fieldWasQuoted = true;
        } else if (ch == QLatin1Char(',')) {
            finishField();
        } else if (ch == QLatin1Char('\r') && i + 1 < length && content.at(i + 1) == QLatin1Char('\n')) {
            continue;
        } else if (ch == QLatin1Char('\n')) {
            ++line;
            finishRecord();
        } else {
            if (fieldWasQuoted) {
                fail(sourceName, line, QStringLiteral("unexpected character after closing quote"));
            }
            field += ch;
        }
    }

    if (inQuotes) {
        fail(sourceName, current.line, QStringLiteral("unterminated quoted field"));
    }
    if (!field.isEmpty() || fieldWasQuoted || !current.fields.isEmpty()) {
        finishRecord();
    }
    return records;
}

TaskItem TaskCsvCodec::decodeRecord(const Record &record, const QString &sourceName)
{
    const QStringList &fields = record.fields;
    if (fields.size() != COLUMNS.size()) {
        fail(sourceName, record.line,
             QStringLiteral("expected %1 fields, found %2").arg(COLUMNS.size()).arg(fields.size()));
    }

    TaskItem task;

    bool ok = false;
    task.id = fields.at(IdColumn).toInt(&ok);
    if (!ok || task.id <= 0) {
        fail(sourceName, record.line, QStringLiteral("invalid id '%1'").arg(fields.at(IdColumn)));
    }

    const QString &status = fields.at(StatusColumn);
    if (status == QLatin1String("TODO")) {
        task.status = TaskStatus::Todo;
    } else if (status == QLatin1String("DONE")) {
        task.status = TaskStatus::Done;
    } else {
        fail(sourceName, record.line, QStringLiteral("invalid status '%1'").arg(status));
    }

    task.description = fields.at(DescColumn);
    task.scheduled = parseOptionalDate(fields.at(ScheduledColumn), COLUMNS.at(ScheduledColumn), sourceName, record.line);
    task.deadline = parseOptionalDate(fields.at(DeadlineColumn), COLUMNS.at(DeadlineColumn), sourceName, record.line);

    const QString &created = fields.at(CreatedColumn);
    if (!created.isEmpty()) {
        task.created = QDateTime::fromString(created, Qt::ISODate);
        if (!task.created.isValid()) {
            fail(sourceName, record.line, QStringLiteral("invalid created timestamp '%1'").arg(created));
        }
    }

    task.visible = parseBool(fields.at(VisibleColumn), &ok);
    if (!ok) {
        fail(sourceName, record.line, QStringLiteral("invalid is_visible flag '%1'").arg(fields.at(VisibleColumn)));
    }
    task.pinned = parseBool(fields.at(PinColumn), &ok);
    if (!ok) {
        fail(sourceName, record.line, QStringLiteral("invalid is_pin flag '%1'").arg(fields.at(PinColumn)));
    }

    task.doneDate = parseOptionalDate(fields.at(DoneDateColumn), COLUMNS.at(DoneDateColumn), sourceName, record.line);
    return task;
}

QString TaskCsvCodec::encodeRecord(const TaskItem &task)
{
    QStringList fields;
    fields.reserve(COLUMNS.size());
    fields << QString::number(task.id)
           << statusToString(task.status)
           << encodeField(task.description)
           << formatTaskDate(task.scheduled)
           << formatTaskDate(task.deadline)
           << formatDateTime(task.created)
           << formatBool(task.visible)
           << formatBool(task.pinned)
           << formatTaskDate(task.doneDate);
    return fields.join(QLatin1Char(','));
}

QString TaskCsvCodec::formatBool(bool value)
{
    return value ? QStringLiteral("true") : QStringLiteral("false");
}

QString TaskCsvCodec::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    if (dt.time().msec() != 0) {
        return dt.toString(Qt::ISODateWithMs);
    }
    return dt.toString(Qt::ISODate);
}

} // namespace data
} // namespace nullus
