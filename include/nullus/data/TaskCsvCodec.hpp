#pragma once

#include <QString>
#include <QStringList>
#include <vector>

#include "nullus/data/Task.hpp"

namespace nullus {
namespace data {

// Row encoding of the task file:
//   id,status,desc,scheduled,deadline,created,is_visible,is_pin,done_date
// Fields holding a delimiter, quote or line break are quoted, quotes doubled.
class TaskCsvCodec
{
public:
    static QString header();
    static QString encode(const std::vector<TaskItem> &tasks);

    // Throws StorageError naming sourceName and the offending line.
    static std::vector<TaskItem> decode(const QString &content, const QString &sourceName);

    static QString encodeField(const QString &value);

private:
    struct Record
    {
        int line = 0;
        QStringList fields;
    };

    static std::vector<Record> splitRecords(const QString &content, const QString &sourceName);
    static TaskItem decodeRecord(const Record &record, const QString &sourceName);
    static QString encodeRecord(const TaskItem &task);

    static QString formatBool(bool value);
    static QString formatDateTime(const QDateTime &dt);
};

} // namespace data
} // namespace nullus
