#pragma once

#include <QString>
#include <QStringList>
#include <vector>

#include "nullus/data/Task.hpp"

namespace nullus {
namespace cli {

class TaskPrinter
{
public:
    // Active listing: pin marker, scheduled and deadline columns only when
    // some row uses them.
    static QString formatListing(const std::vector<data::TaskItem> &view);
    // Every column of every row.
    static QString formatDump(const std::vector<data::TaskItem> &view);

    static QString formatTable(const QStringList &headers, const QList<QStringList> &rows);

private:
    static QString singleLine(const QString &text);
};

} // namespace cli
} // namespace nullus
