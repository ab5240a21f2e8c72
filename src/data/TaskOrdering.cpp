#include "nullus/data/TaskOrdering.hpp"

#include "nullus/Logging.hpp"

#include <algorithm>

namespace nullus {
namespace data {

std::vector<TaskItem> renumber(std::vector<TaskItem> tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const TaskItem &lhs, const TaskItem &rhs) {
        if (lhs.visible != rhs.visible) {
            return lhs.visible;
        }
        if (lhs.visible && lhs.pinned != rhs.pinned) {
            return lhs.pinned;
        }
        return lhs.id < rhs.id;
    });
    int next = 1;
    for (TaskItem &task : tasks) {
        task.id = next++;
    }
    qCDebug(lcData) << "renumbered" << tasks.size() << "task(s)," << activeCount(tasks) << "active";
    return tasks;
}

std::vector<TaskItem> listingOrder(std::vector<TaskItem> tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const TaskItem &lhs, const TaskItem &rhs) {
        if (lhs.pinned != rhs.pinned) {
            return lhs.pinned;
        }
        return lhs.id < rhs.id;
    });
    return tasks;
}

std::vector<TaskItem> storageOrder(std::vector<TaskItem> tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const TaskItem &lhs, const TaskItem &rhs) {
        return lhs.id < rhs.id;
    });
    return tasks;
}

int activeCount(const std::vector<TaskItem> &tasks)
{
    return static_cast<int>(std::count_if(tasks.begin(), tasks.end(), [](const TaskItem &task) {
        return task.visible;
    }));
}

} // namespace data
} // namespace nullus
