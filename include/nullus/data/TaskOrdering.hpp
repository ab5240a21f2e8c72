#pragma once

#include <vector>

#include "nullus/data/Task.hpp"

namespace nullus {
namespace data {

// Visible tasks first, pinned before unpinned, ties by current id; then
// ids are reassigned 1..N so visible tasks hold 1..N_active and hidden
// tasks follow in their previous order.
std::vector<TaskItem> renumber(std::vector<TaskItem> tasks);

// Display order: pinned before unpinned, then id ascending.
std::vector<TaskItem> listingOrder(std::vector<TaskItem> tasks);

// Storage order: id ascending.
std::vector<TaskItem> storageOrder(std::vector<TaskItem> tasks);

int activeCount(const std::vector<TaskItem> &tasks);

} // namespace data
} // namespace nullus
