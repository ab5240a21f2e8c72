#include "nullus/data/InMemoryTaskRepository.hpp"

#include "nullus/data/TaskOrdering.hpp"

namespace nullus {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;

InMemoryTaskRepository::InMemoryTaskRepository(std::vector<TaskItem> tasks)
    : m_items(std::move(tasks))
{
}

InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<TaskItem> InMemoryTaskRepository::load()
{
    ++m_loadCount;
    return m_items;
}

void InMemoryTaskRepository::save(const std::vector<TaskItem> &tasks)
{
    ++m_saveCount;
    m_items = storageOrder(tasks);
}

int InMemoryTaskRepository::loadCount() const
{
    return m_loadCount;
}

int InMemoryTaskRepository::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace nullus
