#pragma once

#include <QString>

#include "nullus/data/TaskRepository.hpp"

namespace nullus {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(QString filePath);
    ~FileTaskRepository() override = default;

    // Creates the file with a header row when it does not exist yet.
    std::vector<TaskItem> load() override;
    // Full rewrite through QSaveFile; the old file survives a failed write.
    // Binary mode: carriage returns inside quoted fields are data.
    void save(const std::vector<TaskItem> &tasks) override;

private:
    void ensureParentDirectory() const;

    QString m_filePath;
};

} // namespace data
} // namespace nullus
