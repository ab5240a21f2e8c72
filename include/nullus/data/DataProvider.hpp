#pragma once

#include <memory>
#include <QString>

namespace nullus {
namespace data {

class TaskRepository;

class DataProvider
{
public:
    // An empty override falls back to QSettings "storage/file", then to the
    // per-user configuration directory.
    explicit DataProvider(const QString &storagePathOverride = QString());
    ~DataProvider();

    TaskRepository &taskRepository();
    const QString &storagePath() const;

    static QString defaultStoragePath();
    static QString resolveStoragePath(const QString &storagePathOverride);

private:
    QString m_storagePath;
    std::unique_ptr<TaskRepository> m_taskRepository;
};

} // namespace data
} // namespace nullus
