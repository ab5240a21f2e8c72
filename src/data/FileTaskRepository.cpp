#include "nullus/data/FileTaskRepository.hpp"

#include "nullus/Logging.hpp"
#include "nullus/TaskError.hpp"
#include "nullus/data/TaskCsvCodec.hpp"
#include "nullus/data/TaskOrdering.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

namespace nullus {
namespace data {

FileTaskRepository::FileTaskRepository(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::vector<TaskItem> FileTaskRepository::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcData) << "creating empty task file" << m_filePath;
        save({});
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw StorageError(QStringLiteral("cannot read %1: %2").arg(m_filePath, file.errorString()));
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    const QString content = stream.readAll();
    if (stream.status() != QTextStream::Ok) {
        throw StorageError(QStringLiteral("cannot read %1").arg(m_filePath));
    }

    auto tasks = TaskCsvCodec::decode(content, m_filePath);
    qCDebug(lcData) << "loaded" << tasks.size() << "task(s) from" << m_filePath;
    return tasks;
}

void FileTaskRepository::save(const std::vector<TaskItem> &tasks)
{
    ensureParentDirectory();

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw StorageError(QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString()));
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << TaskCsvCodec::encode(storageOrder(tasks));
    stream.flush();

    if (stream.status() != QTextStream::Ok) {
        file.cancelWriting();
        throw StorageError(QStringLiteral("cannot write %1").arg(m_filePath));
    }
    if (!file.commit()) {
        throw StorageError(QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString()));
    }
    qCDebug(lcData) << "saved" << tasks.size() << "task(s) to" << m_filePath;
}

void FileTaskRepository::ensureParentDirectory() const
{
    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw StorageError(QStringLiteral("cannot create directory %1").arg(dir.path()));
    }
}

} // namespace data
} // namespace nullus
