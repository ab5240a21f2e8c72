#include "nullus/data/DataProvider.hpp"

#include "nullus/Logging.hpp"
#include "nullus/data/FileTaskRepository.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace nullus {
namespace data {

namespace {
constexpr auto STORAGE_FILE_KEY = "storage/file";
constexpr auto STORAGE_FILE_NAME = "tasks.csv";
} // namespace

DataProvider::DataProvider(const QString &storagePathOverride)
    : m_storagePath(resolveStoragePath(storagePathOverride))
    , m_taskRepository(std::make_unique<FileTaskRepository>(m_storagePath))
{
    qCDebug(lcData) << "task store at" << m_storagePath;
}

DataProvider::~DataProvider() = default;

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

const QString &DataProvider::storagePath() const
{
    return m_storagePath;
}

QString DataProvider::defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.config/nullus-todo");
    }
    return QDir(storageFolder).filePath(QLatin1String(STORAGE_FILE_NAME));
}

QString DataProvider::resolveStoragePath(const QString &storagePathOverride)
{
    if (!storagePathOverride.isEmpty()) {
        return QDir::cleanPath(storagePathOverride);
    }
    QSettings settings;
    const QString configured = settings.value(QLatin1String(STORAGE_FILE_KEY)).toString();
    if (!configured.isEmpty()) {
        return QDir::cleanPath(configured);
    }
    return defaultStoragePath();
}

} // namespace data
} // namespace nullus
