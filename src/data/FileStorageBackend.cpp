#include "taskstore/data/FileStorageBackend.hpp"

#include "taskstore/core/Logging.hpp"
#include "taskstore/data/TaskJson.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>

#include <algorithm>
#include <utility>

namespace taskstore {
namespace data {

using core::StorageError;
using core::setError;

namespace {
constexpr auto TASKS_FILE = "tasks.json";
constexpr auto BACKUP_DIR = "backups";

QHash<QUuid, Task> indexTasks(std::vector<Task> tasks)
{
    QHash<QUuid, Task> index;
    for (Task &task : tasks) {
        const QUuid id = task.id;
        index.insert(id, std::move(task));
    }
    return index;
}

std::vector<Task> orderedTasks(const QHash<QUuid, Task> &tasks)
{
    std::vector<Task> result;
    result.reserve(static_cast<size_t>(tasks.size()));
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), [](const Task &lhs, const Task &rhs) {
        if (lhs.entry == rhs.entry) {
            return lhs.id.toString() < rhs.id.toString();
        }
        return lhs.entry < rhs.entry;
    });
    return result;
}
} // namespace

FileStorageBackend::FileStorageBackend(QString dataDirectory)
    : m_dataDirectory(std::move(dataDirectory))
    , m_tasksFile(QDir(m_dataDirectory).filePath(QLatin1String(TASKS_FILE)))
    , m_backupDirectory(QDir(m_dataDirectory).filePath(QLatin1String(BACKUP_DIR)))
{
}

QString FileStorageBackend::tasksFilePath() const
{
    return m_tasksFile;
}

QString FileStorageBackend::backupDirectory() const
{
    return m_backupDirectory;
}

bool FileStorageBackend::initialize(StorageError *error)
{
    QMutexLocker locker(&m_mutex);
    return initializeLocked(error);
}

bool FileStorageBackend::initializeLocked(StorageError *error)
{
    if (m_initialized) {
        return true;
    }
    if (!QDir().mkpath(m_dataDirectory) || !QDir().mkpath(m_backupDirectory)) {
        setError(error, StorageError::io(QStringLiteral("cannot create data directory %1").arg(m_dataDirectory)));
        return false;
    }
    auto tasks = readFile(error);
    if (!tasks) {
        return false;
    }
    m_cache = std::move(*tasks);
    m_initialized = true;
    qCInfo(lcStorage) << "Loaded" << m_cache.size() << "tasks from" << m_tasksFile;
    return true;
}

bool FileStorageBackend::saveTask(const Task &task, StorageError *error)
{
    QMutexLocker locker(&m_mutex);
    if (!initializeLocked(error)) {
        return false;
    }
    QHash<QUuid, Task> updated = m_cache;
    updated.insert(task.id, task);
    if (!writeFile(updated, error)) {
        return false;
    }
    m_cache = std::move(updated);
    return true;
}

std::optional<Task> FileStorageBackend::loadTask(const QUuid &id, StorageError *error) const
{
    const auto tasks = currentTasks(error);
    if (!tasks) {
        return std::nullopt;
    }
    const auto it = tasks->constFind(id);
    if (it == tasks->constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool FileStorageBackend::deleteTask(const QUuid &id, StorageError *error)
{
    QMutexLocker locker(&m_mutex);
    if (!initializeLocked(error)) {
        return false;
    }
    if (!m_cache.contains(id)) {
        setError(error, StorageError::notFound(
                            QStringLiteral("task %1 not found").arg(id.toString(QUuid::WithoutBraces))));
        return false;
    }
    QHash<QUuid, Task> updated = m_cache;
    updated.remove(id);
    if (!writeFile(updated, error)) {
        return false;
    }
    m_cache = std::move(updated);
    return true;
}

std::optional<std::vector<Task>> FileStorageBackend::loadAllTasks(StorageError *error) const
{
    const auto tasks = currentTasks(error);
    if (!tasks) {
        return std::nullopt;
    }
    return orderedTasks(*tasks);
}

std::optional<std::vector<Task>> FileStorageBackend::queryTasks(const TaskQuery &query,
                                                                const UserContext *activeContext,
                                                                StorageError *error) const
{
    auto tasks = loadAllTasks(error);
    if (!tasks) {
        return std::nullopt;
    }
    return applyQuery(std::move(*tasks), query, activeContext);
}

std::optional<QString> FileStorageBackend::backup(StorageError *error) const
{
    QMutexLocker locker(&m_mutex);
    QFile file(m_tasksFile);
    if (!file.exists()) {
        return QString();
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setError(error, StorageError::io(QStringLiteral("cannot read %1: %2").arg(m_tasksFile, file.errorString())));
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll());
}

bool FileStorageBackend::restore(const QString &backupData, StorageError *error)
{
    if (backupData.isEmpty()) {
        return true;
    }

    const QByteArray contents = backupData.toUtf8();
    StorageError parseError;
    auto tasks = deserializeTasks(contents, &parseError);
    if (!tasks) {
        setError(error, parseError.withContext(QStringLiteral("invalid backup data")));
        return false;
    }

    QMutexLocker locker(&m_mutex);
    if (!QDir().mkpath(m_dataDirectory)) {
        setError(error, StorageError::io(QStringLiteral("cannot create data directory %1").arg(m_dataDirectory)));
        return false;
    }
    StorageError backupError;
    if (!createBackup(&backupError)) {
        qCWarning(lcStorage) << "Restoring without a backup of the current file:" << backupError.toString();
    }
    if (!writeText(contents, error)) {
        return false;
    }
    m_cache = indexTasks(std::move(*tasks));
    m_initialized = true;
    qCInfo(lcStorage) << "Restored" << m_cache.size() << "tasks";
    return true;
}

bool FileStorageBackend::undo(bool *undone, StorageError *error)
{
    if (undone) {
        *undone = false;
    }
    setError(error, StorageError::unsupported(QStringLiteral("undo is not supported by the file backend")));
    return false;
}

std::optional<QHash<QUuid, Task>> FileStorageBackend::currentTasks(StorageError *error) const
{
    QMutexLocker locker(&m_mutex);
    if (m_initialized) {
        return m_cache;
    }
    return readFile(error);
}

std::optional<QHash<QUuid, Task>> FileStorageBackend::readFile(StorageError *error) const
{
    QFile file(m_tasksFile);
    if (!file.exists()) {
        return QHash<QUuid, Task>();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, StorageError::io(QStringLiteral("cannot read %1: %2").arg(m_tasksFile, file.errorString())));
        return std::nullopt;
    }
    StorageError parseError;
    auto tasks = deserializeTasks(file.readAll(), &parseError);
    if (!tasks) {
        setError(error, parseError.withContext(QStringLiteral("failed to parse %1").arg(m_tasksFile)));
        return std::nullopt;
    }
    return indexTasks(std::move(*tasks));
}

bool FileStorageBackend::writeFile(const QHash<QUuid, Task> &tasks, StorageError *error) const
{
    StorageError backupError;
    if (!createBackup(&backupError)) {
        setError(error, backupError);
        return false;
    }
    return writeText(serializeTasks(orderedTasks(tasks)), error);
}

bool FileStorageBackend::writeText(const QByteArray &contents, StorageError *error) const
{
    QSaveFile file(m_tasksFile);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(error, StorageError::io(QStringLiteral("cannot write %1: %2").arg(m_tasksFile, file.errorString())));
        return false;
    }
    if (file.write(contents) != contents.size()) {
        setError(error, StorageError::io(QStringLiteral("cannot write %1: %2").arg(m_tasksFile, file.errorString())));
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        setError(error, StorageError::io(QStringLiteral("cannot replace %1: %2").arg(m_tasksFile, file.errorString())));
        return false;
    }
    return true;
}

bool FileStorageBackend::createBackup(StorageError *error) const
{
    if (!QFileInfo::exists(m_tasksFile)) {
        return true;
    }
    if (!QDir().mkpath(m_backupDirectory)) {
        setError(error, StorageError::io(QStringLiteral("cannot create backup directory %1").arg(m_backupDirectory)));
        return false;
    }
    const QString target = QDir(m_backupDirectory)
                               .filePath(QStringLiteral("tasks_%1.json")
                                             .arg(QDateTime::currentDateTimeUtc().toSecsSinceEpoch()));
    if (QFile::exists(target) && !QFile::remove(target)) {
        setError(error, StorageError::io(QStringLiteral("cannot replace backup %1").arg(target)));
        return false;
    }
    if (!QFile::copy(m_tasksFile, target)) {
        setError(error, StorageError::io(QStringLiteral("cannot copy %1 to %2").arg(m_tasksFile, target)));
        return false;
    }
    qCDebug(lcStorage) << "Backed up tasks to" << target;
    return true;
}

} // namespace data
} // namespace taskstore
