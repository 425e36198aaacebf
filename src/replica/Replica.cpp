#include "taskstore/replica/Replica.hpp"

#include "taskstore/core/Logging.hpp"

#include <QAtomicInt>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

#include <utility>

namespace taskstore {
namespace replica {

using core::StorageError;
using core::setError;

namespace {
constexpr auto DATABASE_FILE = "taskstore.sqlite3";
constexpr auto DRIVER = "QSQLITE";
constexpr int BUSY_TIMEOUT_MS = 5000;

QAtomicInt connectionCounter;

QString uuidText(const QUuid &uuid)
{
    return uuid.toString(QUuid::WithoutBraces);
}

StorageError sqlError(const QString &context, const QSqlError &error)
{
    return StorageError::database(QStringLiteral("%1: %2").arg(context, error.text()));
}

QJsonObject fieldsToJson(const TaskFields &fields)
{
    QJsonObject object;
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        object.insert(it.key(), it.value());
    }
    return object;
}

std::optional<TaskFields> fieldsFromJson(const QJsonObject &object)
{
    TaskFields fields;
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        if (!it.value().isString()) {
            return std::nullopt;
        }
        fields.insert(it.key(), it.value().toString());
    }
    return fields;
}

std::optional<QJsonObject> parseObject(const QByteArray &json)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }
    return document.object();
}

QJsonValue optionalValue(const std::optional<QString> &value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

std::optional<QString> optionalString(const QJsonValue &value)
{
    if (value.isString()) {
        return value.toString();
    }
    return std::nullopt;
}
} // namespace

ReplicaOperation ReplicaOperation::create(const QUuid &uuid)
{
    ReplicaOperation operation;
    operation.kind = Kind::Create;
    operation.uuid = uuid;
    return operation;
}

ReplicaOperation ReplicaOperation::update(const QUuid &uuid, const QString &property,
                                          std::optional<QString> value)
{
    ReplicaOperation operation;
    operation.kind = Kind::Update;
    operation.uuid = uuid;
    operation.property = property;
    operation.value = std::move(value);
    return operation;
}

ReplicaOperation ReplicaOperation::remove(const QUuid &uuid)
{
    ReplicaOperation operation;
    operation.kind = Kind::Delete;
    operation.uuid = uuid;
    return operation;
}

ReplicaOperation ReplicaOperation::undoPoint()
{
    return ReplicaOperation();
}

bool operator==(const ReplicaOperation &lhs, const ReplicaOperation &rhs)
{
    return lhs.kind == rhs.kind && lhs.uuid == rhs.uuid && lhs.property == rhs.property
           && lhs.value == rhs.value;
}

Replica::Replica() = default;

Replica::~Replica()
{
    close();
}

QString Replica::databasePath(const QString &directory)
{
    return QDir(directory).filePath(QLatin1String(DATABASE_FILE));
}

bool Replica::open(const QString &directory, AccessMode mode, StorageError *error)
{
    close();

    if (!QSqlDatabase::isDriverAvailable(QLatin1String(DRIVER))) {
        setError(error, StorageError::database(QStringLiteral("SQLite driver is not available")));
        return false;
    }

    const QString path = databasePath(directory);
    if (mode == AccessMode::ReadWrite) {
        if (!QDir().mkpath(directory)) {
            setError(error, StorageError::database(
                                QStringLiteral("cannot create replica directory %1").arg(directory)));
            return false;
        }
    } else if (!QFileInfo::exists(path)) {
        setError(error, StorageError::database(QStringLiteral("no replica found at %1").arg(path)));
        return false;
    }

    const QString connectionName =
        QStringLiteral("taskstore-replica-%1").arg(connectionCounter.fetchAndAddRelaxed(1));
    m_db = QSqlDatabase::addDatabase(QLatin1String(DRIVER), connectionName);
    m_db.setDatabaseName(path);
    QString options = QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(BUSY_TIMEOUT_MS);
    if (mode == AccessMode::ReadOnly) {
        options.prepend(QStringLiteral("QSQLITE_OPEN_READONLY;"));
    }
    m_db.setConnectOptions(options);

    if (!m_db.open()) {
        const StorageError failure =
            sqlError(QStringLiteral("cannot open replica at %1").arg(path), m_db.lastError());
        close();
        setError(error, failure);
        return false;
    }

    m_directory = directory;
    m_mode = mode;
    if (mode == AccessMode::ReadWrite && !ensureSchema(error)) {
        close();
        return false;
    }

    qCInfo(lcReplica) << "Opened replica" << path
                      << (mode == AccessMode::ReadOnly ? "read-only" : "read-write");
    return true;
}

void Replica::close()
{
    if (!m_db.isValid()) {
        return;
    }
    const QString connection = m_db.connectionName();
    if (m_db.isOpen()) {
        m_db.close();
        qCDebug(lcReplica) << "Closed replica" << m_directory;
    }
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(connection);
    m_directory.clear();
}

bool Replica::isOpen() const
{
    return m_db.isValid() && m_db.isOpen();
}

QString Replica::directory() const
{
    return m_directory;
}

bool Replica::ensureSchema(StorageError *error)
{
    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral(
            "CREATE TABLE IF NOT EXISTS tasks (uuid TEXT PRIMARY KEY, data TEXT NOT NULL)"))) {
        setError(error, sqlError(QStringLiteral("cannot create tasks table"), query.lastError()));
        return false;
    }
    if (!query.exec(QStringLiteral("CREATE TABLE IF NOT EXISTS operations ("
                                   "id INTEGER PRIMARY KEY AUTOINCREMENT, data TEXT NOT NULL)"))) {
        setError(error, sqlError(QStringLiteral("cannot create operations table"), query.lastError()));
        return false;
    }
    return true;
}

std::optional<TaskFields> Replica::taskFields(const QUuid &uuid, StorageError *error) const
{
    if (!isOpen()) {
        setError(error, StorageError::database(QStringLiteral("replica is not open")));
        return std::nullopt;
    }
    return loadFields(uuid, error);
}

std::optional<std::vector<Replica::TaskRecord>> Replica::allTaskFields(StorageError *error) const
{
    if (!isOpen()) {
        setError(error, StorageError::database(QStringLiteral("replica is not open")));
        return std::nullopt;
    }

    QSqlQuery query(m_db);
    query.setForwardOnly(true);
    if (!query.exec(QStringLiteral("SELECT uuid, data FROM tasks ORDER BY uuid"))) {
        setError(error, sqlError(QStringLiteral("cannot list tasks"), query.lastError()));
        return std::nullopt;
    }

    std::vector<TaskRecord> records;
    while (query.next()) {
        const QString uuid = query.value(0).toString();
        const auto object = parseObject(query.value(1).toByteArray());
        std::optional<TaskFields> fields;
        if (object) {
            fields = fieldsFromJson(*object);
        }
        if (!fields) {
            setError(error, StorageError::database(QStringLiteral("corrupt task record %1").arg(uuid)));
            return std::nullopt;
        }
        records.push_back(TaskRecord{QUuid::fromString(uuid), std::move(*fields)});
    }
    return records;
}

bool Replica::commitOperations(const std::vector<ReplicaOperation> &operations, StorageError *error)
{
    if (!isOpen()) {
        setError(error, StorageError::database(QStringLiteral("replica is not open")));
        return false;
    }
    if (m_mode == AccessMode::ReadOnly) {
        setError(error, StorageError::database(QStringLiteral("replica is opened read-only")));
        return false;
    }
    if (operations.empty()) {
        return true;
    }

    if (!m_db.transaction()) {
        setError(error, sqlError(QStringLiteral("cannot start transaction"), m_db.lastError()));
        return false;
    }

    for (const ReplicaOperation &operation : operations) {
        if (!applyOperation(operation, error)) {
            if (!m_db.rollback()) {
                qCWarning(lcReplica) << "Rollback failed:" << m_db.lastError().text();
            }
            return false;
        }
    }

    if (!m_db.commit()) {
        const StorageError failure = sqlError(QStringLiteral("commit failed"), m_db.lastError());
        m_db.rollback();
        setError(error, failure);
        return false;
    }

    qCDebug(lcReplica) << "Committed" << operations.size() << "operations";
    return true;
}

bool Replica::applyOperation(const ReplicaOperation &operation, StorageError *error)
{
    if (operation.kind == ReplicaOperation::Kind::UndoPoint) {
        return appendLog(QJsonObject{{QStringLiteral("type"), QStringLiteral("undo_point")}}, error);
    }

    StorageError lookupError;
    const std::optional<TaskFields> existing = loadFields(operation.uuid, &lookupError);
    if (lookupError.isValid()) {
        setError(error, lookupError);
        return false;
    }

    switch (operation.kind) {
    case ReplicaOperation::Kind::Create: {
        if (existing) {
            return true;
        }
        if (!storeFields(operation.uuid, TaskFields(), error)) {
            return false;
        }
        return appendLog(QJsonObject{{QStringLiteral("type"), QStringLiteral("create")},
                                     {QStringLiteral("uuid"), uuidText(operation.uuid)}},
                         error);
    }
    case ReplicaOperation::Kind::Update: {
        if (!existing) {
            setError(error, StorageError::database(
                                QStringLiteral("cannot update %1: no such task").arg(uuidText(operation.uuid))));
            return false;
        }
        if (operation.property.isEmpty()) {
            setError(error, StorageError::database(QStringLiteral("cannot update %1: empty property name")
                                                       .arg(uuidText(operation.uuid))));
            return false;
        }
        TaskFields fields = *existing;
        std::optional<QString> oldValue;
        if (fields.contains(operation.property)) {
            oldValue = fields.value(operation.property);
        }
        if (oldValue == operation.value) {
            return true;
        }
        if (operation.value) {
            fields.insert(operation.property, *operation.value);
        } else {
            fields.remove(operation.property);
        }
        if (!storeFields(operation.uuid, fields, error)) {
            return false;
        }
        return appendLog(QJsonObject{{QStringLiteral("type"), QStringLiteral("update")},
                                     {QStringLiteral("uuid"), uuidText(operation.uuid)},
                                     {QStringLiteral("property"), operation.property},
                                     {QStringLiteral("old_value"), optionalValue(oldValue)},
                                     {QStringLiteral("value"), optionalValue(operation.value)}},
                         error);
    }
    case ReplicaOperation::Kind::Delete: {
        if (!existing) {
            return true;
        }
        if (!removeTask(operation.uuid, error)) {
            return false;
        }
        return appendLog(QJsonObject{{QStringLiteral("type"), QStringLiteral("delete")},
                                     {QStringLiteral("uuid"), uuidText(operation.uuid)},
                                     {QStringLiteral("old_task"), fieldsToJson(*existing)}},
                         error);
    }
    case ReplicaOperation::Kind::UndoPoint:
        break;
    }
    return true;
}

bool Replica::appendLog(const QJsonObject &entry, StorageError *error)
{
    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("INSERT INTO operations (data) VALUES (?)"));
    query.addBindValue(QString::fromUtf8(QJsonDocument(entry).toJson(QJsonDocument::Compact)));
    if (!query.exec()) {
        setError(error, sqlError(QStringLiteral("cannot append to operation log"), query.lastError()));
        return false;
    }
    return true;
}

bool Replica::undo(bool *undone, StorageError *error)
{
    if (undone) {
        *undone = false;
    }
    if (!isOpen()) {
        setError(error, StorageError::database(QStringLiteral("replica is not open")));
        return false;
    }
    if (m_mode == AccessMode::ReadOnly) {
        setError(error, StorageError::database(QStringLiteral("replica is opened read-only")));
        return false;
    }

    // Walk back to the newest undo point that still has operations after it.
    // Trailing undo points without any operation are skipped.
    std::vector<QJsonObject> pending;
    qint64 boundary = -1;
    {
        QSqlQuery query(m_db);
        query.setForwardOnly(true);
        if (!query.exec(QStringLiteral("SELECT id, data FROM operations ORDER BY id DESC"))) {
            setError(error, sqlError(QStringLiteral("cannot read operation log"), query.lastError()));
            return false;
        }
        while (query.next()) {
            const qint64 id = query.value(0).toLongLong();
            const auto entry = parseObject(query.value(1).toByteArray());
            if (!entry) {
                setError(error, StorageError::database(
                                    QStringLiteral("corrupt operation log entry %1").arg(id)));
                return false;
            }
            if (entry->value(QStringLiteral("type")).toString() == QLatin1String("undo_point")) {
                if (!pending.empty()) {
                    boundary = id;
                    break;
                }
                continue;
            }
            boundary = id;
            pending.push_back(*entry);
        }
    }

    if (pending.empty()) {
        qCDebug(lcReplica) << "Nothing to undo";
        return true;
    }

    if (!m_db.transaction()) {
        setError(error, sqlError(QStringLiteral("cannot start transaction"), m_db.lastError()));
        return false;
    }

    auto fail = [this]() {
        if (!m_db.rollback()) {
            qCWarning(lcReplica) << "Rollback failed:" << m_db.lastError().text();
        }
        return false;
    };

    for (const QJsonObject &entry : pending) {
        if (!revertEntry(entry, error)) {
            return fail();
        }
    }

    QSqlQuery drop(m_db);
    drop.prepare(QStringLiteral("DELETE FROM operations WHERE id >= ?"));
    drop.addBindValue(boundary);
    if (!drop.exec()) {
        setError(error, sqlError(QStringLiteral("cannot trim operation log"), drop.lastError()));
        return fail();
    }

    if (!m_db.commit()) {
        setError(error, sqlError(QStringLiteral("commit failed"), m_db.lastError()));
        return fail();
    }

    qCInfo(lcReplica) << "Undid" << pending.size() << "operations";
    if (undone) {
        *undone = true;
    }
    return true;
}

bool Replica::revertEntry(const QJsonObject &entry, StorageError *error)
{
    const QString type = entry.value(QStringLiteral("type")).toString();
    const QUuid uuid = QUuid::fromString(entry.value(QStringLiteral("uuid")).toString());
    if (uuid.isNull()) {
        setError(error, StorageError::database(QStringLiteral("operation log entry without task uuid")));
        return false;
    }

    if (type == QLatin1String("create")) {
        return removeTask(uuid, error);
    }

    if (type == QLatin1String("update")) {
        StorageError lookupError;
        std::optional<TaskFields> fields = loadFields(uuid, &lookupError);
        if (lookupError.isValid()) {
            setError(error, lookupError);
            return false;
        }
        if (!fields) {
            setError(error, StorageError::database(
                                QStringLiteral("cannot undo update of missing task %1").arg(uuidText(uuid))));
            return false;
        }
        const QString property = entry.value(QStringLiteral("property")).toString();
        const std::optional<QString> oldValue = optionalString(entry.value(QStringLiteral("old_value")));
        if (oldValue) {
            fields->insert(property, *oldValue);
        } else {
            fields->remove(property);
        }
        return storeFields(uuid, *fields, error);
    }

    if (type == QLatin1String("delete")) {
        const std::optional<TaskFields> fields =
            fieldsFromJson(entry.value(QStringLiteral("old_task")).toObject());
        if (!fields) {
            setError(error, StorageError::database(
                                QStringLiteral("corrupt deleted task in operation log: %1").arg(uuidText(uuid))));
            return false;
        }
        return storeFields(uuid, *fields, error);
    }

    setError(error, StorageError::database(QStringLiteral("unknown operation log entry '%1'").arg(type)));
    return false;
}

std::optional<int> Replica::operationCount(StorageError *error) const
{
    if (!isOpen()) {
        setError(error, StorageError::database(QStringLiteral("replica is not open")));
        return std::nullopt;
    }
    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral("SELECT COUNT(*) FROM operations")) || !query.next()) {
        setError(error, sqlError(QStringLiteral("cannot count operations"), query.lastError()));
        return std::nullopt;
    }
    return query.value(0).toInt();
}

std::optional<TaskFields> Replica::loadFields(const QUuid &uuid, StorageError *error) const
{
    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("SELECT data FROM tasks WHERE uuid = ?"));
    query.addBindValue(uuidText(uuid));
    if (!query.exec()) {
        setError(error, sqlError(QStringLiteral("cannot read task %1").arg(uuidText(uuid)),
                                 query.lastError()));
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }

    const auto object = parseObject(query.value(0).toByteArray());
    std::optional<TaskFields> fields;
    if (object) {
        fields = fieldsFromJson(*object);
    }
    if (!fields) {
        setError(error, StorageError::database(QStringLiteral("corrupt task record %1").arg(uuidText(uuid))));
    }
    return fields;
}

bool Replica::storeFields(const QUuid &uuid, const TaskFields &fields, StorageError *error)
{
    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO tasks (uuid, data) VALUES (?, ?)"));
    query.addBindValue(uuidText(uuid));
    query.addBindValue(QString::fromUtf8(QJsonDocument(fieldsToJson(fields)).toJson(QJsonDocument::Compact)));
    if (!query.exec()) {
        setError(error, sqlError(QStringLiteral("cannot write task %1").arg(uuidText(uuid)),
                                 query.lastError()));
        return false;
    }
    return true;
}

bool Replica::removeTask(const QUuid &uuid, StorageError *error)
{
    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("DELETE FROM tasks WHERE uuid = ?"));
    query.addBindValue(uuidText(uuid));
    if (!query.exec()) {
        setError(error, sqlError(QStringLiteral("cannot remove task %1").arg(uuidText(uuid)),
                                 query.lastError()));
        return false;
    }
    return true;
}

} // namespace replica
} // namespace taskstore
