#include "taskstore/core/StorageSettings.hpp"

#include "taskstore/core/Logging.hpp"

#include <QDir>
#include <QStandardPaths>
#include <QVariant>

#include <algorithm>

namespace taskstore {
namespace core {

namespace {
constexpr auto KEY_BACKEND = "storage/backend";
constexpr auto KEY_DATA_DIRECTORY = "storage/dataDirectory";
constexpr auto KEY_STARTUP_TIMEOUT = "replica/startupTimeoutMs";
constexpr auto KEY_REQUEST_TIMEOUT = "replica/requestTimeoutMs";
constexpr auto KEY_ACTIVE_CONTEXT = "context/active";
constexpr auto CONTEXT_GROUP = "context";

std::optional<std::chrono::milliseconds> readTimeout(QSettings &settings, const QString &key,
                                                     std::chrono::milliseconds fallback,
                                                     StorageError *error)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const qlonglong value = settings.value(key).toLongLong(&ok);
    if (!ok || value < 0) {
        setError(error, StorageError::configuration(
                            QStringLiteral("%1 must be a non-negative number of milliseconds, got '%2'")
                                .arg(key, settings.value(key).toString())));
        return std::nullopt;
    }
    return std::chrono::milliseconds(value);
}
} // namespace

QString backendKindToString(BackendKind kind)
{
    switch (kind) {
    case BackendKind::Replica:
        return QStringLiteral("replica");
    case BackendKind::File:
        return QStringLiteral("file");
    }
    return QString();
}

std::optional<BackendKind> backendKindFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("replica")) {
        return BackendKind::Replica;
    }
    if (normalized == QLatin1String("file")) {
        return BackendKind::File;
    }
    return std::nullopt;
}

QString StorageSettings::defaultDataDirectory()
{
    const QString fromEnvironment = qEnvironmentVariable("TASKDATA");
    if (!fromEnvironment.isEmpty()) {
        return fromEnvironment;
    }
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.local/share/taskstore");
    }
    return folder;
}

std::optional<StorageSettings> StorageSettings::load(QSettings &settings, StorageError *error)
{
    StorageSettings result;

    const QString backendKey = QLatin1String(KEY_BACKEND);
    if (settings.contains(backendKey)) {
        const QString value = settings.value(backendKey).toString();
        const auto backend = backendKindFromString(value);
        if (!backend) {
            setError(error, StorageError::configuration(
                                QStringLiteral("%1 must be 'replica' or 'file', got '%2'").arg(backendKey, value)));
            return std::nullopt;
        }
        result.backend = *backend;
    }

    result.dataDirectory = settings.value(QLatin1String(KEY_DATA_DIRECTORY)).toString();
    if (result.dataDirectory.isEmpty()) {
        result.dataDirectory = defaultDataDirectory();
    }

    const auto startup = readTimeout(settings, QLatin1String(KEY_STARTUP_TIMEOUT), result.startupTimeout, error);
    if (!startup) {
        return std::nullopt;
    }
    result.startupTimeout = *startup;

    const auto request = readTimeout(settings, QLatin1String(KEY_REQUEST_TIMEOUT), result.requestTimeout, error);
    if (!request) {
        return std::nullopt;
    }
    result.requestTimeout = *request;

    qCDebug(lcConfig) << "Storage backend" << backendKindToString(result.backend) << "in"
                      << result.dataDirectory;
    return result;
}

void StorageSettings::save(QSettings &settings) const
{
    settings.setValue(QLatin1String(KEY_BACKEND), backendKindToString(backend));
    settings.setValue(QLatin1String(KEY_DATA_DIRECTORY), dataDirectory);
    settings.setValue(QLatin1String(KEY_STARTUP_TIMEOUT), static_cast<qlonglong>(startupTimeout.count()));
    settings.setValue(QLatin1String(KEY_REQUEST_TIMEOUT), static_cast<qlonglong>(requestTimeout.count()));
}

std::optional<std::vector<data::UserContext>> loadContexts(QSettings &settings, StorageError *error)
{
    const QString active = settings.value(QLatin1String(KEY_ACTIVE_CONTEXT)).toString();

    settings.beginGroup(QLatin1String(CONTEXT_GROUP));
    QStringList names = settings.childGroups();
    settings.endGroup();
    names.sort();

    std::vector<data::UserContext> contexts;
    for (const QString &name : names) {
        const QString readKey = QStringLiteral("context/%1/read").arg(name);
        const QString writeKey = QStringLiteral("context/%1/write").arg(name);

        data::UserContext context;
        context.name = name;
        context.readFilter = settings.value(readKey).toString();
        context.writeFilter = settings.value(writeKey).toString();
        context.active = name == active;

        if (context.readFilter.trimmed().isEmpty()) {
            setError(error, StorageError::configuration(
                                QStringLiteral("%1 must be a non-empty filter expression").arg(readKey)));
            return std::nullopt;
        }
        if (settings.contains(writeKey) && !data::parseProjectFromFilter(context.writeFilter)) {
            setError(error, StorageError::configuration(
                                QStringLiteral("%1 must be a simple project filter like project:Name, got '%2'")
                                    .arg(writeKey, context.writeFilter)));
            return std::nullopt;
        }
        contexts.push_back(context);
    }

    if (!active.isEmpty()
        && std::none_of(contexts.begin(), contexts.end(),
                        [](const data::UserContext &context) { return context.active; })) {
        qCWarning(lcConfig) << "Active context" << active << "is not defined";
    }
    return contexts;
}

std::optional<data::UserContext> activeContext(const std::vector<data::UserContext> &contexts)
{
    const auto it = std::find_if(contexts.begin(), contexts.end(),
                                 [](const data::UserContext &context) { return context.active; });
    if (it == contexts.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace core
} // namespace taskstore
