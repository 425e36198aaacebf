#pragma once

#include <QSettings>
#include <QString>

#include <chrono>
#include <optional>
#include <vector>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/data/TaskQuery.hpp"

namespace taskstore {
namespace core {

enum class BackendKind
{
    Replica,
    File,
};

QString backendKindToString(BackendKind kind);
std::optional<BackendKind> backendKindFromString(const QString &value);

struct StorageSettings
{
    BackendKind backend = BackendKind::Replica;
    QString dataDirectory;
    std::chrono::milliseconds startupTimeout{5000};
    std::chrono::milliseconds requestTimeout{0};

    // TASKDATA, then the platform's application data location.
    static QString defaultDataDirectory();

    static std::optional<StorageSettings> load(QSettings &settings, StorageError *error = nullptr);
    void save(QSettings &settings) const;
};

// Reads `context/active` and every `context/<name>/read|write` pair.
std::optional<std::vector<data::UserContext>> loadContexts(QSettings &settings, StorageError *error = nullptr);

std::optional<data::UserContext> activeContext(const std::vector<data::UserContext> &contexts);

} // namespace core
} // namespace taskstore
