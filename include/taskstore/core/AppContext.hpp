#pragma once

#include <QSettings>

#include <memory>
#include <optional>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/core/StorageSettings.hpp"
#include "taskstore/data/TaskQuery.hpp"

namespace taskstore {
namespace data {
class DataProvider;
class StorageBackend;
}

namespace core {

class AppContext
{
public:
    AppContext(StorageSettings settings, std::optional<data::UserContext> activeContext);
    ~AppContext();

    // Reads storage settings and contexts, then brings the storage up.
    static std::unique_ptr<AppContext> load(QSettings &settings, StorageError *error = nullptr);

    bool initialize(StorageError *error = nullptr);

    data::StorageBackend &storageBackend();
    const StorageSettings &settings() const;
    const data::UserContext *activeContext() const;

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::optional<data::UserContext> m_activeContext;
};

} // namespace core
} // namespace taskstore
