#pragma once

#include <memory>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/core/StorageSettings.hpp"

namespace taskstore {
namespace data {

class StorageBackend;

// Builds the configured storage backend. For the replica backend this also
// starts the replica worker and hands it to the backend as its write path.
class DataProvider
{
public:
    explicit DataProvider(core::StorageSettings settings);
    ~DataProvider();

    bool initialize(core::StorageError *error = nullptr);

    StorageBackend &storageBackend();
    const core::StorageSettings &settings() const;

private:
    core::StorageSettings m_settings;
    std::unique_ptr<StorageBackend> m_storageBackend;
};

} // namespace data
} // namespace taskstore
