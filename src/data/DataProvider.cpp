#include "taskstore/data/DataProvider.hpp"

#include "taskstore/core/Logging.hpp"
#include "taskstore/data/FileStorageBackend.hpp"
#include "taskstore/data/ReplicaStorageBackend.hpp"
#include "taskstore/replica/ReplicaActor.hpp"

#include <QDir>

#include <utility>

namespace taskstore {
namespace data {

DataProvider::DataProvider(core::StorageSettings settings)
    : m_settings(std::move(settings))
{
    switch (m_settings.backend) {
    case core::BackendKind::File:
        m_storageBackend = std::make_unique<FileStorageBackend>(m_settings.dataDirectory);
        break;
    case core::BackendKind::Replica:
        m_storageBackend = std::make_unique<ReplicaStorageBackend>(m_settings.dataDirectory);
        break;
    }
}

DataProvider::~DataProvider() = default;

bool DataProvider::initialize(core::StorageError *error)
{
    if (m_settings.backend == core::BackendKind::Replica) {
        auto *backend = static_cast<ReplicaStorageBackend *>(m_storageBackend.get());
        if (!backend->replica()) {
            replica::ReplicaActorOptions options;
            options.startupTimeout = m_settings.startupTimeout;
            options.requestTimeout = m_settings.requestTimeout;

            auto wrapper = replica::openEmbeddedReplica(m_settings.dataDirectory, options, error);
            if (!wrapper) {
                return false;
            }
            backend->setReplica(std::move(wrapper));
        }
    }
    if (!m_storageBackend->initialize(error)) {
        return false;
    }
    qCInfo(lcStorage) << "Storage ready:" << core::backendKindToString(m_settings.backend)
                      << QDir::toNativeSeparators(m_settings.dataDirectory);
    return true;
}

StorageBackend &DataProvider::storageBackend()
{
    return *m_storageBackend;
}

const core::StorageSettings &DataProvider::settings() const
{
    return m_settings;
}

} // namespace data
} // namespace taskstore
