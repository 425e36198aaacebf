#include "taskstore/core/AppContext.hpp"

#include "taskstore/data/DataProvider.hpp"
#include "taskstore/data/StorageBackend.hpp"

#include <utility>

namespace taskstore {
namespace core {

AppContext::AppContext(StorageSettings settings, std::optional<data::UserContext> activeContext)
    : m_dataProvider(std::make_unique<data::DataProvider>(std::move(settings)))
    , m_activeContext(std::move(activeContext))
{
}

AppContext::~AppContext() = default;

std::unique_ptr<AppContext> AppContext::load(QSettings &settings, StorageError *error)
{
    const auto storage = StorageSettings::load(settings, error);
    if (!storage) {
        return nullptr;
    }
    const auto contexts = loadContexts(settings, error);
    if (!contexts) {
        return nullptr;
    }
    auto context = std::make_unique<AppContext>(*storage, core::activeContext(*contexts));
    if (!context->initialize(error)) {
        return nullptr;
    }
    return context;
}

bool AppContext::initialize(StorageError *error)
{
    return m_dataProvider->initialize(error);
}

data::StorageBackend &AppContext::storageBackend()
{
    return m_dataProvider->storageBackend();
}

const StorageSettings &AppContext::settings() const
{
    return m_dataProvider->settings();
}

const data::UserContext *AppContext::activeContext() const
{
    return m_activeContext ? &*m_activeContext : nullptr;
}

} // namespace core
} // namespace taskstore
