#include "taskstore/core/StorageError.hpp"

namespace taskstore {
namespace core {

StorageError::StorageError(Kind kind, QString message)
    : m_kind(kind)
    , m_message(std::move(message))
{
}

StorageError StorageError::configuration(const QString &message)
{
    return StorageError(Kind::Configuration, message);
}

StorageError StorageError::database(const QString &message)
{
    return StorageError(Kind::Database, message);
}

StorageError StorageError::serialization(const QString &message)
{
    return StorageError(Kind::Serialization, message);
}

StorageError StorageError::io(const QString &message)
{
    return StorageError(Kind::Io, message);
}

StorageError StorageError::notFound(const QString &message)
{
    return StorageError(Kind::NotFound, message);
}

StorageError StorageError::unsupported(const QString &message)
{
    return StorageError(Kind::Unsupported, message);
}

StorageError StorageError::timeout(const QString &message)
{
    return StorageError(Kind::Timeout, message);
}

StorageError StorageError::disconnected(const QString &message)
{
    return StorageError(Kind::Disconnected, message);
}

bool StorageError::isStoreError() const
{
    switch (m_kind) {
    case Kind::Database:
    case Kind::Timeout:
    case Kind::Disconnected:
        return true;
    default:
        return false;
    }
}

StorageError StorageError::withContext(const QString &context) const
{
    if (!isValid() || context.isEmpty()) {
        return *this;
    }
    return StorageError(m_kind, QStringLiteral("%1: %2").arg(context, m_message));
}

QString StorageError::toString() const
{
    if (!isValid()) {
        return QString();
    }
    return QStringLiteral("%1 error: %2").arg(kindName(m_kind), m_message);
}

QString StorageError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Configuration:
        return QStringLiteral("Configuration");
    case Kind::Database:
        return QStringLiteral("Database");
    case Kind::Serialization:
        return QStringLiteral("Serialization");
    case Kind::Io:
        return QStringLiteral("I/O");
    case Kind::NotFound:
        return QStringLiteral("Not found");
    case Kind::Unsupported:
        return QStringLiteral("Unsupported");
    case Kind::Timeout:
        return QStringLiteral("Timeout");
    case Kind::Disconnected:
        return QStringLiteral("Disconnected");
    case Kind::None:
    default:
        return QStringLiteral("No");
    }
}

} // namespace core
} // namespace taskstore
