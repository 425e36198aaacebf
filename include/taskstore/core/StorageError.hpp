#pragma once

#include <QString>

#include <utility>

namespace taskstore {
namespace core {

class StorageError
{
public:
    enum class Kind
    {
        None,
        Configuration,
        Database,
        Serialization,
        Io,
        NotFound,
        Unsupported,
        Timeout,
        Disconnected,
    };

    StorageError() = default;
    StorageError(Kind kind, QString message);

    static StorageError configuration(const QString &message);
    static StorageError database(const QString &message);
    static StorageError serialization(const QString &message);
    static StorageError io(const QString &message);
    static StorageError notFound(const QString &message);
    static StorageError unsupported(const QString &message);
    static StorageError timeout(const QString &message);
    static StorageError disconnected(const QString &message);

    bool isValid() const { return m_kind != Kind::None; }
    Kind kind() const { return m_kind; }
    const QString &message() const { return m_message; }

    // Errors raised by the embedded store or the actor plumbing around it.
    bool isStoreError() const;
    bool isTerminal() const { return m_kind == Kind::Disconnected; }

    StorageError withContext(const QString &context) const;
    QString toString() const;

    static QString kindName(Kind kind);

private:
    Kind m_kind = Kind::None;
    QString m_message;
};

// Fills the caller's out parameter if there is one. Mirrors the Qt habit of
// optional QString *errorMessage arguments.
inline void setError(StorageError *target, StorageError error)
{
    if (target) {
        *target = std::move(error);
    }
}

} // namespace core
} // namespace taskstore
