#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>

namespace adk {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "pairing.max_attempts").
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Only scalar keys known to the schema are
    /// accepted; returns false otherwise.
    /// Must be called from the main thread (single-writer rule).
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// All writable keys.
    virtual QStringList keys() const = 0;

    /// Flush config to disk.
    /// Must be called from the main thread.
    virtual void save() = 0;
};

} // namespace adk
