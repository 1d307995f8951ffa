#pragma once

#include "core/airplay/Device.hpp"
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <optional>

namespace adk {
namespace airplay {

/// Sole owner of the Device records. Pure in-memory store, no I/O.
/// All methods are thread-safe; callers receive copies, never references
/// into the table.
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    /// Insert a new record or refresh an existing one keyed by (address, port).
    /// A refresh updates name/model/TXT data and lastSeen but never touches
    /// the paired flag. Returns the stored record.
    Device upsert(const Device& sighting,
                  const QDateTime& now = QDateTime::currentDateTimeUtc());

    std::optional<Device> get(const QString& address, uint16_t port) const;
    std::optional<Device> get(const DeviceKey& key) const;

    /// Devices in first-seen order.
    QList<Device> list() const;

    /// Drop every record whose lastSeen is older than now - ttlMs.
    /// Returns the keys that were removed.
    QList<DeviceKey> evictStale(const QDateTime& now, qint64 ttlMs);

    /// Flip the paired flag. Only PairingCoordinator calls this.
    bool markPaired(const DeviceKey& key);

    int size() const;
    void clear();

private:
    mutable QMutex mutex_;
    QHash<DeviceKey, Device> devices_;
    QList<DeviceKey> order_;
};

} // namespace airplay
} // namespace adk
