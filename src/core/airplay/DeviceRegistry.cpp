#include "core/airplay/DeviceRegistry.hpp"
#include <QDebug>

namespace adk {
namespace airplay {

Device DeviceRegistry::upsert(const Device& sighting, const QDateTime& now)
{
    QMutexLocker lock(&mutex_);
    const DeviceKey key = sighting.key();

    auto it = devices_.find(key);
    if (it == devices_.end()) {
        Device fresh = sighting;
        fresh.paired = false;
        fresh.firstSeen = now;
        fresh.lastSeen = now;
        devices_.insert(key, fresh);
        order_.append(key);
        qInfo() << "[Registry] New receiver" << fresh.name << key.toString();
        return fresh;
    }

    Device& existing = it.value();
    existing.name = sighting.name;
    existing.model = sighting.model;
    if (!sighting.deviceId.isEmpty())
        existing.deviceId = sighting.deviceId;
    if (sighting.features != 0)
        existing.features = sighting.features;
    existing.lastSeen = now;
    return existing;
}

std::optional<Device> DeviceRegistry::get(const QString& address, uint16_t port) const
{
    return get(DeviceKey{address, port});
}

std::optional<Device> DeviceRegistry::get(const DeviceKey& key) const
{
    QMutexLocker lock(&mutex_);
    auto it = devices_.constFind(key);
    if (it == devices_.constEnd())
        return std::nullopt;
    return it.value();
}

QList<Device> DeviceRegistry::list() const
{
    QMutexLocker lock(&mutex_);
    QList<Device> result;
    result.reserve(order_.size());
    for (const auto& key : order_)
        result.append(devices_.value(key));
    return result;
}

QList<DeviceKey> DeviceRegistry::evictStale(const QDateTime& now, qint64 ttlMs)
{
    QMutexLocker lock(&mutex_);
    QList<DeviceKey> evicted;
    const QDateTime cutoff = now.addMSecs(-ttlMs);

    for (auto it = order_.begin(); it != order_.end();) {
        const Device& dev = devices_[*it];
        if (dev.lastSeen < cutoff) {
            qInfo() << "[Registry] Evicting stale receiver" << dev.name << it->toString();
            evicted.append(*it);
            devices_.remove(*it);
            it = order_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

bool DeviceRegistry::markPaired(const DeviceKey& key)
{
    QMutexLocker lock(&mutex_);
    auto it = devices_.find(key);
    if (it == devices_.end())
        return false;
    it->paired = true;
    return true;
}

int DeviceRegistry::size() const
{
    QMutexLocker lock(&mutex_);
    return devices_.size();
}

void DeviceRegistry::clear()
{
    QMutexLocker lock(&mutex_);
    devices_.clear();
    order_.clear();
}

} // namespace airplay
} // namespace adk
