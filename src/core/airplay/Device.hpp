#pragma once

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <cstdint>

namespace adk {
namespace airplay {

/// Registry key: a receiver is identified by where it listens, not by its name.
struct DeviceKey {
    QString address;
    uint16_t port = 0;

    bool isValid() const { return !address.isEmpty() && port != 0; }
    QString toString() const { return address + QLatin1Char(':') + QString::number(port); }

    bool operator==(const DeviceKey& other) const
    {
        return port == other.port && address == other.address;
    }
    bool operator!=(const DeviceKey& other) const { return !(*this == other); }
};

inline size_t qHash(const DeviceKey& key, size_t seed = 0) noexcept
{
    return ::qHash(key.address, seed) ^ ::qHash(key.port, seed);
}

struct Device {
    QString name;
    QString address;
    uint16_t port = 0;
    QString model;
    bool paired = false;

    // TXT record extras, informational only
    QString deviceId;
    quint64 features = 0;

    QDateTime firstSeen;
    QDateTime lastSeen;

    DeviceKey key() const { return {address, port}; }
    bool isValid() const { return key().isValid(); }

    QJsonObject toJson() const;
};

} // namespace airplay
} // namespace adk
