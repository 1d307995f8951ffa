#include "core/airplay/StatusSnapshot.hpp"
#include <QJsonValue>

namespace adk {
namespace airplay {

QString sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle: return QStringLiteral("idle");
    case SessionState::Starting: return QStringLiteral("starting");
    case SessionState::Active: return QStringLiteral("active");
    case SessionState::Stopping: return QStringLiteral("stopping");
    case SessionState::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

QJsonObject StatusSnapshot::toJson() const
{
    QJsonObject obj;
    obj["streaming"] = streaming;
    obj["connected_device"] = connectedDevice ? QJsonValue(connectedDevice->toJson())
                                              : QJsonValue(QJsonValue::Null);
    obj["state"] = sessionStateName(state);
    obj["started_at"] = startedAt.isValid() ? QJsonValue(startedAt.toString(Qt::ISODateWithMs))
                                            : QJsonValue(QJsonValue::Null);
    return obj;
}

bool StatusSnapshot::operator==(const StatusSnapshot& other) const
{
    if (streaming != other.streaming || state != other.state || startedAt != other.startedAt)
        return false;
    if (connectedDevice.has_value() != other.connectedDevice.has_value())
        return false;
    return !connectedDevice || connectedDevice->key() == other.connectedDevice->key();
}

} // namespace airplay
} // namespace adk
