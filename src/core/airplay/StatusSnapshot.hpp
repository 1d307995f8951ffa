#pragma once

#include "core/airplay/Device.hpp"
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <optional>

namespace adk {
namespace airplay {

enum class SessionState {
    Idle,
    Starting,
    Active,
    Stopping,
    Failed
};

QString sessionStateName(SessionState state);

/// Read-only projection of the streaming slot. Never stored as a source of
/// truth; always produced by StreamingSessionManager::current().
struct StatusSnapshot {
    bool streaming = false;
    std::optional<Device> connectedDevice;
    SessionState state = SessionState::Idle;
    QDateTime startedAt;

    QJsonObject toJson() const;

    bool operator==(const StatusSnapshot& other) const;
    bool operator!=(const StatusSnapshot& other) const { return !(*this == other); }
};

} // namespace airplay
} // namespace adk

Q_DECLARE_METATYPE(adk::airplay::StatusSnapshot)
