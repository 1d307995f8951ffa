#pragma once

#include "core/airplay/Device.hpp"
#include "core/airplay/Errors.hpp"
#include "core/airplay/IPairingTransport.hpp"
#include <QElapsedTimer>
#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <functional>

class QTimer;

namespace adk {
namespace airplay {

class DeviceRegistry;

struct PairingPolicy {
    int maxAttempts = 3;
    qint64 attemptWindowMs = 120000;
    int challengeExpiryMs = 60000;
};

enum class PairingState {
    Idle,
    Challenged,
    Verifying,
    Paired,
    Failed
};

QString pairingStateName(PairingState state);

struct PairingResult {
    PairingState state = PairingState::Idle;
    PairingError error;

    bool ok() const { return !error.isError(); }
};

/// Drives the PIN challenge/response handshake, one attempt per receiver.
///
///   Idle -> Challenged -> Verifying -> Paired | Failed
///
/// A wrong PIN fails the attempt; the device starts over from begin(). Submits
/// are counted per device across attempts, and once the window budget is
/// spent every submit fails with TooManyAttempts. The coordinator is the only
/// writer of Device::paired.
class PairingCoordinator : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(const PairingResult&)>;

    PairingCoordinator(DeviceRegistry* registry, IPairingTransport* transport,
                       const PairingPolicy& policy = {}, QObject* parent = nullptr);
    ~PairingCoordinator() override;

    void begin(const DeviceKey& device, Callback callback);
    void submit(const DeviceKey& device, const QString& pin, Callback callback);

    /// Idle when no attempt exists for the device.
    PairingState state(const DeviceKey& device) const;
    bool isInFlight(const DeviceKey& device) const;

    /// Submits counted against the throttle window right now.
    int recentSubmits(const DeviceKey& device);

    const PairingPolicy& policy() const { return policy_; }

signals:
    void stateChanged(const QString& deviceKey, const QString& state);
    void attemptFinished(const QString& deviceKey, bool paired, const QString& reason);

private:
    struct Attempt {
        quint64 id = 0;
        DeviceKey device;
        PairingState state = PairingState::Idle;
        QTimer* expiryTimer = nullptr;
        Callback pending;  // outstanding begin/submit callback
    };

    void setState(Attempt& attempt, PairingState state);
    void onExpired(const DeviceKey& device, quint64 attemptId);
    void destroyAttempt(const DeviceKey& device, PairingError::Kind kind, const QString& reason);
    void pruneSubmitLog(const DeviceKey& device);
    Attempt* findAttempt(const DeviceKey& device, quint64 attemptId);

    static PairingResult failure(PairingError::Kind kind, const QString& reason);

    DeviceRegistry* registry_;
    IPairingTransport* transport_;
    PairingPolicy policy_;

    QElapsedTimer clock_;
    quint64 nextAttemptId_ = 1;
    QHash<DeviceKey, Attempt> attempts_;
    QHash<DeviceKey, QList<qint64>> submitLog_;
    QSet<DeviceKey> expired_;
};

} // namespace airplay
} // namespace adk
