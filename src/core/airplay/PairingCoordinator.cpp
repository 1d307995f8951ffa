#include "core/airplay/PairingCoordinator.hpp"
#include "core/airplay/DeviceRegistry.hpp"
#include <QDebug>
#include <QPointer>
#include <QTimer>

namespace adk {
namespace airplay {

QString pairingStateName(PairingState state)
{
    switch (state) {
    case PairingState::Idle: return QStringLiteral("idle");
    case PairingState::Challenged: return QStringLiteral("challenged");
    case PairingState::Verifying: return QStringLiteral("verifying");
    case PairingState::Paired: return QStringLiteral("paired");
    case PairingState::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

PairingCoordinator::PairingCoordinator(DeviceRegistry* registry, IPairingTransport* transport,
                                       const PairingPolicy& policy, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , transport_(transport)
    , policy_(policy)
{
    clock_.start();
}

PairingCoordinator::~PairingCoordinator()
{
    for (auto& attempt : attempts_)
        delete attempt.expiryTimer;
}

PairingResult PairingCoordinator::failure(PairingError::Kind kind, const QString& reason)
{
    PairingResult result;
    result.state = PairingState::Failed;
    result.error.kind = kind;
    result.error.reason = reason;
    return result;
}

PairingState PairingCoordinator::state(const DeviceKey& device) const
{
    auto it = attempts_.constFind(device);
    return it == attempts_.constEnd() ? PairingState::Idle : it->state;
}

bool PairingCoordinator::isInFlight(const DeviceKey& device) const
{
    return attempts_.contains(device);
}

int PairingCoordinator::recentSubmits(const DeviceKey& device)
{
    pruneSubmitLog(device);
    return submitLog_.value(device).size();
}

void PairingCoordinator::pruneSubmitLog(const DeviceKey& device)
{
    auto it = submitLog_.find(device);
    if (it == submitLog_.end()) return;

    const qint64 cutoff = clock_.elapsed() - policy_.attemptWindowMs;
    auto& log = it.value();
    while (!log.isEmpty() && log.first() <= cutoff)
        log.removeFirst();
    if (log.isEmpty())
        submitLog_.erase(it);
}

PairingCoordinator::Attempt* PairingCoordinator::findAttempt(const DeviceKey& device, quint64 attemptId)
{
    auto it = attempts_.find(device);
    if (it == attempts_.end() || it->id != attemptId)
        return nullptr;
    return &it.value();
}

void PairingCoordinator::setState(Attempt& attempt, PairingState state)
{
    if (attempt.state == state) return;
    attempt.state = state;
    qInfo() << "[Pairing]" << attempt.device.toString() << "->" << pairingStateName(state);
    emit stateChanged(attempt.device.toString(), pairingStateName(state));
}

void PairingCoordinator::begin(const DeviceKey& device, Callback callback)
{
    if (!registry_->get(device)) {
        callback(failure(PairingError::Unreachable,
                         QStringLiteral("Unknown receiver %1; run discovery first").arg(device.toString())));
        return;
    }

    if (attempts_.contains(device)) {
        callback(failure(PairingError::AlreadyPairing,
                         QStringLiteral("Pairing with %1 is already in progress").arg(device.toString())));
        return;
    }

    expired_.remove(device);

    Attempt attempt;
    attempt.id = nextAttemptId_++;
    attempt.device = device;
    attempt.pending = std::move(callback);
    attempt.expiryTimer = new QTimer(this);
    attempt.expiryTimer->setSingleShot(true);

    const quint64 id = attempt.id;
    connect(attempt.expiryTimer, &QTimer::timeout, this, [this, device, id]() {
        onExpired(device, id);
    });
    attempt.expiryTimer->start(policy_.challengeExpiryMs);
    attempts_.insert(device, attempt);

    qInfo() << "[Pairing] Requesting challenge from" << device.toString();

    QPointer<PairingCoordinator> self(this);
    transport_->requestChallenge(device, [self, device, id](IPairingTransport::Outcome outcome,
                                                            const QString& detail) {
        if (!self) return;
        Attempt* attempt = self->findAttempt(device, id);
        if (!attempt) return;  // expired while the receiver was answering

        if (outcome == IPairingTransport::Outcome::Accepted) {
            Callback cb = std::move(attempt->pending);
            attempt->pending = nullptr;
            self->setState(*attempt, PairingState::Challenged);
            PairingResult result;
            result.state = PairingState::Challenged;
            if (cb) cb(result);
            return;
        }

        self->destroyAttempt(device, PairingError::Unreachable,
                             detail.isEmpty() ? QStringLiteral("Receiver could not be contacted") : detail);
    });
}

void PairingCoordinator::submit(const DeviceKey& device, const QString& pin, Callback callback)
{
    pruneSubmitLog(device);
    if (submitLog_.value(device).size() >= policy_.maxAttempts) {
        const QString reason = QStringLiteral("Too many PIN attempts for %1; wait and start pairing again")
                                   .arg(device.toString());
        auto it = attempts_.constFind(device);
        if (it != attempts_.constEnd() && it->state != PairingState::Verifying)
            destroyAttempt(device, PairingError::TooManyAttempts, reason);
        callback(failure(PairingError::TooManyAttempts, reason));
        return;
    }

    auto it = attempts_.find(device);
    if (it == attempts_.end()) {
        callback(failure(PairingError::Expired,
                         expired_.contains(device)
                             ? QStringLiteral("The PIN challenge expired; start pairing again")
                             : QStringLiteral("No PIN challenge is active for %1").arg(device.toString())));
        return;
    }

    Attempt& attempt = it.value();
    if (attempt.state != PairingState::Challenged) {
        callback(failure(PairingError::AlreadyPairing,
                         attempt.state == PairingState::Verifying
                             ? QStringLiteral("A PIN is already being verified")
                             : QStringLiteral("The receiver has not shown its PIN yet")));
        return;
    }

    submitLog_[device].append(clock_.elapsed());
    attempt.pending = std::move(callback);
    setState(attempt, PairingState::Verifying);

    const quint64 id = attempt.id;
    QPointer<PairingCoordinator> self(this);
    transport_->verifyPin(device, pin, [self, device, id](IPairingTransport::Outcome outcome,
                                                          const QString& detail) {
        if (!self) return;
        Attempt* attempt = self->findAttempt(device, id);
        if (!attempt) return;

        switch (outcome) {
        case IPairingTransport::Outcome::Accepted: {
            self->registry_->markPaired(device);
            Callback cb = std::move(attempt->pending);
            self->setState(*attempt, PairingState::Paired);
            delete attempt->expiryTimer;
            self->attempts_.remove(device);
            qInfo() << "[Pairing] Paired with" << device.toString();
            emit self->attemptFinished(device.toString(), true, QString());

            PairingResult result;
            result.state = PairingState::Paired;
            if (cb) cb(result);
            return;
        }
        case IPairingTransport::Outcome::Rejected:
            self->destroyAttempt(device, PairingError::InvalidPin,
                                 detail.isEmpty() ? QStringLiteral("Incorrect PIN") : detail);
            return;
        case IPairingTransport::Outcome::Unreachable:
            self->destroyAttempt(device, PairingError::Unreachable,
                                 detail.isEmpty() ? QStringLiteral("Receiver could not be contacted") : detail);
            return;
        }
    });
}

void PairingCoordinator::onExpired(const DeviceKey& device, quint64 attemptId)
{
    Attempt* attempt = findAttempt(device, attemptId);
    if (!attempt) return;

    if (attempt->state == PairingState::Verifying) {
        // Let the verification in flight decide; the transport has its own timeout
        return;
    }

    expired_.insert(device);
    destroyAttempt(device, PairingError::Expired, QStringLiteral("The PIN challenge expired"));
}

void PairingCoordinator::destroyAttempt(const DeviceKey& device, PairingError::Kind kind,
                                        const QString& reason)
{
    auto it = attempts_.find(device);
    if (it == attempts_.end()) return;

    Callback cb = std::move(it->pending);
    setState(it.value(), PairingState::Failed);
    delete it->expiryTimer;
    attempts_.erase(it);

    PairingResult result = failure(kind, reason);
    qInfo() << "[Pairing]" << device.toString() << "failed:" << result.error.kindName() << reason;
    emit attemptFinished(device.toString(), false, result.error.kindName());

    if (cb) cb(result);
}

} // namespace airplay
} // namespace adk
