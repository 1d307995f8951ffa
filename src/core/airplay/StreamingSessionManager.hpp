#pragma once

#include "core/airplay/Device.hpp"
#include "core/airplay/Errors.hpp"
#include "core/airplay/ICapturePipeline.hpp"
#include "core/airplay/StatusSnapshot.hpp"
#include <QDateTime>
#include <QMutex>
#include <QObject>
#include <QTimer>
#include <functional>
#include <optional>

namespace adk {
namespace airplay {

class DeviceRegistry;

struct StreamingPolicy {
    // Starting gives up after this long without ready() or failed()
    int startTimeoutMs = 10000;
    int stopTimeoutMs = 5000;
    int healthIntervalMs = 1000;
};

struct StreamingResult {
    StatusSnapshot status;
    StreamingError error;
    // stop() had to kill the pipeline after the timeout
    bool forced = false;

    bool ok() const { return !error.isError(); }
};

/// Owns the single streaming slot.
///
///   Idle -> Starting -> Active -> Stopping -> Idle
///   Starting -> Failed -> Idle  (pipeline failure or start timeout)
///   Active -> Idle              (pipeline crash)
///
/// Every transition happens on the owning thread and emits stateChanged().
/// current() may be called from any thread.
class StreamingSessionManager : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(const StreamingResult&)>;

    StreamingSessionManager(DeviceRegistry* registry, ICapturePipelineFactory* pipelines,
                            const StreamingPolicy& policy = {}, QObject* parent = nullptr);
    ~StreamingSessionManager() override;

    /// Callback fires once the pipeline is ready or has failed, at the latest
    /// after the start timeout.
    void start(const DeviceKey& device, Callback callback);

    /// Callback fires once the session is back to Idle, at the latest after
    /// the stop timeout.
    void stop(Callback callback);

    StatusSnapshot current() const;
    SessionState state() const;

    /// Blocking teardown for process exit. Stops an active stream (bounded by
    /// the stop timeout) or aborts one that is still starting.
    void shutdown();

    const StreamingPolicy& policy() const { return policy_; }

signals:
    void stateChanged(const adk::airplay::StatusSnapshot& snapshot);

private:
    void transition(SessionState next);
    void announce(const StatusSnapshot& snap);
    StatusSnapshot snapshotLocked() const;

    void onPipelineReady(quint64 session);
    void onPipelineFailed(quint64 session, const QString& diagnostic);
    void onPipelineExited(quint64 session, const QString& diagnostic);
    void onPipelineStopped(quint64 session);
    void onHealthCheck();
    void onStartTimeout();
    void onStopTimeout();

    void handleCrash(const QString& diagnostic);
    void finishStop(bool forced);
    void retirePipeline();

    DeviceRegistry* registry_;
    ICapturePipelineFactory* pipelines_;
    StreamingPolicy policy_;

    mutable QMutex mutex_;
    SessionState state_ = SessionState::Idle;
    std::optional<Device> device_;
    QDateTime startedAt_;

    ICapturePipeline* pipeline_ = nullptr;
    quint64 sessionId_ = 0;
    Callback pendingStart_;
    Callback pendingStop_;
    QTimer startTimer_;
    QTimer stopTimer_;
    QTimer healthTimer_;
};

} // namespace airplay
} // namespace adk
