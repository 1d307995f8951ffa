#include "core/airplay/StreamingSessionManager.hpp"
#include "core/airplay/DeviceRegistry.hpp"
#include <QDebug>
#include <QEventLoop>
#include <QMutexLocker>

namespace adk {
namespace airplay {

namespace {

StreamingResult streamingFailure(StreamingError::Kind kind, const QString& reason,
                                 const StatusSnapshot& status)
{
    StreamingResult result;
    result.status = status;
    result.error.kind = kind;
    result.error.reason = reason;
    return result;
}

} // namespace

StreamingSessionManager::StreamingSessionManager(DeviceRegistry* registry,
                                                 ICapturePipelineFactory* pipelines,
                                                 const StreamingPolicy& policy, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , pipelines_(pipelines)
    , policy_(policy)
{
    startTimer_.setSingleShot(true);
    connect(&startTimer_, &QTimer::timeout, this, &StreamingSessionManager::onStartTimeout);
    stopTimer_.setSingleShot(true);
    connect(&stopTimer_, &QTimer::timeout, this, &StreamingSessionManager::onStopTimeout);
    connect(&healthTimer_, &QTimer::timeout, this, &StreamingSessionManager::onHealthCheck);
}

StreamingSessionManager::~StreamingSessionManager()
{
    startTimer_.stop();
    stopTimer_.stop();
    healthTimer_.stop();
    if (pipeline_) {
        pipeline_->disconnect(this);
        pipeline_->kill();
        delete pipeline_;
        pipeline_ = nullptr;
    }
}

StatusSnapshot StreamingSessionManager::snapshotLocked() const
{
    StatusSnapshot snap;
    snap.state = state_;
    snap.streaming = state_ == SessionState::Active;
    if (state_ == SessionState::Starting || state_ == SessionState::Active
        || state_ == SessionState::Stopping)
        snap.connectedDevice = device_;
    if (state_ == SessionState::Active || state_ == SessionState::Stopping)
        snap.startedAt = startedAt_;
    return snap;
}

StatusSnapshot StreamingSessionManager::current() const
{
    QMutexLocker lock(&mutex_);
    return snapshotLocked();
}

SessionState StreamingSessionManager::state() const
{
    QMutexLocker lock(&mutex_);
    return state_;
}

void StreamingSessionManager::transition(SessionState next)
{
    StatusSnapshot snap;
    {
        QMutexLocker lock(&mutex_);
        if (state_ == next) return;
        state_ = next;
        if (next == SessionState::Active)
            startedAt_ = QDateTime::currentDateTimeUtc();
        else if (next == SessionState::Idle) {
            device_.reset();
            startedAt_ = QDateTime();
        }
        snap = snapshotLocked();
    }
    announce(snap);
}

void StreamingSessionManager::announce(const StatusSnapshot& snap)
{
    qInfo() << "[Session] ->" << sessionStateName(snap.state)
            << (snap.connectedDevice ? snap.connectedDevice->key().toString() : QString());
    emit stateChanged(snap);
}

void StreamingSessionManager::start(const DeviceKey& device, Callback callback)
{
    // Read the flag from the registry, never from the caller
    const std::optional<Device> record = registry_->get(device);

    // Check and claim the slot in one critical section
    bool busy = false;
    StatusSnapshot snap;
    {
        QMutexLocker lock(&mutex_);
        if (state_ != SessionState::Idle) {
            busy = true;
        } else if (record && record->paired) {
            state_ = SessionState::Starting;
            device_ = *record;
        }
        snap = snapshotLocked();
    }

    if (busy) {
        const QString target = snap.connectedDevice ? snap.connectedDevice->name
                                                    : QStringLiteral("another receiver");
        callback(streamingFailure(StreamingError::AlreadyStreaming,
                                  QStringLiteral("Already streaming to %1").arg(target), snap));
        return;
    }
    if (!record) {
        callback(streamingFailure(StreamingError::NotPaired,
                                  QStringLiteral("Unknown receiver %1").arg(device.toString()),
                                  snap));
        return;
    }
    if (!record->paired) {
        callback(streamingFailure(StreamingError::NotPaired,
                                  QStringLiteral("%1 is not paired").arg(record->name), snap));
        return;
    }

    const quint64 session = ++sessionId_;
    pipeline_ = pipelines_->create().release();
    connect(pipeline_, &ICapturePipeline::ready, this, [this, session]() {
        onPipelineReady(session);
    });
    connect(pipeline_, &ICapturePipeline::failed, this, [this, session](const QString& diag) {
        onPipelineFailed(session, diag);
    });
    connect(pipeline_, &ICapturePipeline::exited, this, [this, session](const QString& diag) {
        onPipelineExited(session, diag);
    });
    connect(pipeline_, &ICapturePipeline::stopped, this, [this, session]() {
        onPipelineStopped(session);
    });

    pendingStart_ = std::move(callback);
    announce(snap);
    startTimer_.start(policy_.startTimeoutMs);
    pipeline_->start(record->address, record->port);
}

void StreamingSessionManager::stop(Callback callback)
{
    if (state() != SessionState::Active) {
        callback(streamingFailure(StreamingError::NotStreaming,
                                  QStringLiteral("No active stream"), current()));
        return;
    }

    healthTimer_.stop();
    pendingStop_ = std::move(callback);
    transition(SessionState::Stopping);
    stopTimer_.start(policy_.stopTimeoutMs);
    pipeline_->requestStop();
}

void StreamingSessionManager::onPipelineReady(quint64 session)
{
    if (session != sessionId_ || state() != SessionState::Starting)
        return;

    startTimer_.stop();
    transition(SessionState::Active);
    healthTimer_.start(policy_.healthIntervalMs);

    Callback cb = std::move(pendingStart_);
    pendingStart_ = nullptr;
    if (cb) {
        StreamingResult result;
        result.status = current();
        cb(result);
    }
}

void StreamingSessionManager::onPipelineFailed(quint64 session, const QString& diagnostic)
{
    if (session != sessionId_)
        return;
    if (state() != SessionState::Starting) {
        handleCrash(diagnostic);
        return;
    }

    qWarning() << "[Session] Pipeline failed to start:" << diagnostic;
    startTimer_.stop();
    retirePipeline();
    transition(SessionState::Failed);
    transition(SessionState::Idle);

    Callback cb = std::move(pendingStart_);
    pendingStart_ = nullptr;
    if (cb)
        cb(streamingFailure(StreamingError::PipelineError, diagnostic, current()));
}

void StreamingSessionManager::onPipelineExited(quint64 session, const QString& diagnostic)
{
    if (session != sessionId_)
        return;

    switch (state()) {
    case SessionState::Starting:
        onPipelineFailed(session, diagnostic);
        break;
    case SessionState::Active:
        handleCrash(diagnostic);
        break;
    case SessionState::Stopping:
        finishStop(false);
        break;
    default:
        break;
    }
}

void StreamingSessionManager::onPipelineStopped(quint64 session)
{
    if (session != sessionId_ || state() != SessionState::Stopping)
        return;
    finishStop(false);
}

void StreamingSessionManager::onHealthCheck()
{
    if (state() != SessionState::Active || !pipeline_)
        return;
    if (!pipeline_->isHealthy())
        handleCrash(QStringLiteral("Pipeline health check failed"));
}

void StreamingSessionManager::onStartTimeout()
{
    if (state() != SessionState::Starting)
        return;
    if (pipeline_)
        pipeline_->kill();
    onPipelineFailed(sessionId_, QStringLiteral("Pipeline not ready after %1 ms")
                                     .arg(policy_.startTimeoutMs));
}

void StreamingSessionManager::onStopTimeout()
{
    if (state() != SessionState::Stopping)
        return;
    qWarning() << "[Session] Pipeline ignored stop request for" << policy_.stopTimeoutMs
               << "ms, killing it";
    if (pipeline_)
        pipeline_->kill();
    finishStop(true);
}

void StreamingSessionManager::handleCrash(const QString& diagnostic)
{
    if (state() != SessionState::Active)
        return;

    qWarning() << "[Session] Pipeline died while streaming:" << diagnostic;
    healthTimer_.stop();
    retirePipeline();
    transition(SessionState::Idle);
}

void StreamingSessionManager::finishStop(bool forced)
{
    stopTimer_.stop();
    retirePipeline();
    transition(SessionState::Idle);

    Callback cb = std::move(pendingStop_);
    pendingStop_ = nullptr;
    if (cb) {
        StreamingResult result;
        result.status = current();
        result.forced = forced;
        cb(result);
    }
}

void StreamingSessionManager::retirePipeline()
{
    if (!pipeline_)
        return;
    pipeline_->disconnect(this);
    if (pipeline_->isHealthy())
        pipeline_->kill();
    // May be inside one of its own signals
    pipeline_->deleteLater();
    pipeline_ = nullptr;
}

void StreamingSessionManager::shutdown()
{
    switch (state()) {
    case SessionState::Active: {
        qInfo() << "[Session] Stopping stream before exit";
        QEventLoop loop;
        bool done = false;
        stop([&loop, &done](const StreamingResult&) {
            done = true;
            loop.quit();
        });
        // stop() completes by itself within the stop timeout
        if (!done)
            loop.exec();
        break;
    }
    case SessionState::Starting: {
        qInfo() << "[Session] Aborting stream start before exit";
        startTimer_.stop();
        retirePipeline();
        transition(SessionState::Idle);
        Callback cb = std::move(pendingStart_);
        pendingStart_ = nullptr;
        if (cb)
            cb(streamingFailure(StreamingError::PipelineError,
                                QStringLiteral("Shutting down"), current()));
        break;
    }
    case SessionState::Stopping: {
        // A stop is already running; finish it now
        if (pipeline_)
            pipeline_->kill();
        finishStop(true);
        break;
    }
    default:
        break;
    }
}

} // namespace airplay
} // namespace adk
