#pragma once

#include <QObject>
#include <QString>
#include <cstdint>
#include <memory>

namespace adk {
namespace airplay {

/// Screen capture + encode + send toward one receiver. One instance per
/// session; StreamingSessionManager creates a fresh one for every start().
///
/// Signal contract:
///   start() -> ready()            pipeline is up and sending
///   start() -> failed(diag)       never became ready
///   ready() -> exited(diag)       died on its own (crash path)
///   requestStop()/kill() -> stopped()
class ICapturePipeline : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ICapturePipeline() override = default;

    virtual void start(const QString& address, uint16_t port) = 0;
    virtual bool isHealthy() const = 0;

    /// Graceful shutdown request. stopped() follows once it has exited.
    virtual void requestStop() = 0;

    /// Forced termination. Must not block.
    virtual void kill() = 0;

signals:
    void ready();
    void failed(const QString& diagnostic);
    void exited(const QString& diagnostic);
    void stopped();
};

class ICapturePipelineFactory {
public:
    virtual ~ICapturePipelineFactory() = default;
    virtual std::unique_ptr<ICapturePipeline> create(QObject* parent = nullptr) = 0;
};

} // namespace airplay
} // namespace adk
