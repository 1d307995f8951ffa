#pragma once

#include "core/airplay/ICapturePipeline.hpp"
#include <QByteArray>
#include <QProcess>
#include <QStringList>
#include <QTimer>

namespace adk {
namespace airplay {

struct PipelineSettings {
    QString program = QStringLiteral("gst-launch-1.0");
    // {address} {port} {width} {height} {fps} are substituted per session
    QStringList arguments;
    int width = 1280;
    int height = 800;
    int fps = 30;
    int readyGraceMs = 1500;
};

/// Runs the capture pipeline as an external process.
class ProcessCapturePipeline : public ICapturePipeline {
    Q_OBJECT
public:
    explicit ProcessCapturePipeline(const PipelineSettings& settings, QObject* parent = nullptr);
    ~ProcessCapturePipeline() override;

    void start(const QString& address, uint16_t port) override;
    bool isHealthy() const override;
    void requestStop() override;
    void kill() override;

    QStringList expandedArguments(const QString& address, uint16_t port) const;

    qint64 processId() const { return process_.processId(); }

private:
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void onProcessError(QProcess::ProcessError error);
    void onReadyGrace();
    QString diagnostic(const QString& headline) const;

    PipelineSettings settings_;
    QProcess process_;
    QTimer readyTimer_;
    QByteArray stderrTail_;
    bool ready_ = false;
    bool stopRequested_ = false;
    bool finished_ = false;
};

class ProcessCapturePipelineFactory : public ICapturePipelineFactory {
public:
    explicit ProcessCapturePipelineFactory(const PipelineSettings& settings)
        : settings_(settings) {}

    std::unique_ptr<ICapturePipeline> create(QObject* parent = nullptr) override;

private:
    PipelineSettings settings_;
};

} // namespace airplay
} // namespace adk
