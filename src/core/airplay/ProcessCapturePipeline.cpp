#include "core/airplay/ProcessCapturePipeline.hpp"
#include <QDebug>

namespace adk {
namespace airplay {

static constexpr int kStderrTailBytes = 2048;
static constexpr int kStartingPollMs = 50;

ProcessCapturePipeline::ProcessCapturePipeline(const PipelineSettings& settings, QObject* parent)
    : ICapturePipeline(parent)
    , settings_(settings)
{
    readyTimer_.setSingleShot(true);
    connect(&readyTimer_, &QTimer::timeout, this, &ProcessCapturePipeline::onReadyGrace);

    process_.setProcessChannelMode(QProcess::SeparateChannels);
    process_.setStandardOutputFile(QProcess::nullDevice());
    connect(&process_, &QProcess::readyReadStandardError, this, [this]() {
        stderrTail_.append(process_.readAllStandardError());
        if (stderrTail_.size() > kStderrTailBytes)
            stderrTail_ = stderrTail_.right(kStderrTailBytes);
    });
    connect(&process_, &QProcess::finished, this, &ProcessCapturePipeline::onProcessFinished);
    connect(&process_, &QProcess::errorOccurred, this, &ProcessCapturePipeline::onProcessError);
}

ProcessCapturePipeline::~ProcessCapturePipeline()
{
    readyTimer_.stop();
    if (process_.state() != QProcess::NotRunning) {
        process_.disconnect(this);
        process_.kill();
        process_.waitForFinished(1000);
    }
}

QStringList ProcessCapturePipeline::expandedArguments(const QString& address, uint16_t port) const
{
    QStringList out;
    out.reserve(settings_.arguments.size());
    for (QString arg : settings_.arguments) {
        arg.replace(QLatin1String("{address}"), address);
        arg.replace(QLatin1String("{port}"), QString::number(port));
        arg.replace(QLatin1String("{width}"), QString::number(settings_.width));
        arg.replace(QLatin1String("{height}"), QString::number(settings_.height));
        arg.replace(QLatin1String("{fps}"), QString::number(settings_.fps));
        out << arg;
    }
    return out;
}

void ProcessCapturePipeline::start(const QString& address, uint16_t port)
{
    ready_ = false;
    stopRequested_ = false;
    finished_ = false;
    stderrTail_.clear();

    const QStringList args = expandedArguments(address, port);
    qInfo() << "[Pipeline] Launching" << settings_.program << args.join(QLatin1Char(' '));
    process_.start(settings_.program, args);
    readyTimer_.start(settings_.readyGraceMs);
}

bool ProcessCapturePipeline::isHealthy() const
{
    return process_.state() == QProcess::Running;
}

void ProcessCapturePipeline::requestStop()
{
    stopRequested_ = true;
    readyTimer_.stop();

    if (process_.state() == QProcess::NotRunning) {
        QTimer::singleShot(0, this, &ICapturePipeline::stopped);
        return;
    }
    qInfo() << "[Pipeline] Sending SIGTERM to pid" << process_.processId();
    process_.terminate();
}

void ProcessCapturePipeline::kill()
{
    stopRequested_ = true;
    readyTimer_.stop();

    if (process_.state() == QProcess::NotRunning)
        return;
    qWarning() << "[Pipeline] Killing pid" << process_.processId();
    process_.kill();
}

void ProcessCapturePipeline::onReadyGrace()
{
    if (stopRequested_ || process_.state() == QProcess::NotRunning)
        return;
    if (process_.state() == QProcess::Starting) {
        // exec() has not returned yet; look again shortly
        readyTimer_.start(kStartingPollMs);
        return;
    }
    ready_ = true;
    qInfo() << "[Pipeline] Running, pid" << process_.processId();
    emit ready();
}

void ProcessCapturePipeline::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    if (finished_) return;
    finished_ = true;
    readyTimer_.stop();
    stderrTail_.append(process_.readAllStandardError());
    if (stderrTail_.size() > kStderrTailBytes)
        stderrTail_ = stderrTail_.right(kStderrTailBytes);

    const QString headline = status == QProcess::CrashExit
        ? QStringLiteral("%1 crashed").arg(settings_.program)
        : QStringLiteral("%1 exited with code %2").arg(settings_.program).arg(exitCode);

    if (stopRequested_) {
        qInfo() << "[Pipeline]" << headline << "after stop request";
        emit stopped();
    } else if (!ready_) {
        emit failed(diagnostic(headline));
    } else {
        qWarning() << "[Pipeline]" << headline;
        emit exited(diagnostic(headline));
    }
}

void ProcessCapturePipeline::onProcessError(QProcess::ProcessError error)
{
    // Only FailedToStart comes without a finished() signal
    if (error != QProcess::FailedToStart || finished_)
        return;
    finished_ = true;
    readyTimer_.stop();

    const QString headline = QStringLiteral("Could not launch %1: %2")
                                 .arg(settings_.program, process_.errorString());
    qWarning() << "[Pipeline]" << headline;
    if (stopRequested_)
        emit stopped();
    else
        emit failed(headline);
}

QString ProcessCapturePipeline::diagnostic(const QString& headline) const
{
    const QString tail = QString::fromLocal8Bit(stderrTail_).trimmed();
    if (tail.isEmpty())
        return headline;
    return headline + QStringLiteral(": ") + tail;
}

std::unique_ptr<ICapturePipeline> ProcessCapturePipelineFactory::create(QObject* parent)
{
    return std::make_unique<ProcessCapturePipeline>(settings_, parent);
}

} // namespace airplay
} // namespace adk
