#include "core/airplay/SystemProbe.hpp"
#include <QDir>
#include <QFileInfo>
#include <QJsonValue>
#include <QStandardPaths>
#include <QSysInfo>
#include <QTcpSocket>
#include <QTimer>
#include <boost/log/trivial.hpp>
#include <memory>

namespace adk {
namespace airplay {

SystemProbe::SystemProbe(const ProbeSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
{
}

void SystemProbe::testConnection(const QString& address, uint16_t port, ReachabilityCallback callback)
{
    if (port == 0)
        port = settings_.connectionTestPort;

    if (address.trimmed().isEmpty()) {
        callback(false, QStringLiteral("No address given"));
        return;
    }

    auto* socket = new QTcpSocket(this);
    auto* timer = new QTimer(socket);
    timer->setSingleShot(true);

    // Shared so whichever of connected/error/timeout fires first wins
    auto done = std::make_shared<bool>(false);
    auto finish = [socket, done, callback, address, port](bool reachable, const QString& detail) {
        if (*done) return;
        *done = true;
        BOOST_LOG_TRIVIAL(info) << "[Probe] " << address.toStdString() << ":" << port
                                << (reachable ? " reachable" : " unreachable: ")
                                << (reachable ? std::string() : detail.toStdString());
        socket->abort();
        socket->deleteLater();
        callback(reachable, detail);
    };

    connect(socket, &QTcpSocket::connected, this, [finish]() {
        finish(true, QString());
    });
    connect(socket, &QTcpSocket::errorOccurred, this, [finish, socket](QAbstractSocket::SocketError) {
        finish(false, socket->errorString());
    });
    connect(timer, &QTimer::timeout, this, [finish, this]() {
        finish(false, QStringLiteral("No answer within %1 ms").arg(settings_.connectionTestTimeoutMs));
    });

    timer->start(settings_.connectionTestTimeoutMs);
    socket->connectToHost(address, port);
}

bool SystemProbe::toolAvailable(const QString& tool)
{
    if (tool.contains(QLatin1Char('/'))) {
        QFileInfo info(tool);
        return info.exists() && info.isExecutable();
    }
    return !QStandardPaths::findExecutable(tool).isEmpty();
}

bool SystemProbe::displayAvailable()
{
    if (!qEnvironmentVariableIsEmpty("DISPLAY") || !qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY"))
        return true;

    // Gaming-mode sessions expose the screen only through PipeWire
    const QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    return !runtimeDir.isEmpty() && QFileInfo::exists(QDir(runtimeDir).filePath(QStringLiteral("pipewire-0")));
}

bool SystemProbe::captureAvailable() const
{
    const bool program = toolAvailable(settings_.captureProgram);
    const bool display = displayAvailable();
    if (!program)
        BOOST_LOG_TRIVIAL(warning) << "[Probe] Capture program not found: "
                                   << settings_.captureProgram.toStdString();
    if (!display)
        BOOST_LOG_TRIVIAL(warning) << "[Probe] No display server or PipeWire session found";
    return program && display;
}

QJsonObject SystemProbe::systemInfo() const
{
    auto envOrNull = [](const char* name) {
        return qEnvironmentVariableIsSet(name) ? QJsonValue(qEnvironmentVariable(name))
                                               : QJsonValue(QJsonValue::Null);
    };

    QJsonObject tools;
    for (const QString& tool : settings_.tools)
        tools[tool] = toolAvailable(tool);

    QJsonObject info;
    info["platform"] = QSysInfo::kernelType();
    info["kernel"] = QSysInfo::kernelVersion();
    info["architecture"] = QSysInfo::currentCpuArchitecture();
    info["product"] = QSysInfo::prettyProductName();
    info["display"] = envOrNull("DISPLAY");
    info["wayland_display"] = envOrNull("WAYLAND_DISPLAY");
    info["tools"] = tools;
    info["screen_capture_available"] = captureAvailable();
    return info;
}

} // namespace airplay
} // namespace adk
