#pragma once

#include <QJsonObject>
#include <QObject>
#include <QStringList>
#include <cstdint>
#include <functional>

namespace adk {
namespace airplay {

struct ProbeSettings {
    QStringList tools = {QStringLiteral("ffmpeg"), QStringLiteral("gst-launch-1.0"),
                         QStringLiteral("xwininfo")};
    QString captureProgram = QStringLiteral("gst-launch-1.0");
    uint16_t connectionTestPort = 7000;
    int connectionTestTimeoutMs = 3000;
};

/// Host environment checks used by the panel's diagnostics page.
class SystemProbe : public QObject {
    Q_OBJECT
public:
    using ReachabilityCallback = std::function<void(bool reachable, const QString& detail)>;

    explicit SystemProbe(const ProbeSettings& settings = {}, QObject* parent = nullptr);

    /// TCP connect to address:port. port 0 uses the configured default.
    void testConnection(const QString& address, uint16_t port, ReachabilityCallback callback);

    bool captureAvailable() const;
    QJsonObject systemInfo() const;

    static bool toolAvailable(const QString& tool);
    static bool displayAvailable();

    const ProbeSettings& settings() const { return settings_; }

private:
    ProbeSettings settings_;
};

} // namespace airplay
} // namespace adk
