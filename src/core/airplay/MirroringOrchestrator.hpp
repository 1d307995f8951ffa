#pragma once

#include "core/airplay/DeviceRegistry.hpp"
#include "core/airplay/DiscoveryEngine.hpp"
#include "core/airplay/MirroringSettings.hpp"
#include "core/airplay/PairingCoordinator.hpp"
#include "core/airplay/StatusBroadcaster.hpp"
#include "core/airplay/StreamingSessionManager.hpp"
#include "core/airplay/SystemProbe.hpp"
#include <QJsonObject>
#include <QObject>

namespace adk {
namespace airplay {

class IServiceBrowser;
class IPairingTransport;
class ICapturePipelineFactory;

/// Owns the mirroring components and exposes the remote operations the
/// panel calls. Network collaborators are injected and not owned.
class MirroringOrchestrator : public QObject {
    Q_OBJECT
public:
    MirroringOrchestrator(const MirroringSettings& settings,
                          IServiceBrowser* browser,
                          IPairingTransport* transport,
                          ICapturePipelineFactory* pipelines,
                          QObject* parent = nullptr);
    ~MirroringOrchestrator() override;

    void discoverDevices(DiscoveryEngine::ScanCallback callback);
    QList<Device> listDevices() const;

    void beginPairing(const DeviceKey& device, PairingCoordinator::Callback callback);

    /// Submits to the running challenge when there is one, otherwise asks
    /// the receiver for a challenge first and submits right after.
    void pairDevice(const DeviceKey& device, const QString& pin, PairingCoordinator::Callback callback);

    void startStreaming(const DeviceKey& device, StreamingSessionManager::Callback callback);
    void stopStreaming(StreamingSessionManager::Callback callback);
    StatusSnapshot streamingStatus() const;

    void testDeviceConnection(const QString& address, uint16_t port,
                              SystemProbe::ReachabilityCallback callback);
    bool screenCaptureAvailable() const;
    QJsonObject systemInfo() const;

    /// Stop any stream before the process exits. Blocks at most the stop timeout.
    void shutdown();

    DeviceKey keyFor(const QString& address, int port) const;

    const MirroringSettings& settings() const { return settings_; }
    DeviceRegistry* registry() { return &registry_; }
    PairingCoordinator* pairing() { return &pairing_; }
    StreamingSessionManager* sessions() { return &sessions_; }
    StatusBroadcaster* broadcaster() { return &broadcaster_; }

private:
    MirroringSettings settings_;
    DeviceRegistry registry_;
    DiscoveryEngine discovery_;
    PairingCoordinator pairing_;
    StreamingSessionManager sessions_;
    StatusBroadcaster broadcaster_;
    SystemProbe probe_;
};

} // namespace airplay
} // namespace adk
