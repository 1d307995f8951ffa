#include "core/airplay/MirroringOrchestrator.hpp"
#include <QDebug>
#include <QPointer>

namespace adk {
namespace airplay {

MirroringOrchestrator::MirroringOrchestrator(const MirroringSettings& settings,
                                             IServiceBrowser* browser,
                                             IPairingTransport* transport,
                                             ICapturePipelineFactory* pipelines,
                                             QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , discovery_(&registry_, browser, settings.discovery)
    , pairing_(&registry_, transport, settings.pairing)
    , sessions_(&registry_, pipelines, settings.streaming)
    , broadcaster_(&sessions_, settings.subscriberQueueDepth)
    , probe_(settings.probe)
{
    qInfo() << "[Orchestrator] Ready, service type" << settings_.discovery.serviceType;
}

MirroringOrchestrator::~MirroringOrchestrator() = default;

DeviceKey MirroringOrchestrator::keyFor(const QString& address, int port) const
{
    DeviceKey key;
    key.address = address.trimmed();
    key.port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : settings_.defaultPort;
    return key;
}

void MirroringOrchestrator::discoverDevices(DiscoveryEngine::ScanCallback callback)
{
    discovery_.scan(std::move(callback));
}

QList<Device> MirroringOrchestrator::listDevices() const
{
    return registry_.list();
}

void MirroringOrchestrator::beginPairing(const DeviceKey& device, PairingCoordinator::Callback callback)
{
    pairing_.begin(device, std::move(callback));
}

void MirroringOrchestrator::pairDevice(const DeviceKey& device, const QString& pin,
                                       PairingCoordinator::Callback callback)
{
    // Throttled or already challenged: let the coordinator answer directly
    if (pairing_.isInFlight(device)
        || pairing_.recentSubmits(device) >= pairing_.policy().maxAttempts) {
        pairing_.submit(device, pin, std::move(callback));
        return;
    }

    QPointer<MirroringOrchestrator> self(this);
    pairing_.begin(device, [self, device, pin, callback](const PairingResult& challenge) {
        if (!self) return;
        if (!challenge.ok()) {
            callback(challenge);
            return;
        }
        self->pairing_.submit(device, pin, callback);
    });
}

void MirroringOrchestrator::startStreaming(const DeviceKey& device, StreamingSessionManager::Callback callback)
{
    sessions_.start(device, std::move(callback));
}

void MirroringOrchestrator::stopStreaming(StreamingSessionManager::Callback callback)
{
    sessions_.stop(std::move(callback));
}

StatusSnapshot MirroringOrchestrator::streamingStatus() const
{
    return broadcaster_.snapshot();
}

void MirroringOrchestrator::testDeviceConnection(const QString& address, uint16_t port,
                                                 SystemProbe::ReachabilityCallback callback)
{
    probe_.testConnection(address, port, std::move(callback));
}

bool MirroringOrchestrator::screenCaptureAvailable() const
{
    return probe_.captureAvailable();
}

QJsonObject MirroringOrchestrator::systemInfo() const
{
    return probe_.systemInfo();
}

void MirroringOrchestrator::shutdown()
{
    sessions_.shutdown();
}

} // namespace airplay
} // namespace adk
