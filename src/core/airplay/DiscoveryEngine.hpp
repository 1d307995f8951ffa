#pragma once

#include "core/airplay/Device.hpp"
#include "core/airplay/Errors.hpp"
#include "core/airplay/IServiceBrowser.hpp"
#include <QHash>
#include <QList>
#include <QObject>
#include <QTimer>
#include <functional>

namespace adk {
namespace airplay {

class DeviceRegistry;

struct DiscoveryPolicy {
    QString serviceType = QStringLiteral("_airplay._tcp");
    int scanTimeoutMs = 5000;
    qint64 staleTtlMs = 60000;
    // Extra time the browser gets to report finished() before the scan is
    // declared timed out.
    int guardMarginMs = 1000;
};

struct ScanResult {
    QList<Device> devices;
    int skippedAdvertisements = 0;
    DiscoveryError error;

    bool ok() const { return !error.isError(); }
};

/// Runs scan cycles against the service browser and feeds the registry.
/// Concurrent scan() calls while a browse is in flight attach to that browse
/// and receive the same result.
class DiscoveryEngine : public QObject {
    Q_OBJECT
public:
    using ScanCallback = std::function<void(const ScanResult&)>;

    DiscoveryEngine(DeviceRegistry* registry, IServiceBrowser* browser,
                    const DiscoveryPolicy& policy = {}, QObject* parent = nullptr);
    ~DiscoveryEngine() override;

    /// timeoutMs <= 0 uses the policy default.
    void scan(int timeoutMs, ScanCallback callback);
    void scan(ScanCallback callback) { scan(0, std::move(callback)); }

    bool isScanning() const { return inFlight_; }
    const DiscoveryPolicy& policy() const { return policy_; }

signals:
    void scanStarted();
    void scanCompleted(int deviceCount, bool ok);

private:
    void onAdvertisement(const RawAdvertisement& ad);
    void onBrowseFinished();
    void onBrowseFailed(IServiceBrowser::Failure reason, const QString& message);
    void onGuardTimeout();
    void complete(const ScanResult& result);

    DeviceRegistry* registry_;
    IServiceBrowser* browser_;
    DiscoveryPolicy policy_;

    bool inFlight_ = false;
    QList<ScanCallback> waiters_;
    QList<DeviceKey> seenOrder_;
    QHash<DeviceKey, bool> seen_;
    int skipped_ = 0;
    QTimer guardTimer_;
};

} // namespace airplay
} // namespace adk
