#include "core/airplay/DiscoveryEngine.hpp"
#include "core/airplay/AdvertisementParser.hpp"
#include "core/airplay/DeviceRegistry.hpp"
#include <QDateTime>
#include <QDebug>
#include <boost/log/trivial.hpp>

namespace adk {
namespace airplay {

DiscoveryEngine::DiscoveryEngine(DeviceRegistry* registry, IServiceBrowser* browser,
                                 const DiscoveryPolicy& policy, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , browser_(browser)
    , policy_(policy)
{
    guardTimer_.setSingleShot(true);
    connect(&guardTimer_, &QTimer::timeout, this, &DiscoveryEngine::onGuardTimeout);

    connect(browser_, &IServiceBrowser::advertisement,
            this, &DiscoveryEngine::onAdvertisement);
    connect(browser_, &IServiceBrowser::finished,
            this, &DiscoveryEngine::onBrowseFinished);
    connect(browser_, &IServiceBrowser::failed,
            this, &DiscoveryEngine::onBrowseFailed);
}

DiscoveryEngine::~DiscoveryEngine()
{
    if (inFlight_)
        browser_->cancel();
}

void DiscoveryEngine::scan(int timeoutMs, ScanCallback callback)
{
    if (callback)
        waiters_.append(std::move(callback));

    if (inFlight_) {
        qDebug() << "[Discovery] Scan already in flight, attaching ("
                 << waiters_.size() << "waiters)";
        return;
    }

    const int window = timeoutMs > 0 ? timeoutMs : policy_.scanTimeoutMs;

    inFlight_ = true;
    seen_.clear();
    seenOrder_.clear();
    skipped_ = 0;

    qInfo() << "[Discovery] Browsing" << policy_.serviceType << "for" << window << "ms";
    emit scanStarted();

    guardTimer_.start(window + policy_.guardMarginMs);
    browser_->browse(policy_.serviceType, window);
}

void DiscoveryEngine::onAdvertisement(const RawAdvertisement& ad)
{
    if (!inFlight_)
        return;

    QString reason;
    Device dev = AdvertisementParser::parse(ad, &reason);
    if (!dev.isValid()) {
        ++skipped_;
        return;
    }

    // Same receiver on several interfaces/protocols arrives more than once per pass
    const DeviceKey key = dev.key();
    registry_->upsert(dev);
    if (!seen_.contains(key)) {
        seen_.insert(key, true);
        seenOrder_.append(key);
    }
}

void DiscoveryEngine::onBrowseFinished()
{
    if (!inFlight_)
        return;

    registry_->evictStale(QDateTime::currentDateTimeUtc(), policy_.staleTtlMs);

    ScanResult result;
    result.skippedAdvertisements = skipped_;
    for (const auto& key : seenOrder_) {
        // Re-read so pairing that completed mid-scan is reflected
        auto dev = registry_->get(key);
        if (dev)
            result.devices.append(*dev);
    }

    if (skipped_ > 0) {
        BOOST_LOG_TRIVIAL(warning) << "[Discovery] " << skipped_
                                   << " advertisement(s) could not be parsed and were skipped";
    }
    qInfo() << "[Discovery] Scan finished:" << result.devices.size() << "receiver(s)";
    complete(result);
}

void DiscoveryEngine::onBrowseFailed(IServiceBrowser::Failure reason, const QString& message)
{
    if (!inFlight_)
        return;

    ScanResult result;
    result.error.kind = reason == IServiceBrowser::Failure::Timeout
        ? DiscoveryError::Timeout
        : DiscoveryError::NoNetwork;
    result.error.reason = message;
    qWarning() << "[Discovery] Scan failed:" << result.error.kindName() << message;
    complete(result);
}

void DiscoveryEngine::onGuardTimeout()
{
    if (!inFlight_)
        return;

    qWarning() << "[Discovery] Browser did not finish in time, cancelling query";
    browser_->cancel();

    ScanResult result;
    result.error.kind = DiscoveryError::Timeout;
    result.error.reason = QStringLiteral("Service discovery did not respond in time");
    complete(result);
}

void DiscoveryEngine::complete(const ScanResult& result)
{
    guardTimer_.stop();
    inFlight_ = false;

    QList<ScanCallback> waiters;
    waiters.swap(waiters_);

    emit scanCompleted(result.devices.size(), result.ok());
    for (const auto& cb : waiters)
        cb(result);
}

} // namespace airplay
} // namespace adk
