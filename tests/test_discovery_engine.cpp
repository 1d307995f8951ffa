#include <QtTest>
#include <QSignalSpy>
#include "core/airplay/DeviceRegistry.hpp"
#include "core/airplay/DiscoveryEngine.hpp"
#include "fakes/FakeServiceBrowser.hpp"

using namespace adk::airplay;

class TestDiscoveryEngine : public QObject {
    Q_OBJECT

private slots:
    void zeroReceiversIsSuccess()
    {
        DeviceRegistry registry;
        FakeServiceBrowser browser;
        browser.autoFinish = true;
        DiscoveryEngine engine(&registry, &browser);

        bool done = false;
        ScanResult result;
        engine.scan([&](const ScanResult& r) { result = r; done = true; });

        QTRY_VERIFY(done);
        QVERIFY(result.ok());
        QVERIFY(result.devices.isEmpty());
        QCOMPARE(browser.lastServiceType, QString("_airplay._tcp"));
        QCOMPARE(browser.lastWindowMs, 5000);
    }

    void scanPopulatesRegistryAndDedups()
    {
        DeviceRegistry registry;
        FakeServiceBrowser browser;
        browser.autoFinish = true;
        browser.script = {FakeServiceBrowser::ad("Living Room", "10.0.0.5"),
                          FakeServiceBrowser::ad("Bedroom", "10.0.0.6"),
                          FakeServiceBrowser::ad("Living Room", "10.0.0.5")};
        DiscoveryEngine engine(&registry, &browser);

        bool done = false;
        ScanResult result;
        engine.scan([&](const ScanResult& r) { result = r; done = true; });

        QTRY_VERIFY(done);
        QVERIFY(result.ok());
        QCOMPARE(result.devices.size(), 2);
        QCOMPARE(result.devices[0].name, QString("Living Room"));
        QCOMPARE(result.devices[1].name, QString("Bedroom"));
        QCOMPARE(registry.size(), 2);
    }

    void partialParseFailureIsAbsorbed()
    {
        DeviceRegistry registry;
        FakeServiceBrowser browser;
        browser.autoFinish = true;
        RawAdvertisement broken = FakeServiceBrowser::ad("Broken", "10.0.0.9");
        broken.port = 0;
        browser.script = {FakeServiceBrowser::ad("Living Room", "10.0.0.5"), broken};
        DiscoveryEngine engine(&registry, &browser);

        bool done = false;
        ScanResult result;
        engine.scan([&](const ScanResult& r) { result = r; done = true; });

        QTRY_VERIFY(done);
        QVERIFY(result.ok());
        QCOMPARE(result.devices.size(), 1);
        QCOMPARE(result.skippedAdvertisements, 1);
    }

    void concurrentScansShareOneBrowse()
    {
        DeviceRegistry registry;
        FakeServiceBrowser browser;
        DiscoveryEngine engine(&registry, &browser);

        int calls = 0;
        QList<int> sizes;
        engine.scan([&](const ScanResult& r) { ++calls; sizes << r.devices.size(); });
        engine.scan([&](const ScanResult& r) { ++calls; sizes << r.devices.size(); });
        QVERIFY(engine.isScanning());
        QCOMPARE(browser.browseCount, 1);

        browser.deliver(FakeServiceBrowser::ad("Living Room", "10.0.0.5"));
        browser.finish();

        QCOMPARE(calls, 2);
        QCOMPARE(sizes, (QList<int>{1, 1}));
        QVERIFY(!engine.isScanning());

        // A later scan starts a fresh browse
        engine.scan([](const ScanResult&) {});
        QCOMPARE(browser.browseCount, 2);
    }

    void noNetworkFailure()
    {
        DeviceRegistry registry;
        FakeServiceBrowser browser;
        DiscoveryEngine engine(&registry, &browser);

        ScanResult result;
        engine.scan([&](const ScanResult& r) { result = r; });
        browser.fail(IServiceBrowser::Failure::NoNetwork, "Avahi daemon not running");

        QVERIFY(!result.ok());
        QCOMPARE(result.error.kind, DiscoveryError::NoNetwork);
        QCOMPARE(result.error.kindName(), QString("NoNetwork"));
        QCOMPARE(result.error.reason, QString("Avahi daemon not running"));
    }

    void guardTimeoutCancelsBrowse()
    {
        DeviceRegistry registry;
        FakeServiceBrowser browser;  // never finishes
        DiscoveryPolicy policy;
        policy.guardMarginMs = 20;
        DiscoveryEngine engine(&registry, &browser, policy);
        QSignalSpy completed(&engine, &DiscoveryEngine::scanCompleted);

        bool done = false;
        ScanResult result;
        engine.scan(50, [&](const ScanResult& r) { result = r; done = true; });

        QTRY_VERIFY_WITH_TIMEOUT(done, 2000);
        QCOMPARE(result.error.kind, DiscoveryError::Timeout);
        QCOMPARE(browser.cancelCount, 1);
        QCOMPARE(completed.count(), 1);
        QCOMPARE(completed.first().at(1).toBool(), false);
    }

    void staleDevicesEvictedAfterScan()
    {
        DeviceRegistry registry;
        Device old;
        old.name = "Gone";
        old.address = "10.0.0.99";
        old.port = 7000;
        registry.upsert(old, QDateTime::currentDateTimeUtc().addSecs(-3600));

        FakeServiceBrowser browser;
        browser.autoFinish = true;
        browser.script = {FakeServiceBrowser::ad("Living Room", "10.0.0.5")};
        DiscoveryEngine engine(&registry, &browser);

        bool done = false;
        engine.scan([&](const ScanResult&) { done = true; });
        QTRY_VERIFY(done);

        QVERIFY(!registry.get("10.0.0.99", 7000).has_value());
        QVERIFY(registry.get("10.0.0.5", 7000).has_value());
    }

    void pairedFlagSurvivesRescan()
    {
        DeviceRegistry registry;
        FakeServiceBrowser browser;
        browser.autoFinish = true;
        browser.script = {FakeServiceBrowser::ad("Living Room", "10.0.0.5")};
        DiscoveryEngine engine(&registry, &browser);

        bool done = false;
        engine.scan([&](const ScanResult&) { done = true; });
        QTRY_VERIFY(done);
        registry.markPaired(DeviceKey{"10.0.0.5", 7000});

        done = false;
        ScanResult result;
        engine.scan([&](const ScanResult& r) { result = r; done = true; });
        QTRY_VERIFY(done);
        QCOMPARE(result.devices.size(), 1);
        QCOMPARE(result.devices.first().paired, true);
    }
};

QTEST_MAIN(TestDiscoveryEngine)
#include "test_discovery_engine.moc"
