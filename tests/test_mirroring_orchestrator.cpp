#include <QtTest>
#include "core/airplay/MirroringOrchestrator.hpp"
#include "fakes/FakeCapturePipeline.hpp"
#include "fakes/FakePairingTransport.hpp"
#include "fakes/FakeServiceBrowser.hpp"

using namespace adk::airplay;

class TestMirroringOrchestrator : public QObject {
    Q_OBJECT

private:
    struct Rig {
        FakeServiceBrowser browser;
        FakePairingTransport transport;
        FakePipelineFactory pipelines;
        std::unique_ptr<MirroringOrchestrator> orchestrator;

        explicit Rig(MirroringSettings settings = {})
        {
            browser.autoFinish = true;
            browser.script = {FakeServiceBrowser::ad("Living Room", "10.0.0.5"),
                              FakeServiceBrowser::ad("Bedroom", "10.0.0.6")};
            orchestrator = std::make_unique<MirroringOrchestrator>(settings, &browser, &transport,
                                                                   &pipelines);
        }

        QList<Device> discover()
        {
            bool done = false;
            QList<Device> devices;
            orchestrator->discoverDevices([&](const ScanResult& r) { devices = r.devices; done = true; });
            QTest::qWaitFor([&]() { return done; }, 2000);
            return devices;
        }

        bool pair(const QString& address, const QString& pin, PairingResult* out = nullptr)
        {
            PairingResult result;
            orchestrator->pairDevice(orchestrator->keyFor(address, 7000), pin,
                                     [&](const PairingResult& r) { result = r; });
            if (out) *out = result;
            return result.ok();
        }

        StreamingResult start(const QString& address)
        {
            bool done = false;
            StreamingResult result;
            orchestrator->startStreaming(orchestrator->keyFor(address, 7000),
                                         [&](const StreamingResult& r) { result = r; done = true; });
            QTest::qWaitFor([&]() { return done; }, 2000);
            return result;
        }

        StreamingResult stop()
        {
            bool done = false;
            StreamingResult result;
            orchestrator->stopStreaming([&](const StreamingResult& r) { result = r; done = true; });
            QTest::qWaitFor([&]() { return done; }, 5000);
            return result;
        }
    };

private slots:
    void initTestCase()
    {
        qRegisterMetaType<adk::airplay::StatusSnapshot>();
    }

    void scenarioA_noReceivers()
    {
        Rig rig;
        rig.browser.script.clear();

        bool done = false;
        ScanResult result;
        rig.orchestrator->discoverDevices([&](const ScanResult& r) { result = r; done = true; });
        QTRY_VERIFY(done);
        QVERIFY(result.ok());
        QVERIFY(result.devices.isEmpty());
    }

    void scenarioB_pairThenDiscoverShowsPaired()
    {
        Rig rig;
        rig.discover();

        QVERIFY(rig.pair("10.0.0.5", "1234"));
        QCOMPARE(rig.transport.challengeCount, 1);
        QCOMPARE(rig.transport.verifyCount, 1);

        const auto devices = rig.discover();
        QCOMPARE(devices.size(), 2);
        for (const Device& d : devices)
            QCOMPARE(d.paired, d.address == QLatin1String("10.0.0.5"));
    }

    void pairSubmitsToExistingChallenge()
    {
        Rig rig;
        rig.discover();

        PairingResult challenge;
        rig.orchestrator->beginPairing(rig.orchestrator->keyFor("10.0.0.5", 7000),
                                       [&](const PairingResult& r) { challenge = r; });
        QVERIFY(challenge.ok());

        QVERIFY(rig.pair("10.0.0.5", "1234"));
        QCOMPARE(rig.transport.challengeCount, 1);
    }

    void pairThrottledWithoutContactingReceiver()
    {
        Rig rig;
        rig.discover();

        for (int i = 0; i < 3; ++i)
            QVERIFY(!rig.pair("10.0.0.5", "0000"));
        const int challenges = rig.transport.challengeCount;

        PairingResult result;
        QVERIFY(!rig.pair("10.0.0.5", "1234", &result));
        QCOMPARE(result.error.kind, PairingError::TooManyAttempts);
        QCOMPARE(rig.transport.challengeCount, challenges);
        QCOMPARE(rig.transport.verifyCount, 3);
    }

    void pairUndiscoveredDevice()
    {
        Rig rig;
        PairingResult result;
        QVERIFY(!rig.pair("10.0.0.5", "1234", &result));
        QCOMPARE(result.error.kind, PairingError::Unreachable);
    }

    void scenarioC_secondStartIsAlreadyStreaming()
    {
        Rig rig;
        rig.discover();
        QVERIFY(rig.pair("10.0.0.5", "1234"));
        QVERIFY(rig.pair("10.0.0.6", "1234"));

        QVERIFY(rig.start("10.0.0.5").ok());
        StreamingResult second = rig.start("10.0.0.6");
        QCOMPARE(second.error.kind, StreamingError::AlreadyStreaming);

        const StatusSnapshot status = rig.orchestrator->streamingStatus();
        QVERIFY(status.streaming);
        QCOMPARE(status.connectedDevice->address, QString("10.0.0.5"));
    }

    void startUnpairedIsNotPaired()
    {
        Rig rig;
        rig.discover();
        StreamingResult result = rig.start("10.0.0.5");
        QCOMPARE(result.error.kind, StreamingError::NotPaired);
        QVERIFY(rig.pipelines.created.isEmpty());
    }

    void scenarioD_crashIsPushedBeforeStatusRead()
    {
        Rig rig;
        rig.discover();
        QVERIFY(rig.pair("10.0.0.5", "1234"));

        QList<StatusSnapshot> pushed;
        rig.orchestrator->broadcaster()->subscribe([&](const StatusSnapshot& s) { pushed << s; });

        QVERIFY(rig.start("10.0.0.5").ok());
        QTRY_VERIFY(!pushed.isEmpty() && pushed.last().streaming);

        rig.pipelines.last()->crash("encoder died");
        QTRY_VERIFY(!pushed.last().streaming);

        const StatusSnapshot status = rig.orchestrator->streamingStatus();
        QVERIFY(!status.streaming);
        QCOMPARE(pushed.last(), status);
    }

    void scenarioE_stopWithStubbornPipeline()
    {
        MirroringSettings settings;
        settings.streaming.stopTimeoutMs = 200;
        Rig rig(settings);
        rig.pipelines.ignoreStop = true;
        rig.discover();
        QVERIFY(rig.pair("10.0.0.5", "1234"));
        QVERIFY(rig.start("10.0.0.5").ok());

        QElapsedTimer timer;
        timer.start();
        StreamingResult stopped = rig.stop();
        QVERIFY(stopped.ok());
        QVERIFY(timer.elapsed() < 2000);
        QVERIFY(!rig.orchestrator->streamingStatus().streaming);

        rig.pipelines.ignoreStop = false;
        QVERIFY(rig.start("10.0.0.5").ok());
        QVERIFY(rig.orchestrator->streamingStatus().streaming);
    }

    void stopWhenIdle()
    {
        Rig rig;
        StreamingResult result = rig.stop();
        QCOMPARE(result.error.kind, StreamingError::NotStreaming);
    }

    void keyForUsesDefaultPort()
    {
        Rig rig;
        QCOMPARE(rig.orchestrator->keyFor(" 10.0.0.5 ", 0), (DeviceKey{"10.0.0.5", 7000}));
        QCOMPARE(rig.orchestrator->keyFor("10.0.0.5", 7100), (DeviceKey{"10.0.0.5", 7100}));
        QCOMPARE(rig.orchestrator->keyFor("10.0.0.5", 70000), (DeviceKey{"10.0.0.5", 7000}));
    }

    void shutdownEndsStream()
    {
        Rig rig;
        rig.discover();
        QVERIFY(rig.pair("10.0.0.5", "1234"));
        QVERIFY(rig.start("10.0.0.5").ok());

        rig.orchestrator->shutdown();
        QCOMPARE(rig.orchestrator->sessions()->state(), SessionState::Idle);
    }
};

QTEST_MAIN(TestMirroringOrchestrator)
#include "test_mirroring_orchestrator.moc"
