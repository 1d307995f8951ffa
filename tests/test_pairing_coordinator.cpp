#include <QtTest>
#include <QSignalSpy>
#include "core/airplay/DeviceRegistry.hpp"
#include "core/airplay/PairingCoordinator.hpp"
#include "fakes/FakePairingTransport.hpp"

using namespace adk::airplay;

static const DeviceKey kLivingRoom{"10.0.0.5", 7000};
static const DeviceKey kBedroom{"10.0.0.6", 7000};

static void seed(DeviceRegistry& registry)
{
    for (const auto& key : {kLivingRoom, kBedroom}) {
        Device d;
        d.name = key.address;
        d.address = key.address;
        d.port = key.port;
        registry.upsert(d);
    }
}

class TestPairingCoordinator : public QObject {
    Q_OBJECT

private slots:
    void correctPinPairsExactlyOneDevice()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        PairingCoordinator coordinator(&registry, &transport);
        QSignalSpy finished(&coordinator, &PairingCoordinator::attemptFinished);

        PairingResult challenge;
        coordinator.begin(kLivingRoom, [&](const PairingResult& r) { challenge = r; });
        QVERIFY(challenge.ok());
        QCOMPARE(challenge.state, PairingState::Challenged);
        QCOMPARE(coordinator.state(kLivingRoom), PairingState::Challenged);

        PairingResult result;
        coordinator.submit(kLivingRoom, "1234", [&](const PairingResult& r) { result = r; });
        QVERIFY(result.ok());
        QCOMPARE(result.state, PairingState::Paired);

        QCOMPARE(registry.get(kLivingRoom)->paired, true);
        QCOMPARE(registry.get(kBedroom)->paired, false);
        QVERIFY(!coordinator.isInFlight(kLivingRoom));
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.first().at(1).toBool(), true);
    }

    void wrongPinFailsAttempt()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        PairingCoordinator coordinator(&registry, &transport);

        coordinator.begin(kLivingRoom, [](const PairingResult&) {});
        PairingResult result;
        coordinator.submit(kLivingRoom, "0000", [&](const PairingResult& r) { result = r; });

        QVERIFY(!result.ok());
        QCOMPARE(result.state, PairingState::Failed);
        QCOMPARE(result.error.kind, PairingError::InvalidPin);
        QCOMPARE(registry.get(kLivingRoom)->paired, false);
        QCOMPARE(coordinator.state(kLivingRoom), PairingState::Idle);
        QCOMPARE(coordinator.recentSubmits(kLivingRoom), 1);
    }

    void fourthSubmitIsThrottledEvenWithCorrectPin()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        PairingCoordinator coordinator(&registry, &transport);

        for (int i = 0; i < 3; ++i) {
            coordinator.begin(kLivingRoom, [](const PairingResult&) {});
            PairingResult r;
            coordinator.submit(kLivingRoom, "9999", [&](const PairingResult& res) { r = res; });
            QCOMPARE(r.error.kind, PairingError::InvalidPin);
        }

        PairingResult challenge;
        coordinator.begin(kLivingRoom, [&](const PairingResult& r) { challenge = r; });
        QVERIFY(challenge.ok());

        PairingResult result;
        coordinator.submit(kLivingRoom, "1234", [&](const PairingResult& r) { result = r; });
        QCOMPARE(result.error.kind, PairingError::TooManyAttempts);
        QCOMPARE(transport.verifyCount, 3);
        QCOMPARE(registry.get(kLivingRoom)->paired, false);
        QVERIFY(!coordinator.isInFlight(kLivingRoom));

        // Throttling is per device
        coordinator.begin(kBedroom, [](const PairingResult&) {});
        PairingResult other;
        coordinator.submit(kBedroom, "1234", [&](const PairingResult& r) { other = r; });
        QVERIFY(other.ok());
    }

    void throttleWindowSlides()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        PairingPolicy policy;
        policy.attemptWindowMs = 100;
        PairingCoordinator coordinator(&registry, &transport, policy);

        for (int i = 0; i < 3; ++i) {
            coordinator.begin(kLivingRoom, [](const PairingResult&) {});
            coordinator.submit(kLivingRoom, "9999", [](const PairingResult&) {});
        }
        QCOMPARE(coordinator.recentSubmits(kLivingRoom), 3);

        QTest::qWait(150);
        QCOMPARE(coordinator.recentSubmits(kLivingRoom), 0);

        coordinator.begin(kLivingRoom, [](const PairingResult&) {});
        PairingResult result;
        coordinator.submit(kLivingRoom, "1234", [&](const PairingResult& r) { result = r; });
        QVERIFY(result.ok());
    }

    void challengeExpires()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        PairingPolicy policy;
        policy.challengeExpiryMs = 50;
        PairingCoordinator coordinator(&registry, &transport, policy);
        QSignalSpy finished(&coordinator, &PairingCoordinator::attemptFinished);

        coordinator.begin(kLivingRoom, [](const PairingResult&) {});
        QTRY_COMPARE(coordinator.state(kLivingRoom), PairingState::Idle);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.first().at(2).toString(), QString("Expired"));

        PairingResult result;
        coordinator.submit(kLivingRoom, "1234", [&](const PairingResult& r) { result = r; });
        QCOMPARE(result.error.kind, PairingError::Expired);
        QCOMPARE(transport.verifyCount, 0);

        // Device is free for a new attempt
        PairingResult again;
        coordinator.begin(kLivingRoom, [&](const PairingResult& r) { again = r; });
        QVERIFY(again.ok());
    }

    void expiryWhileReceiverSilent()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        transport.deferred = true;
        PairingPolicy policy;
        policy.challengeExpiryMs = 50;
        PairingCoordinator coordinator(&registry, &transport, policy);

        int calls = 0;
        PairingResult result;
        coordinator.begin(kLivingRoom, [&](const PairingResult& r) { ++calls; result = r; });
        QTRY_COMPARE(calls, 1);
        QCOMPARE(result.error.kind, PairingError::Expired);

        // Late answer is ignored
        transport.release();
        QCOMPARE(calls, 1);
        QCOMPARE(coordinator.state(kLivingRoom), PairingState::Idle);
    }

    void secondBeginIsAlreadyPairing()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        PairingCoordinator coordinator(&registry, &transport);

        coordinator.begin(kLivingRoom, [](const PairingResult&) {});
        PairingResult result;
        coordinator.begin(kLivingRoom, [&](const PairingResult& r) { result = r; });
        QCOMPARE(result.error.kind, PairingError::AlreadyPairing);
        QCOMPARE(transport.challengeCount, 1);
        QCOMPARE(coordinator.state(kLivingRoom), PairingState::Challenged);
    }

    void submitWhileVerifyingIsAlreadyPairing()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        transport.deferred = true;
        PairingCoordinator coordinator(&registry, &transport);

        coordinator.begin(kLivingRoom, [](const PairingResult&) {});
        transport.release();
        QCOMPARE(coordinator.state(kLivingRoom), PairingState::Challenged);

        PairingResult first;
        coordinator.submit(kLivingRoom, "1234", [&](const PairingResult& r) { first = r; });
        QCOMPARE(coordinator.state(kLivingRoom), PairingState::Verifying);

        PairingResult second;
        coordinator.submit(kLivingRoom, "1234", [&](const PairingResult& r) { second = r; });
        QCOMPARE(second.error.kind, PairingError::AlreadyPairing);

        transport.release();
        QVERIFY(first.ok());
        QCOMPARE(registry.get(kLivingRoom)->paired, true);
    }

    void unreachableReceiver()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        transport.reachable = false;
        PairingCoordinator coordinator(&registry, &transport);

        PairingResult result;
        coordinator.begin(kLivingRoom, [&](const PairingResult& r) { result = r; });
        QCOMPARE(result.error.kind, PairingError::Unreachable);
        QVERIFY(!result.error.reason.isEmpty());
        QVERIFY(!coordinator.isInFlight(kLivingRoom));
    }

    void unknownDeviceIsUnreachable()
    {
        DeviceRegistry registry;
        FakePairingTransport transport;
        PairingCoordinator coordinator(&registry, &transport);

        PairingResult result;
        coordinator.begin(DeviceKey{"10.9.9.9", 7000}, [&](const PairingResult& r) { result = r; });
        QCOMPARE(result.error.kind, PairingError::Unreachable);
        QCOMPARE(transport.challengeCount, 0);
    }

    void submitWithoutChallenge()
    {
        DeviceRegistry registry;
        seed(registry);
        FakePairingTransport transport;
        PairingCoordinator coordinator(&registry, &transport);

        PairingResult result;
        coordinator.submit(kLivingRoom, "1234", [&](const PairingResult& r) { result = r; });
        QCOMPARE(result.error.kind, PairingError::Expired);
        QCOMPARE(transport.verifyCount, 0);
    }

    void stateNames()
    {
        QCOMPARE(pairingStateName(PairingState::Challenged), QString("challenged"));
        QCOMPARE(pairingStateName(PairingState::Verifying), QString("verifying"));
    }
};

QTEST_MAIN(TestPairingCoordinator)
#include "test_pairing_coordinator.moc"
