#include <QtTest>
#include <QDir>
#include <QSignalSpy>
#include "core/YamlConfig.hpp"
#include "core/services/ConfigService.hpp"

class TestConfigService : public QObject {
    Q_OBJECT
private slots:
    void testReadValues();
    void testWriteValues();
    void testRejectsUnknownKey();
    void testKeys();
    void testSaveAndReload();
};

void TestConfigService::testReadValues()
{
    adk::YamlConfig yaml;
    adk::ConfigService svc(&yaml, "/tmp/adk_test_cs.yaml");

    QCOMPARE(svc.value("pairing.max_attempts").toInt(), 3);
    QCOMPARE(svc.value("discovery.default_port").toInt(), 7000);
    QCOMPARE(svc.value("ipc.socket_path").toString(), QString("/tmp/airdecky.sock"));
    // Unknown key returns invalid
    QVERIFY(!svc.value("nonexistent.key").isValid());
}

void TestConfigService::testWriteValues()
{
    adk::YamlConfig yaml;
    adk::ConfigService svc(&yaml, "/tmp/adk_test_cs.yaml");
    QSignalSpy changed(&svc, &adk::ConfigService::configChanged);

    QVERIFY(svc.setValue("pairing.challenge_expiry_ms", 45000));
    QCOMPARE(svc.value("pairing.challenge_expiry_ms").toInt(), 45000);
    QCOMPARE(yaml.pairingChallengeExpiryMs(), 45000);

    QCOMPARE(changed.count(), 1);
    QCOMPARE(changed.first().at(0).toString(), QString("pairing.challenge_expiry_ms"));
    QCOMPARE(changed.first().at(1).toInt(), 45000);
}

void TestConfigService::testRejectsUnknownKey()
{
    adk::YamlConfig yaml;
    adk::ConfigService svc(&yaml, "/tmp/adk_test_cs.yaml");
    QSignalSpy changed(&svc, &adk::ConfigService::configChanged);

    QVERIFY(!svc.setValue("pairing.bogus", 1));
    QVERIFY(!svc.setValue("pipeline.arguments", QString("x")));
    QCOMPARE(changed.count(), 0);
}

void TestConfigService::testKeys()
{
    adk::YamlConfig yaml;
    adk::ConfigService svc(&yaml, "/tmp/adk_test_cs.yaml");

    const QStringList keys = svc.keys();
    QVERIFY(keys.contains("streaming.stop_timeout_ms"));
    QVERIFY(keys.contains("system.connection_test_port"));
    for (const QString& key : keys)
        QVERIFY2(svc.value(key).isValid(), qPrintable(key));
}

void TestConfigService::testSaveAndReload()
{
    const QString path = QDir::tempPath() + "/adk_test_cs_reload.yaml";
    {
        adk::YamlConfig yaml;
        adk::ConfigService svc(&yaml, path);
        QVERIFY(svc.setValue("streaming.stop_timeout_ms", 2500));
        svc.save();
    }

    adk::YamlConfig reloaded;
    reloaded.load(path);
    QCOMPARE(reloaded.streamStopTimeoutMs(), 2500);
    QFile::remove(path);
}

QTEST_MAIN(TestConfigService)
#include "test_config_service.moc"
