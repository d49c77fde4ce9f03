/**
 * @file test_settings.cpp
 * @brief Unit tests for Settings
 *
 * Every test works on an INI file in a temporary directory so the
 * user's real configuration is never touched.
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "settings.h"

using namespace PhoneSync;

class TestSettings : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Default Tests ==========
    void testDeviceDefaults();
    void testBackupDefaults();
    void testSyncDefaults();

    // ========== Override Tests ==========
    void testPollIntervalFloor();
    void testToolCommandsOverride();
    void testPersistence();
    void testPhaseWeightOverride();

    // ========== Projection Tests ==========
    void testDeviceToolConfig();
    void testSyncConfig();

private:
    QString iniPath() const { return m_tempDir->filePath("qphonesync.ini"); }

    QTemporaryDir *m_tempDir = nullptr;
};

void TestSettings::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestSettings::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

// ========== Default Tests ==========

void TestSettings::testDeviceDefaults()
{
    Settings settings(iniPath());
    QCOMPARE(settings.pollIntervalMs(), 2000);
    QCOMPARE(settings.ideviceIdCommand(), QString("idevice_id"));
    QCOMPARE(settings.ideviceInfoCommand(), QString("ideviceinfo"));
    QVERIFY(!settings.debugLogging());
}

void TestSettings::testBackupDefaults()
{
    Settings settings(iniPath());
    QCOMPARE(settings.backupSizeRatio(), 1.5);
    QCOMPARE(settings.diskSpaceHeadroom(), 2.0);
    QCOMPARE(settings.minimumFreeSpaceGB(), 10);
    QVERIFY(settings.backupDirectory().endsWith("Backups"));
}

void TestSettings::testSyncDefaults()
{
    Settings settings(iniPath());
    QVERIFY(settings.resolveMessageSenders());
    QCOMPARE(settings.phaseWeight(SyncPhase::Backup).weight, 60.0);
    QCOMPARE(settings.phaseWeight(SyncPhase::ParsingMessages).start, 75.0);
}

// ========== Override Tests ==========

void TestSettings::testPollIntervalFloor()
{
    Settings settings(iniPath());
    settings.setPollIntervalMs(500);
    QCOMPARE(settings.pollIntervalMs(), 2000);

    settings.setPollIntervalMs(5000);
    QCOMPARE(settings.pollIntervalMs(), 5000);
}

void TestSettings::testToolCommandsOverride()
{
    Settings settings(iniPath());
    settings.setIdeviceIdCommand("/opt/libimobiledevice/bin/idevice_id");
    settings.setIdeviceInfoCommand("/opt/libimobiledevice/bin/ideviceinfo");

    QCOMPARE(settings.ideviceIdCommand(), QString("/opt/libimobiledevice/bin/idevice_id"));
    QCOMPARE(settings.ideviceInfoCommand(), QString("/opt/libimobiledevice/bin/ideviceinfo"));
}

void TestSettings::testPersistence()
{
    {
        Settings settings(iniPath());
        settings.setBackupDirectory(m_tempDir->filePath("backups/"));
        settings.setBackupSizeRatio(1.2);
        settings.setDebugLogging(true);
        settings.sync();
    }

    Settings reloaded(iniPath());
    QCOMPARE(reloaded.backupDirectory(), m_tempDir->filePath("backups"));
    QCOMPARE(reloaded.backupSizeRatio(), 1.2);
    QVERIFY(reloaded.debugLogging());
}

void TestSettings::testPhaseWeightOverride()
{
    Settings settings(iniPath());

    PhaseWeight weight;
    weight.start = 0;
    weight.weight = 40;
    settings.setPhaseWeight(SyncPhase::Backup, weight);

    QCOMPARE(settings.phaseWeight(SyncPhase::Backup).weight, 40.0);
    QCOMPARE(settings.phaseWeight(SyncPhase::Decrypting).weight, 10.0);
}

// ========== Projection Tests ==========

void TestSettings::testDeviceToolConfig()
{
    Settings settings(iniPath());
    settings.setIdeviceIdCommand("my_idevice_id");
    settings.setBackupSizeRatio(2.0);

    const DeviceToolConfig config = settings.deviceToolConfig();
    QCOMPARE(config.ideviceIdCommand, QString("my_idevice_id"));
    QCOMPARE(config.ideviceInfoCommand, QString("ideviceinfo"));
    QCOMPARE(config.backupSizeRatio, 2.0);
}

void TestSettings::testSyncConfig()
{
    Settings settings(iniPath());
    settings.setDiskSpaceHeadroom(3.0);
    settings.setMinimumFreeSpaceGB(4);
    settings.setResolveMessageSenders(false);
    settings.setBackupDirectory(m_tempDir->path());

    PhaseWeight weight;
    weight.start = 50;
    weight.weight = 20;
    settings.setPhaseWeight(SyncPhase::ParsingMessages, weight);

    const SyncConfig config = settings.syncConfig();
    QCOMPARE(config.diskSpaceHeadroom, 3.0);
    QCOMPARE(config.minimumFreeSpaceBytes, qint64(4) * 1024 * 1024 * 1024);
    QVERIFY(!config.resolveMessageSenders);
    QCOMPARE(config.backupDirectory, QDir::cleanPath(m_tempDir->path()));
    QCOMPARE(config.phaseWeights.overallProgress(SyncPhase::ParsingMessages, 50), 60.0);
    QCOMPARE(config.phaseWeights.overallProgress(SyncPhase::Resolving, 0), 90.0);
}

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
