/**
 * @file test_backuppath.cpp
 * @brief Unit tests for backup file addressing and change tracking
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include "backup/backuppath.h"
#include "backup/backuptracker.h"

class TestBackupPath : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Hash Path Tests ==========
    void testAddressBookHash();
    void testMessagesHash();
    void testFilePathUsesTwoCharacterSubdirectory();
    void testDomainFilePath();

    // ========== Change Tracking Tests ==========
    void testManifestHashMissing();
    void testManifestHashKnownContent();
    void testShouldProcessWithoutManifest();
    void testShouldProcessWithoutRecord();
    void testSkipUnchangedBackup();
    void testProcessChangedManifest();
    void testProcessDifferentPath();
    void testClearRecord();

private:
    void writeManifest(const QString &backupPath, const QByteArray &content);

    QTemporaryDir *m_tempDir = nullptr;
};

void TestBackupPath::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestBackupPath::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

void TestBackupPath::writeManifest(const QString &backupPath, const QByteArray &content)
{
    QDir().mkpath(backupPath);
    QFile file(QDir(backupPath).filePath("Manifest.db"));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(content);
}

// ========== Hash Path Tests ==========

void TestBackupPath::testAddressBookHash()
{
    QCOMPARE(BackupPath::fileHash("HomeDomain", "Library/AddressBook/AddressBook.sqlitedb"),
             QString::fromLatin1(BackupPath::ADDRESSBOOK_DB_HASH));
}

void TestBackupPath::testMessagesHash()
{
    QCOMPARE(BackupPath::fileHash("HomeDomain", "Library/SMS/sms.db"),
             QString::fromLatin1(BackupPath::SMS_DB_HASH));
}

void TestBackupPath::testFilePathUsesTwoCharacterSubdirectory()
{
    const QString path = BackupPath::filePath("/backups/device",
                                              "31bb7ba8914766d4ba40d6dfb6113c8b614be442");
    QCOMPARE(path, QString("/backups/device/31/31bb7ba8914766d4ba40d6dfb6113c8b614be442"));
}

void TestBackupPath::testDomainFilePath()
{
    QCOMPARE(BackupPath::domainFilePath("/b", "HomeDomain", "Library/SMS/sms.db"),
             QString("/b/3d/3d0d7e5fb2ce288813306e4d4636395e047a3d28"));
}

// ========== Change Tracking Tests ==========

void TestBackupPath::testManifestHashMissing()
{
    QVERIFY(BackupChangeTracker::manifestHash(m_tempDir->path()).isEmpty());
}

void TestBackupPath::testManifestHashKnownContent()
{
    writeManifest(m_tempDir->path(), "manifest-v1");
    QCOMPARE(BackupChangeTracker::manifestHash(m_tempDir->path()),
             QString("88c7275ef3ef13f6eb8bf6a201c972557ab952d4d6ebe115ca80d40a1c9b64c3"));
}

void TestBackupPath::testShouldProcessWithoutManifest()
{
    BackupChangeTracker tracker;
    tracker.record(m_tempDir->path(), "abc");
    QVERIFY(tracker.shouldProcess(m_tempDir->path()));
}

void TestBackupPath::testShouldProcessWithoutRecord()
{
    writeManifest(m_tempDir->path(), "manifest-v1");
    BackupChangeTracker tracker;
    QVERIFY(!tracker.hasRecord());
    QVERIFY(tracker.shouldProcess(m_tempDir->path()));
}

void TestBackupPath::testSkipUnchangedBackup()
{
    const QString path = m_tempDir->path();
    writeManifest(path, "manifest-v1");

    BackupChangeTracker tracker;
    tracker.record(path, BackupChangeTracker::manifestHash(path));

    QVERIFY(!tracker.shouldProcess(path));
    QCOMPARE(tracker.lastRecord().backupPath, path);
    QVERIFY(tracker.lastRecord().syncedAt.isValid());
}

void TestBackupPath::testProcessChangedManifest()
{
    const QString path = m_tempDir->path();
    writeManifest(path, "manifest-v1");

    BackupChangeTracker tracker;
    tracker.record(path, BackupChangeTracker::manifestHash(path));

    writeManifest(path, "manifest-v2");
    QVERIFY(tracker.shouldProcess(path));
}

void TestBackupPath::testProcessDifferentPath()
{
    const QString first = m_tempDir->filePath("first");
    const QString second = m_tempDir->filePath("second");
    writeManifest(first, "same");
    writeManifest(second, "same");

    BackupChangeTracker tracker;
    tracker.record(first, BackupChangeTracker::manifestHash(first));

    QVERIFY(!tracker.shouldProcess(first));
    QVERIFY(tracker.shouldProcess(second));
}

void TestBackupPath::testClearRecord()
{
    const QString path = m_tempDir->path();
    writeManifest(path, "manifest-v1");

    BackupChangeTracker tracker;
    tracker.record(path, BackupChangeTracker::manifestHash(path));
    tracker.clear();

    QVERIFY(!tracker.hasRecord());
    QVERIFY(tracker.shouldProcess(path));
}

QTEST_MAIN(TestBackupPath)
#include "test_backuppath.moc"
