#include "backuptracker.h"
#include "backuppath.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <QDebug>

QString BackupChangeTracker::manifestHash(const QString &backupPath)
{
    QFile manifest(QDir(backupPath).filePath(QString::fromLatin1(BackupPath::MANIFEST_DB)));
    if (!manifest.open(QIODevice::ReadOnly)) {
        return QString();
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&manifest)) {
        qWarning() << "[BackupChangeTracker] Failed to read" << manifest.fileName();
        return QString();
    }
    return QString::fromLatin1(hash.result().toHex());
}

bool BackupChangeTracker::shouldProcess(const QString &backupPath) const
{
    const QString currentHash = manifestHash(backupPath);
    if (currentHash.isEmpty()) {
        qInfo() << "[BackupChangeTracker] No backup manifest available, will process backup";
        return true;
    }

    QMutexLocker locker(&m_mutex);

    if (!m_hasRecord) {
        qInfo() << "[BackupChangeTracker] No previous sync recorded, will process backup";
        return true;
    }

    if (QDir::cleanPath(m_record.backupPath) != QDir::cleanPath(backupPath)) {
        qInfo() << "[BackupChangeTracker] Different backup path, will process backup";
        return true;
    }

    if (m_record.manifestHash == currentHash) {
        const qint64 minutes = m_record.syncedAt.secsTo(QDateTime::currentDateTime()) / 60;
        qInfo() << "[BackupChangeTracker] Backup unchanged since last sync (" << minutes
                << "min ago), skipping re-parse";
        return false;
    }

    qInfo() << "[BackupChangeTracker] Backup manifest changed, will process backup";
    return true;
}

void BackupChangeTracker::record(const QString &backupPath, const QString &manifestHash)
{
    QMutexLocker locker(&m_mutex);
    m_record.backupPath = backupPath;
    m_record.manifestHash = manifestHash;
    m_record.syncedAt = QDateTime::currentDateTime();
    m_hasRecord = true;

    qInfo() << "[BackupChangeTracker] Recorded backup sync:" << backupPath
            << manifestHash.left(16) + "...";
}

void BackupChangeTracker::clear()
{
    QMutexLocker locker(&m_mutex);
    m_record = Record();
    m_hasRecord = false;
    qInfo() << "[BackupChangeTracker] Cleared last backup sync record";
}

bool BackupChangeTracker::hasRecord() const
{
    QMutexLocker locker(&m_mutex);
    return m_hasRecord;
}

BackupChangeTracker::Record BackupChangeTracker::lastRecord() const
{
    QMutexLocker locker(&m_mutex);
    return m_record;
}
