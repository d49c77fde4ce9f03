#ifndef BACKUPTRACKER_H
#define BACKUPTRACKER_H

#include <QString>
#include <QDateTime>
#include <QMutex>

/**
 * @brief Remembers the last processed backup to skip unchanged ones
 *
 * A backup is identified by its directory and the SHA-256 of its
 * Manifest.db. If both match the last successful sync, re-parsing the
 * backup would produce the same data.
 *
 * The record is kept in memory only.
 */
class BackupChangeTracker
{
public:
    struct Record {
        QString backupPath;
        QString manifestHash;
        QDateTime syncedAt;
    };

    /**
     * @brief SHA-256 (hex) of <backupPath>/Manifest.db
     * @return Empty string if the manifest is missing or unreadable
     */
    static QString manifestHash(const QString &backupPath);

    /**
     * @brief Decide whether a backup needs processing
     *
     * Returns true when there is no manifest, no previous record, a
     * different backup path or a different manifest hash.
     */
    bool shouldProcess(const QString &backupPath) const;

    void record(const QString &backupPath, const QString &manifestHash);
    void clear();

    bool hasRecord() const;
    Record lastRecord() const;

private:
    mutable QMutex m_mutex;
    Record m_record;
    bool m_hasRecord = false;
};

#endif // BACKUPTRACKER_H
