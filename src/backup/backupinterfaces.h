#ifndef BACKUPINTERFACES_H
#define BACKUPINTERFACES_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QList>

#include "messagetypes.h"

/**
 * @file backupinterfaces.h
 * @brief Collaborators the sync pipeline drives but does not implement
 *
 * Backup creation, decryption and message database parsing are
 * provided from outside. SyncOrchestrator only talks to these
 * interfaces.
 *
 * Implementations may throw. A std::exception is reported as a failed
 * SyncResult carrying what(); any other thrown type is reported as
 * "Unknown error during sync". Nothing propagates out of sync().
 */

// ========== Backup creation ==========

struct BackupOptions
{
    QString udid;
    QString password;
    bool forceFullBackup = false;
};

/**
 * @brief Progress reported while a backup is being created
 *
 * phase is one of "preparing", "transferring", "finishing",
 * "extracting" or "decrypting".
 */
struct BackupProgress
{
    QString phase;
    double percentComplete = 0.0;
    QString currentFile;
    int filesTransferred = 0;
    int totalFiles = 0;
    qint64 bytesTransferred = 0;
    qint64 totalBytes = 0;
    qint64 estimatedTimeRemaining = -1;     ///< Seconds, -1 if unknown
};

struct BackupResult
{
    bool success = false;
    QString backupPath;
    bool isEncrypted = false;
    QString error;
};

struct BackupStatus
{
    bool exists = false;
    bool isComplete = false;
    bool isCorrupted = false;
    qint64 sizeBytes = 0;
    QDateTime lastModified;
};

/**
 * @brief Creates device backups
 *
 * startBackup() blocks until the backup finishes, fails or is
 * cancelled. It may be called from a worker thread; progress() is
 * emitted from that same thread.
 */
class BackupProvider : public QObject
{
    Q_OBJECT

public:
    explicit BackupProvider(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~BackupProvider() = default;

    virtual BackupResult startBackup(const BackupOptions &options) = 0;

    /**
     * @brief Inspect the backup already stored for a device
     */
    virtual BackupStatus checkBackupStatus(const QString &udid) = 0;

    /**
     * @brief Ask a running startBackup() to stop; may be called from any thread
     */
    virtual void cancelBackup() = 0;

    virtual QString backupPathForDevice(const QString &udid) const = 0;

signals:
    void progress(const BackupProgress &progress);
    void passwordRequired(const QString &udid);
    void waitingForPasscode(const QString &udid);
    void passcodeEntered(const QString &udid);
};

// ========== Decryption ==========

struct DecryptionResult
{
    bool success = false;
    QString decryptedPath;
    QString error;
};

/**
 * @brief Decrypts encrypted backups into a separate directory
 */
class BackupDecryptor
{
public:
    virtual ~BackupDecryptor() = default;

    virtual DecryptionResult decryptBackup(const QString &backupPath, const QString &password) = 0;
    virtual bool isBackupEncrypted(const QString &backupPath) = 0;

    /**
     * @brief Remove a directory produced by decryptBackup()
     */
    virtual void cleanup(const QString &decryptedPath) = 0;
};

// ========== Messages ==========

/**
 * @brief Reads conversations from the message database of a backup
 */
class MessageSource
{
public:
    virtual ~MessageSource() = default;

    /**
     * @return false if the message database cannot be opened; see errorString()
     */
    virtual bool open(const QString &backupPath) = 0;
    virtual QString errorString() const = 0;

    virtual QList<Conversation> conversations() = 0;
    virtual QList<Message> messages(qint64 chatId) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

Q_DECLARE_METATYPE(BackupProgress)

#endif // BACKUPINTERFACES_H
