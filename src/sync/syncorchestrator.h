#ifndef SYNCORCHESTRATOR_H
#define SYNCORCHESTRATOR_H

#include <QObject>
#include <QString>
#include <QList>
#include <atomic>
#include <functional>

#include "synctypes.h"
#include "syncstatemachine.h"
#include "backup/backuptracker.h"
#include "device/devicetypes.h"

class DeviceWatcher;
class BackupProvider;
class BackupDecryptor;
class MessageSource;
class ContactStore;

namespace PhoneSync {

/**
 * @brief Runs the device backup sync pipeline
 *
 * A run goes through these phases:
 *   backup -> [decrypting] -> parsing-contacts -> parsing-messages
 *          -> resolving -> cleanup -> complete
 *
 * sync() creates a fresh backup first; processExistingBackup() starts
 * from a backup already on disk. Both then share the same extraction
 * steps.
 *
 * Only one run can be active at a time. sync() and
 * processExistingBackup() block until the run ends and are meant to be
 * called on a worker thread; progress and status signals can be
 * received on other threads through queued connections. cancel(),
 * status() and forceReset() may be called from any thread.
 *
 * Failures are never thrown. They come back as SyncResult::error and
 * are also announced through errorOccurred().
 *
 * Usage:
 * @code
 * SyncOrchestrator orchestrator(&watcher, &provider, &decryptor,
 *                               &messages, &contacts, settings.syncConfig());
 * connect(&orchestrator, &SyncOrchestrator::progress, ...);
 *
 * SyncOptions options;
 * options.udid = device.udid;
 * SyncResult result = orchestrator.sync(options);
 * @endcode
 */
class SyncOrchestrator : public QObject
{
    Q_OBJECT

public:
    /// Returns free bytes on the volume holding @p path, or -1 if unknown
    using DiskSpaceProbe = std::function<qint64(const QString &path)>;

    /// Backup progress is capped here until the backup has finished
    static constexpr double BACKUP_PROGRESS_CAP = 99.0;

    /// Message loading reports progress every this many conversations
    static constexpr int CONVERSATION_PROGRESS_STEP = 10;

    /**
     * All collaborators are borrowed and must outlive the orchestrator.
     */
    SyncOrchestrator(DeviceWatcher *deviceWatcher,
                     BackupProvider *backupProvider,
                     BackupDecryptor *decryptor,
                     MessageSource *messageSource,
                     ContactStore *contactStore,
                     const SyncConfig &config = SyncConfig(),
                     QObject *parent = nullptr);
    ~SyncOrchestrator() override;

    // ========== Configuration ==========

    const SyncConfig &config() const { return m_config; }

    /**
     * @brief Replace the free disk space check (QStorageInfo by default)
     */
    void setDiskSpaceProbe(DiskSpaceProbe probe);

    // ========== Sync ==========

    /**
     * @brief Back up the device, then extract contacts and messages
     */
    SyncResult sync(const SyncOptions &options);

    /**
     * @brief Extract contacts and messages from the backup already on disk
     *
     * Skipped (success with skipped = true) when the backup has not
     * changed since the last successful run, unless forceResync is set.
     */
    SyncResult processExistingBackup(const ProcessBackupOptions &options);
    SyncResult processExistingBackup(const QString &udid, const QString &password = QString());

    /**
     * @brief Request cancellation of the active run
     *
     * The run stops at its next checkpoint, closes everything it opened
     * and returns "Sync cancelled by user". A running backup is asked to
     * stop as well.
     */
    void cancel();

    /**
     * @brief Unconditionally return to idle
     *
     * Recovery for a run that is stuck (e.g. a backup tool that never
     * exits). The stuck run can no longer change the state once it
     * returns.
     */
    void forceReset();

    SyncStatus status() const;
    bool isRunning() const;

    /// Estimate used for the active run, 0 if none
    qint64 estimatedBackupSize() const { return m_estimatedBackupSize.load(); }

    /**
     * @brief Remove a decrypted backup directory; failures are only logged
     */
    void cleanupBackup(const QString &backupPath);

    // ========== Change detection ==========

    bool shouldProcessBackup(const QString &backupPath) const;
    void recordBackupSync(const QString &backupPath, const QString &manifestHash);
    void clearLastBackupSync();

    // ========== Devices ==========

    QList<Device> connectedDevices() const;
    void startDeviceDetection(int intervalMs);
    void stopDeviceDetection();

    // ========== Helpers ==========

    /**
     * @brief User-facing text for a backup progress event
     */
    static QString backupProgressMessage(const BackupProgress &progress);

    /**
     * @brief "N minutes ago", "N hours ago" or "N days ago"
     */
    static QString formatTimeAgo(qint64 minutes);

    /**
     * @brief Bytes as GiB with one decimal, e.g. "12.5"
     */
    static QString formatGigabytes(qint64 bytes);

    /**
     * @brief Default DiskSpaceProbe based on QStorageInfo
     *
     * Uses the nearest existing ancestor of @p path, so the backup
     * directory does not need to exist yet.
     */
    static qint64 availableDiskSpace(const QString &path);

signals:
    void progress(const PhoneSync::SyncProgress &progress);
    void phaseChanged(PhoneSync::SyncPhase phase);
    void deviceConnected(const Device &device);
    void deviceDisconnected(const Device &device);
    void passwordRequired(const QString &udid);
    void waitingForPasscode(const QString &udid);
    void passcodeEntered(const QString &udid);
    void errorOccurred(const QString &error);
    void syncComplete(const PhoneSync::SyncResult &result);
    void logMessage(const QString &message);

private slots:
    void onBackupProgress(const BackupProgress &backupProgress);
    void onWaitingForPasscode(const QString &udid);
    void onPasscodeEntered(const QString &udid);

private:
    enum class BackupSource {
        Fresh,      ///< Create a backup first
        Existing    ///< Use the backup already on disk
    };

    struct SyncRequest {
        BackupSource source = BackupSource::Fresh;
        QString udid;
        QString password;
        bool forceFullBackup = false;
        bool forceResync = false;
    };

    struct RunContext {
        quint64 id = 0;
        QDateTime startTime;
        SyncRequest request;
    };

    /// Backup ready for extraction
    struct AcquiredBackup {
        QString error;          ///< Set when acquisition failed
        QString backupPath;
        bool isEncrypted = false;
        bool skipped = false;   ///< Unchanged since the last run
    };

    class ExtractionSession;

    SyncResult execute(const SyncRequest &request);
    SyncResult runPipeline(const RunContext &run);

    bool acquireFreshBackup(const RunContext &run, AcquiredBackup &backup);
    bool acquireExistingBackup(const RunContext &run, AcquiredBackup &backup);
    void announceExistingBackup(const BackupStatus &status);
    bool checkDiskSpace(qint64 estimatedBytes, const QString &udid, QString &error);

    SyncResult extract(const RunContext &run, const AcquiredBackup &backup);
    void resolveContactNames(QList<Conversation> &conversations);

    bool enterPhase(const RunContext &run, SyncPhase phase);
    QString interruption(const RunContext &run) const;

    void reportProgress(SyncPhase phase, double phaseProgress, const QString &message);
    void emitProgress(const SyncProgress &progress);

    SyncResult successResult(const RunContext &run, SyncResult result);
    SyncResult failureResult(const RunContext &run, const QString &error);
    static SyncResult errorResult(const QString &error, const QDateTime &startTime);

    QString backupDirectoryFor(const QString &udid) const;

    DeviceWatcher *m_deviceWatcher = nullptr;
    BackupProvider *m_backupProvider = nullptr;
    BackupDecryptor *m_decryptor = nullptr;
    MessageSource *m_messageSource = nullptr;
    ContactStore *m_contactStore = nullptr;

    SyncConfig m_config;
    DiskSpaceProbe m_diskSpaceProbe;

    SyncStateMachine m_state;
    BackupChangeTracker m_tracker;
    std::atomic<qint64> m_estimatedBackupSize{0};
};

} // namespace PhoneSync

#endif // SYNCORCHESTRATOR_H
