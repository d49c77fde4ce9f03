#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QHash>
#include <QMetaType>

#include "backup/backupinterfaces.h"
#include "backup/contacttypes.h"
#include "backup/messagetypes.h"

/**
 * @file synctypes.h
 * @brief Common types and enums for the device sync pipeline
 */

namespace PhoneSync {

/**
 * @brief Phases of one sync run, in order
 *
 * Decrypting is skipped for unencrypted backups. Complete and Error
 * end a run.
 */
enum class SyncPhase {
    Idle,
    Backup,
    Decrypting,
    ParsingContacts,
    ParsingMessages,
    Resolving,
    Cleanup,
    Complete,
    Error
};

/**
 * @brief Wire name of a phase, e.g. "parsing-contacts"
 */
QString phaseName(SyncPhase phase);

/**
 * @brief Inverse of phaseName()
 * @return false if @p name is not a phase
 */
bool phaseFromName(const QString &name, SyncPhase &phase);

/**
 * @brief All phases, in pipeline order
 */
QList<SyncPhase> allPhases();

/**
 * @brief Slice of the overall progress bar owned by a phase
 */
struct PhaseWeight {
    double start = 0.0;     ///< Overall percent when the phase begins
    double weight = 0.0;    ///< Overall percent the phase spans
};

/**
 * @brief Maps phase-local progress onto overall progress
 *
 * overall = start + phasePercent / 100 * weight
 */
class PhaseWeightTable
{
public:
    /// backup 0/60, decrypting 60/10, contacts 70/5, messages 75/15,
    /// resolving 90/5, cleanup 95/5, complete 100/0
    static PhaseWeightTable defaults();

    void set(SyncPhase phase, const PhaseWeight &weight);
    PhaseWeight weight(SyncPhase phase) const;

    double overallProgress(SyncPhase phase, double phasePercent) const;

private:
    QHash<int, PhaseWeight> m_weights;
};

/**
 * @brief Input to SyncOrchestrator::sync()
 */
struct SyncOptions {
    QString udid;
    QString password;           ///< Empty if none supplied
    bool forceFullBackup = false;
};

/**
 * @brief Input to SyncOrchestrator::processExistingBackup()
 */
struct ProcessBackupOptions {
    QString udid;
    QString password;
    bool forceResync = false;   ///< Process even if the backup is unchanged
};

/**
 * @brief Progress report emitted by the orchestrator
 */
struct SyncProgress {
    SyncPhase phase = SyncPhase::Idle;
    double phaseProgress = 0.0;     ///< 0-100 within the phase
    double overallProgress = 0.0;   ///< 0-100 across the run
    QString message;

    bool hasBackupProgress = false;
    BackupProgress backupProgress;  ///< Raw provider event, valid if hasBackupProgress
    qint64 estimatedTotalBytes = 0; ///< 0 if unknown
};

/**
 * @brief Outcome of a sync run
 *
 * Failures never escape as exceptions; they end up in error.
 */
struct SyncResult {
    bool success = false;
    QList<Message> messages;        ///< All messages of all conversations
    QList<Contact> contacts;
    QList<Conversation> conversations;
    QString error;                  ///< Empty on success
    QDateTime startTime;
    QDateTime endTime;

    bool skipped = false;           ///< Backup unchanged since last sync
    QString skipReason;             ///< "unchanged" when skipped
    QString backupPath;             ///< Directory the data was read from

    qint64 durationMs() const {
        if (!startTime.isValid() || !endTime.isValid()) {
            return 0;
        }
        return startTime.msecsTo(endTime);
    }
};

struct SyncStatus {
    bool isRunning = false;
    SyncPhase phase = SyncPhase::Idle;
};

/**
 * @brief Tunables for SyncOrchestrator, usually from Settings::syncConfig()
 */
struct SyncConfig {
    /// Free space required = headroom * estimated backup size
    double diskSpaceHeadroom = 2.0;

    /// Required free space when no estimate is available
    qint64 minimumFreeSpaceBytes = 10LL * 1024 * 1024 * 1024;

    /// Volume checked by the disk space preflight
    QString backupDirectory;

    /// Fill Message::senderName from the address book
    bool resolveMessageSenders = true;

    PhaseWeightTable phaseWeights = PhaseWeightTable::defaults();
};

} // namespace PhoneSync

Q_DECLARE_METATYPE(PhoneSync::SyncPhase)
Q_DECLARE_METATYPE(PhoneSync::SyncProgress)
Q_DECLARE_METATYPE(PhoneSync::SyncResult)

#endif // SYNCTYPES_H
