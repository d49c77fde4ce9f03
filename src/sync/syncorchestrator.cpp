#include "syncorchestrator.h"
#include "backup/backupinterfaces.h"
#include "backup/contactstore.h"
#include "device/devicewatcher.h"

#include <QDir>
#include <QFileInfo>
#include <QStorageInfo>
#include <QHash>
#include <QDebug>
#include <exception>

namespace PhoneSync {

namespace {

const qint64 BYTES_PER_GB = 1024LL * 1024 * 1024;

const char *ERROR_ALREADY_RUNNING = "Sync already in progress";
const char *ERROR_CANCELLED = "Sync cancelled by user";
const char *ERROR_RESET = "Sync was reset";
const char *ERROR_PASSWORD_REQUIRED = "Password required for encrypted backup";
const char *ERROR_DECRYPTION_FAILED = "Decryption failed";
const char *ERROR_BACKUP_FAILED = "Backup failed";
const char *ERROR_NO_BACKUP = "No existing backup found for this device";
const char *ERROR_BACKUP_INCOMPLETE = "Backup is incomplete or corrupted";
const char *ERROR_UNKNOWN_EXCEPTION = "Unknown error during sync";

} // namespace

// ========== ExtractionSession ==========

/**
 * Closes whatever an extraction opened, on every exit path.
 *
 * Cleanup is best-effort: a failure is logged and does not change the
 * result of the run. Once the run has been reset the contact store and
 * message source may already belong to a newer run, so only the
 * decrypted copy is removed.
 */
class SyncOrchestrator::ExtractionSession
{
public:
    ExtractionSession(const SyncOrchestrator *owner, quint64 runId)
        : m_owner(owner)
        , m_runId(runId)
    {
    }

    ~ExtractionSession()
    {
        close();
    }

    void setDecryptedPath(const QString &path) { m_decryptedPath = path; }

    void close()
    {
        if (m_closed) {
            return;
        }
        m_closed = true;

        if (m_owner->m_state.currentRunId() == m_runId) {
            try {
                m_owner->m_messageSource->close();
            } catch (const std::exception &e) {
                qWarning() << "[SyncOrchestrator] Failed to close message source:" << e.what();
            }

            m_owner->m_contactStore->close();
        } else {
            qWarning() << "[SyncOrchestrator] Run" << m_runId
                       << "was reset, leaving parsers to run" << m_owner->m_state.currentRunId();
        }

        if (!m_decryptedPath.isEmpty()) {
            qInfo() << "[SyncOrchestrator] Removing decrypted backup" << m_decryptedPath;
            try {
                m_owner->m_decryptor->cleanup(m_decryptedPath);
            } catch (const std::exception &e) {
                qWarning() << "[SyncOrchestrator] Decrypted backup cleanup failed:" << e.what();
            }
        }
    }

private:
    const SyncOrchestrator *m_owner;
    quint64 m_runId;
    QString m_decryptedPath;
    bool m_closed = false;
};

// ========== SyncOrchestrator ==========

SyncOrchestrator::SyncOrchestrator(DeviceWatcher *deviceWatcher,
                                   BackupProvider *backupProvider,
                                   BackupDecryptor *decryptor,
                                   MessageSource *messageSource,
                                   ContactStore *contactStore,
                                   const SyncConfig &config,
                                   QObject *parent)
    : QObject(parent)
    , m_deviceWatcher(deviceWatcher)
    , m_backupProvider(backupProvider)
    , m_decryptor(decryptor)
    , m_messageSource(messageSource)
    , m_contactStore(contactStore)
    , m_config(config)
    , m_diskSpaceProbe(&SyncOrchestrator::availableDiskSpace)
{
    qRegisterMetaType<PhoneSync::SyncPhase>();
    qRegisterMetaType<PhoneSync::SyncProgress>();
    qRegisterMetaType<PhoneSync::SyncResult>();
    qRegisterMetaType<Device>();
    qRegisterMetaType<BackupProgress>();

    // startBackup() blocks the calling thread and reports from it
    connect(m_backupProvider, &BackupProvider::progress,
            this, &SyncOrchestrator::onBackupProgress, Qt::DirectConnection);
    connect(m_backupProvider, &BackupProvider::passwordRequired,
            this, &SyncOrchestrator::passwordRequired, Qt::DirectConnection);
    connect(m_backupProvider, &BackupProvider::waitingForPasscode,
            this, &SyncOrchestrator::onWaitingForPasscode, Qt::DirectConnection);
    connect(m_backupProvider, &BackupProvider::passcodeEntered,
            this, &SyncOrchestrator::onPasscodeEntered, Qt::DirectConnection);

    connect(m_deviceWatcher, &DeviceWatcher::deviceConnected,
            this, &SyncOrchestrator::deviceConnected);
    connect(m_deviceWatcher, &DeviceWatcher::deviceDisconnected,
            this, &SyncOrchestrator::deviceDisconnected);
}

SyncOrchestrator::~SyncOrchestrator()
{
}

void SyncOrchestrator::setDiskSpaceProbe(DiskSpaceProbe probe)
{
    m_diskSpaceProbe = probe ? std::move(probe) : DiskSpaceProbe(&SyncOrchestrator::availableDiskSpace);
}

// ========== Entry points ==========

SyncResult SyncOrchestrator::sync(const SyncOptions &options)
{
    SyncRequest request;
    request.source = BackupSource::Fresh;
    request.udid = options.udid;
    request.password = options.password;
    request.forceFullBackup = options.forceFullBackup;
    return execute(request);
}

SyncResult SyncOrchestrator::processExistingBackup(const ProcessBackupOptions &options)
{
    SyncRequest request;
    request.source = BackupSource::Existing;
    request.udid = options.udid;
    request.password = options.password;
    request.forceResync = options.forceResync;
    return execute(request);
}

SyncResult SyncOrchestrator::processExistingBackup(const QString &udid, const QString &password)
{
    ProcessBackupOptions options;
    options.udid = udid;
    options.password = password;
    return processExistingBackup(options);
}

SyncResult SyncOrchestrator::execute(const SyncRequest &request)
{
    RunContext run;
    run.startTime = QDateTime::currentDateTime();
    run.request = request;

    if (!m_state.begin(&run.id)) {
        qWarning() << "[SyncOrchestrator] Sync requested while another run is active";
        return errorResult(QString::fromLatin1(ERROR_ALREADY_RUNNING), run.startTime);
    }

    m_estimatedBackupSize = 0;

    qInfo() << "[SyncOrchestrator]"
            << (request.source == BackupSource::Fresh ? "Starting sync" : "Processing existing backup")
            << "for" << request.udid;
    emit logMessage(QString("Starting sync for device %1").arg(request.udid));

    try {
        return runPipeline(run);
    } catch (const std::exception &e) {
        qWarning() << "[SyncOrchestrator] Sync failed with exception:" << e.what();
        return failureResult(run, QString::fromLocal8Bit(e.what()));
    } catch (...) {
        qWarning() << "[SyncOrchestrator] Sync failed with non-standard exception";
        return failureResult(run, QString::fromLatin1(ERROR_UNKNOWN_EXCEPTION));
    }
}

SyncResult SyncOrchestrator::runPipeline(const RunContext &run)
{
    AcquiredBackup backup;

    if (run.request.source == BackupSource::Fresh) {
        const bool acquired = acquireFreshBackup(run, backup);

        // A cancelled backup usually reports failure too; cancellation wins
        const QString stop = interruption(run);
        if (!stop.isEmpty()) {
            return failureResult(run, stop);
        }
        if (!acquired) {
            return failureResult(run, backup.error);
        }
    } else {
        if (!acquireExistingBackup(run, backup)) {
            return failureResult(run, backup.error);
        }
        if (backup.skipped) {
            SyncResult result;
            result.skipped = true;
            result.skipReason = QStringLiteral("unchanged");
            result.backupPath = backup.backupPath;
            qInfo() << "[SyncOrchestrator] Skipped unchanged backup";
            emit logMessage("Backup unchanged since last sync, nothing to do");
            return successResult(run, result);
        }
    }

    return extract(run, backup);
}

// ========== Backup acquisition ==========

bool SyncOrchestrator::acquireFreshBackup(const RunContext &run, AcquiredBackup &backup)
{
    const SyncRequest &request = run.request;

    if (!enterPhase(run, SyncPhase::Backup)) {
        backup.error = QString::fromLatin1(ERROR_RESET);
        return false;
    }
    reportProgress(SyncPhase::Backup, 0, QStringLiteral("Initializing sync..."));

    const BackupStatus status = m_backupProvider->checkBackupStatus(request.udid);
    announceExistingBackup(status);

    // An existing backup's size is the best estimate; device storage is a fallback
    qint64 estimate = 0;
    if (status.exists && status.sizeBytes > 0) {
        estimate = status.sizeBytes;
        qInfo() << "[SyncOrchestrator] Using existing backup size for estimate:"
                << formatGigabytes(estimate) << "GB";
    } else {
        DeviceStorageInfo storage;
        if (m_deviceWatcher->deviceStorageInfo(request.udid, storage)) {
            estimate = storage.estimatedBackupSize;
            qInfo() << "[SyncOrchestrator] Estimated backup size from storage:"
                    << estimate / (1024 * 1024) << "MB (used space:"
                    << formatGigabytes(storage.usedSpace) << "GB)";
        } else {
            qWarning() << "[SyncOrchestrator] Could not get storage info, progress will be estimated";
        }
    }
    m_estimatedBackupSize = estimate;

    reportProgress(SyncPhase::Backup, 0, QStringLiteral("Checking available disk space..."));
    if (!checkDiskSpace(estimate, request.udid, backup.error)) {
        return false;
    }

    if (estimate > 0) {
        reportProgress(SyncPhase::Backup, 0, QStringLiteral("Estimating backup size..."));
    }

    BackupOptions options;
    options.udid = request.udid;
    options.password = request.password;
    options.forceFullBackup = request.forceFullBackup;

    const BackupResult result = m_backupProvider->startBackup(options);

    if (!result.success || result.backupPath.isEmpty()) {
        backup.error = result.error.isEmpty() ? QString::fromLatin1(ERROR_BACKUP_FAILED) : result.error;
        return false;
    }

    backup.backupPath = result.backupPath;
    backup.isEncrypted = result.isEncrypted;

    reportProgress(SyncPhase::Backup, 100, QStringLiteral("Backup complete"));
    emit logMessage(QString("Backup complete: %1").arg(result.backupPath));
    return true;
}

void SyncOrchestrator::announceExistingBackup(const BackupStatus &status)
{
    if (!status.exists) {
        reportProgress(SyncPhase::Backup, 0,
                       QStringLiteral("Preparing first sync (this may take a while)..."));
        return;
    }

    const QString size = formatGigabytes(status.sizeBytes);

    if (status.isCorrupted) {
        qWarning() << "[SyncOrchestrator] Previous backup was interrupted, will attempt to resume";
        reportProgress(SyncPhase::Backup, 0,
                       QString("Found interrupted backup (%1 GB). Resuming...").arg(size));
    } else if (status.isComplete) {
        QString message;
        if (status.lastModified.isValid()) {
            const qint64 minutes = qRound64(
                status.lastModified.secsTo(QDateTime::currentDateTime()) / 60.0);
            qInfo() << "[SyncOrchestrator] Previous backup exists (" << size
                    << "GB), last modified" << minutes << "minutes ago";
            message = QString("Found previous backup (%1 GB, synced %2)")
                          .arg(size, formatTimeAgo(minutes));
        } else {
            message = QString("Found previous backup (%1 GB)").arg(size);
        }
        reportProgress(SyncPhase::Backup, 0, message);
        reportProgress(SyncPhase::Backup, 0,
                       QStringLiteral("Comparing with iPhone to find new data..."));
    }
}

bool SyncOrchestrator::checkDiskSpace(qint64 estimatedBytes, const QString &udid, QString &error)
{
    const QString directory = backupDirectoryFor(udid);
    const qint64 available = m_diskSpaceProbe(directory);

    if (available < 0) {
        // Let the backup itself fail if space really runs out
        qWarning() << "[SyncOrchestrator] Failed to check disk space for" << directory
                   << "- assuming there is enough";
        return true;
    }

    qInfo() << "[SyncOrchestrator] Disk space:" << formatGigabytes(available)
            << "GB free on" << directory;

    if (estimatedBytes > 0) {
        // The estimate may be low, so ask for headroom on top of it
        const qint64 required = qRound64(estimatedBytes * m_config.diskSpaceHeadroom);
        if (available < required) {
            error = QString("Not enough disk space. Need approximately %1 GB free, but only %2 GB "
                            "available. Please free up some space and try again.")
                        .arg(formatGigabytes(required), formatGigabytes(available));
            return false;
        }
    } else if (available < m_config.minimumFreeSpaceBytes) {
        const double minimumGB = static_cast<double>(m_config.minimumFreeSpaceBytes) / BYTES_PER_GB;
        error = QString("Not enough disk space. Need at least %1 GB free for backup, but only %2 GB "
                        "available. Please free up some space and try again.")
                    .arg(QString::number(minimumGB), formatGigabytes(available));
        return false;
    }

    qInfo() << "[SyncOrchestrator] Disk space check passed";
    return true;
}

bool SyncOrchestrator::acquireExistingBackup(const RunContext &run, AcquiredBackup &backup)
{
    const SyncRequest &request = run.request;

    backup.backupPath = m_backupProvider->backupPathForDevice(request.udid);
    qInfo() << "[SyncOrchestrator] Processing existing backup at" << backup.backupPath;

    const BackupStatus status = m_backupProvider->checkBackupStatus(request.udid);
    if (!status.exists) {
        backup.error = QString::fromLatin1(ERROR_NO_BACKUP);
        return false;
    }
    if (!status.isComplete || status.isCorrupted) {
        backup.error = QString::fromLatin1(ERROR_BACKUP_INCOMPLETE);
        return false;
    }

    m_estimatedBackupSize = status.sizeBytes;

    if (request.forceResync) {
        qInfo() << "[SyncOrchestrator] Force resync requested, skipping change detection";
    } else if (!m_tracker.shouldProcess(backup.backupPath)) {
        backup.skipped = true;
        return true;
    }

    backup.isEncrypted = m_decryptor->isBackupEncrypted(backup.backupPath);
    return true;
}

// ========== Extraction ==========

SyncResult SyncOrchestrator::extract(const RunContext &run, const AcquiredBackup &backup)
{
    const SyncRequest &request = run.request;

    if (backup.isEncrypted && request.password.isEmpty()) {
        emit passwordRequired(request.udid);
        return failureResult(run, QString::fromLatin1(ERROR_PASSWORD_REQUIRED));
    }

    // Parsers are closed before the run is finished, so a caller reacting
    // to errorOccurred never sees them still open
    ExtractionSession session(this, run.id);
    auto fail = [&](const QString &error) {
        session.close();
        return failureResult(run, error);
    };

    QString extractionPath = backup.backupPath;
    QString stop;

    // Decrypt
    if (backup.isEncrypted) {
        if (!enterPhase(run, SyncPhase::Decrypting)) {
            return fail(QString::fromLatin1(ERROR_RESET));
        }
        reportProgress(SyncPhase::Decrypting, 0, QStringLiteral("Decrypting backup..."));

        const DecryptionResult decrypted = m_decryptor->decryptBackup(backup.backupPath,
                                                                      request.password);
        if (decrypted.success && !decrypted.decryptedPath.isEmpty()
                && decrypted.decryptedPath != backup.backupPath) {
            session.setDecryptedPath(decrypted.decryptedPath);
        }

        stop = interruption(run);
        if (!stop.isEmpty()) {
            return fail(stop);
        }
        if (!decrypted.success || decrypted.decryptedPath.isEmpty()) {
            return fail(decrypted.error.isEmpty()
                            ? QString::fromLatin1(ERROR_DECRYPTION_FAILED)
                            : decrypted.error);
        }

        extractionPath = decrypted.decryptedPath;
        reportProgress(SyncPhase::Decrypting, 100, QStringLiteral("Backup decrypted"));
    }

    // Contacts
    if (!enterPhase(run, SyncPhase::ParsingContacts)) {
        return fail(QString::fromLatin1(ERROR_RESET));
    }
    reportProgress(SyncPhase::ParsingContacts, 0, QStringLiteral("Reading contacts..."));

    if (!m_contactStore->open(extractionPath)) {
        return fail(m_contactStore->errorString());
    }
    const QList<Contact> contacts = m_contactStore->allContacts();

    reportProgress(SyncPhase::ParsingContacts, 100,
                   QString("Found %1 contacts").arg(contacts.size()));

    stop = interruption(run);
    if (!stop.isEmpty()) {
        return fail(stop);
    }

    // Messages
    if (!enterPhase(run, SyncPhase::ParsingMessages)) {
        return fail(QString::fromLatin1(ERROR_RESET));
    }
    reportProgress(SyncPhase::ParsingMessages, 0, QStringLiteral("Reading messages..."));

    if (!m_messageSource->open(extractionPath)) {
        const QString reason = m_messageSource->errorString();
        return fail(reason.isEmpty()
                            ? QStringLiteral("Failed to open message database")
                            : reason);
    }

    QList<Conversation> conversations = m_messageSource->conversations();
    const int total = conversations.size();

    // First half of the phase: the conversation list
    reportProgress(SyncPhase::ParsingMessages, 50,
                   QString("Scanning chats: %1/%1").arg(total));

    // Second half: messages per conversation
    int loaded = 0;
    for (Conversation &conversation : conversations) {
        if (!interruption(run).isEmpty()) {
            break;
        }

        conversation.messages = m_messageSource->messages(conversation.chatId);
        ++loaded;

        if (loaded % CONVERSATION_PROGRESS_STEP == 0 || loaded == total) {
            const double phaseProgress = 50.0 + (static_cast<double>(loaded) / total) * 50.0;
            reportProgress(SyncPhase::ParsingMessages, phaseProgress,
                           QString("Loading conversations: %1/%2").arg(loaded).arg(total));
        }
    }

    stop = interruption(run);
    if (!stop.isEmpty()) {
        return fail(stop);
    }

    // Resolve
    if (!enterPhase(run, SyncPhase::Resolving)) {
        return fail(QString::fromLatin1(ERROR_RESET));
    }
    reportProgress(SyncPhase::Resolving, 0, QStringLiteral("Resolving contact names..."));

    resolveContactNames(conversations);

    reportProgress(SyncPhase::Resolving, 100, QStringLiteral("Contact names resolved"));

    stop = interruption(run);
    if (!stop.isEmpty()) {
        return fail(stop);
    }

    // Cleanup
    if (!enterPhase(run, SyncPhase::Cleanup)) {
        return fail(QString::fromLatin1(ERROR_RESET));
    }
    reportProgress(SyncPhase::Cleanup, 0, QStringLiteral("Finalizing..."));

    session.close();

    const QString manifestHash = BackupChangeTracker::manifestHash(backup.backupPath);
    if (!manifestHash.isEmpty()) {
        m_tracker.record(backup.backupPath, manifestHash);
    }

    SyncResult result;
    result.contacts = contacts;
    result.conversations = conversations;
    for (const Conversation &conversation : conversations) {
        result.messages.append(conversation.messages);
    }
    result.backupPath = backup.backupPath;

    qInfo() << "[SyncOrchestrator] Extracted" << result.conversations.size() << "conversations,"
            << result.messages.size() << "messages," << result.contacts.size() << "contacts";

    return successResult(run, result);
}

void SyncOrchestrator::resolveContactNames(QList<Conversation> &conversations)
{
    QHash<QString, QString> resolved;   // handle -> display name, empty if unknown

    auto displayNameFor = [this, &resolved](const QString &handle) -> QString {
        auto it = resolved.constFind(handle);
        if (it != resolved.constEnd()) {
            return it.value();
        }
        const ContactLookupResult lookup = m_contactStore->lookupByHandle(handle);
        const QString name = lookup.found ? lookup.contact.displayName : QString();
        resolved.insert(handle, name);
        return name;
    };

    for (Conversation &conversation : conversations) {
        QStringList participants;
        for (const QString &handle : conversation.participants) {
            const QString name = displayNameFor(handle);
            participants << (name.isEmpty() ? handle : name);
        }
        conversation.participants = participants;

        if (!m_config.resolveMessageSenders) {
            continue;
        }

        for (Message &message : conversation.messages) {
            if (message.isFromMe || message.handle.isEmpty()) {
                continue;
            }
            const QString name = displayNameFor(message.handle);
            if (!name.isEmpty()) {
                message.senderName = name;
            }
        }
    }
}

// ========== Run state ==========

bool SyncOrchestrator::enterPhase(const RunContext &run, SyncPhase phase)
{
    if (!m_state.transitionTo(phase, run.id)) {
        return false;
    }
    qDebug() << "[SyncOrchestrator] Phase:" << phaseName(phase);
    emit phaseChanged(phase);
    return true;
}

QString SyncOrchestrator::interruption(const RunContext &run) const
{
    if (m_state.currentRunId() != run.id || !m_state.isRunning()) {
        return QString::fromLatin1(ERROR_RESET);
    }
    if (m_state.isCancelled()) {
        return QString::fromLatin1(ERROR_CANCELLED);
    }
    return QString();
}

void SyncOrchestrator::cancel()
{
    if (!m_state.isRunning()) {
        return;
    }

    qInfo() << "[SyncOrchestrator] Cancelling sync";
    emit logMessage("Cancel requested...");
    m_state.requestCancel();
    m_backupProvider->cancelBackup();
}

void SyncOrchestrator::forceReset()
{
    qWarning() << "[SyncOrchestrator] Force resetting sync state";
    m_state.reset();
    m_estimatedBackupSize = 0;
}

SyncStatus SyncOrchestrator::status() const
{
    SyncStatus s;
    s.isRunning = m_state.isRunning();
    s.phase = m_state.phase();
    return s;
}

bool SyncOrchestrator::isRunning() const
{
    return m_state.isRunning();
}

// ========== Results ==========

SyncResult SyncOrchestrator::errorResult(const QString &error, const QDateTime &startTime)
{
    SyncResult result;
    result.success = false;
    result.error = error;
    result.startTime = startTime;
    result.endTime = QDateTime::currentDateTime();
    return result;
}

SyncResult SyncOrchestrator::failureResult(const RunContext &run, const QString &error)
{
    const bool current = m_state.currentRunId() == run.id && m_state.isRunning();

    qWarning() << "[SyncOrchestrator] Sync failed:" << error;

    if (current) {
        m_state.finish(SyncPhase::Error, run.id);
        emit phaseChanged(SyncPhase::Error);
    }

    emit logMessage(QString("Sync failed: %1").arg(error));
    emit errorOccurred(error);
    return errorResult(error, run.startTime);
}

SyncResult SyncOrchestrator::successResult(const RunContext &run, SyncResult result)
{
    result.success = true;
    result.error.clear();
    result.startTime = run.startTime;
    result.endTime = QDateTime::currentDateTime();

    m_state.finish(SyncPhase::Complete, run.id);
    if (m_state.phase() == SyncPhase::Complete) {
        emit phaseChanged(SyncPhase::Complete);
        reportProgress(SyncPhase::Complete, 100,
                       result.skipped ? QStringLiteral("Backup unchanged") : QStringLiteral("Sync complete"));
    }

    emit logMessage(QString("Sync complete. Contacts: %1, conversations: %2, messages: %3. Duration: %4ms")
                        .arg(result.contacts.size())
                        .arg(result.conversations.size())
                        .arg(result.messages.size())
                        .arg(result.durationMs()));
    emit syncComplete(result);
    return result;
}

// ========== Progress ==========

void SyncOrchestrator::onBackupProgress(const BackupProgress &backupProgress)
{
    const qint64 estimate = m_estimatedBackupSize.load();

    double phaseProgress = backupProgress.percentComplete;
    if (estimate > 0 && backupProgress.bytesTransferred > 0) {
        phaseProgress = qMin(static_cast<double>(backupProgress.bytesTransferred) / estimate * 100.0,
                             BACKUP_PROGRESS_CAP);
    }

    SyncProgress p;
    p.phase = SyncPhase::Backup;
    p.phaseProgress = phaseProgress;
    p.overallProgress = m_config.phaseWeights.overallProgress(SyncPhase::Backup, phaseProgress);
    p.message = backupProgressMessage(backupProgress);
    p.hasBackupProgress = true;
    p.backupProgress = backupProgress;
    p.estimatedTotalBytes = estimate;
    emitProgress(p);
}

void SyncOrchestrator::onWaitingForPasscode(const QString &udid)
{
    qInfo() << "[SyncOrchestrator] Waiting for user to enter passcode on device";
    emit logMessage("Enter your passcode on the device to allow the backup");
    emit waitingForPasscode(udid);
}

void SyncOrchestrator::onPasscodeEntered(const QString &udid)
{
    qInfo() << "[SyncOrchestrator] Passcode entered, backup starting";
    emit passcodeEntered(udid);
}

void SyncOrchestrator::reportProgress(SyncPhase phase, double phaseProgress, const QString &message)
{
    SyncProgress p;
    p.phase = phase;
    p.phaseProgress = phaseProgress;
    p.overallProgress = m_config.phaseWeights.overallProgress(phase, phaseProgress);
    p.message = message;
    if (phase == SyncPhase::Backup) {
        p.estimatedTotalBytes = m_estimatedBackupSize.load();
    }
    emitProgress(p);
}

void SyncOrchestrator::emitProgress(const SyncProgress &p)
{
    if (p.phase != m_state.phase()) {
        qDebug() << "[SyncOrchestrator] Dropping" << phaseName(p.phase)
                 << "progress while in" << phaseName(m_state.phase());
        return;
    }
    emit progress(p);
}

QString SyncOrchestrator::backupProgressMessage(const BackupProgress &progress)
{
    // Per-file percentages are not shown; each file runs 0-100 on its own
    if (progress.phase == QLatin1String("preparing")) {
        return QStringLiteral("iPhone is preparing backup... This may take several minutes.");
    }
    if (progress.phase == QLatin1String("transferring")) {
        if (progress.filesTransferred > 0) {
            return QStringLiteral("Receiving files from iPhone...");
        }
        return QStringLiteral("Starting file transfer...");
    }
    if (progress.phase == QLatin1String("finishing")) {
        return QStringLiteral("Finalizing backup...");
    }
    if (progress.phase == QLatin1String("extracting")) {
        return QStringLiteral("Extracting messages and contacts...");
    }
    if (progress.phase == QLatin1String("decrypting")) {
        return QStringLiteral("Decrypting backup data...");
    }
    return QStringLiteral("Processing...");
}

QString SyncOrchestrator::formatTimeAgo(qint64 minutes)
{
    if (minutes < 60) {
        return QString("%1 minutes ago").arg(minutes);
    }
    if (minutes < 1440) {
        return QString("%1 hours ago").arg(qRound64(minutes / 60.0));
    }
    return QString("%1 days ago").arg(qRound64(minutes / 1440.0));
}

QString SyncOrchestrator::formatGigabytes(qint64 bytes)
{
    return QString::number(static_cast<double>(bytes) / BYTES_PER_GB, 'f', 1);
}

// ========== Disk space ==========

QString SyncOrchestrator::backupDirectoryFor(const QString &udid) const
{
    if (!m_config.backupDirectory.isEmpty()) {
        return m_config.backupDirectory;
    }
    return m_backupProvider->backupPathForDevice(udid);
}

qint64 SyncOrchestrator::availableDiskSpace(const QString &path)
{
    if (path.isEmpty()) {
        return -1;
    }

    // The backup directory may not exist before the first sync
    QFileInfo info(QDir::cleanPath(QDir(path).absolutePath()));
    while (!info.exists()) {
        const QString parent = info.absolutePath();
        if (parent == info.absoluteFilePath()) {
            return -1;
        }
        info = QFileInfo(parent);
    }

    const QStorageInfo storage(info.absoluteFilePath());
    if (!storage.isValid() || !storage.isReady()) {
        return -1;
    }
    return storage.bytesAvailable();
}

// ========== Change detection ==========

bool SyncOrchestrator::shouldProcessBackup(const QString &backupPath) const
{
    return m_tracker.shouldProcess(backupPath);
}

void SyncOrchestrator::recordBackupSync(const QString &backupPath, const QString &manifestHash)
{
    m_tracker.record(backupPath, manifestHash);
}

void SyncOrchestrator::clearLastBackupSync()
{
    m_tracker.clear();
}

void SyncOrchestrator::cleanupBackup(const QString &backupPath)
{
    if (backupPath.isEmpty()) {
        return;
    }

    qInfo() << "[SyncOrchestrator] Cleaning up decrypted backup" << backupPath;
    try {
        m_decryptor->cleanup(backupPath);
    } catch (const std::exception &e) {
        qWarning() << "[SyncOrchestrator] Backup cleanup failed:" << e.what();
        return;
    }
    qInfo() << "[SyncOrchestrator] Backup cleanup complete";
}

// ========== Devices ==========

QList<Device> SyncOrchestrator::connectedDevices() const
{
    return m_deviceWatcher->connectedDevices();
}

void SyncOrchestrator::startDeviceDetection(int intervalMs)
{
    m_deviceWatcher->start(intervalMs);
}

void SyncOrchestrator::stopDeviceDetection()
{
    m_deviceWatcher->stop();
}

} // namespace PhoneSync
