#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QSettings>

#include "device/devicetypes.h"
#include "sync/synctypes.h"

/**
 * @brief Application settings using QSettings
 *
 * Uses QSettings for platform-appropriate storage:
 *   - Linux: ~/.config/QPhoneSync/QPhoneSync.conf
 *   - Windows: Registry
 *   - macOS: plist
 *
 * or an explicit INI file (qphonesync --config).
 *
 * Settings is an ordinary object; whoever builds the sync services
 * creates one and hands the projected values to them.
 */
class Settings
{
public:
    /// Native settings location
    Settings();

    /// INI file at @p fileName
    explicit Settings(const QString &fileName);

    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    QString fileName() const { return m_settings.fileName(); }

    // ========== Device Detection ==========

    int pollIntervalMs() const;
    void setPollIntervalMs(int intervalMs);

    QString ideviceIdCommand() const;
    void setIdeviceIdCommand(const QString &command);

    QString ideviceInfoCommand() const;
    void setIdeviceInfoCommand(const QString &command);

    // ========== Backup ==========

    // Where device backups are stored (defaults to <AppData>/Backups)
    QString backupDirectory() const;
    void setBackupDirectory(const QString &path);

    // Backup size estimate as a multiple of used device storage
    double backupSizeRatio() const;
    void setBackupSizeRatio(double ratio);

    // Free space required as a multiple of the estimate
    double diskSpaceHeadroom() const;
    void setDiskSpaceHeadroom(double headroom);

    // Free space required when nothing can be estimated
    int minimumFreeSpaceGB() const;
    void setMinimumFreeSpaceGB(int gigabytes);

    // ========== Sync ==========

    bool resolveMessageSenders() const;
    void setResolveMessageSenders(bool enabled);

    // Progress weight of a phase; unset keys fall back to the defaults
    PhoneSync::PhaseWeight phaseWeight(PhoneSync::SyncPhase phase) const;
    void setPhaseWeight(PhoneSync::SyncPhase phase, const PhoneSync::PhaseWeight &weight);

    // ========== Advanced Settings ==========
    bool debugLogging() const;
    void setDebugLogging(bool enabled);

    // ========== Projections ==========

    DeviceToolConfig deviceToolConfig() const;
    PhoneSync::SyncConfig syncConfig() const;

    // Sync to disk
    void sync();

private:
    mutable QSettings m_settings;
};

#endif // SETTINGS_H
