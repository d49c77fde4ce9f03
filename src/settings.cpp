#include "settings.h"
#include <QDir>
#include <QStandardPaths>

#include "device/devicewatcher.h"

namespace {

QString phaseKey(PhoneSync::SyncPhase phase, const char *field)
{
    return QString("sync/phaseWeights/%1/%2").arg(PhoneSync::phaseName(phase), QLatin1String(field));
}

} // namespace

Settings::Settings()
    : m_settings("QPhoneSync", "QPhoneSync")
{
}

Settings::Settings(const QString &fileName)
    : m_settings(fileName, QSettings::IniFormat)
{
}

// ========== Device Detection ==========

int Settings::pollIntervalMs() const
{
    const int interval = m_settings.value("device/pollIntervalMs",
                                          DeviceWatcher::MIN_POLL_INTERVAL_MS).toInt();
    return qMax(interval, static_cast<int>(DeviceWatcher::MIN_POLL_INTERVAL_MS));
}

void Settings::setPollIntervalMs(int intervalMs)
{
    m_settings.setValue("device/pollIntervalMs", intervalMs);
}

QString Settings::ideviceIdCommand() const
{
    return m_settings.value("device/ideviceIdCommand", DeviceToolConfig().ideviceIdCommand).toString();
}

void Settings::setIdeviceIdCommand(const QString &command)
{
    m_settings.setValue("device/ideviceIdCommand", command);
}

QString Settings::ideviceInfoCommand() const
{
    return m_settings.value("device/ideviceInfoCommand", DeviceToolConfig().ideviceInfoCommand).toString();
}

void Settings::setIdeviceInfoCommand(const QString &command)
{
    m_settings.setValue("device/ideviceInfoCommand", command);
}

// ========== Backup ==========

QString Settings::backupDirectory() const
{
    const QString defaultPath = QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation))
                                    .filePath("Backups");
    return m_settings.value("backup/directory", defaultPath).toString();
}

void Settings::setBackupDirectory(const QString &path)
{
    m_settings.setValue("backup/directory", QDir::cleanPath(path));
}

double Settings::backupSizeRatio() const
{
    return m_settings.value("backup/sizeRatio", DeviceToolConfig().backupSizeRatio).toDouble();
}

void Settings::setBackupSizeRatio(double ratio)
{
    m_settings.setValue("backup/sizeRatio", ratio);
}

double Settings::diskSpaceHeadroom() const
{
    return m_settings.value("backup/diskSpaceHeadroom", PhoneSync::SyncConfig().diskSpaceHeadroom).toDouble();
}

void Settings::setDiskSpaceHeadroom(double headroom)
{
    m_settings.setValue("backup/diskSpaceHeadroom", headroom);
}

int Settings::minimumFreeSpaceGB() const
{
    return m_settings.value("backup/minimumFreeSpaceGB", 10).toInt();
}

void Settings::setMinimumFreeSpaceGB(int gigabytes)
{
    m_settings.setValue("backup/minimumFreeSpaceGB", gigabytes);
}

// ========== Sync ==========

bool Settings::resolveMessageSenders() const
{
    return m_settings.value("sync/resolveMessageSenders", true).toBool();
}

void Settings::setResolveMessageSenders(bool enabled)
{
    m_settings.setValue("sync/resolveMessageSenders", enabled);
}

PhoneSync::PhaseWeight Settings::phaseWeight(PhoneSync::SyncPhase phase) const
{
    const PhoneSync::PhaseWeight defaults = PhoneSync::PhaseWeightTable::defaults().weight(phase);

    PhoneSync::PhaseWeight weight;
    weight.start = m_settings.value(phaseKey(phase, "start"), defaults.start).toDouble();
    weight.weight = m_settings.value(phaseKey(phase, "weight"), defaults.weight).toDouble();
    return weight;
}

void Settings::setPhaseWeight(PhoneSync::SyncPhase phase, const PhoneSync::PhaseWeight &weight)
{
    m_settings.setValue(phaseKey(phase, "start"), weight.start);
    m_settings.setValue(phaseKey(phase, "weight"), weight.weight);
}

// ========== Advanced Settings ==========

bool Settings::debugLogging() const
{
    return m_settings.value("advanced/debugLogging", false).toBool();
}

void Settings::setDebugLogging(bool enabled)
{
    m_settings.setValue("advanced/debugLogging", enabled);
}

// ========== Projections ==========

DeviceToolConfig Settings::deviceToolConfig() const
{
    DeviceToolConfig config;
    config.ideviceIdCommand = ideviceIdCommand();
    config.ideviceInfoCommand = ideviceInfoCommand();
    config.backupSizeRatio = backupSizeRatio();
    return config;
}

PhoneSync::SyncConfig Settings::syncConfig() const
{
    PhoneSync::SyncConfig config;
    config.diskSpaceHeadroom = diskSpaceHeadroom();
    config.minimumFreeSpaceBytes = static_cast<qint64>(minimumFreeSpaceGB()) * 1024 * 1024 * 1024;
    config.backupDirectory = backupDirectory();
    config.resolveMessageSenders = resolveMessageSenders();

    for (PhoneSync::SyncPhase phase : PhoneSync::allPhases()) {
        config.phaseWeights.set(phase, phaseWeight(phase));
    }
    return config;
}

void Settings::sync()
{
    m_settings.sync();
}
