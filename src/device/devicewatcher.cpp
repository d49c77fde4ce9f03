#include "devicewatcher.h"
#include "devicetoolrunner.h"

#include <QMutexLocker>
#include <QSet>
#include <QThread>
#include <QDebug>

namespace {

const char *const DISK_USAGE_DOMAIN = "com.apple.disk_usage";

// Mock storage: 128 GB device with 64 GB in use
const qint64 MOCK_TOTAL_CAPACITY = 128000000000LL;
const qint64 MOCK_AVAILABLE_SPACE = 64000000000LL;

qint64 gigabytes(qint64 bytes)
{
    return qRound64(bytes / 1024.0 / 1024.0 / 1024.0);
}

} // namespace

DeviceWatcher::DeviceWatcher(DeviceToolRunner *runner,
                             const DeviceToolConfig &config,
                             QObject *parent)
    : QObject(parent)
    , m_runner(runner)
    , m_config(config)
{
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &DeviceWatcher::pollDevices);

    m_mockMode = qEnvironmentVariable("MOCK_DEVICE") == QLatin1String("true");
    if (m_mockMode) {
        qInfo() << "[DeviceWatcher] Running in mock mode";
    }

    qDebug() << "[DeviceWatcher] Created on thread:" << QThread::currentThread();
}

DeviceWatcher::~DeviceWatcher()
{
    stop();
    qDebug() << "[DeviceWatcher] Destroyed";
}

void DeviceWatcher::setMockMode(bool enabled)
{
    m_mockMode = enabled;
}

bool DeviceWatcher::isRunning() const
{
    return m_timer->isActive();
}

// ========== Polling ==========

void DeviceWatcher::start(int intervalMs)
{
    if (m_timer->isActive()) {
        qWarning() << "[DeviceWatcher] Already running, stopping first";
        stop();
    }

    m_intervalMs = qMax(intervalMs, MIN_POLL_INTERVAL_MS);
    qInfo() << "[DeviceWatcher] Starting device polling (interval:" << m_intervalMs << "ms)";
    emit logMessage(QString("Watching for devices every %1 ms").arg(m_intervalMs));

    pollDevices();

    m_timer->start(m_intervalMs);
}

void DeviceWatcher::stop()
{
    if (!m_timer->isActive()) {
        return;
    }

    qInfo() << "[DeviceWatcher] Stopping device polling";
    m_timer->stop();
}

bool DeviceWatcher::pollDevices()
{
    bool expected = false;
    if (!m_polling.compare_exchange_strong(expected, true)) {
        qDebug() << "[DeviceWatcher] Previous poll still running, skipping";
        return false;
    }

    const QStringList currentUdids = listDevices();

    QSet<QString> previousUdids;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_devices.cbegin(); it != m_devices.cend(); ++it) {
            previousUdids.insert(it.key());
        }
    }

    for (const QString &udid : currentUdids) {
        if (previousUdids.contains(udid)) {
            continue;
        }

        qInfo() << "[DeviceWatcher] New device found:" << udid << "- fetching info";

        Device device;
        QString error;
        if (!deviceInfo(udid, device, &error)) {
            // Only this device is affected; keep going with the rest
            qWarning() << "[DeviceWatcher] Failed to get info for device" << udid << ":" << error;
            emit logMessage(QString("Could not read device %1: %2").arg(udid, error));
            continue;
        }

        {
            QMutexLocker locker(&m_mutex);
            m_devices.insert(udid, device);
        }

        qInfo() << "[DeviceWatcher] Device connected:" << device.name << udid;
        emit logMessage(QString("Device connected: %1 (%2)").arg(device.name, udid));
        emit deviceConnected(device);
    }

    for (const QString &udid : previousUdids) {
        if (currentUdids.contains(udid)) {
            continue;
        }

        Device device;
        {
            QMutexLocker locker(&m_mutex);
            device = m_devices.take(udid);
        }
        device.isConnected = false;

        qInfo() << "[DeviceWatcher] Device disconnected:" << device.name << udid;
        emit logMessage(QString("Device disconnected: %1 (%2)").arg(device.name, udid));
        emit deviceDisconnected(device);
    }

    m_polling = false;
    return true;
}

// ========== Queries ==========

QList<Device> DeviceWatcher::connectedDevices() const
{
    QMutexLocker locker(&m_mutex);
    return m_devices.values();
}

bool DeviceWatcher::isToolAvailable()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_toolState != ToolState::Unknown) {
            return m_toolState == ToolState::Available;
        }
    }

    if (!m_runner) {
        QMutexLocker locker(&m_mutex);
        m_toolState = ToolState::Unavailable;
        qWarning() << "[DeviceWatcher] No tool runner configured";
        return false;
    }

    qInfo() << "[DeviceWatcher] Checking libimobiledevice at:" << m_config.ideviceIdCommand;
    const ToolResult result = m_runner->run(m_config.ideviceIdCommand, {QStringLiteral("--version")});
    const bool available = result.succeeded();

    if (available) {
        qInfo() << "[DeviceWatcher] libimobiledevice is available";
    } else {
        qWarning() << "[DeviceWatcher] libimobiledevice is not available - device detection will not work:"
                   << result.errorString;
        emit logMessage("idevice_id not found - device detection disabled");
    }

    QMutexLocker locker(&m_mutex);
    m_toolState = available ? ToolState::Available : ToolState::Unavailable;
    return available;
}

QStringList DeviceWatcher::listDevices()
{
    if (m_mockMode) {
        return {mockDevice().udid};
    }

    if (!isToolAvailable()) {
        return {};
    }

    // Not logged per call: this runs on every poll
    const ToolResult result = m_runner->run(m_config.ideviceIdCommand, {QStringLiteral("-l")});

    if (!result.started) {
        qWarning() << "[DeviceWatcher] Failed to spawn idevice_id:" << result.errorString;
        return {};
    }

    if (result.exitCode != 0) {
        // Non-zero exit with nothing attached is normal
        if (!result.standardError.trimmed().isEmpty()) {
            qDebug() << "[DeviceWatcher] idevice_id stderr:" << result.standardError.trimmed();
        }
        return {};
    }

    QStringList udids;
    const QStringList lines = result.standardOutput.split('\n');
    for (const QString &line : lines) {
        const QString udid = line.trimmed();
        if (!udid.isEmpty()) {
            udids << udid;
        }
    }
    return udids;
}

bool DeviceWatcher::deviceInfo(const QString &udid, Device &device, QString *errorMessage)
{
    if (m_mockMode) {
        device = mockDevice();
        return true;
    }

    if (!m_runner) {
        if (errorMessage) *errorMessage = "No tool runner configured";
        return false;
    }

    qDebug() << "[DeviceWatcher] Running:" << m_config.ideviceInfoCommand << "-u" << udid;
    const ToolResult result = m_runner->run(m_config.ideviceInfoCommand, {QStringLiteral("-u"), udid});

    if (!result.started) {
        if (errorMessage) {
            *errorMessage = QString("Failed to spawn ideviceinfo: %1").arg(result.errorString);
        }
        return false;
    }

    if (result.exitCode != 0) {
        if (errorMessage) {
            *errorMessage = QString("ideviceinfo exited with code %1: %2")
                                .arg(result.exitCode)
                                .arg(result.standardError.trimmed());
        }
        return false;
    }

    device = parseDeviceInfo(udid, result.standardOutput);
    return true;
}

bool DeviceWatcher::deviceStorageInfo(const QString &udid, DeviceStorageInfo &info)
{
    if (m_mockMode) {
        info.totalCapacity = MOCK_TOTAL_CAPACITY;
        info.availableSpace = MOCK_AVAILABLE_SPACE;
        info.usedSpace = MOCK_TOTAL_CAPACITY - MOCK_AVAILABLE_SPACE;
        info.estimatedBackupSize = qRound64(info.usedSpace * m_config.backupSizeRatio);
        return true;
    }

    if (!m_runner) {
        return false;
    }

    qDebug() << "[DeviceWatcher] Getting storage info for device:" << udid;
    const ToolResult result = m_runner->run(m_config.ideviceInfoCommand,
                                            {QStringLiteral("-u"), udid,
                                             QStringLiteral("-q"), QString::fromLatin1(DISK_USAGE_DOMAIN)});

    if (!result.started) {
        qWarning() << "[DeviceWatcher] Failed to spawn ideviceinfo for storage:" << result.errorString;
        return false;
    }

    if (result.exitCode != 0) {
        qWarning() << "[DeviceWatcher] Failed to get storage info:" << result.standardError.trimmed();
        return false;
    }

    info = parseStorageInfo(result.standardOutput, m_config.backupSizeRatio);

    qInfo() << "[DeviceWatcher] Storage: total=" << gigabytes(info.totalCapacity) << "GB"
            << "available=" << gigabytes(info.availableSpace) << "GB"
            << "used=" << gigabytes(info.usedSpace) << "GB";
    qInfo() << "[DeviceWatcher] Estimated backup size:" << info.estimatedBackupSize / 1024 / 1024 << "MB"
            << "(" << m_config.backupSizeRatio * 100 << "% of used space )";

    return true;
}

// ========== Parsing ==========

QMap<QString, QString> DeviceWatcher::parseKeyValueOutput(const QString &output)
{
    QMap<QString, QString> values;

    const QStringList lines = output.split('\n');
    for (const QString &line : lines) {
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            continue;
        }
        values.insert(line.left(colon).trimmed(), line.mid(colon + 1).trimmed());
    }

    return values;
}

Device DeviceWatcher::parseDeviceInfo(const QString &udid, const QString &output)
{
    const QMap<QString, QString> info = parseKeyValueOutput(output);

    auto field = [&info](const char *key, const char *fallback) {
        const QString value = info.value(QString::fromLatin1(key));
        return value.isEmpty() ? QString::fromLatin1(fallback) : value;
    };

    Device device;
    device.udid = udid;
    device.name = field("DeviceName", "Unknown Device");
    device.productType = field("ProductType", "Unknown");
    device.productVersion = field("ProductVersion", "Unknown");
    device.serialNumber = field("SerialNumber", "Unknown");
    device.isConnected = true;
    return device;
}

DeviceStorageInfo DeviceWatcher::parseStorageInfo(const QString &output, double backupSizeRatio)
{
    const QMap<QString, QString> info = parseKeyValueOutput(output);

    // Key names vary between OS versions
    auto firstOf = [&info](const char *primary, const char *fallback) -> qint64 {
        QString value = info.value(QString::fromLatin1(primary));
        if (value.isEmpty()) {
            value = info.value(QString::fromLatin1(fallback));
        }
        bool ok = false;
        const qint64 number = value.toLongLong(&ok);
        return ok ? number : 0;
    };

    DeviceStorageInfo storage;
    storage.totalCapacity = firstOf("TotalDataCapacity", "TotalDiskCapacity");
    storage.availableSpace = firstOf("TotalDataAvailable", "TotalSystemAvailable");
    storage.usedSpace = storage.totalCapacity - storage.availableSpace;
    storage.estimatedBackupSize = qRound64(storage.usedSpace * backupSizeRatio);
    return storage;
}

Device DeviceWatcher::mockDevice()
{
    Device device;
    device.udid = QStringLiteral("00000000-0000000000000000");
    device.name = QStringLiteral("Mock iPhone");
    device.productType = QStringLiteral("iPhone14,2");
    device.productVersion = QStringLiteral("17.0");
    device.serialNumber = QStringLiteral("MOCK123456789");
    device.isConnected = true;
    return device;
}
