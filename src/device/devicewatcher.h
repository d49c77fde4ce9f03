#ifndef DEVICEWATCHER_H
#define DEVICEWATCHER_H

#include <QObject>
#include <QTimer>
#include <QMap>
#include <QMutex>
#include <QStringList>
#include <atomic>

#include "devicetypes.h"

class DeviceToolRunner;

/**
 * @brief Polls for USB-attached devices using idevice_id / ideviceinfo
 *
 * Each poll cycle re-lists the attached UDIDs, diffs them against the
 * previously seen set and emits deviceConnected()/deviceDisconnected().
 *
 * Intended to live on its own thread (moveToThread, see the "watch"
 * command in main.cpp): the tool invocations block while they run.
 *
 * Implementation notes:
 * - The polling interval is never shorter than MIN_POLL_INTERVAL_MS
 * - A cycle that is still running when the next one is due causes the
 *   next one to be skipped, not queued
 * - Mock mode (MOCK_DEVICE=true in the environment) never spawns tools
 */
class DeviceWatcher : public QObject
{
    Q_OBJECT

public:
    static constexpr int MIN_POLL_INTERVAL_MS = 2000;

    /**
     * @param runner Tool runner (not owned, must outlive the watcher)
     * @param config Tool paths and backup size ratio
     */
    explicit DeviceWatcher(DeviceToolRunner *runner,
                           const DeviceToolConfig &config = DeviceToolConfig(),
                           QObject *parent = nullptr);
    ~DeviceWatcher() override;

    // ========== Configuration ==========

    void setMockMode(bool enabled);
    bool isMockMode() const { return m_mockMode; }

    const DeviceToolConfig &config() const { return m_config; }

    /**
     * @brief Check if polling is active
     */
    bool isRunning() const;

    /**
     * @brief The effective polling interval (after the floor is applied)
     */
    int pollInterval() const { return m_intervalMs; }

    // ========== Queries ==========

    /**
     * @brief Snapshot of the devices seen by the last poll cycle
     */
    QList<Device> connectedDevices() const;

    /**
     * @brief Check once whether idevice_id can be run; the answer is cached
     */
    bool isToolAvailable();

    /**
     * @brief List the UDIDs of attached devices
     *
     * Returns an empty list when the tool is unavailable or exits
     * non-zero; neither is treated as an error.
     */
    QStringList listDevices();

    /**
     * @brief Read identification for one device
     * @return false if ideviceinfo could not be run or exited non-zero
     */
    bool deviceInfo(const QString &udid, Device &device, QString *errorMessage = nullptr);

    /**
     * @brief Read storage statistics and estimate the backup size
     * @return false on any failure; callers must tolerate the absence
     */
    bool deviceStorageInfo(const QString &udid, DeviceStorageInfo &info);

    // ========== Parsing ==========

    /**
     * @brief Parse "Key: Value" lines into a flat map
     *
     * Lines are split on the first colon only. Lines whose colon is
     * missing or at position 0 are ignored.
     */
    static QMap<QString, QString> parseKeyValueOutput(const QString &output);

    static Device parseDeviceInfo(const QString &udid, const QString &output);

    static DeviceStorageInfo parseStorageInfo(const QString &output, double backupSizeRatio);

    /**
     * @brief The static device reported in mock mode
     */
    static Device mockDevice();

public slots:
    /**
     * @brief Start polling
     *
     * Polls once immediately, then every intervalMs (at least
     * MIN_POLL_INTERVAL_MS). Restarts if already running.
     */
    void start(int intervalMs = MIN_POLL_INTERVAL_MS);

    /**
     * @brief Stop polling; safe to call when not running
     */
    void stop();

    /**
     * @brief Run one poll cycle
     * @return false if a cycle was already in progress and this one was skipped
     */
    bool pollDevices();

signals:
    void deviceConnected(const Device &device);
    void deviceDisconnected(const Device &device);
    void logMessage(const QString &message);

private:
    enum class ToolState {
        Unknown,
        Available,
        Unavailable
    };

    DeviceToolRunner *m_runner = nullptr;
    DeviceToolConfig m_config;
    QTimer *m_timer = nullptr;
    int m_intervalMs = MIN_POLL_INTERVAL_MS;
    bool m_mockMode = false;

    mutable QMutex m_mutex;
    QMap<QString, Device> m_devices;   // guarded by m_mutex
    ToolState m_toolState = ToolState::Unknown;   // guarded by m_mutex

    std::atomic<bool> m_polling{false};
};

#endif // DEVICEWATCHER_H
