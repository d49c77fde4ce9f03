#ifndef DEVICETYPES_H
#define DEVICETYPES_H

#include <QString>
#include <QMetaType>

/**
 * @file devicetypes.h
 * @brief Value types describing attached devices
 */

/**
 * @brief An attached device as reported by ideviceinfo
 *
 * Created when a poll cycle first sees the UDID. Never persisted.
 */
struct Device
{
    QString udid;           ///< Unique device identifier
    QString name;           ///< DeviceName, e.g. "Jane's iPhone"
    QString productType;    ///< ProductType, e.g. "iPhone14,2"
    QString productVersion; ///< ProductVersion (OS version)
    QString serialNumber;
    bool isConnected = false;
};

/**
 * @brief Storage statistics for a device, computed on demand
 */
struct DeviceStorageInfo
{
    qint64 totalCapacity = 0;
    qint64 availableSpace = 0;
    qint64 usedSpace = 0;
    qint64 estimatedBackupSize = 0;   ///< round(usedSpace * backupSizeRatio)
};

/**
 * @brief External tool configuration for device detection
 */
struct DeviceToolConfig
{
    QString ideviceIdCommand = QStringLiteral("idevice_id");
    QString ideviceInfoCommand = QStringLiteral("ideviceinfo");

    /// Backups are estimated at this multiple of used space. The ratio is
    /// hand-tuned; exactness is not guaranteed.
    double backupSizeRatio = 1.5;
};

Q_DECLARE_METATYPE(Device)
Q_DECLARE_METATYPE(DeviceStorageInfo)

#endif // DEVICETYPES_H
