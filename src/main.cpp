#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTextStream>
#include <QThread>
#include <QDebug>

#include "qphonesync_version.h"
#include "settings.h"
#include "device/devicetoolrunner.h"
#include "device/devicewatcher.h"
#include "backup/contactstore.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString formatBytes(qint64 bytes)
{
    return QString("%1 GB").arg(static_cast<double>(bytes) / (1024.0 * 1024 * 1024), 0, 'f', 1);
}

void printDevice(const Device &device)
{
    out() << device.udid << "\n"
          << "  Name:    " << device.name << "\n"
          << "  Model:   " << device.productType << "\n"
          << "  Version: " << device.productVersion << "\n"
          << "  Serial:  " << device.serialNumber << "\n";
}

void printContact(const Contact &contact)
{
    out() << "[" << contact.id << "] " << contact.displayName << "\n";
    for (const ContactPhone &phone : contact.phoneNumbers) {
        out() << "    phone (" << phone.label << "): " << phone.number
              << "  ->  " << phone.normalizedNumber << "\n";
    }
    for (const ContactEmail &email : contact.emails) {
        out() << "    email (" << email.label << "): " << email.email << "\n";
    }
}

// ========== Commands ==========

int listDevices(DeviceWatcher &watcher)
{
    if (!watcher.isMockMode() && !watcher.isToolAvailable()) {
        err() << "idevice_id is not available. Install libimobiledevice.\n";
        return 1;
    }

    const QStringList udids = watcher.listDevices();
    if (udids.isEmpty()) {
        out() << "No devices connected\n";
        return 0;
    }

    int failures = 0;
    for (const QString &udid : udids) {
        Device device;
        QString error;
        if (watcher.deviceInfo(udid, device, &error)) {
            printDevice(device);
        } else {
            err() << udid << ": " << error << "\n";
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

int showStorage(DeviceWatcher &watcher, const QString &udid)
{
    DeviceStorageInfo info;
    if (!watcher.deviceStorageInfo(udid, info)) {
        err() << "Could not read storage information for " << udid << "\n";
        return 1;
    }

    out() << "Total capacity:        " << formatBytes(info.totalCapacity) << "\n"
          << "Available:             " << formatBytes(info.availableSpace) << "\n"
          << "Used:                  " << formatBytes(info.usedSpace) << "\n"
          << "Estimated backup size: " << formatBytes(info.estimatedBackupSize) << "\n";
    return 0;
}

int showContacts(const QString &backupPath, const QString &handle)
{
    ContactStore store;
    if (!store.open(backupPath)) {
        err() << store.errorString() << "\n";
        return 1;
    }

    if (!handle.isEmpty()) {
        const ContactLookupResult result = store.lookupByHandle(handle);
        if (!result.found) {
            out() << "No contact found for " << handle << "\n";
            return 1;
        }
        out() << "Matched on " << result.matchedOnName() << ":\n";
        printContact(result.contact);
        return 0;
    }

    for (const Contact &contact : store.allContacts()) {
        printContact(contact);
    }

    const ContactStoreStats stats = store.stats();
    out() << stats.contactCount << " contacts, "
          << stats.phoneIndexSize << " phone keys, "
          << stats.emailIndexSize << " email keys\n";
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("QPhoneSync");
    app.setApplicationVersion(QPHONESYNC_VERSION);
    app.setOrganizationName("QPhoneSync");

    QCommandLineParser parser;
    parser.setApplicationDescription("Detect attached phones and read their backups");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command",
                                 "devices | storage <udid> | watch | contacts <backup-dir>");

    QCommandLineOption configOption("config", "Read settings from an INI <file>.", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Show debug output.");
    QCommandLineOption intervalOption("interval", "Polling interval for watch, in <ms>.", "ms");
    QCommandLineOption lookupOption("lookup", "Look up a phone number or email <handle>.", "handle");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addOption(intervalOption);
    parser.addOption(lookupOption);
    parser.process(app);

    QScopedPointer<Settings> settings(parser.isSet(configOption)
                                          ? new Settings(parser.value(configOption))
                                          : new Settings());

    if (!parser.isSet(verboseOption) && !settings->debugLogging()) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const QString command = args.first();

    if (command == "contacts") {
        if (args.size() < 2) {
            err() << "Usage: qphonesync contacts <backup-dir> [--lookup <handle>]\n";
            return 1;
        }
        return showContacts(args.at(1), parser.value(lookupOption));
    }

    ProcessToolRunner runner;
    DeviceWatcher watcher(&runner, settings->deviceToolConfig());

    if (command == "devices") {
        return listDevices(watcher);
    }

    if (command == "storage") {
        if (args.size() < 2) {
            err() << "Usage: qphonesync storage <udid>\n";
            return 1;
        }
        return showStorage(watcher, args.at(1));
    }

    if (command == "watch") {
        int interval = settings->pollIntervalMs();
        if (parser.isSet(intervalOption)) {
            bool ok = false;
            interval = parser.value(intervalOption).toInt(&ok);
            if (!ok) {
                err() << "Invalid interval: " << parser.value(intervalOption) << "\n";
                return 1;
            }
        }

        qRegisterMetaType<Device>();

        // Tool invocations block, so polling runs on its own thread
        QThread pollThread;
        watcher.moveToThread(&pollThread);

        QObject::connect(&watcher, &DeviceWatcher::deviceConnected, &app, [](const Device &device) {
            out() << "Connected: " << device.name << " (" << device.udid << ")\n";
            out().flush();
        });
        QObject::connect(&watcher, &DeviceWatcher::deviceDisconnected, &app, [](const Device &device) {
            out() << "Disconnected: " << device.name << " (" << device.udid << ")\n";
            out().flush();
        });
        QObject::connect(&watcher, &DeviceWatcher::logMessage, &app, [](const QString &message) {
            qInfo().noquote() << message;
        });
        QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&watcher, &pollThread]() {
            QMetaObject::invokeMethod(&watcher, "stop", Qt::BlockingQueuedConnection);
            pollThread.quit();
            pollThread.wait();
        });

        pollThread.start();
        QMetaObject::invokeMethod(&watcher, "start", Qt::QueuedConnection, Q_ARG(int, interval));

        out() << "Watching for devices every " << qMax(interval, static_cast<int>(DeviceWatcher::MIN_POLL_INTERVAL_MS))
              << " ms (Ctrl+C to stop)\n";
        out().flush();

        return app.exec();
    }

    err() << "Unknown command: " << command << "\n";
    parser.showHelp(1);
}
