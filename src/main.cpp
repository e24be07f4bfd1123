#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>

#include "services/driveengine.h"
#include "utils/logging.h"
#include "version.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QString transferLine(const TransferEvent &event)
{
    switch (event.type) {
    case TransferEvent::Type::Queued:
        return QStringLiteral("queued    #%1").arg(event.itemId);
    case TransferEvent::Type::Started:
        return QStringLiteral("started   #%1").arg(event.itemId);
    case TransferEvent::Type::Progressed:
        return QStringLiteral("progress  #%1 %2%").arg(event.itemId).arg(int(event.progress * 100));
    case TransferEvent::Type::Completed:
        return QStringLiteral("completed #%1").arg(event.itemId);
    case TransferEvent::Type::Failed:
        return QStringLiteral("failed    #%1 %2 %3%4")
            .arg(event.itemId)
            .arg(QString::fromLatin1(errorKindToString(event.errorKind)), event.message,
                 event.willRetry ? QStringLiteral(" (will retry)") : QString());
    case TransferEvent::Type::Cancelled:
        return QStringLiteral("cancelled #%1").arg(event.itemId);
    }
    return QString();
}

void printDevice(const NetworkDevice &device)
{
    QStringList services;
    for (const NetworkService &service : device.services) {
        services << QStringLiteral("%1/%2").arg(service.name).arg(service.port);
    }
    QStringList protocols;
    for (Protocol protocol : device.supportedProtocols()) {
        protocols << protocolToString(protocol);
    }
    out() << device.ipAddress << "  " << device.name << "  [" << deviceTypeToString(device.type)
          << "]  " << services.join(QLatin1Char(' '));
    if (!protocols.isEmpty()) {
        out() << "  -> " << protocols.join(QLatin1Char(','));
    }
    out() << Qt::endl;
}

int runScan(DriveEngine &engine, QCoreApplication &app)
{
    NetworkDiscoveryService *discovery = engine.discovery();
    QObject::connect(discovery, &NetworkDiscoveryService::scanStarted, &app, [](int candidates) {
        out() << "Probing " << candidates << " hosts..." << Qt::endl;
    });
    QObject::connect(discovery, &NetworkDiscoveryService::deviceDiscovered, &app, &printDevice);
    QObject::connect(discovery, &NetworkDiscoveryService::scanFinished, &app, [&app](int found) {
        out() << found << " devices found" << Qt::endl;
        app.exit(0);
    });
    QObject::connect(discovery, &NetworkDiscoveryService::scanFailed, &app, [&app](const QString &message) {
        out() << "Scan failed: " << message << Qt::endl;
        app.exit(1);
    });

    discovery->scan();
    return app.exec();
}

int runMount(DriveEngine &engine, QCoreApplication &app, const QString &name, bool doSync)
{
    VirtualDriveManager *drives = engine.drives();
    bool failed = false;
    bool finished = false;

    auto finish = [&](int code) {
        if (finished) {
            return;
        }
        finished = true;
        engine.unmountAll();
        app.exit(code);
    };

    QObject::connect(drives, &VirtualDriveManager::transferEvent, &app,
                     [&failed](const TransferEvent &event) {
        if (event.type == TransferEvent::Type::Progressed && !netdrive::verboseLogging) {
            return;
        }
        if (event.type == TransferEvent::Type::Failed && !event.willRetry) {
            failed = true;
        }
        out() << transferLine(event) << Qt::endl;
    });

    QObject::connect(drives, &VirtualDriveManager::mountFailed, &app,
                     [&](const QString &, MountError error, const QString &message) {
        out() << "Mount failed: " << mountErrorToString(error) << " " << message << Qt::endl;
        app.exit(1);
    });

    QObject::connect(drives, &VirtualDriveManager::mounted, &app, [&, doSync](const QString &id) {
        out() << "Mounted " << name << " as " << id << Qt::endl;
        if (!doSync) {
            drives->browse(id, QString());
            return;
        }
        if (!drives->isSyncing(id) && !drives->sync(id)) {
            out() << "Cannot sync " << name << Qt::endl;
            finish(1);
        }
    });

    QObject::connect(drives, &VirtualDriveManager::listingReady, &app,
                     [&](const QString &, const QString &, const QList<RemoteEntry> &entries) {
        for (const RemoteEntry &entry : entries) {
            out() << (entry.isDirectory ? "d " : "- ") << qSetFieldWidth(12) << entry.size
                  << qSetFieldWidth(0) << "  " << entry.name << Qt::endl;
        }
        finish(0);
    });
    QObject::connect(drives, &VirtualDriveManager::listingFailed, &app,
                     [&](const QString &, const QString &, ErrorKind, const QString &message) {
        out() << "Listing failed: " << message << Qt::endl;
        finish(1);
    });

    QObject::connect(drives, &VirtualDriveManager::syncFinished, &app,
                     [&](const QString &id, int queued) {
        const DriveStats stats = drives->stats(id);
        out() << "Remote: " << stats.fileCount << " files, " << stats.totalBytes << " bytes; "
              << queued << " transfers queued" << Qt::endl;
        TransferQueue *queue = drives->queue(id);
        if (queued == 0 || !queue || queue->isIdle()) {
            finish(0);
            return;
        }
        QObject::connect(queue, &TransferQueue::allOperationsCompleted, &app, [&]() {
            finish(failed ? 1 : 0);
        });
    });
    QObject::connect(drives, &VirtualDriveManager::syncFailed, &app,
                     [&](const QString &, ErrorKind kind, const QString &message) {
        out() << "Sync failed: " << errorKindToString(kind) << " " << message << Qt::endl;
        finish(1);
    });

    QString error;
    if (engine.mountConfigured(name, &error).isEmpty()) {
        out() << "Cannot mount " << name << ": " << error << Qt::endl;
        return 1;
    }
    return app.exec();
}

int listDrives(const EngineConfig &config)
{
    if (config.drives.isEmpty()) {
        out() << "No drives configured" << Qt::endl;
        return 0;
    }
    for (const DriveConfig &drive : config.drives) {
        out() << drive.name << "  " << protocolToString(drive.params.protocol) << "://"
              << drive.params.host << ':' << drive.params.effectivePort() << drive.params.rootPath;
        if (!drive.localRoot.isEmpty()) {
            out() << "  <-> " << drive.localRoot;
        }
        if (drive.autoSync) {
            out() << "  (auto sync)";
        }
        out() << Qt::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("netdrive");
    app.setApplicationVersion(NETDRIVE_VERSION);
    app.setOrganizationName("netdrive");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Network drive and file transfer engine");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    const QString defaultConfig = QDir(QStandardPaths::writableLocation(
        QStandardPaths::AppConfigLocation)).filePath("netdrive.ini");
    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Configuration file (default: " + defaultConfig + ")", "file", defaultConfig);
    parser.addOption(configOption);

    QCommandLineOption scanOption("scan", "Scan the local network for storage devices");
    QCommandLineOption mountOption("mount", "Mount the configured drive <name>", "name");
    QCommandLineOption syncOption("sync", "With --mount: sync the drive and wait for its transfers");
    QCommandLineOption listOption("list-drives", "List the configured drives");
    parser.addOption(scanOption);
    parser.addOption(mountOption);
    parser.addOption(syncOption);
    parser.addOption(listOption);

    parser.process(app);

    // Set verbose logging flag
    netdrive::verboseLogging = parser.isSet(verboseOption);

    if (netdrive::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    const int modes = int(parser.isSet(scanOption)) + int(parser.isSet(mountOption))
                      + int(parser.isSet(listOption));
    if (modes != 1) {
        out() << "Specify exactly one of --scan, --mount or --list-drives" << Qt::endl;
        parser.showHelp(1);
    }

    const QString configPath = parser.value(configOption);
    EngineConfig config;
    if (QFileInfo::exists(configPath) || parser.isSet(configOption)) {
        QString error;
        const std::optional<EngineConfig> loaded = EngineConfig::loadFile(configPath, &error);
        if (!loaded) {
            out() << error << Qt::endl;
            return 1;
        }
        config = *loaded;
    } else if (!parser.isSet(scanOption)) {
        out() << "No configuration file at " << configPath << Qt::endl;
        return 1;
    }

    if (parser.isSet(listOption)) {
        return listDrives(config);
    }

    DriveEngine engine(config);
    if (parser.isSet(scanOption)) {
        return runScan(engine, app);
    }
    return runMount(engine, app, parser.value(mountOption), parser.isSet(syncOption));
}
