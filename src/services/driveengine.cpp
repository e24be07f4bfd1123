#include "driveengine.h"

#include <QDebug>

DriveEngine::DriveEngine(const EngineConfig &config, std::unique_ptr<IConnectorFactory> factory,
                         IHostProber *prober, QObject *parent)
    : QObject(parent)
    , config_(config)
    , factory_(factory ? std::move(factory) : std::make_unique<ConnectorFactory>())
{
    registry_ = new ConnectionRegistry(this);
    errors_ = new ErrorHandler(this);

    drives_ = new VirtualDriveManager(factory_.get(), registry_, this);
    drives_->setTransferSettings(config_.transfers);

    discovery_ = new NetworkDiscoveryService(prober ? prober : new TcpHostProber, this);
    discovery_->setProbeTimeoutMs(config_.discovery.probeTimeoutMs);
    discovery_->setParallelProbes(config_.discovery.parallelProbes);
    discovery_->setUnreachableAfterMisses(config_.discovery.unreachableAfterMisses);
    discovery_->setPruneAfterMs(qint64(config_.discovery.pruneAfterHours) * 3600 * 1000);

    // Route engine errors through the handler
    connect(drives_, &VirtualDriveManager::transferEvent,
            errors_, &ErrorHandler::handleTransferEvent);
    connect(drives_, &VirtualDriveManager::driveEvent,
            errors_, &ErrorHandler::handleDriveEvent);
    connect(drives_, &VirtualDriveManager::mountFailed, errors_,
            [this](const QString &driveId, MountError error, const QString &message) {
        const std::optional<VirtualDrive> drive = drives_->drive(driveId);
        errors_->handleMountFailed(drive ? drive->name : driveId, error, message);
    });
    connect(drives_, &VirtualDriveManager::listingFailed, errors_,
            [this](const QString &, const QString &path, ErrorKind, const QString &message) {
        errors_->handleOperationFailed(tr("Listing %1").arg(path), message);
    });
    connect(drives_, &VirtualDriveManager::statusMessage,
            errors_, &ErrorHandler::statusMessage);
    connect(discovery_, &NetworkDiscoveryService::scanFailed,
            errors_, &ErrorHandler::handleScanFailed);

    qDebug() << "DriveEngine: ready with" << config_.drives.size() << "configured drives";
}

DriveEngine::~DriveEngine()
{
    // Sessions go before the factory that created them
    delete drives_;
    drives_ = nullptr;
}

QString DriveEngine::mountConfigured(const QString &name, QString *error)
{
    const std::optional<DriveConfig> drive = config_.driveByName(name);
    if (!drive) {
        if (error) {
            *error = tr("No drive named %1 in the configuration").arg(name);
        }
        return QString();
    }

    MountError mountError = MountError::InvalidConfig;
    const QString id = drives_->mount(*drive, &mountError);
    if (id.isEmpty()) {
        const QString reason = VirtualDriveManager::validateDriveConfig(*drive);
        errors_->handleMountFailed(name, mountError, reason);
        if (error) {
            *error = reason;
        }
    }
    return id;
}

QStringList DriveEngine::mountAll()
{
    QStringList ids;
    for (const DriveConfig &drive : std::as_const(config_.drives)) {
        const QString id = mountConfigured(drive.name);
        if (!id.isEmpty()) {
            ids.append(id);
        }
    }
    return ids;
}

void DriveEngine::unmountAll()
{
    const QList<VirtualDrive> all = drives_->drives();
    for (const VirtualDrive &drive : all) {
        drives_->unmount(drive.id);
    }
}
