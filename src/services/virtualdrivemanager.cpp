#include "virtualdrivemanager.h"

#include <QDir>
#include <QFileInfo>

#include "utils/logging.h"

namespace {

bool sameEndpoint(const ConnectionParams &a, const ConnectionParams &b)
{
    return a.protocol == b.protocol && a.host == b.host && a.effectivePort() == b.effectivePort()
           && a.user == b.user && a.password == b.password && a.rootPath == b.rootPath
           && a.secure == b.secure && a.timeoutSec == b.timeoutSec;
}

} // namespace

VirtualDriveManager::VirtualDriveManager(IConnectorFactory *factory, ConnectionRegistry *registry,
                                         QObject *parent)
    : QObject(parent)
    , factory_(factory)
    , registry_(registry)
{
    connect(registry_, &ConnectionRegistry::connectSlotFreed,
            this, &VirtualDriveManager::onConnectSlotFreed);
}

VirtualDriveManager::~VirtualDriveManager()
{
    if (registry_) {
        registry_->disconnect(this);
    }
    for (auto it = drives_.begin(); it != drives_.end(); ++it) {
        Drive &drive = it.value();
        if (drive.queue) {
            drive.queue->disconnect(this);
        }
        releaseConnection(drive);
    }
}

void VirtualDriveManager::setTransferSettings(const TransferSettings &settings)
{
    transferSettings_ = settings;
    for (const Drive &drive : std::as_const(drives_)) {
        if (drive.queue) {
            drive.queue->applySettings(transferSettings_);
        }
    }
}

QString VirtualDriveManager::validateDriveConfig(const DriveConfig &config)
{
    if (config.name.trimmed().isEmpty()) {
        return QStringLiteral("Drive name cannot be empty");
    }
    if (!config.localRoot.isEmpty() && !QDir::isAbsolutePath(config.localRoot)) {
        return QStringLiteral("Local root must be an absolute path: %1").arg(config.localRoot);
    }
    return validateConnectionParams(config.params);
}

// ---------------------------------------------------------------------------
// Drive lifecycle
// ---------------------------------------------------------------------------

QString VirtualDriveManager::mount(const DriveConfig &config, MountError *error)
{
    const QString invalid = validateDriveConfig(config);
    if (!invalid.isEmpty()) {
        qWarning() << "VirtualDriveManager: rejected drive" << config.name << "-" << invalid;
        if (error) {
            *error = MountError::InvalidConfig;
        }
        return QString();
    }

    QString id = driveIdForName(config.name);
    if (id.isEmpty()) {
        id = QStringLiteral("drive-%1").arg(nextDriveNumber_++);
        Drive fresh;
        fresh.info.id = id;
        fresh.info.name = config.name;
        drives_.insert(id, fresh);
        driveOrder_.append(id);
    }

    Drive &drive = drives_[id];
    if (drive.mounting || isOnline(drive)) {
        LOG_VERBOSE() << "VirtualDriveManager:" << config.name << "is already mounted or mounting";
        return id;
    }

    // A changed endpoint gets fresh sessions and a fresh queue
    if (drive.pool && !sameEndpoint(drive.pool->params(), config.params)) {
        destroyTransferMachinery(drive);
    }
    if (drive.control && drive.control->protocol() != config.params.protocol) {
        drive.control->disconnect(this);
        drive.control->deleteLater();
        drive.control = nullptr;
    }

    drive.info.params = config.params;
    drive.info.localRoot = config.localRoot;
    drive.info.autoSync = config.autoSync;
    drive.mounting = true;

    if (!drive.control) {
        ProtocolConnector *control = factory_->create(config.params.protocol, this);
        connect(control, &ProtocolConnector::connected, this, [this, id]() {
            onControlConnected(id);
        });
        connect(control, &ProtocolConnector::connectFailed, this,
                [this, id](ErrorKind kind, const QString &message) {
            onControlConnectFailed(id, kind, message);
        });
        connect(control, &ProtocolConnector::stateChanged, this,
                [this, id](ProtocolConnector::State state) {
            onControlStateChanged(id, state);
        });
        connect(control, &ProtocolConnector::entriesListed, this,
                [this, id](const QString &path, const QList<RemoteEntry> &entries) {
            onEntriesListed(id, path, entries);
        });
        connect(control, &ProtocolConnector::listFailed, this,
                [this, id](const QString &path, ErrorKind kind, const QString &message) {
            onListFailed(id, path, kind, message);
        });
        drive.control = control;
    }

    drive.connectionId = registry_->open(config.params.host, config.params.protocol);
    qInfo() << "VirtualDriveManager: mounting" << config.name << "as" << id << "via"
            << protocolToString(config.params.protocol) << config.params.host;

    beginControlConnect(drive);
    return id;
}

bool VirtualDriveManager::unmount(const QString &driveId)
{
    Drive *drive = findDrive(driveId);
    if (!drive) {
        return false;
    }

    const bool wasActive = drive->mounting || isOnline(*drive);
    const bool wasSyncing = drive->sync.running;
    drive->mounting = false;
    drive->sync = SyncJob();
    drive->pendingBrowse.clear();

    QPointer<TransferQueue> queue = drive->queue;
    QPointer<ConnectionPool> pool = drive->pool;
    releaseConnection(*drive);

    // Transfers are cancelled before the pool closes so its failed waiters
    // find nothing left to requeue
    if (queue) {
        queue->cancelAll();
    }
    if (pool) {
        pool->closeAll();
    }

    if (wasActive) {
        qInfo() << "VirtualDriveManager: unmounted" << driveId;
    }
    if (wasSyncing) {
        emit syncFailed(driveId, ErrorKind::Cancelled, tr("Drive unmounted"));
    }
    if (wasActive) {
        emitDriveEvent(DriveEvent::Type::Unmounted, driveId);
    }
    return true;
}

bool VirtualDriveManager::remove(const QString &driveId)
{
    if (!unmount(driveId)) {
        return false;
    }

    Drive *drive = findDrive(driveId);
    if (!drive) {
        return true;
    }
    destroyTransferMachinery(*drive);
    if (drive->control) {
        drive->control->disconnect(this);
        drive->control->deleteLater();
    }
    drives_.remove(driveId);
    driveOrder_.removeAll(driveId);
    qDebug() << "VirtualDriveManager: removed" << driveId;
    return true;
}

void VirtualDriveManager::createTransferMachinery(Drive &drive)
{
    drive.pool = new ConnectionPool(factory_, registry_, drive.info.params,
                                    transferSettings_.concurrentLimit, this);
    drive.queue = new TransferQueue(drive.pool, this);
    drive.queue->setDriveId(drive.info.id);
    drive.queue->applySettings(transferSettings_);
    connect(drive.queue, &TransferQueue::transferEvent, this, &VirtualDriveManager::transferEvent);
    connect(drive.queue, &TransferQueue::statusMessage, this, &VirtualDriveManager::statusMessage);

    drive.tracker = new ProgressTracker(this);
    drive.tracker->track(drive.queue);
}

void VirtualDriveManager::destroyTransferMachinery(Drive &drive)
{
    if (drive.queue) {
        drive.queue->disconnect(this);
        drive.queue->cancelAll();
        drive.queue->deleteLater();
    }
    if (drive.pool) {
        drive.pool->closeAll();
        drive.pool->deleteLater();
    }
    if (drive.tracker) {
        drive.tracker->deleteLater();
    }
    drive.queue = nullptr;
    drive.pool = nullptr;
    drive.tracker = nullptr;
}

void VirtualDriveManager::releaseConnection(Drive &drive)
{
    const quint64 connectionId = drive.connectionId;
    drive.connectionId = 0;
    if (drive.control) {
        drive.control->disconnectFromHost();
    }
    if (registry_ && connectionId != 0) {
        registry_->close(connectionId);
    }
}

// ---------------------------------------------------------------------------
// Control session
// ---------------------------------------------------------------------------

void VirtualDriveManager::beginControlConnect(Drive &drive)
{
    if (!drive.control || drive.connectionId == 0) {
        return;
    }
    if (registry_->tryBeginConnect(drive.connectionId)) {
        drive.control->connectToHost(drive.info.params);
    } else {
        LOG_VERBOSE() << "VirtualDriveManager:" << drive.info.id << "waits for a connect slot to"
                      << drive.info.params.host;
    }
}

void VirtualDriveManager::onConnectSlotFreed(const QString &host, Protocol protocol)
{
    for (const QString &id : std::as_const(driveOrder_)) {
        Drive *drive = findDrive(id);
        if (!drive || !drive->mounting || drive->connectionId == 0
            || drive->info.params.protocol != protocol
            || drive->info.params.host.compare(host, Qt::CaseInsensitive) != 0) {
            continue;
        }
        if (registry_->connection(drive->connectionId).status
            != ProtocolConnector::State::Disconnected) {
            continue;
        }
        if (registry_->tryBeginConnect(drive->connectionId)) {
            drive->control->connectToHost(drive->info.params);
            return;
        }
    }
}

void VirtualDriveManager::onControlConnected(const QString &driveId)
{
    Drive *drive = findDrive(driveId);
    if (!drive || !drive->mounting) {
        return;
    }

    drive->mounting = false;
    registry_->setStatus(drive->connectionId, ProtocolConnector::State::Connected);
    drive->info.connectionId = drive->connectionId;
    if (!drive->queue) {
        createTransferMachinery(*drive);
    }

    const bool autoSync = drive->info.autoSync && !drive->info.localRoot.isEmpty();
    qInfo() << "VirtualDriveManager:" << drive->info.name << "online";

    emitDriveEvent(DriveEvent::Type::Mounted, driveId);
    emit mounted(driveId);

    if (autoSync) {
        sync(driveId);
    }
}

void VirtualDriveManager::onControlConnectFailed(const QString &driveId, ErrorKind kind,
                                                 const QString &message)
{
    Drive *drive = findDrive(driveId);
    if (!drive || !drive->mounting) {
        return;
    }

    drive->mounting = false;
    drive->info.connectionId = 0;
    releaseConnection(*drive);

    const MountError error = mountErrorForKind(kind);
    qWarning() << "VirtualDriveManager: mount of" << drive->info.name << "failed:"
               << mountErrorToString(error) << message;

    emitDriveEvent(DriveEvent::Type::Error, driveId, 0, kind, message);
    emit mountFailed(driveId, error, message);
}

void VirtualDriveManager::onControlStateChanged(const QString &driveId, ProtocolConnector::State state)
{
    Drive *drive = findDrive(driveId);
    if (!drive || drive->connectionId == 0) {
        return;
    }

    const bool wasOnline = !drive->mounting && isOnline(*drive);
    registry_->setStatus(drive->connectionId, state);

    if (!wasOnline
        || (state != ProtocolConnector::State::Error && state != ProtocolConnector::State::Disconnected)) {
        return;
    }

    // Lost the control session without an unmount
    qWarning() << "VirtualDriveManager:" << drive->info.name << "lost its connection";
    const bool wasSyncing = drive->sync.running;
    drive->sync = SyncJob();
    const QHash<QString, QStringList> browsing = drive->pendingBrowse;
    drive->pendingBrowse.clear();
    drive->info.connectionId = 0;
    releaseConnection(*drive);

    const QString message = tr("Connection lost");
    for (auto it = browsing.cbegin(); it != browsing.cend(); ++it) {
        for (const QString &requested : it.value()) {
            emit listingFailed(driveId, requested, ErrorKind::Connection, message);
        }
    }
    if (wasSyncing) {
        emit syncFailed(driveId, ErrorKind::Connection, message);
    }
    emitDriveEvent(DriveEvent::Type::Disconnected, driveId, 0, ErrorKind::Connection, message);
}

// ---------------------------------------------------------------------------
// Browse and sync
// ---------------------------------------------------------------------------

QString VirtualDriveManager::absoluteRemotePath(const ConnectionParams &params, const QString &path)
{
    if (path.isEmpty() || path == QLatin1String("/")) {
        return params.rootPath;
    }
    return joinRemotePath(params.rootPath, path);
}

QString VirtualDriveManager::relativeRemotePath(const ConnectionParams &params, const QString &path)
{
    QString root = params.rootPath;
    if (!root.endsWith(QLatin1Char('/'))) {
        root += QLatin1Char('/');
    }
    return path.startsWith(root) ? path.mid(root.length()) : path;
}

bool VirtualDriveManager::browse(const QString &driveId, const QString &path)
{
    Drive *drive = findDrive(driveId);
    if (!drive || !isOnline(*drive)) {
        qWarning() << "VirtualDriveManager: cannot browse" << driveId << "while offline";
        return false;
    }

    const QString absolute = absoluteRemotePath(drive->info.params, path);
    const bool inFlight = drive->pendingBrowse.contains(absolute)
                          || drive->sync.pendingDirs.contains(absolute);
    drive->pendingBrowse[absolute].append(path);
    if (!inFlight) {
        drive->control->list(absolute);
    }
    return true;
}

bool VirtualDriveManager::sync(const QString &driveId)
{
    Drive *drive = findDrive(driveId);
    if (!drive) {
        return false;
    }
    if (!isOnline(*drive)) {
        qWarning() << "VirtualDriveManager: cannot sync" << drive->info.name << "while offline";
        return false;
    }
    if (drive->info.localRoot.isEmpty()) {
        qWarning() << "VirtualDriveManager:" << drive->info.name << "has no local root to sync";
        return false;
    }
    if (drive->sync.running) {
        qDebug() << "VirtualDriveManager: sync of" << drive->info.name << "already running";
        return false;
    }

    qInfo() << "VirtualDriveManager: syncing" << drive->info.name << "with" << drive->info.localRoot;
    drive->sync = SyncJob();
    drive->sync.running = true;
    listForSync(*drive, drive->info.params.rootPath);
    return true;
}

void VirtualDriveManager::listForSync(Drive &drive, const QString &absolutePath)
{
    const bool inFlight = drive.pendingBrowse.contains(absolutePath);
    drive.sync.pendingDirs.insert(absolutePath);
    if (!inFlight) {
        drive.control->list(absolutePath);
    }
}

void VirtualDriveManager::onEntriesListed(const QString &driveId, const QString &path,
                                          const QList<RemoteEntry> &entries)
{
    Drive *drive = findDrive(driveId);
    if (!drive) {
        return;
    }

    const QStringList browsePaths = drive->pendingBrowse.take(path);

    bool syncComplete = false;
    if (drive->sync.running && drive->sync.pendingDirs.remove(path)) {
        for (const RemoteEntry &entry : entries) {
            if (entry.name == QLatin1String(".") || entry.name == QLatin1String("..")) {
                continue;
            }
            const QString child = joinRemotePath(path, entry.name);
            if (entry.isDirectory) {
                drive->sync.stats.directoryCount++;
                listForSync(*drive, child);
                continue;
            }
            SyncEntry remote;
            remote.relativePath = relativeRemotePath(drive->info.params, child);
            remote.size = entry.size;
            remote.modified = entry.modified;
            drive->sync.remoteFiles.append(remote);
            drive->sync.stats.fileCount++;
            drive->sync.stats.totalBytes += entry.size;
        }
        syncComplete = drive->sync.pendingDirs.isEmpty();
        LOG_VERBOSE() << "VirtualDriveManager: sync listed" << path << "-"
                      << drive->sync.pendingDirs.size() << "directories left";
    }

    for (const QString &requested : browsePaths) {
        emit listingReady(driveId, requested, entries);
    }

    if (syncComplete) {
        drive = findDrive(driveId);
        if (drive && drive->sync.running) {
            finishSync(*drive);
        }
    }
}

void VirtualDriveManager::onListFailed(const QString &driveId, const QString &path, ErrorKind kind,
                                       const QString &message)
{
    Drive *drive = findDrive(driveId);
    if (!drive) {
        return;
    }

    const QStringList browsePaths = drive->pendingBrowse.take(path);
    const bool syncAborted = drive->sync.running && drive->sync.pendingDirs.contains(path);
    if (syncAborted) {
        qWarning() << "VirtualDriveManager: sync of" << drive->info.name << "failed listing" << path
                   << "-" << message;
        drive->sync = SyncJob();
    }

    for (const QString &requested : browsePaths) {
        emit listingFailed(driveId, requested, kind, message);
    }
    if (syncAborted) {
        emitDriveEvent(DriveEvent::Type::Error, driveId, 0, kind, message);
        emit syncFailed(driveId, kind, message);
    }
}

void VirtualDriveManager::finishSync(Drive &drive)
{
    const QList<SyncEntry> local = scanLocalTree(drive.info.localRoot);
    const QList<SyncAction> actions = planSync(local, drive.sync.remoteFiles, syncToleranceSec_);
    const QDir localRoot(drive.info.localRoot);

    int queued = 0;
    for (const SyncAction &action : actions) {
        TransferItem item;
        item.fileName = remoteFileName(action.relativePath);
        item.localPath = localRoot.filePath(action.relativePath);
        item.remotePath = joinRemotePath(drive.info.params.rootPath, action.relativePath);
        item.totalBytes = action.size;
        item.metadata.insert(QStringLiteral("sync"), true);

        if (action.kind == SyncAction::Kind::Download) {
            item.direction = TransferItem::Direction::Download;
            const QString parent = QFileInfo(item.localPath).absolutePath();
            if (!QDir().mkpath(parent)) {
                qWarning() << "VirtualDriveManager: cannot create" << parent;
            }
        } else {
            item.direction = TransferItem::Direction::Upload;
        }
        drive.queue->enqueue(item);
        queued++;
    }

    drive.info.stats = drive.sync.stats;
    drive.info.lastSync = QDateTime::currentDateTimeUtc();
    drive.sync = SyncJob();

    const QString driveId = drive.info.id;
    qInfo() << "VirtualDriveManager: sync of" << drive.info.name << "queued" << queued << "transfers";

    emitDriveEvent(DriveEvent::Type::Synced, driveId, queued);
    emit syncFinished(driveId, queued);
}

// ---------------------------------------------------------------------------
// Transfers
// ---------------------------------------------------------------------------

quint64 VirtualDriveManager::upload(const QString &driveId, const QString &localPath,
                                    const QString &remotePath, TransferItem::Priority priority)
{
    Drive *drive = findDrive(driveId);
    if (!drive || !isOnline(*drive)) {
        qWarning() << "VirtualDriveManager: cannot upload to" << driveId << "while offline";
        return 0;
    }

    const QFileInfo info(localPath);
    if (!info.isFile() || !info.isReadable()) {
        qWarning() << "VirtualDriveManager: cannot read" << localPath;
        emit statusMessage(tr("Cannot read %1").arg(localPath), 5000);
        return 0;
    }

    QString destination = absoluteRemotePath(drive->info.params, remotePath);
    if (remotePath.isEmpty() || remotePath.endsWith(QLatin1Char('/'))) {
        destination = joinRemotePath(destination, info.fileName());
    }

    TransferItem item;
    item.direction = TransferItem::Direction::Upload;
    item.fileName = info.fileName();
    item.localPath = info.absoluteFilePath();
    item.remotePath = destination;
    item.totalBytes = info.size();
    item.priority = priority;
    return drive->queue->enqueue(item);
}

quint64 VirtualDriveManager::download(const QString &driveId, const QString &remotePath,
                                      const QString &localPath, TransferItem::Priority priority)
{
    Drive *drive = findDrive(driveId);
    if (!drive || !isOnline(*drive)) {
        qWarning() << "VirtualDriveManager: cannot download from" << driveId << "while offline";
        return 0;
    }

    const QString parent = QFileInfo(localPath).absolutePath();
    if (!QDir().mkpath(parent)) {
        qWarning() << "VirtualDriveManager: cannot create" << parent;
        emit statusMessage(tr("Cannot create folder %1").arg(parent), 5000);
        return 0;
    }

    TransferItem item;
    item.direction = TransferItem::Direction::Download;
    item.remotePath = absoluteRemotePath(drive->info.params, remotePath);
    item.fileName = remoteFileName(item.remotePath);
    item.localPath = localPath;
    item.priority = priority;
    return drive->queue->enqueue(item);
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

VirtualDriveManager::Drive *VirtualDriveManager::findDrive(const QString &driveId)
{
    auto it = drives_.find(driveId);
    return it == drives_.end() ? nullptr : &it.value();
}

const VirtualDriveManager::Drive *VirtualDriveManager::findDrive(const QString &driveId) const
{
    auto it = drives_.constFind(driveId);
    return it == drives_.cend() ? nullptr : &it.value();
}

bool VirtualDriveManager::isOnline(const Drive &drive) const
{
    return registry_ && drive.connectionId != 0 && registry_->contains(drive.connectionId)
           && registry_->connection(drive.connectionId).status == ProtocolConnector::State::Connected;
}

bool VirtualDriveManager::isOnline(const QString &driveId) const
{
    const Drive *drive = findDrive(driveId);
    return drive && isOnline(*drive);
}

bool VirtualDriveManager::isSyncing(const QString &driveId) const
{
    const Drive *drive = findDrive(driveId);
    return drive && drive->sync.running;
}

VirtualDrive VirtualDriveManager::snapshot(const Drive &drive) const
{
    VirtualDrive info = drive.info;
    info.online = isOnline(drive);
    info.connectionId = info.online ? drive.connectionId : 0;
    return info;
}

std::optional<VirtualDrive> VirtualDriveManager::drive(const QString &driveId) const
{
    const Drive *found = findDrive(driveId);
    if (!found) {
        return std::nullopt;
    }
    return snapshot(*found);
}

QList<VirtualDrive> VirtualDriveManager::drives() const
{
    QList<VirtualDrive> result;
    for (const QString &id : driveOrder_) {
        if (const Drive *found = findDrive(id)) {
            result.append(snapshot(*found));
        }
    }
    return result;
}

QString VirtualDriveManager::driveIdForName(const QString &name) const
{
    for (const QString &id : driveOrder_) {
        const Drive *found = findDrive(id);
        if (found && found->info.name == name) {
            return id;
        }
    }
    return QString();
}

DriveStats VirtualDriveManager::stats(const QString &driveId) const
{
    const Drive *found = findDrive(driveId);
    return found ? found->info.stats : DriveStats();
}

TransferQueue *VirtualDriveManager::queue(const QString &driveId) const
{
    const Drive *found = findDrive(driveId);
    return found ? found->queue.data() : nullptr;
}

ProgressTracker *VirtualDriveManager::progressTracker(const QString &driveId) const
{
    const Drive *found = findDrive(driveId);
    return found ? found->tracker.data() : nullptr;
}

double VirtualDriveManager::aggregateSpeed() const
{
    double total = 0.0;
    for (const Drive &drive : drives_) {
        if (drive.tracker) {
            total += drive.tracker->aggregateSpeed();
        }
    }
    return total;
}

void VirtualDriveManager::emitDriveEvent(DriveEvent::Type type, const QString &driveId, int count,
                                         ErrorKind kind, const QString &message)
{
    DriveEvent event;
    event.type = type;
    event.driveId = driveId;
    event.count = count;
    event.errorKind = kind;
    event.message = message;
    LOG_VERBOSE() << "VirtualDriveManager: event" << driveEventTypeToString(type) << driveId;
    emit driveEvent(event);
}
