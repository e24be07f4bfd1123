/**
 * @file virtualdrivemanager.h
 * @brief Mounting, browsing and syncing of virtual drives.
 */

#ifndef VIRTUALDRIVEMANAGER_H
#define VIRTUALDRIVEMANAGER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QSet>

#include <optional>

#include "connectionpool.h"
#include "connectionregistry.h"
#include "connectorfactory.h"
#include "models/transferitem.h"
#include "models/transferqueue.h"  // Full include needed for QPointer
#include "progresstracker.h"
#include "syncplanner.h"
#include "virtualdrive.h"

/**
 * @brief Owns every drive binding and the machinery behind it.
 *
 * Each drive has a control session (connect, browse and sync listings), a
 * ConnectionPool of transfer sessions and its own TransferQueue. All
 * sessions of all drives share one ConnectionRegistry, so at most one
 * connect per (host, protocol) is in flight at a time.
 *
 * A drive is online exactly while its control session's ActiveConnection
 * is Connected. A failed mount leaves the drive offline and is never
 * retried; the caller decides whether to mount again.
 *
 * @par Example usage:
 * @code
 * VirtualDriveManager manager(&factory, &registry);
 * connect(&manager, &VirtualDriveManager::mounted, this, [&](const QString &id) {
 *     manager.sync(id);
 * });
 * QString id = manager.mount(config);
 * @endcode
 */
class VirtualDriveManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs the manager.
     * @param factory Creates connector sessions; must outlive the manager.
     * @param registry Shared ActiveConnection bookkeeping; must outlive the manager.
     * @param parent Optional parent QObject.
     */
    VirtualDriveManager(IConnectorFactory *factory, ConnectionRegistry *registry,
                        QObject *parent = nullptr);
    ~VirtualDriveManager() override;

    /// @brief Queue settings applied to every drive queue, present and future.
    void setTransferSettings(const TransferSettings &settings);
    [[nodiscard]] TransferSettings transferSettings() const { return transferSettings_; }

    /// @brief Tolerance used when comparing modification times during sync.
    void setSyncToleranceSec(int seconds) { syncToleranceSec_ = qMax(0, seconds); }

    /// @name Drive lifecycle
    /// @{

    /**
     * @brief Starts mounting a drive.
     *
     * The configuration is validated first; an invalid one is rejected
     * synchronously: the return value is empty and @p error is set to
     * MountError::InvalidConfig. Otherwise the drive id is returned and the
     * outcome arrives later through mounted() or mountFailed().
     *
     * Mounting a name that is already bound reuses its drive. If that drive
     * is online or connecting, nothing happens.
     */
    QString mount(const DriveConfig &config, MountError *error = nullptr);

    /**
     * @brief Takes a drive offline.
     *
     * Cancels the drive's unfinished transfers, closes its transfer sessions
     * and disconnects the control session. Idempotent.
     * @return False if the drive is unknown.
     */
    bool unmount(const QString &driveId);

    /// @brief Unmounts and forgets a drive, including its transfer history.
    bool remove(const QString &driveId);
    /// @}

    /// @name Drive operations
    /// @{

    /**
     * @brief Compares the remote tree with the local root and queues the transfers.
     *
     * The remote side is listed recursively through the control session.
     * Result through syncFinished() or syncFailed().
     * @return False if the drive is unknown, offline, has no local root or is
     *         already syncing.
     */
    bool sync(const QString &driveId);

    /**
     * @brief Lists a directory of a drive.
     * @param path Path relative to the drive's remote root ("" or "/" for the root).
     * @return False if the drive is unknown or offline.
     */
    bool browse(const QString &driveId, const QString &path);

    /**
     * @brief Queues an upload.
     * @param remotePath Destination, relative to the drive's remote root.
     * @return Item id, or 0 if the drive is offline or the file is unreadable.
     */
    quint64 upload(const QString &driveId, const QString &localPath, const QString &remotePath,
                   TransferItem::Priority priority = TransferItem::Priority::Normal);

    /**
     * @brief Queues a download.
     * @param remotePath Source, relative to the drive's remote root.
     * @return Item id, or 0 if the drive is offline.
     */
    quint64 download(const QString &driveId, const QString &remotePath, const QString &localPath,
                     TransferItem::Priority priority = TransferItem::Priority::Normal);
    /// @}

    /// @name State
    /// @{
    [[nodiscard]] bool isOnline(const QString &driveId) const;
    [[nodiscard]] bool isSyncing(const QString &driveId) const;
    [[nodiscard]] bool contains(const QString &driveId) const { return drives_.contains(driveId); }
    [[nodiscard]] std::optional<VirtualDrive> drive(const QString &driveId) const;
    [[nodiscard]] QList<VirtualDrive> drives() const;
    [[nodiscard]] QString driveIdForName(const QString &name) const;
    [[nodiscard]] DriveStats stats(const QString &driveId) const;

    /// @brief The drive's queue, or nullptr if the drive is unknown.
    [[nodiscard]] TransferQueue *queue(const QString &driveId) const;

    /// @brief Speed and ETA of the drive's transfers, or nullptr if the drive is unknown.
    [[nodiscard]] ProgressTracker *progressTracker(const QString &driveId) const;

    /// @brief Sum of the transfer speeds of all drives, in bytes per second.
    [[nodiscard]] double aggregateSpeed() const;
    /// @}

    /// @brief Validates a drive configuration; empty string when valid.
    [[nodiscard]] static QString validateDriveConfig(const DriveConfig &config);

signals:
    void driveEvent(const DriveEvent &event);

    void mounted(const QString &driveId);
    void mountFailed(const QString &driveId, MountError error, const QString &message);

    void listingReady(const QString &driveId, const QString &path, const QList<RemoteEntry> &entries);
    void listingFailed(const QString &driveId, const QString &path, ErrorKind kind,
                       const QString &message);

    void syncFinished(const QString &driveId, int transfersQueued);
    void syncFailed(const QString &driveId, ErrorKind kind, const QString &message);

    /// @brief Forwarded from every drive queue.
    void transferEvent(const TransferEvent &event);

    void statusMessage(const QString &message, int timeout);

private:
    struct SyncJob {
        bool running = false;
        QSet<QString> pendingDirs;  ///< Absolute remote paths still to list
        QList<SyncEntry> remoteFiles;
        DriveStats stats;
    };

    struct Drive {
        VirtualDrive info;
        QPointer<ProtocolConnector> control;
        quint64 connectionId = 0;
        bool mounting = false;
        QPointer<ConnectionPool> pool;
        QPointer<TransferQueue> queue;
        QPointer<ProgressTracker> tracker;
        QHash<QString, QStringList> pendingBrowse;  ///< Absolute path -> requested paths
        SyncJob sync;
    };

    void createTransferMachinery(Drive &drive);
    void destroyTransferMachinery(Drive &drive);
    void beginControlConnect(Drive &drive);
    void onConnectSlotFreed(const QString &host, Protocol protocol);
    void onControlConnected(const QString &driveId);
    void onControlConnectFailed(const QString &driveId, ErrorKind kind, const QString &message);
    void onControlStateChanged(const QString &driveId, ProtocolConnector::State state);
    void onEntriesListed(const QString &driveId, const QString &path,
                         const QList<RemoteEntry> &entries);
    void onListFailed(const QString &driveId, const QString &path, ErrorKind kind,
                      const QString &message);

    void listForSync(Drive &drive, const QString &absolutePath);
    void finishSync(Drive &drive);
    void releaseConnection(Drive &drive);
    void emitDriveEvent(DriveEvent::Type type, const QString &driveId, int count = 0,
                        ErrorKind kind = ErrorKind::None, const QString &message = QString());

    [[nodiscard]] Drive *findDrive(const QString &driveId);
    [[nodiscard]] const Drive *findDrive(const QString &driveId) const;
    [[nodiscard]] bool isOnline(const Drive &drive) const;
    [[nodiscard]] VirtualDrive snapshot(const Drive &drive) const;
    [[nodiscard]] static QString absoluteRemotePath(const ConnectionParams &params, const QString &path);
    [[nodiscard]] static QString relativeRemotePath(const ConnectionParams &params, const QString &path);

    IConnectorFactory *factory_;
    QPointer<ConnectionRegistry> registry_;

    QHash<QString, Drive> drives_;
    QStringList driveOrder_;
    quint64 nextDriveNumber_ = 1;

    TransferSettings transferSettings_;
    int syncToleranceSec_ = 2;
};

#endif // VIRTUALDRIVEMANAGER_H
