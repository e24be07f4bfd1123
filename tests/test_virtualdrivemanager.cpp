#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "mocks/mockconnector.h"
#include "services/virtualdrivemanager.h"

class TestVirtualDriveManager : public QObject
{
    Q_OBJECT

private:
    MockConnectorFactory *factory;
    ConnectionRegistry *registry;
    VirtualDriveManager *manager;
    QTemporaryDir tempDir;
    QList<DriveEvent> events;

    DriveConfig makeConfig(const QString &name, const QString &host = "nas.local")
    {
        DriveConfig config;
        config.name = name;
        config.params.protocol = Protocol::Ftp;
        config.params.host = host;
        config.params.user = "alice";
        config.params.password = "secret";
        return config;
    }

    static RemoteEntry fileEntry(const QString &name, qint64 size,
                                 const QDateTime &modified = QDateTime())
    {
        RemoteEntry entry;
        entry.name = name;
        entry.size = size;
        entry.modified = modified;
        return entry;
    }

    static RemoteEntry dirEntry(const QString &name)
    {
        RemoteEntry entry;
        entry.name = name;
        entry.isDirectory = true;
        return entry;
    }

    QString mountOnline(const DriveConfig &config)
    {
        QSignalSpy mountedSpy(manager, &VirtualDriveManager::mounted);
        const QString id = manager->mount(config);
        if (!mountedSpy.wait(1000)) {
            return QString();
        }
        return id;
    }

    QList<DriveEvent::Type> eventTypes() const
    {
        QList<DriveEvent::Type> types;
        for (const DriveEvent &event : events) {
            types.append(event.type);
        }
        return types;
    }

    static void writeFile(const QString &path, const QByteArray &content,
                          const QDateTime &modified = QDateTime())
    {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QCOMPARE(file.write(content), qint64(content.size()));
        file.flush();
        if (modified.isValid()) {
            QVERIFY(file.setFileTime(modified, QFileDevice::FileModificationTime));
        }
    }

private slots:
    void init()
    {
        QVERIFY(tempDir.isValid());
        events.clear();
        factory = new MockConnectorFactory(this);
        registry = new ConnectionRegistry(this);
        manager = new VirtualDriveManager(factory, registry, this);

        TransferSettings settings;
        settings.retryBaseDelayMs = 0;
        settings.retryMaxDelayMs = 0;
        manager->setTransferSettings(settings);

        connect(manager, &VirtualDriveManager::driveEvent, this, [this](const DriveEvent &event) {
            events.append(event);
        });
    }

    void cleanup()
    {
        delete manager;
        delete registry;
        delete factory;
        manager = nullptr;
        registry = nullptr;
        factory = nullptr;
    }

    void testMountSucceeds()
    {
        QSignalSpy mountedSpy(manager, &VirtualDriveManager::mounted);
        const QString id = manager->mount(makeConfig("photos"));

        QCOMPARE(id, QString("drive-1"));
        QVERIFY(!manager->isOnline(id));
        QVERIFY(mountedSpy.wait(1000));
        QCOMPARE(mountedSpy.first().at(0).toString(), id);

        QVERIFY(manager->isOnline(id));
        const auto drive = manager->drive(id);
        QVERIFY(drive);
        QVERIFY(drive->online);
        QCOMPARE(drive->name, QString("photos"));
        QCOMPARE(drive->protocol(), Protocol::Ftp);
        QVERIFY(drive->connectionId != 0);
        QCOMPARE(registry->connection(drive->connectionId).status, ProtocolConnector::State::Connected);

        QVERIFY(manager->queue(id));
        QVERIFY(manager->progressTracker(id));
        QCOMPARE(eventTypes(), QList<DriveEvent::Type>{DriveEvent::Type::Mounted});
        QCOMPARE(factory->mockConnectors().first()->mockParams().user, QString("alice"));
    }

    void testInvalidConfigRejectedSynchronously()
    {
        DriveConfig config = makeConfig("broken", QString());
        MountError error = MountError::ProtocolError;
        QSignalSpy failedSpy(manager, &VirtualDriveManager::mountFailed);

        QVERIFY(manager->mount(config, &error).isEmpty());
        QCOMPARE(error, MountError::InvalidConfig);
        QCOMPARE(factory->mockCreatedCount(), 0);
        QVERIFY(manager->drives().isEmpty());
        QCOMPARE(failedSpy.count(), 0);

        config = makeConfig("relative");
        config.localRoot = "relative/dir";
        QVERIFY(!VirtualDriveManager::validateDriveConfig(config).isEmpty());
        config = makeConfig(" ");
        QVERIFY(!VirtualDriveManager::validateDriveConfig(config).isEmpty());
    }

    void testWrongCredentialsLeaveDriveOffline()
    {
        factory->mockSetConnectFailure(ErrorKind::Authentication, "530 Login incorrect");
        QSignalSpy failedSpy(manager, &VirtualDriveManager::mountFailed);
        QSignalSpy mountedSpy(manager, &VirtualDriveManager::mounted);

        const QString id = manager->mount(makeConfig("photos"));
        QVERIFY(!id.isEmpty());
        QVERIFY(failedSpy.wait(1000));

        QCOMPARE(failedSpy.first().at(0).toString(), id);
        QCOMPARE(failedSpy.first().at(1).value<MountError>(), MountError::AuthenticationFailed);
        QCOMPARE(failedSpy.first().at(2).toString(), QString("530 Login incorrect"));
        QVERIFY(!manager->isOnline(id));
        QVERIFY(!manager->drive(id)->online);
        QCOMPARE(manager->drive(id)->connectionId, quint64(0));
        QVERIFY(registry->connections().isEmpty());

        QCOMPARE(eventTypes(), QList<DriveEvent::Type>{DriveEvent::Type::Error});
        QCOMPARE(events.first().errorKind, ErrorKind::Authentication);

        // Never retried on its own
        QTest::qWait(100);
        QCOMPARE(factory->mockConnectCount(), 1);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(mountedSpy.count(), 0);
    }

    void testMountErrorMapping()
    {
        QCOMPARE(mountErrorForKind(ErrorKind::Authentication), MountError::AuthenticationFailed);
        QCOMPARE(mountErrorForKind(ErrorKind::Connection), MountError::HostUnreachable);
        QCOMPARE(mountErrorForKind(ErrorKind::Timeout), MountError::Timeout);
        QCOMPARE(mountErrorForKind(ErrorKind::UnsupportedProtocol), MountError::UnsupportedProtocol);
        QCOMPARE(mountErrorForKind(ErrorKind::Protocol), MountError::ProtocolError);
    }

    void testRemountAfterFailureReusesDrive()
    {
        factory->mockSetConnectFailure(ErrorKind::Connection, "No route to host");
        QSignalSpy failedSpy(manager, &VirtualDriveManager::mountFailed);
        const QString id = manager->mount(makeConfig("photos"));
        QVERIFY(failedSpy.wait(1000));
        QCOMPARE(failedSpy.first().at(1).value<MountError>(), MountError::HostUnreachable);

        factory->mockSetConnectFailure(ErrorKind::None);
        QCOMPARE(mountOnline(makeConfig("photos")), id);
        QVERIFY(manager->isOnline(id));
        QCOMPARE(manager->drives().size(), 1);
    }

    void testMountWhileOnlineIsNoOp()
    {
        const QString id = mountOnline(makeConfig("photos"));
        QVERIFY(!id.isEmpty());
        const int connects = factory->mockConnectCount();

        QCOMPARE(manager->mount(makeConfig("photos")), id);
        QTest::qWait(20);
        QCOMPARE(factory->mockConnectCount(), connects);
        QCOMPARE(manager->driveIdForName("photos"), id);
    }

    void testOnlineFollowsControlConnection()
    {
        const QString id = mountOnline(makeConfig("photos"));
        QVERIFY(manager->isOnline(id));

        QSignalSpy syncFailedSpy(manager, &VirtualDriveManager::syncFailed);
        MockConnector *control = factory->mockConnectors().first();
        control->mockDropConnection();

        QVERIFY(!manager->isOnline(id));
        QVERIFY(!manager->drive(id)->online);
        QCOMPARE(eventTypes().last(), DriveEvent::Type::Disconnected);
        QCOMPARE(events.last().errorKind, ErrorKind::Connection);
        QCOMPARE(syncFailedSpy.count(), 0);
        QVERIFY(!manager->browse(id, "/"));
    }

    void testUnmountIsIdempotent()
    {
        const QString id = mountOnline(makeConfig("photos"));
        QVERIFY(manager->unmount(id));
        QVERIFY(!manager->isOnline(id));
        QCOMPARE(eventTypes(),
                 (QList<DriveEvent::Type>{DriveEvent::Type::Mounted, DriveEvent::Type::Unmounted}));

        QVERIFY(manager->unmount(id));
        QCOMPARE(events.size(), 2);
        QVERIFY(manager->contains(id));
        QVERIFY(!manager->unmount("drive-99"));
    }

    void testUnmountCancelsTransfers()
    {
        factory->mockSetAutoComplete(false);
        const QString id = mountOnline(makeConfig("photos"));
        const quint64 itemId = manager->download(id, "movie.mkv", tempDir.filePath("movie.mkv"));
        QVERIFY(itemId != 0);
        QTRY_VERIFY(factory->mockSessionRunning(itemId) != nullptr);

        QVERIFY(manager->unmount(id));
        QCOMPARE(manager->queue(id)->item(itemId)->status, TransferItem::Status::Cancelled);
        QTRY_COMPARE(factory->mockBusySessions(), 0);
        QTRY_VERIFY(registry->connections().isEmpty());
    }

    void testRemoveForgetsDrive()
    {
        const QString id = mountOnline(makeConfig("photos"));
        QVERIFY(manager->remove(id));
        QVERIFY(!manager->contains(id));
        QVERIFY(manager->drives().isEmpty());
        QVERIFY(!manager->queue(id));
        QVERIFY(!manager->remove(id));

        // The name is free again and gets a new id
        QCOMPARE(mountOnline(makeConfig("photos")), QString("drive-2"));
    }

    void testOperationsRequireOnlineDrive()
    {
        factory->mockSetHoldConnects(true);
        DriveConfig config = makeConfig("photos");
        config.localRoot = tempDir.path();
        const QString id = manager->mount(config);

        QVERIFY(!manager->browse(id, QString()));
        QVERIFY(!manager->sync(id));
        QCOMPARE(manager->download(id, "a.txt", tempDir.filePath("a.txt")), quint64(0));
        QVERIFY(!manager->browse("drive-42", QString()));
    }

    void testBrowseRelativeToRoot()
    {
        DriveConfig config = makeConfig("media");
        config.params.rootPath = "/volume1/media";
        factory->mockSetListing("/volume1/media", {dirEntry("music"), fileEntry("readme.txt", 10)});
        factory->mockSetListing("/volume1/media/music", {fileEntry("song.flac", 1000)});
        const QString id = mountOnline(config);

        QSignalSpy readySpy(manager, &VirtualDriveManager::listingReady);
        QVERIFY(manager->browse(id, QString()));
        QVERIFY(manager->browse(id, "music"));
        QTRY_COMPARE(readySpy.count(), 2);

        QCOMPARE(readySpy.at(0).at(1).toString(), QString());
        QCOMPARE(readySpy.at(0).at(2).value<QList<RemoteEntry>>().size(), 2);
        QCOMPARE(readySpy.at(1).at(1).toString(), QString("music"));
        const auto entries = readySpy.at(1).at(2).value<QList<RemoteEntry>>();
        QCOMPARE(entries.first().name, QString("song.flac"));
        QCOMPARE(factory->mockListRequests(),
                 (QStringList{"/volume1/media", "/volume1/media/music"}));
    }

    void testBrowseSharesInFlightListing()
    {
        factory->mockSetListing("/", {fileEntry("a.txt", 1)});
        const QString id = mountOnline(makeConfig("photos"));

        QSignalSpy readySpy(manager, &VirtualDriveManager::listingReady);
        QVERIFY(manager->browse(id, QString()));
        QVERIFY(manager->browse(id, "/"));
        QTRY_COMPARE(readySpy.count(), 2);
        QCOMPARE(factory->mockListRequests().size(), 1);
    }

    void testBrowseFailureReported()
    {
        factory->mockSetListFailure("/private", ErrorKind::Protocol);
        const QString id = mountOnline(makeConfig("photos"));

        QSignalSpy failedSpy(manager, &VirtualDriveManager::listingFailed);
        QVERIFY(manager->browse(id, "private"));
        QVERIFY(failedSpy.wait(1000));
        QCOMPARE(failedSpy.first().at(1).toString(), QString("private"));
        QCOMPARE(failedSpy.first().at(2).value<ErrorKind>(), ErrorKind::Protocol);
        QVERIFY(manager->isOnline(id));
    }

    void testSyncQueuesMissingFilesBothWays()
    {
        const QDateTime stamp(QDate(2024, 5, 1), QTime(10, 0), Qt::UTC);
        factory->mockSetListing("/", {dirEntry("photos"), fileEntry("same.txt", 12, stamp)});
        factory->mockSetListing("/photos", {fileEntry("beach.jpg", 100, stamp)});

        const QString root = tempDir.filePath("mirror");
        writeFile(root + "/same.txt", "mock payload", stamp);
        writeFile(root + "/notes.txt", "local only");

        DriveConfig config = makeConfig("photos");
        config.localRoot = root;
        const QString id = mountOnline(config);

        QSignalSpy finishedSpy(manager, &VirtualDriveManager::syncFinished);
        QVERIFY(manager->sync(id));
        QVERIFY(manager->isSyncing(id));
        QVERIFY(!manager->sync(id));

        QVERIFY(finishedSpy.wait(1000));
        QCOMPARE(finishedSpy.first().at(1).toInt(), 2);
        QVERIFY(!manager->isSyncing(id));

        const DriveStats stats = manager->stats(id);
        QCOMPARE(stats.fileCount, 2);
        QCOMPARE(stats.directoryCount, 1);
        QCOMPARE(stats.totalBytes, qint64(112));
        QVERIFY(manager->drive(id)->lastSync.isValid());
        QCOMPARE(eventTypes().last(), DriveEvent::Type::Synced);
        QCOMPARE(events.last().count, 2);

        TransferQueue *queue = manager->queue(id);
        QTRY_VERIFY(queue->isIdle() && queue->countByStatus(TransferItem::Status::Completed) == 2);

        bool sawUpload = false;
        bool sawDownload = false;
        for (const auto &call : factory->mockTransferCalls()) {
            if (call.upload) {
                sawUpload = true;
                QCOMPARE(call.remotePath, QString("/notes.txt"));
            } else {
                sawDownload = true;
                QCOMPARE(call.remotePath, QString("/photos/beach.jpg"));
                QCOMPARE(call.localPath, root + "/photos/beach.jpg");
            }
        }
        QVERIFY(sawUpload && sawDownload);
        QVERIFY(QFileInfo::exists(root + "/photos/beach.jpg"));
        QVERIFY(queue->items().first().metadata.value("sync").toBool());
    }

    void testSyncNeverDeletes()
    {
        factory->mockSetListing("/", {});
        const QString root = tempDir.filePath("keep");
        writeFile(root + "/only-here.txt", "data");

        DriveConfig config = makeConfig("photos");
        config.localRoot = root;
        const QString id = mountOnline(config);

        QSignalSpy finishedSpy(manager, &VirtualDriveManager::syncFinished);
        QVERIFY(manager->sync(id));
        QVERIFY(finishedSpy.wait(1000));
        QCOMPARE(finishedSpy.first().at(1).toInt(), 1);
        QTRY_VERIFY(manager->queue(id)->isIdle());
        QVERIFY(QFileInfo::exists(root + "/only-here.txt"));
    }

    void testSyncRequiresLocalRoot()
    {
        const QString id = mountOnline(makeConfig("photos"));
        QVERIFY(!manager->sync(id));
        QVERIFY(!manager->isSyncing(id));
    }

    void testSyncFailsWhenListingFails()
    {
        factory->mockSetListing("/", {dirEntry("locked")});
        factory->mockSetListFailure("/locked", ErrorKind::Protocol);
        DriveConfig config = makeConfig("photos");
        config.localRoot = tempDir.path();
        const QString id = mountOnline(config);

        QSignalSpy failedSpy(manager, &VirtualDriveManager::syncFailed);
        QSignalSpy finishedSpy(manager, &VirtualDriveManager::syncFinished);
        QVERIFY(manager->sync(id));
        QVERIFY(failedSpy.wait(1000));
        QCOMPARE(failedSpy.first().at(1).value<ErrorKind>(), ErrorKind::Protocol);
        QCOMPARE(finishedSpy.count(), 0);
        QVERIFY(!manager->isSyncing(id));
        QCOMPARE(eventTypes().last(), DriveEvent::Type::Error);
    }

    void testUnmountDuringSyncReportsCancelled()
    {
        factory->mockSetListing("/", {fileEntry("a.txt", 1)});
        DriveConfig config = makeConfig("photos");
        config.localRoot = tempDir.path();
        const QString id = mountOnline(config);

        QSignalSpy failedSpy(manager, &VirtualDriveManager::syncFailed);
        QVERIFY(manager->sync(id));
        QVERIFY(manager->unmount(id));
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.first().at(1).value<ErrorKind>(), ErrorKind::Cancelled);
        QVERIFY(!manager->isSyncing(id));
    }

    void testAutoSyncAfterMount()
    {
        factory->mockSetListing("/", {fileEntry("a.txt", 12)});
        DriveConfig config = makeConfig("photos");
        config.localRoot = tempDir.filePath("auto");
        config.autoSync = true;

        QSignalSpy finishedSpy(manager, &VirtualDriveManager::syncFinished);
        manager->mount(config);
        QVERIFY(finishedSpy.wait(1000));
        QCOMPARE(finishedSpy.first().at(1).toInt(), 1);
    }

    void testUploadAppendsFileNameToDirectory()
    {
        const QString localPath = tempDir.filePath("report.pdf");
        writeFile(localPath, "pdf");
        DriveConfig config = makeConfig("docs");
        config.params.rootPath = "/share";
        const QString id = mountOnline(config);

        const quint64 first = manager->upload(id, localPath, "incoming/");
        const quint64 second = manager->upload(id, localPath, "archive/renamed.pdf");
        QVERIFY(first != 0 && second != 0);
        QCOMPARE(manager->queue(id)->item(first)->remotePath, QString("/share/incoming/report.pdf"));
        QCOMPARE(manager->queue(id)->item(second)->remotePath, QString("/share/archive/renamed.pdf"));
        QCOMPARE(manager->queue(id)->item(first)->totalBytes, qint64(3));

        QCOMPARE(manager->upload(id, tempDir.filePath("missing.bin"), QString()), quint64(0));
    }

    void testDownloadCreatesParentFolder()
    {
        const QString id = mountOnline(makeConfig("photos"));
        const QString localPath = tempDir.filePath("deep/nested/pic.jpg");

        const quint64 itemId = manager->download(id, "/pics/pic.jpg", localPath,
                                                 TransferItem::Priority::High);
        QVERIFY(itemId != 0);
        QVERIFY(QFileInfo(tempDir.filePath("deep/nested")).isDir());
        QCOMPARE(manager->queue(id)->item(itemId)->priority, TransferItem::Priority::High);
        QCOMPARE(manager->queue(id)->item(itemId)->driveId, id);
        QTRY_COMPARE(manager->queue(id)->item(itemId)->status, TransferItem::Status::Completed);
    }

    void testTransferEventsForwarded()
    {
        const QString id = mountOnline(makeConfig("photos"));
        QList<TransferEvent> transfers;
        connect(manager, &VirtualDriveManager::transferEvent, this,
                [&transfers](const TransferEvent &event) { transfers.append(event); });

        manager->download(id, "a.txt", tempDir.filePath("a.txt"));
        QTRY_VERIFY(!transfers.isEmpty() && transfers.last().type == TransferEvent::Type::Completed);
        QCOMPARE(transfers.first().type, TransferEvent::Type::Queued);
        QCOMPARE(transfers.first().driveId, id);
    }

    void testQueuesAreIsolatedPerDrive()
    {
        factory->mockSetAutoComplete(false);
        const QString first = mountOnline(makeConfig("one", "host-a"));
        const QString second = mountOnline(makeConfig("two", "host-b"));

        const quint64 a = manager->download(first, "a.txt", tempDir.filePath("a.txt"));
        const quint64 b = manager->download(second, "b.txt", tempDir.filePath("b.txt"));
        QCOMPARE(a, quint64(1));
        QCOMPARE(b, quint64(1));
        QVERIFY(manager->queue(first) != manager->queue(second));

        QTRY_COMPARE(factory->mockBusySessions(), 2);
        manager->unmount(first);
        QCOMPARE(manager->queue(first)->item(a)->status, TransferItem::Status::Cancelled);
        QCOMPARE(manager->queue(second)->item(b)->status, TransferItem::Status::InProgress);
    }

    void testOneConnectPerHostAndProtocol()
    {
        factory->mockSetHoldConnects(true);
        QSignalSpy mountedSpy(manager, &VirtualDriveManager::mounted);
        const QString first = manager->mount(makeConfig("one"));
        const QString second = manager->mount(makeConfig("two"));
        const QString other = manager->mount(makeConfig("three", "other.local"));

        QCOMPARE(factory->mockConnectCount(), 2);
        QCOMPARE(registry->connectingCount("nas.local", Protocol::Ftp), 1);
        QCOMPARE(registry->connectingCount("other.local", Protocol::Ftp), 1);

        factory->mockSetHoldConnects(false);
        factory->mockReleaseConnects();
        QTRY_COMPARE(mountedSpy.count(), 3);
        QVERIFY(manager->isOnline(first));
        QVERIFY(manager->isOnline(second));
        QVERIFY(manager->isOnline(other));
        QCOMPARE(factory->mockMaxConcurrentConnects(), 2);
    }

    void testSettingsAppliedToQueues()
    {
        const QString id = mountOnline(makeConfig("photos"));
        TransferSettings settings;
        settings.concurrentLimit = 6;
        settings.maxRetries = 9;
        manager->setTransferSettings(settings);

        QCOMPARE(manager->queue(id)->concurrentLimit(), 6);
        QCOMPARE(manager->queue(id)->defaultMaxRetries(), 9);
        QCOMPARE(manager->transferSettings().maxRetries, 9);
    }
};

QTEST_MAIN(TestVirtualDriveManager)
#include "test_virtualdrivemanager.moc"
