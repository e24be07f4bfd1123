#include <QtTest>
#include <QCryptographicHash>
#include <QTemporaryDir>
#include <QSignalSpy>

#include "mocks/mockconnector.h"
#include "models/transferqueue.h"
#include "services/connectionpool.h"
#include "services/connectionregistry.h"

class TestTransferQueue : public QObject
{
    Q_OBJECT

private:
    MockConnectorFactory *factory;
    ConnectionRegistry *registry;
    ConnectionPool *pool;
    TransferQueue *queue;
    QTemporaryDir tempDir;
    QList<TransferEvent> events;

    TransferItem makeDownload(const QString &remotePath,
                              TransferItem::Priority priority = TransferItem::Priority::Normal)
    {
        TransferItem item;
        item.direction = TransferItem::Direction::Download;
        item.remotePath = remotePath;
        item.localPath = tempDir.filePath(remoteFileName(remotePath));
        item.priority = priority;
        return item;
    }

    QList<quint64> eventIds(TransferEvent::Type type) const
    {
        QList<quint64> ids;
        for (const TransferEvent &event : events) {
            if (event.type == type) {
                ids.append(event.itemId);
            }
        }
        return ids;
    }

    int transferCallsFor(const QString &remotePath) const
    {
        int count = 0;
        for (const auto &call : factory->mockTransferCalls()) {
            if (call.remotePath == remotePath) {
                count++;
            }
        }
        return count;
    }

    TransferItem::Status statusOf(quint64 id) const
    {
        const auto item = queue->item(id);
        return item ? item->status : TransferItem::Status::Cancelled;
    }

private slots:
    void init()
    {
        QVERIFY(tempDir.isValid());
        events.clear();

        ConnectionParams params;
        params.protocol = Protocol::Ftp;
        params.host = "nas.local";

        factory = new MockConnectorFactory(this);
        registry = new ConnectionRegistry(this);
        pool = new ConnectionPool(factory, registry, params, 3, this);
        queue = new TransferQueue(pool, this);
        queue->setDriveId("drive-1");
        queue->setRetryDelays(0, 0);

        connect(queue, &TransferQueue::transferEvent, this, [this](const TransferEvent &event) {
            events.append(event);
        });
    }

    void cleanup()
    {
        delete queue;
        delete pool;
        delete registry;
        delete factory;
        queue = nullptr;
        pool = nullptr;
        registry = nullptr;
        factory = nullptr;
    }

    void testEnqueueIsDeferred()
    {
        const quint64 id = queue->enqueue(makeDownload("/a.txt"));

        QCOMPARE(id, quint64(1));
        QCOMPARE(statusOf(id), TransferItem::Status::Queued);
        QCOMPARE(queue->item(id)->driveId, QString("drive-1"));
        QCOMPARE(queue->item(id)->fileName, QString("a.txt"));
        QCOMPARE(queue->item(id)->maxRetries, TransferQueue::DefaultMaxRetries);
        QCOMPARE(eventIds(TransferEvent::Type::Queued), QList<quint64>{id});
        QVERIFY(eventIds(TransferEvent::Type::Started).isEmpty());
    }

    void testSingleDownloadCompletes()
    {
        factory->mockSetDownloadPayload("Hello World");
        const quint64 id = queue->enqueue(makeDownload("/docs/hello.txt"));

        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);

        const TransferItem item = *queue->item(id);
        QCOMPARE(item.progress, 1.0);
        QCOMPARE(item.processedBytes, qint64(11));
        QCOMPARE(item.totalBytes, qint64(11));

        QFile file(item.localPath);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), QByteArray("Hello World"));

        QCOMPARE(eventIds(TransferEvent::Type::Started), QList<quint64>{id});
        QCOMPARE(eventIds(TransferEvent::Type::Completed), QList<quint64>{id});
    }

    void testUploadTakesSizeFromLocalFile()
    {
        const QString localPath = tempDir.filePath("upload.bin");
        QFile file(localPath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(QByteArray(2048, 'x'));
        file.close();

        TransferItem item;
        item.direction = TransferItem::Direction::Upload;
        item.localPath = localPath;
        item.remotePath = "/incoming/upload.bin";
        const quint64 id = queue->enqueue(item);

        QCOMPARE(queue->item(id)->totalBytes, qint64(2048));
        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);

        const auto calls = factory->mockTransferCalls();
        QCOMPARE(calls.size(), 1);
        QVERIFY(calls.first().upload);
        QCOMPARE(calls.first().localPath, localPath);
        QCOMPARE(calls.first().remotePath, QString("/incoming/upload.bin"));
    }

    void testPriorityDispatchOrder()
    {
        queue->setConcurrentLimit(1);
        const quint64 low = queue->enqueue(makeDownload("/low.txt", TransferItem::Priority::Low));
        const quint64 high = queue->enqueue(makeDownload("/high.txt", TransferItem::Priority::High));
        const quint64 normal = queue->enqueue(makeDownload("/normal.txt", TransferItem::Priority::Normal));

        QTRY_VERIFY(queue->isIdle() && eventIds(TransferEvent::Type::Completed).size() == 3);

        const QList<quint64> expected{high, normal, low};
        QCOMPARE(eventIds(TransferEvent::Type::Started), expected);
    }

    void testEqualPriorityIsFifo()
    {
        queue->setConcurrentLimit(1);
        const quint64 first = queue->enqueue(makeDownload("/1.txt"));
        const quint64 second = queue->enqueue(makeDownload("/2.txt"));
        const quint64 third = queue->enqueue(makeDownload("/3.txt"));

        QTRY_COMPARE(eventIds(TransferEvent::Type::Completed).size(), 3);
        const QList<quint64> expected{first, second, third};
        QCOMPARE(eventIds(TransferEvent::Type::Started), expected);
    }

    void testConcurrencyLimit()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(2);
        QList<quint64> ids;
        for (int i = 0; i < 5; ++i) {
            ids.append(queue->enqueue(makeDownload(QString("/file%1.txt").arg(i))));
        }

        QTRY_COMPARE(factory->mockBusySessions(), 2);
        QCOMPARE(queue->activeCount(), 2);
        QCOMPARE(queue->pendingCount(), 3);

        factory->mockSessionRunning(ids[0])->mockFinishTransfer();
        QTRY_COMPARE(factory->mockTransferCalls().size(), 3);
        QCOMPARE(factory->mockBusySessions(), 2);
        QVERIFY(pool->sessionCount() <= 2);
        QVERIFY(queue->activeCount() <= 2);
    }

    void testConcurrentLimitClamped()
    {
        queue->setConcurrentLimit(0);
        QCOMPARE(queue->concurrentLimit(), TransferQueue::MinConcurrentLimit);
        queue->setConcurrentLimit(50);
        QCOMPARE(queue->concurrentLimit(), TransferQueue::MaxConcurrentLimit);
        QCOMPARE(pool->maxSessions(), TransferQueue::MaxConcurrentLimit);
    }

    void testProgressIsMonotonic()
    {
        factory->mockSetAutoComplete(false);
        TransferItem item = makeDownload("/big.iso");
        item.totalBytes = 100;
        const quint64 id = queue->enqueue(item);

        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);
        MockConnector *session = factory->mockSessionRunning(id);
        session->mockEmitProgress(50, 100);
        session->mockEmitProgress(30, 100);
        session->mockEmitProgress(80, 100);

        QList<qint64> reported;
        for (const TransferEvent &event : events) {
            if (event.type == TransferEvent::Type::Progressed) {
                reported.append(event.bytes);
            }
        }
        QCOMPARE(reported, (QList<qint64>{50, 80}));
        QCOMPARE(queue->item(id)->progress, 0.8);
        QCOMPARE(queue->item(id)->processedBytes, qint64(80));
    }

    void testTransientFailureRetriedUntilBudgetSpent()
    {
        TransferItem item = makeDownload("/flaky.bin");
        item.maxRetries = 2;
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::Connection);
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::Connection);
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::Connection);
        const quint64 id = queue->enqueue(item);

        QTRY_VERIFY(queue->item(id)->isTerminal());

        const TransferItem result = *queue->item(id);
        QCOMPARE(result.status, TransferItem::Status::Failed);
        QCOMPARE(result.retryCount, 2);
        QCOMPARE(result.errorKind, ErrorKind::Connection);
        QCOMPARE(transferCallsFor("/flaky.bin"), 3);

        QList<bool> willRetry;
        for (const TransferEvent &event : events) {
            if (event.type == TransferEvent::Type::Failed) {
                willRetry.append(event.willRetry);
            }
        }
        QCOMPARE(willRetry, (QList<bool>{true, true, false}));
    }

    void testTransientFailureRecoversOnRetry()
    {
        TransferItem item = makeDownload("/flaky.bin");
        item.maxRetries = 2;
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::Timeout);
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::None);
        const quint64 id = queue->enqueue(item);

        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);
        QCOMPARE(queue->item(id)->retryCount, 1);
        QCOMPARE(transferCallsFor("/flaky.bin"), 2);
    }

    void testNonTransientFailureNotRetried()
    {
        factory->mockQueueOutcome("/secret.txt", ErrorKind::Authentication);
        const quint64 id = queue->enqueue(makeDownload("/secret.txt"));

        QTRY_COMPARE(statusOf(id), TransferItem::Status::Failed);
        QVERIFY(queue->item(id)->isTerminal());
        QCOMPARE(queue->item(id)->retryCount, 0);
        QCOMPARE(queue->item(id)->errorKind, ErrorKind::Authentication);
        QCOMPARE(transferCallsFor("/secret.txt"), 1);
    }

    void testSessionConnectFailureFailsItem()
    {
        factory->mockSetConnectFailure(ErrorKind::Authentication, "530 Login incorrect");
        QSignalSpy statusSpy(queue, &TransferQueue::statusMessage);
        const quint64 id = queue->enqueue(makeDownload("/a.txt"));

        QTRY_COMPARE(statusOf(id), TransferItem::Status::Failed);
        QCOMPARE(queue->item(id)->errorKind, ErrorKind::Authentication);
        QCOMPARE(queue->item(id)->errorMessage, QString("530 Login incorrect"));
        QCOMPARE(queue->item(id)->retryCount, 0);
        QVERIFY(factory->mockTransferCalls().isEmpty());
        QCOMPARE(statusSpy.count(), 1);
    }

    void testChecksumMismatchIsTerminal()
    {
        TransferItem item = makeDownload("/image.bin");
        item.checksum = QString(64, QLatin1Char('0'));
        item.maxRetries = 3;
        const quint64 id = queue->enqueue(item);

        QTRY_COMPARE(statusOf(id), TransferItem::Status::Failed);
        QCOMPARE(queue->item(id)->errorKind, ErrorKind::Integrity);
        QCOMPARE(queue->item(id)->retryCount, 0);
        QVERIFY(queue->item(id)->isTerminal());
        QCOMPARE(transferCallsFor("/image.bin"), 1);
    }

    void testChecksumMatchCompletes()
    {
        const QByteArray payload("verified payload");
        factory->mockSetDownloadPayload(payload);

        TransferItem item = makeDownload("/image.bin");
        item.checksum = QString::fromLatin1(
            QCryptographicHash::hash(payload, QCryptographicHash::Sha256).toHex().toUpper());
        const quint64 id = queue->enqueue(item);

        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);
    }

    void testCancelQueuedItemNeverDispatched()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(1);
        const quint64 running = queue->enqueue(makeDownload("/running.txt"));
        const quint64 waiting = queue->enqueue(makeDownload("/waiting.txt"));

        QTRY_VERIFY(factory->mockSessionRunning(running) != nullptr);
        QVERIFY(queue->cancel(waiting));
        QCOMPARE(statusOf(waiting), TransferItem::Status::Cancelled);

        factory->mockSessionRunning(running)->mockFinishTransfer();
        QTRY_COMPARE(statusOf(running), TransferItem::Status::Completed);
        QTRY_VERIFY(queue->isIdle());

        QCOMPARE(transferCallsFor("/waiting.txt"), 0);
        QVERIFY(!queue->cancel(waiting));
    }

    void testCancelInProgressItem()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(1);
        const quint64 id = queue->enqueue(makeDownload("/movie.mkv"));

        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);
        MockConnector *session = factory->mockSessionRunning(id);

        QVERIFY(queue->cancel(id));
        QCOMPARE(statusOf(id), TransferItem::Status::Cancelled);
        QCOMPARE(queue->item(id)->errorKind, ErrorKind::Cancelled);
        QVERIFY(session->mockTokenCancelled());

        // The connector notices at its next checkpoint
        session->mockEmitProgress(10, 100);
        QVERIFY(!session->isBusy());
        QCOMPARE(statusOf(id), TransferItem::Status::Cancelled);
        QCOMPARE(eventIds(TransferEvent::Type::Cancelled), QList<quint64>{id});

        // The session went back to the pool and serves the next item
        const quint64 next = queue->enqueue(makeDownload("/next.txt"));
        QTRY_VERIFY(factory->mockSessionRunning(next) != nullptr);
        QCOMPARE(factory->mockSessionRunning(next), session);
    }

    void testCancelAll()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(1);
        const quint64 first = queue->enqueue(makeDownload("/1.txt"));
        const quint64 second = queue->enqueue(makeDownload("/2.txt"));
        QTRY_VERIFY(factory->mockSessionRunning(first) != nullptr);

        QSignalSpy completedSpy(queue, &TransferQueue::allOperationsCompleted);
        queue->cancelAll();

        QCOMPARE(statusOf(first), TransferItem::Status::Cancelled);
        QCOMPARE(statusOf(second), TransferItem::Status::Cancelled);
        QVERIFY(queue->isIdle());
        QTRY_COMPARE(completedSpy.count(), 1);
    }

    void testSessionTornDownMidTransferRetries()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(1);
        const quint64 id = queue->enqueue(makeDownload("/big.bin"));
        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);

        pool->closeAll();

        QCOMPARE(eventIds(TransferEvent::Type::Failed), QList<quint64>{id});
        QCOMPARE(events.last().errorKind, ErrorKind::Connection);
        QVERIFY(events.last().willRetry);

        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);
        QCOMPARE(queue->item(id)->retryCount, 1);
        QCOMPARE(factory->mockCreatedCount(), 2);
    }

    void testAbandonedSessionTornDown()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(1);
        const quint64 id = queue->enqueue(makeDownload("/big.bin"));
        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);

        QVERIFY(queue->cancel(id));
        pool->closeAll();

        QCOMPARE(statusOf(id), TransferItem::Status::Cancelled);
        QCOMPARE(eventIds(TransferEvent::Type::Cancelled), QList<quint64>{id});
        QVERIFY(eventIds(TransferEvent::Type::Failed).isEmpty());
        QVERIFY(queue->isIdle());
    }

    void testPauseAndResume()
    {
        factory->mockSetAutoComplete(false);
        const quint64 id = queue->enqueue(makeDownload("/resume.bin"));
        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);
        MockConnector *session = factory->mockSessionRunning(id);
        session->mockEmitProgress(40, 100);

        QVERIFY(queue->pause(id));
        QCOMPARE(statusOf(id), TransferItem::Status::Paused);
        QVERIFY(session->mockTokenCancelled());
        session->mockEmitProgress(50, 100);
        QCOMPARE(statusOf(id), TransferItem::Status::Paused);
        QVERIFY(!queue->pause(id));

        QVERIFY(queue->resume(id));
        QCOMPARE(statusOf(id), TransferItem::Status::Queued);
        QCOMPARE(queue->item(id)->processedBytes, qint64(0));

        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);
        factory->mockSessionRunning(id)->mockFinishTransfer();
        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);
        QCOMPARE(transferCallsFor("/resume.bin"), 2);
    }

    void testResumeBeforeAbandonedAttemptStops()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(1);
        const quint64 id = queue->enqueue(makeDownload("/early.bin"));
        QTRY_VERIFY(factory->mockSessionRunning(id) != nullptr);
        MockConnector *session = factory->mockSessionRunning(id);

        QVERIFY(queue->pause(id));
        QVERIFY(queue->resume(id));
        queue->flushEventQueue();

        // The old attempt still holds the session, so the item waits for it
        QCOMPARE(statusOf(id), TransferItem::Status::Queued);
        QCOMPARE(transferCallsFor("/early.bin"), 1);

        session->mockEmitProgress(1, 2);
        QTRY_COMPARE(transferCallsFor("/early.bin"), 2);
        QCOMPARE(statusOf(id), TransferItem::Status::InProgress);
        QCOMPARE(pool->sessionCount(), 1);

        factory->mockSessionRunning(id)->mockFinishTransfer();
        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);
        QVERIFY(!eventIds(TransferEvent::Type::Cancelled).contains(id));

        const quint64 next = queue->enqueue(makeDownload("/next.bin"));
        QTRY_VERIFY(factory->mockSessionRunning(next) != nullptr);
        factory->mockSessionRunning(next)->mockFinishTransfer();
        QTRY_COMPARE(statusOf(next), TransferItem::Status::Completed);
        QTRY_COMPARE(pool->idleCount(), 1);
    }

    void testPauseQueuedItem()
    {
        factory->mockSetAutoComplete(false);
        queue->setConcurrentLimit(1);
        const quint64 running = queue->enqueue(makeDownload("/running.txt"));
        const quint64 held = queue->enqueue(makeDownload("/held.txt"));
        QTRY_VERIFY(factory->mockSessionRunning(running) != nullptr);

        QVERIFY(queue->pause(held));
        factory->mockSessionRunning(running)->mockFinishTransfer();
        QTRY_COMPARE(statusOf(running), TransferItem::Status::Completed);

        QTest::qWait(20);
        QCOMPARE(statusOf(held), TransferItem::Status::Paused);
        QCOMPARE(transferCallsFor("/held.txt"), 0);
        QVERIFY(!queue->resume(running));
    }

    void testManualRetryKeepsRetryCount()
    {
        TransferItem item = makeDownload("/flaky.bin");
        item.maxRetries = 1;
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::Connection);
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::Connection);
        factory->mockQueueOutcome("/flaky.bin", ErrorKind::Connection);
        const quint64 id = queue->enqueue(item);

        QTRY_VERIFY(queue->item(id)->isTerminal());
        QCOMPARE(queue->item(id)->retryCount, 1);

        QVERIFY(queue->retry(id));
        QCOMPARE(statusOf(id), TransferItem::Status::Queued);
        QCOMPARE(queue->item(id)->retryCount, 1);

        QTRY_VERIFY(queue->item(id)->isTerminal());
        QCOMPARE(statusOf(id), TransferItem::Status::Failed);
        QCOMPARE(queue->item(id)->retryCount, 1);
        QCOMPARE(transferCallsFor("/flaky.bin"), 3);
    }

    void testRetryRejectsItemAwaitingAutomaticRetry()
    {
        queue->setRetryDelays(60000, 60000);
        TransferItem item = makeDownload("/later.bin");
        item.maxRetries = 2;
        factory->mockQueueOutcome("/later.bin", ErrorKind::Timeout);
        const quint64 id = queue->enqueue(item);

        QTRY_VERIFY(queue->item(id)->isAwaitingRetry());
        QVERIFY(!queue->retry(id));
        QCOMPARE(queue->item(id)->retryCount, 1);
        QVERIFY(queue->item(id)->isAwaitingRetry());
        QCOMPARE(transferCallsFor("/later.bin"), 1);

        QVERIFY(queue->cancel(id));
    }

    void testRetryRejectsNonFailedItem()
    {
        const quint64 id = queue->enqueue(makeDownload("/a.txt"));
        QVERIFY(!queue->retry(id));
        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);
        QVERIFY(!queue->retry(id));
        QVERIFY(!queue->retry(999));
    }

    void testRetryDelay()
    {
        QCOMPARE(TransferQueue::retryDelayMs(0, 2000, 60000), 0);
        QCOMPARE(TransferQueue::retryDelayMs(1, 2000, 60000), 2000);
        QCOMPARE(TransferQueue::retryDelayMs(2, 2000, 60000), 4000);
        QCOMPARE(TransferQueue::retryDelayMs(5, 2000, 60000), 32000);
        QCOMPARE(TransferQueue::retryDelayMs(6, 2000, 60000), 60000);
        QCOMPARE(TransferQueue::retryDelayMs(40, 2000, 60000), 60000);
    }

    void testRetryWaitsForBackoff()
    {
        queue->setRetryDelays(200, 1000);
        factory->mockQueueOutcome("/slow.bin", ErrorKind::Timeout);
        const quint64 id = queue->enqueue(makeDownload("/slow.bin"));

        QTRY_VERIFY(queue->item(id)->isAwaitingRetry());
        QVERIFY(!queue->isIdle());
        QCOMPARE(transferCallsFor("/slow.bin"), 1);

        QTest::qWait(50);
        QCOMPARE(transferCallsFor("/slow.bin"), 1);

        QTRY_COMPARE(statusOf(id), TransferItem::Status::Completed);
        QCOMPARE(transferCallsFor("/slow.bin"), 2);
    }

    void testHistoryEviction()
    {
        queue->setConcurrentLimit(1);
        queue->setMaxHistory(2);
        QList<quint64> ids;
        for (int i = 0; i < 4; ++i) {
            ids.append(queue->enqueue(makeDownload(QString("/h%1.txt").arg(i))));
        }

        QTRY_COMPARE(eventIds(TransferEvent::Type::Completed).size(), 4);
        QCOMPARE(queue->rowCount(), 2);
        QVERIFY(!queue->item(ids[0]));
        QVERIFY(!queue->item(ids[1]));
        QVERIFY(queue->item(ids[3]));
    }

    void testHistoryNeverEvictsLiveItems()
    {
        factory->mockSetAutoComplete(false);
        queue->setMaxHistory(1);
        queue->enqueue(makeDownload("/a.txt"));
        queue->enqueue(makeDownload("/b.txt"));
        queue->enqueue(makeDownload("/c.txt"));

        QCOMPARE(queue->rowCount(), 3);
    }

    void testRemoveAndRemoveCompleted()
    {
        const quint64 a = queue->enqueue(makeDownload("/a.txt"));
        const quint64 b = queue->enqueue(makeDownload("/b.txt"));
        QTRY_COMPARE(eventIds(TransferEvent::Type::Completed).size(), 2);

        QVERIFY(queue->remove(a));
        QVERIFY(!queue->item(a));
        QVERIFY(!queue->remove(a));

        queue->removeCompleted();
        QVERIFY(!queue->item(b));
        QCOMPARE(queue->rowCount(), 0);
    }

    void testAllOperationsCompletedSignal()
    {
        QSignalSpy spy(queue, &TransferQueue::allOperationsCompleted);
        queue->enqueue(makeDownload("/a.txt"));
        queue->enqueue(makeDownload("/b.txt"));

        QTRY_COMPARE(spy.count(), 1);
        QTest::qWait(20);
        QCOMPARE(spy.count(), 1);
    }

    void testModelData()
    {
        TransferItem item = makeDownload("/music/song.flac", TransferItem::Priority::High);
        queue->enqueue(item);

        const QModelIndex index = queue->index(0);
        QCOMPARE(queue->data(index, TransferQueue::FileNameRole).toString(), QString("song.flac"));
        QCOMPARE(queue->data(index, TransferQueue::RemotePathRole).toString(), QString("/music/song.flac"));
        QCOMPARE(queue->data(index, TransferQueue::PriorityRole).toInt(),
                 static_cast<int>(TransferItem::Priority::High));
        QCOMPARE(queue->data(index, TransferQueue::StatusRole).toInt(),
                 static_cast<int>(TransferItem::Status::Queued));
        QVERIFY(!queue->data(queue->index(5), TransferQueue::FileNameRole).isValid());
        QCOMPARE(queue->roleNames().value(TransferQueue::RetryCountRole), QByteArray("retryCount"));
    }

    void testApplySettings()
    {
        TransferSettings settings;
        settings.concurrentLimit = 5;
        settings.maxRetries = 7;
        settings.retryBaseDelayMs = 100;
        settings.retryMaxDelayMs = 50;
        settings.maxHistory = 20;
        queue->applySettings(settings);

        QCOMPARE(queue->concurrentLimit(), 5);
        QCOMPARE(queue->defaultMaxRetries(), 7);
        QCOMPARE(queue->retryBaseDelayMs(), 100);
        QCOMPARE(queue->retryMaxDelayMs(), 100);
        QCOMPARE(queue->maxHistory(), 20);
        QCOMPARE(pool->maxSessions(), 5);
    }
};

QTEST_MAIN(TestTransferQueue)
#include "test_transferqueue.moc"
