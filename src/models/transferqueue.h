/**
 * @file transferqueue.h
 * @brief Priority queue of file transfers with bounded concurrency and retries.
 */

#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QAbstractListModel>
#include <QHash>
#include <QList>
#include <QPointer>
#include <QQueue>
#include <QTimer>

#include <functional>
#include <optional>

#include "models/transferitem.h"
#include "services/cancellationtoken.h"
#include "services/connectionpool.h"  // Full include needed for QPointer

/**
 * @brief Tunables applied to every drive queue.
 */
struct TransferSettings {
    int concurrentLimit = 3;
    int maxRetries = 3;
    int retryBaseDelayMs = 2000;
    int retryMaxDelayMs = 60000;
    int maxHistory = 500;
};

/**
 * @brief Owns and dispatches the transfer items of one drive.
 *
 * Items are started in (priority desc, createdAt asc) order while fewer than
 * concurrentLimit() of them are in progress. Each running item borrows one
 * session from the drive's ConnectionPool for the duration of its transfer.
 *
 * Failures with a transient ErrorKind (Connection, Timeout) are retried
 * after an exponential backoff while retryCount < maxRetries; any other
 * failure is terminal. A checksum mismatch after a successful transfer fails
 * the item with ErrorKind::Integrity without consuming a retry.
 *
 * All mutation goes through the public operations. Observers read
 * snapshots (items(), item()), the list model interface, or the
 * transferEvent() signal.
 *
 * @par Example usage:
 * @code
 * TransferQueue queue(pool);
 * connect(&queue, &TransferQueue::transferEvent, this, &MyClass::onTransferEvent);
 *
 * TransferItem item;
 * item.direction = TransferItem::Direction::Download;
 * item.remotePath = "/photos/a.jpg";
 * item.localPath = "/home/me/a.jpg";
 * item.priority = TransferItem::Priority::High;
 * quint64 id = queue.enqueue(item);
 * @endcode
 */
class TransferQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        FileNameRole = Qt::UserRole + 1,
        LocalPathRole,
        RemotePathRole,
        DirectionRole,
        StatusRole,
        PriorityRole,
        ProgressRole,
        BytesTransferredRole,
        TotalBytesRole,
        ErrorMessageRole,
        RetryCountRole
    };

    static constexpr int DefaultConcurrentLimit = 3;
    static constexpr int MinConcurrentLimit = 1;
    static constexpr int MaxConcurrentLimit = 10;
    static constexpr int DefaultMaxRetries = 3;
    static constexpr int DefaultRetryBaseDelayMs = 2000;
    static constexpr int DefaultRetryMaxDelayMs = 60000;
    static constexpr int DefaultMaxHistory = 500;

    /**
     * @brief Constructs a queue bound to a drive's session pool.
     * @param pool Source of connector sessions; not owned.
     * @param parent Optional parent QObject.
     */
    explicit TransferQueue(ConnectionPool *pool, QObject *parent = nullptr);
    ~TransferQueue() override;

    /// @name Configuration
    /// @{
    /// @brief Sets the worker slot count, clamped to [1, 10].
    void setConcurrentLimit(int limit);
    [[nodiscard]] int concurrentLimit() const { return concurrentLimit_; }

    /// @brief maxRetries given to enqueued items that do not set their own.
    void setDefaultMaxRetries(int maxRetries) { defaultMaxRetries_ = qMax(0, maxRetries); }
    [[nodiscard]] int defaultMaxRetries() const { return defaultMaxRetries_; }

    void setRetryDelays(int baseMs, int maxMs);
    [[nodiscard]] int retryBaseDelayMs() const { return retryBaseDelayMs_; }
    [[nodiscard]] int retryMaxDelayMs() const { return retryMaxDelayMs_; }

    /// @brief Item count above which the oldest terminal items are evicted.
    void setMaxHistory(int maxHistory);
    [[nodiscard]] int maxHistory() const { return maxHistory_; }

    /// @brief Applies all tunables at once.
    void applySettings(const TransferSettings &settings);

    /// @brief Drive id stamped onto enqueued items and events.
    void setDriveId(const QString &driveId) { driveId_ = driveId; }
    [[nodiscard]] QString driveId() const { return driveId_; }
    /// @}

    /// @name Queue operations
    /// @{

    /**
     * @brief Adds an item and returns its id.
     *
     * The item starts in Queued state; dispatch happens on the next event
     * loop iteration, never inside this call. A negative maxRetries is
     * replaced by defaultMaxRetries().
     */
    quint64 enqueue(TransferItem item);

    /// @brief Cancels a non-terminal item. Returns false if there is nothing to cancel.
    bool cancel(quint64 id);

    /**
     * @brief Re-queues a terminally Failed item.
     *
     * Resets progress and error but keeps retryCount, so manual retries never
     * refresh the automatic retry budget. Items still awaiting an automatic
     * retry are refused.
     */
    bool retry(quint64 id);

    /// @brief Cancels the item if needed and forgets it.
    bool remove(quint64 id);

    /// @brief Stops a Queued or InProgress item without terminating it.
    bool pause(quint64 id);

    /// @brief Re-queues a Paused item; the transfer restarts from the beginning.
    bool resume(quint64 id);

    /// @brief Forgets all terminal items.
    void removeCompleted();

    /// @brief Cancels every non-terminal item.
    void cancelAll();
    /// @}

    /// @name Snapshots
    /// @{
    [[nodiscard]] QList<TransferItem> items() const { return items_; }
    [[nodiscard]] std::optional<TransferItem> item(quint64 id) const;
    [[nodiscard]] int countByStatus(TransferItem::Status status) const;
    [[nodiscard]] int activeCount() const { return countByStatus(TransferItem::Status::InProgress); }
    [[nodiscard]] int pendingCount() const { return countByStatus(TransferItem::Status::Queued); }

    /// @brief True when nothing is queued, running or awaiting a retry.
    [[nodiscard]] bool isIdle() const;
    /// @}

    /**
     * @brief Backoff before automatic retry number @p retryCount (1-based).
     * @return min(maxMs, baseMs * 2^(retryCount - 1))
     */
    [[nodiscard]] static int retryDelayMs(int retryCount, int baseMs, int maxMs);

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    // For testing: immediately process all pending events
    void flushEventQueue();

signals:
    void transferEvent(const TransferEvent &event);
    void allOperationsCompleted();
    void queueChanged();

    // Status messages (for user feedback)
    void statusMessage(const QString &message, int timeout);

private slots:
    void onSessionAcquired(quint64 ticket, ProtocolConnector *session);
    void onAcquireFailed(quint64 ticket, ErrorKind kind, const QString &message);
    void onRetryTimer();

private:
    /// Bookkeeping for an item that holds (or waits for) a session
    struct ActiveTransfer {
        quint64 ticket = 0;
        QPointer<ProtocolConnector> session;
        CancellationToken token;
        bool abandoned = false;  ///< Cancelled/paused; only the session release is pending
    };

    void processNext();
    void scheduleProcessNext();  // Defers processNext() to prevent re-entrancy
    void processEventQueue();    // Processes pending events

    void startItem(int index);
    void beginTransfer(quint64 id, ProtocolConnector *session);
    void onTransferProgress(quint64 id, qint64 bytes, qint64 total);
    void onTransferFinished(quint64 id);
    void onTransferFailed(quint64 id, ErrorKind kind, const QString &message);
    void onSessionStateChanged(quint64 id, ProtocolConnector::State state);

    void stopActive(quint64 id);
    void finishActive(quint64 id);
    void completeItem(int index);
    void failItem(int index, ErrorKind kind, const QString &message, bool retryable);
    void requeueItem(int index);
    void armRetryTimer();
    void evictHistory();
    void checkIdle();

    [[nodiscard]] QString verifyChecksum(const TransferItem &item, ErrorKind *kind) const;
    [[nodiscard]] int findItemIndex(quint64 id) const;
    [[nodiscard]] int nextQueuedIndex() const;
    void notifyRowChanged(int index);
    void emitEvent(TransferEvent::Type type, const TransferItem &item);

    QPointer<ConnectionPool> pool_;
    QList<TransferItem> items_;
    QHash<quint64, ActiveTransfer> active_;
    QHash<quint64, quint64> ticketToItem_;
    quint64 nextId_ = 1;

    QString driveId_;
    int concurrentLimit_ = DefaultConcurrentLimit;
    int defaultMaxRetries_ = DefaultMaxRetries;
    int retryBaseDelayMs_ = DefaultRetryBaseDelayMs;
    int retryMaxDelayMs_ = DefaultRetryMaxDelayMs;
    int maxHistory_ = DefaultMaxHistory;

    QTimer *retryTimer_ = nullptr;
    bool wasBusy_ = false;

    // Event queue for deferred processing
    QQueue<std::function<void()>> eventQueue_;
    bool eventProcessingScheduled_ = false;
    bool processingEvents_ = false;
};

#endif // TRANSFERQUEUE_H
