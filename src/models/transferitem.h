/**
 * @file transferitem.h
 * @brief The unit of work moved by a TransferQueue, and the events it emits.
 */

#ifndef TRANSFERITEM_H
#define TRANSFERITEM_H

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVariantMap>

#include "services/transfererror.h"

/**
 * @brief One file transfer, queued, running or finished.
 *
 * Items are owned by their TransferQueue. Everything outside the queue sees
 * copies (snapshots); fields change only through queue operations and the
 * running connector's progress reports.
 */
struct TransferItem {
    enum class Direction { Upload, Download };

    enum class Priority { Low, Normal, High, Critical };

    enum class Status {
        Queued,      ///< Waiting for a worker slot (or a retry after backoff)
        InProgress,  ///< Running on a connector session
        Paused,      ///< Stopped by the user, resumable
        Completed,   ///< Transferred (and verified if a checksum was given)
        Failed,      ///< Failed; may be awaiting an automatic retry
        Cancelled    ///< Stopped by the user, terminal
    };

    quint64 id = 0;
    QString driveId;
    QString fileName;
    QString localPath;
    QString remotePath;
    Direction direction = Direction::Download;
    qint64 totalBytes = 0;      ///< 0 when unknown
    qint64 processedBytes = 0;
    Priority priority = Priority::Normal;
    Status status = Status::Queued;
    double progress = 0.0;      ///< Fraction in [0, 1]
    QString errorMessage;
    ErrorKind errorKind = ErrorKind::None;
    int retryCount = 0;         ///< Automatic retries scheduled so far
    int maxRetries = -1;        ///< -1 takes the queue default
    QDateTime createdAt;
    QDateTime lastAttempt;
    QDateTime nextRetryAt;      ///< Set while a failed item waits for its retry
    QString checksum;           ///< Expected SHA-256 (hex) of the local file, optional
    QVariantMap metadata;

    /// @brief True for Completed, Cancelled and Failed items with no retry pending.
    [[nodiscard]] bool isTerminal() const
    {
        return status == Status::Completed || status == Status::Cancelled
               || (status == Status::Failed && !isAwaitingRetry());
    }

    /// @brief True for a Failed item that the queue will re-run after its backoff.
    [[nodiscard]] bool isAwaitingRetry() const
    {
        return status == Status::Failed && nextRetryAt.isValid();
    }
};

Q_DECLARE_METATYPE(TransferItem)

/// @brief Convert TransferItem::Status to string for logs
[[nodiscard]] inline const char *transferStatusToString(TransferItem::Status status)
{
    switch (status) {
    case TransferItem::Status::Queued: return "Queued";
    case TransferItem::Status::InProgress: return "InProgress";
    case TransferItem::Status::Paused: return "Paused";
    case TransferItem::Status::Completed: return "Completed";
    case TransferItem::Status::Failed: return "Failed";
    case TransferItem::Status::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Convert TransferItem::Priority to string for logs
[[nodiscard]] inline const char *transferPriorityToString(TransferItem::Priority priority)
{
    switch (priority) {
    case TransferItem::Priority::Low: return "Low";
    case TransferItem::Priority::Normal: return "Normal";
    case TransferItem::Priority::High: return "High";
    case TransferItem::Priority::Critical: return "Critical";
    }
    return "Unknown";
}

/**
 * @brief Notification about one transfer item, emitted by TransferQueue.
 */
struct TransferEvent {
    enum class Type { Queued, Started, Progressed, Completed, Failed, Cancelled };

    Type type = Type::Queued;
    quint64 itemId = 0;
    QString driveId;
    qint64 bytes = 0;          ///< Progressed: bytes moved so far
    qint64 totalBytes = 0;     ///< Progressed: total, 0 if unknown
    double progress = 0.0;
    ErrorKind errorKind = ErrorKind::None;  ///< Failed: cause
    QString message;           ///< Failed: human-readable reason
    bool willRetry = false;    ///< Failed: an automatic retry is scheduled
};

Q_DECLARE_METATYPE(TransferEvent)

#endif // TRANSFERITEM_H
