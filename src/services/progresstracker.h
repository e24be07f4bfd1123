/**
 * @file progresstracker.h
 * @brief Speed and ETA estimation from transfer progress events.
 */

#ifndef PROGRESSTRACKER_H
#define PROGRESSTRACKER_H

#include <QElapsedTimer>
#include <QHash>
#include <QObject>

#include "models/transferitem.h"
#include "utils/ratewindow.h"

class TransferQueue;

/**
 * @brief Derives per-transfer speed, ETA and aggregate throughput.
 *
 * Consumes the TransferEvent stream of one or more queues. Each running
 * transfer gets a RateWindow of recent (time, bytes) samples; speed is the
 * throughput across that window and ETA is remaining bytes divided by speed.
 * Entries are dropped when their transfer reaches a terminal state.
 */
class ProgressTracker : public QObject
{
    Q_OBJECT

public:
    static constexpr size_t DefaultWindowSize = 10;

    explicit ProgressTracker(QObject *parent = nullptr);

    /// @brief Subscribes to a queue's transferEvent() signal.
    void track(TransferQueue *queue);

    /**
     * @brief Records a progress sample with an explicit timestamp.
     * @param itemId Transfer id.
     * @param timestampMs Monotonic milliseconds.
     * @param bytes Cumulative bytes moved.
     * @param totalBytes Total size, 0 if unknown.
     */
    void addSample(quint64 itemId, qint64 timestampMs, qint64 bytes, qint64 totalBytes);

    /// @brief Stops tracking a transfer.
    void forget(quint64 itemId);
    void clear();

    /// @brief Current speed of a transfer in bytes per second (0 if unknown).
    [[nodiscard]] double speed(quint64 itemId) const;

    /// @brief Seconds until completion, or -1 when speed or size is unknown.
    [[nodiscard]] int etaSeconds(quint64 itemId) const;

    /// @brief Sum of the speeds of all tracked transfers.
    [[nodiscard]] double aggregateSpeed() const;

    [[nodiscard]] bool isTracking(quint64 itemId) const { return entries_.contains(itemId); }
    [[nodiscard]] int trackedCount() const { return static_cast<int>(entries_.size()); }

    /// @brief "512.0 B/s", "1.5 KB/s", "2.3 MB/s" or "1.25 GB/s".
    [[nodiscard]] static QString formatSpeed(double bytesPerSecond);

    /// @brief "45s", "3m 20s" or "2h 5m"; empty for a negative value.
    [[nodiscard]] static QString formatEta(int seconds);

public slots:
    void onTransferEvent(const TransferEvent &event);

signals:
    /**
     * @brief Emitted after every sample of a tracked transfer.
     * @param itemId Transfer id.
     * @param bytesPerSecond Current speed.
     * @param etaSeconds Seconds remaining, -1 if unknown.
     */
    void speedUpdated(quint64 itemId, double bytesPerSecond, int etaSeconds);

private:
    struct Entry {
        RateWindow window{DefaultWindowSize};
        qint64 totalBytes = 0;
    };

    QHash<quint64, Entry> entries_;
    QElapsedTimer clock_;
};

#endif // PROGRESSTRACKER_H
