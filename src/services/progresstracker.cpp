#include "progresstracker.h"

#include <cmath>

#include "models/transferqueue.h"

ProgressTracker::ProgressTracker(QObject *parent)
    : QObject(parent)
{
    clock_.start();
}

void ProgressTracker::track(TransferQueue *queue)
{
    connect(queue, &TransferQueue::transferEvent, this, &ProgressTracker::onTransferEvent);
}

void ProgressTracker::onTransferEvent(const TransferEvent &event)
{
    switch (event.type) {
    case TransferEvent::Type::Started:
        forget(event.itemId);
        addSample(event.itemId, clock_.elapsed(), 0, event.totalBytes);
        break;
    case TransferEvent::Type::Progressed:
        addSample(event.itemId, clock_.elapsed(), event.bytes, event.totalBytes);
        break;
    case TransferEvent::Type::Queued:
    case TransferEvent::Type::Completed:
    case TransferEvent::Type::Failed:
    case TransferEvent::Type::Cancelled:
        forget(event.itemId);
        break;
    }
}

void ProgressTracker::addSample(quint64 itemId, qint64 timestampMs, qint64 bytes, qint64 totalBytes)
{
    Entry &entry = entries_[itemId];
    if (totalBytes > 0) {
        entry.totalBytes = totalBytes;
    }
    entry.window.addSample(timestampMs, bytes);
    emit speedUpdated(itemId, entry.window.bytesPerSecond(), etaSeconds(itemId));
}

void ProgressTracker::forget(quint64 itemId)
{
    entries_.remove(itemId);
}

void ProgressTracker::clear()
{
    entries_.clear();
}

double ProgressTracker::speed(quint64 itemId) const
{
    const auto it = entries_.constFind(itemId);
    return it == entries_.constEnd() ? 0.0 : it->window.bytesPerSecond();
}

int ProgressTracker::etaSeconds(quint64 itemId) const
{
    const auto it = entries_.constFind(itemId);
    if (it == entries_.constEnd() || it->totalBytes <= 0) {
        return -1;
    }
    const double bytesPerSecond = it->window.bytesPerSecond();
    if (bytesPerSecond <= 0.0) {
        return -1;
    }
    const qint64 remaining = qMax<qint64>(0, it->totalBytes - it->window.latestBytes());
    return static_cast<int>(std::ceil(static_cast<double>(remaining) / bytesPerSecond));
}

double ProgressTracker::aggregateSpeed() const
{
    double total = 0.0;
    for (const Entry &entry : entries_) {
        total += entry.window.bytesPerSecond();
    }
    return total;
}

QString ProgressTracker::formatSpeed(double bytesPerSecond)
{
    constexpr double KiB = 1024.0;
    constexpr double MiB = KiB * 1024.0;
    constexpr double GiB = MiB * 1024.0;

    if (bytesPerSecond < KiB) {
        return QString("%1 B/s").arg(bytesPerSecond, 0, 'f', 1);
    }
    if (bytesPerSecond < MiB) {
        return QString("%1 KB/s").arg(bytesPerSecond / KiB, 0, 'f', 1);
    }
    if (bytesPerSecond < GiB) {
        return QString("%1 MB/s").arg(bytesPerSecond / MiB, 0, 'f', 1);
    }
    return QString("%1 GB/s").arg(bytesPerSecond / GiB, 0, 'f', 2);
}

QString ProgressTracker::formatEta(int seconds)
{
    if (seconds < 0) {
        return QString();
    }
    if (seconds < 60) {
        return QString("%1s").arg(seconds);
    }
    if (seconds < 3600) {
        return QString("%1m %2s").arg(seconds / 60).arg(seconds % 60);
    }
    return QString("%1h %2m").arg(seconds / 3600).arg((seconds % 3600) / 60);
}
