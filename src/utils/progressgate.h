#ifndef PROGRESSGATE_H
#define PROGRESSGATE_H

#include <QtGlobal>

/**
 * @brief Decides when a chunked transfer should publish a progress update.
 *
 * A report passes the gate when at least @c intervalMs elapsed since the last
 * report, when at least @c byteDelta bytes moved since then, or when the
 * transfer reached its known total. Everything else is dropped so observers
 * are not flooded with one signal per network chunk.
 */
class ProgressGate
{
public:
    ProgressGate(int intervalMs, qint64 byteDelta)
        : intervalMs_(intervalMs)
        , byteDelta_(byteDelta)
    {
    }

    [[nodiscard]] bool shouldReport(qint64 nowMs, qint64 bytes, qint64 totalBytes)
    {
        if (bytes == lastBytes_ && reported_) {
            return false;
        }
        const bool complete = totalBytes > 0 && bytes >= totalBytes;
        const bool elapsed = !reported_ || nowMs - lastReportMs_ >= intervalMs_;
        const bool moved = bytes - lastBytes_ >= byteDelta_;
        if (!complete && !elapsed && !moved) {
            return false;
        }
        reported_ = true;
        lastReportMs_ = nowMs;
        lastBytes_ = bytes;
        return true;
    }

    void reset()
    {
        reported_ = false;
        lastReportMs_ = 0;
        lastBytes_ = 0;
    }

private:
    int intervalMs_;
    qint64 byteDelta_;
    bool reported_ = false;
    qint64 lastReportMs_ = 0;
    qint64 lastBytes_ = 0;
};

#endif // PROGRESSGATE_H
