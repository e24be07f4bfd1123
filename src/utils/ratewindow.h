/**
 * @file ratewindow.h
 * @brief Rolling window of byte-count samples for transfer rate estimation.
 *
 * Keeps the most recent (timestamp, cumulative bytes) samples in a fixed-size
 * circular buffer and derives a throughput figure from the oldest and newest
 * samples in the window.
 */

#ifndef RATEWINDOW_H
#define RATEWINDOW_H

#include <QtGlobal>

#include <vector>

/**
 * @brief Calculates transfer throughput over a fixed window of samples.
 *
 * Each sample records the cumulative number of bytes processed at a point in
 * time (milliseconds on a monotonic clock). The rate is the byte delta between
 * the oldest and newest retained sample divided by their time delta, which
 * smooths out bursty progress reports.
 *
 * @par Example usage:
 * @code
 * RateWindow window(8);
 * window.addSample(0, 0);
 * window.addSample(1000, 512 * 1024);
 * double bps = window.bytesPerSecond();  // 524288.0
 * @endcode
 */
class RateWindow
{
public:
    /**
     * @brief Constructs a RateWindow with the specified window size.
     * @param windowSize Maximum number of samples to keep (at least 2).
     */
    explicit RateWindow(size_t windowSize = 10)
        : windowSize_(windowSize < 2 ? 2 : windowSize)
    {
        samples_.reserve(windowSize_);
    }

    /**
     * @brief Adds a sample to the rolling window.
     * @param timestampMs Monotonic timestamp in milliseconds.
     * @param totalBytes Cumulative bytes processed at that time.
     *
     * Samples older than the newest one are ignored. A sample whose byte count
     * is lower than the previous one resets the window, which happens when a
     * transfer restarts from zero after a retry.
     */
    void addSample(qint64 timestampMs, qint64 totalBytes)
    {
        if (count_ > 0) {
            const Sample &last = newest();
            if (timestampMs < last.timestampMs) {
                return;
            }
            if (totalBytes < last.bytes) {
                clear();
            }
        }

        Sample sample{timestampMs, totalBytes};
        if (samples_.size() < windowSize_) {
            samples_.push_back(sample);
        } else {
            samples_[writeIndex_] = sample;
        }
        writeIndex_ = (writeIndex_ + 1) % windowSize_;
        if (count_ < windowSize_) {
            count_++;
        }
    }

    /**
     * @brief Returns the throughput across the window.
     * @return Bytes per second, or 0.0 if fewer than 2 samples or no elapsed time.
     */
    [[nodiscard]] double bytesPerSecond() const
    {
        if (count_ < 2) {
            return 0.0;
        }
        const Sample &first = oldest();
        const Sample &last = newest();
        const qint64 elapsedMs = last.timestampMs - first.timestampMs;
        if (elapsedMs <= 0) {
            return 0.0;
        }
        return static_cast<double>(last.bytes - first.bytes) * 1000.0
               / static_cast<double>(elapsedMs);
    }

    /**
     * @brief Returns the cumulative byte count of the newest sample.
     */
    [[nodiscard]] qint64 latestBytes() const
    {
        return count_ > 0 ? newest().bytes : 0;
    }

    /**
     * @brief Returns the number of samples currently in the window.
     */
    [[nodiscard]] size_t count() const { return count_; }

    /**
     * @brief Returns the window size.
     */
    [[nodiscard]] size_t windowSize() const { return windowSize_; }

    /**
     * @brief Clears all samples.
     */
    void clear()
    {
        samples_.clear();
        writeIndex_ = 0;
        count_ = 0;
    }

private:
    struct Sample {
        qint64 timestampMs = 0;
        qint64 bytes = 0;
    };

    [[nodiscard]] const Sample &newest() const
    {
        return samples_[(writeIndex_ + windowSize_ - 1) % windowSize_];
    }

    [[nodiscard]] const Sample &oldest() const
    {
        return count_ < windowSize_ ? samples_.front() : samples_[writeIndex_];
    }

    size_t windowSize_;
    std::vector<Sample> samples_;
    size_t writeIndex_ = 0;
    size_t count_ = 0;
};

#endif // RATEWINDOW_H
