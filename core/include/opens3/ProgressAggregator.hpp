// Batch-wide progress: folds per-key cumulative byte counts into one total,
// throttles aggregate events, and derives a smoothed rate/ETA for display.
#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace opens3 {

using ProgressClock = std::chrono::steady_clock;

struct BatchProgress {
    std::uint64_t done = 0;
    std::uint64_t total = 0;
    bool final = false;
};

// Per-key bookkeeping for one batch. Callbacks for different files of the
// same job may arrive concurrently; every read-modify-write happens under
// one mutex. Only increases over the last value seen for a key count, so
// repeated or out-of-order callbacks (SDK range retries) never double-count.
class AggregatorState {
public:
    static constexpr std::chrono::milliseconds kMinInterval{600};
    static constexpr std::uint64_t kMinBytes = 1024 * 1024;

    explicit AggregatorState(std::uint64_t total,
                             ProgressClock::time_point start =
                                 ProgressClock::now());

    // Returns true and fills `out` when an aggregate event is due: 600 ms
    // since the last one, or 1 MiB more progress, or the batch reached its
    // total.
    bool record(const std::string &key, std::uint64_t cumulative,
                ProgressClock::time_point now, BatchProgress &out);

    // Unconditional last event of a completed batch.
    BatchProgress finish();

    std::uint64_t done() const;
    std::uint64_t total() const { return total_; }
    std::uint64_t lastSeen(const std::string &key) const;

private:
    const std::uint64_t total_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::uint64_t> lastSeen_;
    std::uint64_t done_ = 0;
    std::uint64_t doneAtLastEmit_ = 0;
    bool emittedTotal_ = false;
    ProgressClock::time_point lastEmit_;
};

struct ProgressSample {
    ProgressClock::time_point at;
    std::uint64_t bytes = 0;
};

struct RateSnapshot {
    double bytes_per_sec = 0.0;
    std::string rate_text;
    std::string eta_text;
};

// UI-facing rate estimator, fed on a fixed tick.
class RateEstimator {
public:
    static constexpr std::chrono::milliseconds kTick{600};
    static constexpr std::chrono::milliseconds kWindow{2000};
    static constexpr std::chrono::milliseconds kStallAfter{2000};
    static constexpr double kAlpha = 0.15;
    // Below this the ETA is not shown.
    static constexpr double kTrivialRate = 512.0;

    RateSnapshot tick(ProgressClock::time_point now, std::uint64_t done,
                      std::uint64_t total);

    double smoothedRate() const { return smoothed_; }
    std::size_t sampleCount() const { return samples_.size(); }

private:
    std::deque<ProgressSample> samples_;
    double smoothed_ = 0.0;
    bool primed_ = false;
    bool haveAdvance_ = false;
    std::uint64_t lastDone_ = 0;
    ProgressClock::time_point lastAdvance_;
};

// "0 B", "1.5 KiB", "12.0 MiB" ...
std::string formatBytes(std::uint64_t bytes);
// "1.2 MiB/s"
std::string formatRate(double bytes_per_sec);
// "mm:ss" or "h:mm:ss"
std::string formatEta(std::uint64_t seconds);
// "Done" once done >= total, the formatted ETA for a non-trivial rate,
// "—" otherwise.
std::string etaText(std::uint64_t done, std::uint64_t total,
                    double bytes_per_sec);

} // namespace opens3
