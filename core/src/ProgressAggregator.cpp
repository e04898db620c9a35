#include "opens3/ProgressAggregator.hpp"

#include <cmath>
#include <cstdio>

namespace opens3 {

AggregatorState::AggregatorState(std::uint64_t total,
                                 ProgressClock::time_point start)
    : total_(total), lastEmit_(start) {}

bool AggregatorState::record(const std::string &key, std::uint64_t cumulative,
                             ProgressClock::time_point now,
                             BatchProgress &out) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::uint64_t &seen = lastSeen_[key];
    if (cumulative <= seen)
        return false;
    done_ += cumulative - seen;
    seen = cumulative;

    const bool intervalDue = (now - lastEmit_) >= kMinInterval;
    const bool bytesDue = (done_ - doneAtLastEmit_) >= kMinBytes;
    const bool reachedTotal = total_ > 0 && done_ >= total_ && !emittedTotal_;
    if (!intervalDue && !bytesDue && !reachedTotal)
        return false;

    lastEmit_ = now;
    doneAtLastEmit_ = done_;
    if (reachedTotal)
        emittedTotal_ = true;
    out.done = done_;
    out.total = total_;
    out.final = false;
    return true;
}

BatchProgress AggregatorState::finish() {
    std::lock_guard<std::mutex> lk(mtx_);
    doneAtLastEmit_ = done_;
    emittedTotal_ = true;
    BatchProgress p;
    p.done = done_;
    p.total = total_;
    p.final = true;
    return p;
}

std::uint64_t AggregatorState::done() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return done_;
}

std::uint64_t AggregatorState::lastSeen(const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = lastSeen_.find(key);
    return it == lastSeen_.end() ? 0 : it->second;
}

RateSnapshot RateEstimator::tick(ProgressClock::time_point now,
                                 std::uint64_t done, std::uint64_t total) {
    if (!haveAdvance_ || done > lastDone_) {
        haveAdvance_ = true;
        lastAdvance_ = now;
        lastDone_ = done;
    }

    samples_.push_back({now, done});
    while (samples_.size() > 1 && (now - samples_.front().at) > kWindow)
        samples_.pop_front();

    if ((now - lastAdvance_) >= kStallAfter) {
        // Stalled: halve instead of dropping straight to zero.
        smoothed_ /= 2.0;
        if (smoothed_ < 1.0)
            smoothed_ = 0.0;
    } else if (samples_.size() >= 2) {
        const auto &first = samples_.front();
        const auto &last = samples_.back();
        const double dt =
            std::chrono::duration<double>(last.at - first.at).count();
        if (dt > 0.0 && last.bytes >= first.bytes) {
            const double inst = double(last.bytes - first.bytes) / dt;
            if (!primed_) {
                if (inst > 0.0) {
                    smoothed_ = inst;
                    primed_ = true;
                }
            } else {
                smoothed_ = kAlpha * inst + (1.0 - kAlpha) * smoothed_;
            }
        }
    }

    RateSnapshot snap;
    snap.bytes_per_sec = smoothed_;
    snap.rate_text = formatRate(smoothed_);
    snap.eta_text = etaText(done, total, smoothed_);
    return snap;
}

std::string formatBytes(std::uint64_t bytes) {
    static const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024)
        return std::to_string(bytes) + " B";
    double v = double(bytes);
    int unit = 0;
    while (v >= 1024.0 && unit < 4) {
        v /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", v, kUnits[unit]);
    return buf;
}

std::string formatRate(double bytes_per_sec) {
    if (!(bytes_per_sec > 0.0))
        return "0 B/s";
    return formatBytes(static_cast<std::uint64_t>(std::llround(bytes_per_sec))) +
           "/s";
}

std::string formatEta(std::uint64_t seconds) {
    const std::uint64_t h = seconds / 3600;
    const std::uint64_t m = (seconds % 3600) / 60;
    const std::uint64_t s = seconds % 60;
    char buf[32];
    if (h > 0)
        std::snprintf(buf, sizeof(buf), "%llu:%02llu:%02llu",
                      static_cast<unsigned long long>(h),
                      static_cast<unsigned long long>(m),
                      static_cast<unsigned long long>(s));
    else
        std::snprintf(buf, sizeof(buf), "%02llu:%02llu",
                      static_cast<unsigned long long>(m),
                      static_cast<unsigned long long>(s));
    return buf;
}

std::string etaText(std::uint64_t done, std::uint64_t total,
                    double bytes_per_sec) {
    if (total > 0 && done >= total)
        return "Done";
    if (bytes_per_sec < RateEstimator::kTrivialRate)
        return "\xE2\x80\x94"; // U+2014
    const double remaining = double(total > done ? total - done : 0);
    return formatEta(static_cast<std::uint64_t>(std::ceil(remaining / bytes_per_sec)));
}

} // namespace opens3
