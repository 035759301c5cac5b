#include "lapbench/lap_timer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lapbench {

LapTimer::LapTimer(int count, Clock clock)
    : clock_(std::move(clock)) {
    if (count <= 0) throw InvalidCapacity(count);
    if (!clock_) throw std::invalid_argument("lap timer needs a clock");
    laps_.assign(static_cast<std::size_t>(count), Duration{0});
}

LapTimer::LapTimer(std::vector<Duration> laps, Duration start, Duration stop, Clock clock)
    : clock_(std::move(clock)),
      laps_(std::move(laps)),
      step_(laps_.size()),
      start_(start),
      stop_(stop),
      state_(State::Finalized) {}

bool LapTimer::next() {
    // Read unconditionally: on the closing call this reading ends the last lap.
    const Duration now = clock_();

    if (step_ < laps_.size()) {
        laps_[step_] = now;
        ++step_;
        if (step_ == laps_.size()) state_ = State::AwaitingClose;
        return true;
    }

    finalize(now);
    return false;
}

void LapTimer::finalize(Duration last) {
    if (state_ == State::Finalized) return;

    start_ = laps_.front();
    for (std::size_t i = 0; i + 1 < laps_.size(); ++i) {
        laps_[i] = laps_[i + 1] - laps_[i];
    }
    laps_.back() = last - laps_.back();
    stop_ = last;
    state_ = State::Finalized;
}

void LapTimer::must_be_completed() const {
    if (state_ != State::Finalized) throw IncompleteBenchmark();
}

std::vector<Duration> LapTimer::laps() const {
    must_be_completed();
    return laps_;
}

Duration LapTimer::elapsed() const {
    must_be_completed();
    return stop_ - start_;
}

Histogram LapTimer::histogram(int bin_count, const HistogramOptions& defaults) const {
    must_be_completed();

    HistogramOptions opts = defaults;
    opts.bin_count = bin_count;
    return make_duration_histogram(laps_, opts);
}

Histogram LapTimer::histogram_clamp(int bin_count, Duration min, Duration max,
                                    const HistogramOptions& defaults) const {
    must_be_completed();

    std::vector<Duration> clamped;
    clamped.reserve(laps_.size());
    for (const auto& lap : laps_) {
        clamped.push_back(lap < min ? min : lap);
    }

    HistogramOptions opts = defaults;
    opts.bin_count = bin_count;
    opts.clamp_maximum = static_cast<double>(max.count());
    opts.clamp_percentile = 0.0;
    return make_duration_histogram(clamped, opts);
}

std::optional<LapTimer> merge_timers(const std::vector<const LapTimer*>& timers) {
    if (timers.empty()) return std::nullopt;

    Duration start = Duration::max();
    Duration stop = Duration::min();
    std::size_t total = 0;
    for (const LapTimer* t : timers) {
        t->must_be_completed();
        total += t->laps_.size();
        start = std::min(start, t->start_);
        stop = std::max(stop, t->stop_);
    }

    std::vector<Duration> laps;
    laps.reserve(total);
    for (const LapTimer* t : timers) {
        laps.insert(laps.end(), t->laps_.begin(), t->laps_.end());
    }

    return LapTimer(std::move(laps), start, stop, timers.front()->clock_);
}

std::optional<LapTimer> merge_timers(const std::vector<LapTimer>& timers) {
    std::vector<const LapTimer*> ptrs;
    ptrs.reserve(timers.size());
    for (const auto& t : timers) ptrs.push_back(&t);
    return merge_timers(ptrs);
}

} // namespace lapbench
