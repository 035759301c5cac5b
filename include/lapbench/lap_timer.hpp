#ifndef LAPBENCH_LAP_TIMER_HPP
#define LAPBENCH_LAP_TIMER_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "lapbench/clock.hpp"
#include "lapbench/errors.hpp"
#include "lapbench/histogram.hpp"

namespace lapbench {

/**
 * @brief Lap based benchmarking timer with a fixed number of samples.
 *
 * Typical use:
 *
 *     LapTimer timer(1000);
 *     while (timer.next()) {
 *         work();
 *     }
 *     auto hist = timer.histogram(10);
 *
 * While recording, the sample buffer holds raw clock readings. The call that
 * finds the buffer full converts it in place into lap durations: lap i is the
 * time between reading i and reading i+1 (or the closing reading for the last
 * lap). After that the timer is read-only.
 *
 * A single timer must be driven by one thread. Independent timers can be
 * driven by separate threads and combined with merge_timers().
 */
class LapTimer {
public:
    enum class State {
        Raw,           // step() < count()
        AwaitingClose, // buffer full, closing reading not taken yet
        Finalized      // laps hold durations
    };

    /**
     * @param count Number of laps to measure.
     * @param clock Source of monotonic readings.
     * @throws InvalidCapacity if count < 1.
     * @throws std::invalid_argument if clock is empty.
     */
    explicit LapTimer(int count, Clock clock = monotonic_clock());

    /**
     * @brief Take one clock reading and advance the state machine.
     * @return true while laps remain to be measured; false once the timer is
     *         finalized (including every later call).
     */
    bool next();

    // Copy of the lap durations. Throws IncompleteBenchmark until finalized.
    std::vector<Duration> laps() const;

    /**
     * @brief Histogram of all laps.
     * @param bin_count Number of buckets; overrides defaults.bin_count.
     * @param defaults Remaining bucketing options.
     */
    Histogram histogram(int bin_count, const HistogramOptions& defaults = HistogramOptions{}) const;

    /**
     * @brief Histogram of all laps with an explicit value range.
     *
     * Laps shorter than min are raised to min before bucketing. max becomes
     * the last bucket boundary and percentile clamping is disabled, so laps
     * above max land in the last bucket.
     */
    Histogram histogram_clamp(int bin_count, Duration min, Duration max,
                              const HistogramOptions& defaults = HistogramOptions{}) const;

    State state() const { return state_; }
    bool completed() const { return state_ == State::Finalized; }

    std::size_t count() const { return laps_.size(); }
    std::size_t step() const { return step_; }

    // First reading; zero until finalized.
    Duration start() const { return start_; }
    // Closing reading; zero until finalized.
    Duration stop() const { return stop_; }
    // stop() - start(). Throws IncompleteBenchmark until finalized.
    Duration elapsed() const;

private:
    friend std::optional<LapTimer> merge_timers(const std::vector<const LapTimer*>& timers);

    // Already finalized timer built from merged laps.
    LapTimer(std::vector<Duration> laps, Duration start, Duration stop, Clock clock);

    void must_be_completed() const;
    void finalize(Duration last);

    Clock clock_;
    std::vector<Duration> laps_;
    std::size_t step_ = 0;
    Duration start_{0};
    Duration stop_{0};
    State state_ = State::Raw;
};

/**
 * @brief Combine finalized timers, e.g. one per worker thread.
 *
 * Laps are concatenated in argument order. The result spans the earliest
 * start to the latest stop and is already finalized.
 *
 * @return std::nullopt when no timers are given.
 * @throws IncompleteBenchmark if any input is not finalized.
 */
std::optional<LapTimer> merge_timers(const std::vector<const LapTimer*>& timers);

std::optional<LapTimer> merge_timers(const std::vector<LapTimer>& timers);

template <class... Timers>
std::optional<LapTimer> merge_timers(const Timers&... timers) {
    return merge_timers(std::vector<const LapTimer*>{&timers...});
}

} // namespace lapbench

#endif // LAPBENCH_LAP_TIMER_HPP
