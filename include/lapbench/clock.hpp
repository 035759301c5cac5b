#ifndef LAPBENCH_CLOCK_HPP
#define LAPBENCH_CLOCK_HPP

#include <chrono>
#include <functional>

namespace lapbench {

// All lap values, starts and stops are expressed in nanoseconds.
using Duration = std::chrono::nanoseconds;

/**
 * @brief Source of monotonic instants, as a duration since an arbitrary reference.
 *
 * Only differences between two readings are meaningful.
 */
using Clock = std::function<Duration()>;

/**
 * @brief Current instant of std::chrono::steady_clock.
 *
 * steady_clock is not affected by wall clock adjustments, so consecutive
 * readings never go backwards.
 */
inline Duration monotonic_now() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now().time_since_epoch());
}

// Default clock for LapTimer.
inline Clock monotonic_clock() {
    return &monotonic_now;
}

} // namespace lapbench

#endif // LAPBENCH_CLOCK_HPP
