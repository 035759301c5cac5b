#ifndef LAPBENCH_PLATFORM_HPP
#define LAPBENCH_PLATFORM_HPP

#include <cstdint>
#include <string>

#include "lapbench/clock.hpp"

namespace lapbench {

/**
 * @brief How fine-grained and how costly the timer's clock is.
 *
 * Measured by driving a LapTimer with no work between next() calls: every
 * lap is then the cost of one clock reading plus the timer bookkeeping.
 */
struct ClockProbe {
    int reads = 0;
    long long read_cost_ns = 0;    // median empty lap
    long long granularity_ns = 0;  // smallest non-zero empty lap (0 if none)
};

/**
 * @param clock Clock to measure.
 * @param reads Number of empty laps.
 * @throws InvalidCapacity if reads < 1.
 */
ClockProbe probe_clock(const Clock& clock, int reads = 1000);

// Where a run happened; stored in RunReport so results stay comparable.
struct Platform {
    std::string os;                   // uname sysname + release
    std::string arch;                 // uname machine
    std::uint32_t hardware_threads = 0;
    std::string compiler;
    long cpp_standard = 0;            // __cplusplus
    bool steady_clock = false;        // std::chrono::steady_clock::is_steady
    ClockProbe clock;
};

Platform collect_platform(const Clock& clock = monotonic_clock());

} // namespace lapbench

#endif // LAPBENCH_PLATFORM_HPP
