#ifndef LAPBENCH_RUNNER_HPP
#define LAPBENCH_RUNNER_HPP

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

#include "lapbench/config.hpp"
#include "lapbench/lap_timer.hpp"

namespace lapbench {

struct RunOutcome {
    std::vector<LapTimer> workers; // one finalized timer per worker, in worker order
    LapTimer merged;               // merge_timers(workers)
};

// Starts a thread running fn. run_in_parallel() takes it as a parameter so a
// failing thread start can be simulated.
using ThreadStarter = std::function<std::thread(std::function<void()>)>;

std::thread start_thread(std::function<void()> fn);

/**
 * @brief Run body(0) .. body(n-1) on n threads and wait for all of them.
 *
 * If a thread cannot be started, the threads already running are joined
 * before the error propagates. Otherwise the first exception thrown by a
 * body (lowest index) is rethrown once every thread has finished.
 */
void run_in_parallel(std::size_t n, const std::function<void(std::size_t)>& body,
                     const ThreadStarter& starter = &start_thread);

/**
 * @brief Time conf.laps laps of the configured workload on conf.workers threads.
 *
 * Every worker owns its LapTimer and Workload; the only synchronization is
 * the join before the timers are merged on the calling thread.
 *
 * @param clock Clock handed to every worker timer.
 */
RunOutcome run_workers(const Config& conf, const Clock& clock = monotonic_clock());

} // namespace lapbench

#endif // LAPBENCH_RUNNER_HPP
