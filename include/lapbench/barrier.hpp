#ifndef LAPBENCH_BARRIER_HPP
#define LAPBENCH_BARRIER_HPP

#include <atomic>

namespace lapbench {

/**
 * @brief Compiler barriers for the measured region of a lap.
 *
 * A lap is the code between two LapTimer::next() calls. The driver loop is
 *
 *     while (timer.next()) {
 *         lap_fence();
 *         work.run();          // result passed to keep_result()
 *         lap_fence();
 *     }
 *
 * so the optimizer can neither hoist work into the previous lap nor sink it
 * past the reading that closes this one. Neither barrier emits a CPU fence.
 */
inline void lap_fence() {
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : : "memory");
#else
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

// Marks the result of a lap's work as used so the work is not eliminated.
template <typename T>
inline void keep_result(const T& value) {
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : "g"(value) : "memory");
#else
    volatile T sink = value;
    (void)sink;
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

} // namespace lapbench

#endif // LAPBENCH_BARRIER_HPP
