#include "lapbench/runner.hpp"
#include "lapbench/barrier.hpp"
#include "lapbench/workload.hpp"

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <thread>
#include <utility>

namespace lapbench {

namespace {

// Distinct chase permutation per worker.
std::uint32_t worker_seed(const Config& conf, int worker) {
    return static_cast<std::uint32_t>(conf.seed) ^ (static_cast<std::uint32_t>(worker) * 0x9E3779B9u);
}

void drive(LapTimer& timer, Workload& work) {
    while (timer.next()) {
        lap_fence();
        work.run();
        lap_fence();
    }
}

} // namespace

std::thread start_thread(std::function<void()> fn) {
    return std::thread(std::move(fn));
}

void run_in_parallel(std::size_t n, const std::function<void(std::size_t)>& body,
                     const ThreadStarter& starter) {
    std::vector<std::exception_ptr> errors(n);
    std::vector<std::thread> threads;
    threads.reserve(n);

    auto join_all = [&threads] {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    };

    try {
        for (std::size_t i = 0; i < n; ++i) {
            threads.push_back(starter([&body, &errors, i] {
                try {
                    body(i);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }));
        }
    } catch (...) {
        // A joinable std::thread must not be destroyed.
        join_all();
        throw;
    }
    join_all();

    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
}

RunOutcome run_workers(const Config& conf, const Clock& clock) {
    const WorkloadKind kind = parse_workload_kind(conf.workload);

    std::vector<Workload> workloads;
    std::vector<LapTimer> timers;
    workloads.reserve(static_cast<std::size_t>(conf.workers));
    timers.reserve(static_cast<std::size_t>(conf.workers));
    for (int w = 0; w < conf.workers; ++w) {
        workloads.emplace_back(kind, conf.work, worker_seed(conf, w));
        timers.emplace_back(conf.laps, clock);
    }

    // ---- Warmup (not timed) ----
    for (auto& wl : workloads) {
        for (int i = 0; i < conf.warmup; ++i) wl.run();
    }

    std::cout << "[Run] " << conf.workers << " worker(s) x " << conf.laps
              << " laps of " << workload_name(kind) << "(" << conf.work << ")\n";

    // ---- Measurement: one thread per timer ----
    run_in_parallel(timers.size(), [&](std::size_t w) { drive(timers[w], workloads[w]); });

    for (std::size_t w = 0; w < workloads.size(); ++w) {
        keep_result(workloads[w].checksum());
    }

    // Non-empty (workers >= 1), so the merge always has a value.
    auto merged = merge_timers(timers);
    if (!merged) throw std::logic_error("no worker timers to merge");

    std::cout << "[Run] merged " << merged->count() << " laps over "
              << format_duration(static_cast<double>(merged->elapsed().count())) << "\n";

    return RunOutcome{std::move(timers), std::move(*merged)};
}

} // namespace lapbench
