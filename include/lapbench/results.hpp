#ifndef LAPBENCH_RESULTS_HPP
#define LAPBENCH_RESULTS_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

#include "lapbench/config.hpp"
#include "lapbench/histogram.hpp"
#include "lapbench/lap_timer.hpp"
#include "lapbench/runner.hpp"
#include "lapbench/platform.hpp"

namespace lapbench {

using json = nlohmann::json;

/**
 * @brief Histogram for a finalized timer as requested on the command line:
 * histogram_clamp() when --clamp-max is set, histogram() otherwise.
 */
Histogram summarize(const Config& conf, const LapTimer& timer);

/**
 * @brief Run output + metadata, written as JSON.
 *
 * Design goals:
 * - machine-readable JSON output
 * - include run config and platform for reproducibility
 * - one summary per worker plus the merged view
 */
struct RunReport {
    struct WorkerSummary {
        int worker = 0;
        std::size_t laps = 0;
        long long start_ns = 0;
        long long stop_ns = 0;
        long long elapsed_ns = 0;
        Histogram histogram;
    };

    std::string timestamp;  // local time, "%Y-%m-%d %H:%M:%S"
    Platform platform;
    Config config;

    std::vector<WorkerSummary> workers;

    std::size_t merged_laps = 0;
    long long merged_start_ns = 0;
    long long merged_stop_ns = 0;
    long long merged_elapsed_ns = 0;
    Histogram merged;
    std::vector<long long> merged_lap_ns;  // only filled with --dump-laps

    json to_json() const;

    // Throws std::runtime_error if the file cannot be written.
    void save(const std::string& path) const;
};

RunReport make_report(const Config& conf, const RunOutcome& outcome, Platform platform);

void to_json(json& j, const Histogram& h);
void to_json(json& j, const Platform& platform);

} // namespace lapbench

#endif // LAPBENCH_RESULTS_HPP
