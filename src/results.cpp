#include "lapbench/results.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lapbench {

namespace {

std::string local_timestamp() {
    const auto now_tp = std::chrono::system_clock::now();
    const std::time_t now = std::chrono::system_clock::to_time_t(now_tp);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

json summary_json(const Histogram& h) {
    return {
        {"samples", h.samples},
        {"min_ns", h.minimum},
        {"avg_ns", h.average},
        {"max_ns", h.maximum},
        {"p50_ns", h.p50},
        {"p90_ns", h.p90},
        {"p99_ns", h.p99},
        {"p999_ns", h.p999},
        {"p9999_ns", h.p9999}
    };
}

} // namespace

Histogram summarize(const Config& conf, const LapTimer& timer) {
    if (conf.clamp_max) {
        return timer.histogram_clamp(conf.bins, conf.clamp_min.value_or(Duration{0}), *conf.clamp_max);
    }
    return timer.histogram(conf.bins);
}

void to_json(json& j, const Histogram& h) {
    j = summary_json(h);
    j["bins"] = json::array();
    for (const auto& bin : h.bins) {
        j["bins"].push_back({
            {"start", bin.start},
            {"count", bin.count},
            {"and_above", bin.and_above}
        });
    }
}

void to_json(json& j, const Platform& platform) {
    j = {
        {"os", platform.os},
        {"arch", platform.arch},
        {"hardware_threads", platform.hardware_threads},
        {"compiler", platform.compiler},
        {"cpp_standard", platform.cpp_standard},
        {"steady_clock", platform.steady_clock},
        {"clock", {
            {"reads", platform.clock.reads},
            {"read_cost_ns", platform.clock.read_cost_ns},
            {"granularity_ns", platform.clock.granularity_ns}
        }}
    };
}

RunReport make_report(const Config& conf, const RunOutcome& outcome, Platform platform) {
    RunReport report;
    report.timestamp = local_timestamp();
    report.platform = std::move(platform);
    report.config = conf;

    int index = 0;
    for (const auto& timer : outcome.workers) {
        RunReport::WorkerSummary ws;
        ws.worker = index++;
        ws.laps = timer.count();
        ws.start_ns = timer.start().count();
        ws.stop_ns = timer.stop().count();
        ws.elapsed_ns = timer.elapsed().count();
        ws.histogram = summarize(conf, timer);
        report.workers.push_back(std::move(ws));
    }

    const LapTimer& merged = outcome.merged;
    report.merged_laps = merged.count();
    report.merged_start_ns = merged.start().count();
    report.merged_stop_ns = merged.stop().count();
    report.merged_elapsed_ns = merged.elapsed().count();
    report.merged = summarize(conf, merged);

    if (conf.dump_laps) {
        for (const auto& lap : merged.laps()) report.merged_lap_ns.push_back(lap.count());
    }
    return report;
}

json RunReport::to_json() const {
    json j;

    // ---------- Metadata ----------
    j["metadata"]["timestamp"] = timestamp;
    j["metadata"]["platform"] = platform;

    // ---------- Config (CLI) ----------
    j["config"]["workload"] = config.workload;
    j["config"]["work"]     = config.work;
    j["config"]["laps"]     = config.laps;
    j["config"]["workers"]  = config.workers;
    j["config"]["warmup"]   = config.warmup;
    j["config"]["bins"]     = config.bins;
    j["config"]["seed"]     = config.seed;
    if (config.clamp_min) j["config"]["clamp_min_ns"] = config.clamp_min->count();
    if (config.clamp_max) j["config"]["clamp_max_ns"] = config.clamp_max->count();

    // ---------- Per worker ----------
    j["workers"] = json::array();
    for (const auto& ws : workers) {
        j["workers"].push_back({
            {"worker", ws.worker},
            {"laps", ws.laps},
            {"start_ns", ws.start_ns},
            {"stop_ns", ws.stop_ns},
            {"elapsed_ns", ws.elapsed_ns},
            {"stats", summary_json(ws.histogram)}
        });
    }

    // ---------- Merged ----------
    j["merged"]["laps"] = merged_laps;
    j["merged"]["start_ns"] = merged_start_ns;
    j["merged"]["stop_ns"] = merged_stop_ns;
    j["merged"]["elapsed_ns"] = merged_elapsed_ns;
    j["merged"]["histogram"] = merged;
    if (!merged_lap_ns.empty()) j["merged"]["laps_ns"] = merged_lap_ns;

    return j;
}

void RunReport::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("failed to open output file: " + path);
    }
    file << to_json().dump(4);
    if (!file) {
        throw std::runtime_error("failed to write output file: " + path);
    }

    std::cout << "[Results] JSON written to: " << path << "\n";
}

} // namespace lapbench
