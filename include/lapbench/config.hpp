#ifndef LAPBENCH_CONFIG_HPP
#define LAPBENCH_CONFIG_HPP

#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "lapbench/clock.hpp"
#include "lapbench/duration_parse.hpp"
#include "lapbench/workload.hpp"

namespace lapbench {

// Bad command line: main prints the message + usage and exits 1.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---- Config struct: every run setting in ONE place ----
struct Config {
    std::string workload = "spin";       // measured work per lap: spin, chase, sleep
    int work           = 1000;           // work amount per lap (iterations / nodes / microseconds)
    int laps           = 1000;           // laps measured per worker (must be >= 1)
    int workers        = 1;              // worker threads, one LapTimer each
    int warmup         = 10;             // unmeasured laps before timing (can be 0)
    int bins           = 10;             // histogram buckets
    std::optional<Duration> clamp_min;   // raise shorter laps to this value
    std::optional<Duration> clamp_max;   // last histogram bucket boundary
    std::string out    = "results.json"; // JSON report path (empty = no report)
    int seed           = 14;             // RNG seed for the chase workload
    bool dump_laps     = false;          // include every merged lap in the report
    bool help          = false;          // --help was given

    void print() const {
        std::cout << "--- Lap Benchmark Configuration ---\n";
        std::cout << "Workload : " << workload << " (work=" << work << ")\n";
        std::cout << "Laps     : " << laps    << "\n";
        std::cout << "Workers  : " << workers << "\n";
        std::cout << "Warmup   : " << warmup  << "\n";
        std::cout << "Bins     : " << bins    << "\n";
        if (clamp_max) {
            std::cout << "Clamp    : [" << (clamp_min ? clamp_min->count() : 0) << "ns, "
                      << clamp_max->count() << "ns]\n";
        }
        std::cout << "Output   : " << (out.empty() ? "(none)" : out) << "\n";
        std::cout << "Seed     : " << seed    << "\n";
        std::cout << "-----------------------------------\n";
    }
};

inline void print_help(const char* prog) {
    std::cout
        << "Usage: " << prog << " [options]\n\n"
        << "Options:\n"
        << "  --workload  <name>  (default: spin | allowed: spin, chase, sleep)\n"
        << "  --work      <int>   (default: 1000; iterations, nodes or microseconds per lap)\n"
        << "  --laps      <int>   (default: 1000)\n"
        << "  --workers   <int>   (default: 1)\n"
        << "  --warmup    <int>   (default: 10)\n"
        << "  --bins      <int>   (default: 10)\n"
        << "  --clamp-min <dur>   (e.g. 250ns, 1.5us, 2ms; requires --clamp-max)\n"
        << "  --clamp-max <dur>   (last histogram bucket boundary)\n"
        << "  --out       <file>  (default: results.json; empty string disables)\n"
        << "  --seed      <int>   (default: 14)\n"
        << "  --dump-laps         write every merged lap to the report\n"
        << "  --help              show this message\n";
}

/**
 * @brief Parse and validate the command line.
 * @throws ConfigError on unknown flags, missing or invalid values.
 */
inline Config parse_args(int argc, char** argv) {
    Config conf;
    std::vector<std::string> args(argv + 1, argv + argc);

    auto need_value = [&](std::size_t i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw ConfigError("missing value after '" + args[i] + "'");
        }
        return args[i + 1];
    };

    auto to_int = [](const std::string& flag, const std::string& value) {
        std::size_t used = 0;
        int v = 0;
        try {
            v = std::stoi(value, &used);
        } catch (const std::exception&) {
            throw ConfigError("invalid integer for " + flag + ": '" + value + "'");
        }
        if (used != value.size()) {
            throw ConfigError("invalid integer for " + flag + ": '" + value + "'");
        }
        return v;
    };

    auto to_duration = [](const std::string& flag, const std::string& value) {
        try {
            return parse_duration(value);
        } catch (const std::exception& e) {
            throw ConfigError("invalid duration for " + flag + ": " + e.what());
        }
    };

    for (std::size_t i = 0; i < args.size(); i++) {
        const std::string& flag = args[i];

        if (flag == "--help") {
            conf.help = true;
            return conf;
        }
        else if (flag == "--dump-laps") {
            conf.dump_laps = true;
        }
        // ---- String flags ----
        else if (flag == "--workload") {
            conf.workload = need_value(i); ++i;
        }
        else if (flag == "--out") {
            conf.out = need_value(i); ++i;
        }
        // ---- Integer flags ----
        else if (flag == "--work") {
            conf.work = to_int(flag, need_value(i)); ++i;
        }
        else if (flag == "--laps") {
            conf.laps = to_int(flag, need_value(i)); ++i;
        }
        else if (flag == "--workers") {
            conf.workers = to_int(flag, need_value(i)); ++i;
        }
        else if (flag == "--warmup") {
            conf.warmup = to_int(flag, need_value(i)); ++i;
        }
        else if (flag == "--bins") {
            conf.bins = to_int(flag, need_value(i)); ++i;
        }
        else if (flag == "--seed") {
            conf.seed = to_int(flag, need_value(i)); ++i;
        }
        // ---- Duration flags ----
        else if (flag == "--clamp-min") {
            conf.clamp_min = to_duration(flag, need_value(i)); ++i;
        }
        else if (flag == "--clamp-max") {
            conf.clamp_max = to_duration(flag, need_value(i)); ++i;
        }
        // ---- Unknown flag ----
        // Fail fast so typos like "--lapz 10" are not silently ignored.
        else {
            throw ConfigError("unknown option '" + flag + "'");
        }
    }

    // ---- Validation ----
    if (conf.laps < 1)    throw ConfigError("--laps must be >= 1");
    if (conf.work < 1)    throw ConfigError("--work must be >= 1");
    if (conf.workers < 1) throw ConfigError("--workers must be >= 1");
    if (conf.warmup < 0)  throw ConfigError("--warmup must be >= 0");
    if (conf.bins < 1)    throw ConfigError("--bins must be >= 1");

    if (conf.clamp_min && !conf.clamp_max) {
        throw ConfigError("--clamp-min requires --clamp-max");
    }
    if (conf.clamp_min && *conf.clamp_min > *conf.clamp_max) {
        throw ConfigError("--clamp-min must not exceed --clamp-max");
    }

    try {
        parse_workload_kind(conf.workload);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    return conf;
}

} // namespace lapbench

#endif // LAPBENCH_CONFIG_HPP
