#ifndef LAPBENCH_HISTOGRAM_HPP
#define LAPBENCH_HISTOGRAM_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "lapbench/clock.hpp"

namespace lapbench {

/**
 * @brief Bucketing options for make_histogram().
 *
 * A default-constructed value holds the defaults; callers copy it and override
 * what they need instead of touching shared state.
 */
struct HistogramOptions {
    int bin_count = 10;             // number of buckets (must be >= 1)
    bool nice_range = true;         // round spacing to 1/2/5 x 10^k
    double clamp_maximum = 0.0;     // explicit last-bucket boundary (0 = unset)
    double clamp_percentile = 99.9; // percentile in [0,100) for the boundary (0 = unset)
};

struct HistogramBin {
    double start = 0.0;     // lower edge of the bucket
    std::size_t count = 0;  // samples in the bucket
    double width = 0.0;     // count relative to the fullest bucket, in [0,1]
    bool and_above = false; // last bucket also holds samples past the boundary
};

/**
 * @brief Summary statistics + bucketed distribution of a sample set.
 */
struct Histogram {
    std::size_t samples = 0;
    double minimum = 0.0;
    double average = 0.0;
    double maximum = 0.0;

    double p50 = 0.0;
    double p90 = 0.0;
    double p99 = 0.0;
    double p999 = 0.0;
    double p9999 = 0.0;

    std::vector<HistogramBin> bins;

    // Options the histogram was built with.
    HistogramOptions options;

    // Render values as durations (values are nanoseconds).
    bool durations = false;

    // Text table: summary lines followed by one bar per bin.
    std::string str() const;
};

std::ostream& operator<<(std::ostream& os, const Histogram& h);

/**
 * @brief Build a histogram from raw values.
 * @param values Samples; taken by value because they are sorted in place.
 * @param opts Bucketing options.
 * @throws std::invalid_argument if opts.bin_count < 1.
 */
Histogram make_histogram(std::vector<double> values, const HistogramOptions& opts);

// Same as make_histogram(), with nanosecond values and duration formatting.
Histogram make_duration_histogram(const std::vector<Duration>& laps, const HistogramOptions& opts);

// "1.25ms", "830ns", "2s"; used by the histogram table and the CLI.
std::string format_duration(double nanoseconds);

} // namespace lapbench

#endif // LAPBENCH_HISTOGRAM_HPP
