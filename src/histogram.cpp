#include "lapbench/histogram.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lapbench {

namespace {

// Widest bar drawn by Histogram::str().
constexpr int kBarWidth = 40;

/**
 * @brief Round a span to 1, 2, 5 or 10 times a power of ten.
 *
 * With round=true the closest nice number is picked, otherwise the
 * smallest nice number that is >= span.
 */
double nice_number(double span, bool round) {
    const double exponent = std::floor(std::log10(span));
    const double magnitude = std::pow(10.0, exponent);
    const double fraction = span / magnitude;

    double nice = 10.0;
    if (round) {
        if (fraction < 1.5)      nice = 1.0;
        else if (fraction < 3.0) nice = 2.0;
        else if (fraction < 7.0) nice = 5.0;
    } else {
        if (fraction <= 1.0)      nice = 1.0;
        else if (fraction <= 2.0) nice = 2.0;
        else if (fraction <= 5.0) nice = 5.0;
    }
    return nice * magnitude;
}

// sorted must be non-empty. p in [0,100].
double percentile_at(const std::vector<double>& sorted, double p) {
    std::size_t idx = static_cast<std::size_t>(static_cast<double>(sorted.size()) * p / 100.0);
    if (idx >= sorted.size()) idx = sorted.size() - 1;
    return sorted[idx];
}

std::string format_value(double v, bool durations) {
    if (durations) return format_duration(v);
    std::ostringstream os;
    os << std::setprecision(4) << v;
    return os.str();
}

} // namespace

std::string format_duration(double nanoseconds) {
    const double a = std::fabs(nanoseconds);

    std::ostringstream os;
    os << std::setprecision(3);
    if (a < 1e3) {
        os << nanoseconds << "ns";
    } else if (a < 1e6) {
        os << nanoseconds / 1e3 << "us";
    } else if (a < 1e9) {
        os << nanoseconds / 1e6 << "ms";
    } else {
        os << nanoseconds / 1e9 << "s";
    }
    return os.str();
}

Histogram make_histogram(std::vector<double> values, const HistogramOptions& opts) {
    if (opts.bin_count < 1) {
        throw std::invalid_argument("histogram bin count must be >= 1 (got " +
                                    std::to_string(opts.bin_count) + ")");
    }

    Histogram h;
    h.options = opts;
    h.bins.resize(static_cast<std::size_t>(opts.bin_count));
    if (values.empty()) return h;

    // ---- Summary ----
    std::sort(values.begin(), values.end());
    h.samples = values.size();
    h.minimum = values.front();
    h.maximum = values.back();

    double sum = 0.0;
    for (double v : values) sum += v;
    h.average = sum / static_cast<double>(values.size());

    h.p50   = percentile_at(values, 50.0);
    h.p90   = percentile_at(values, 90.0);
    h.p99   = percentile_at(values, 99.0);
    h.p999  = percentile_at(values, 99.9);
    h.p9999 = percentile_at(values, 99.99);

    if (opts.bin_count == 1) {
        h.bins[0].start = h.minimum;
        h.bins[0].count = values.size();
        h.bins[0].width = 1.0;
        return h;
    }

    // ---- Last bucket boundary ----
    double boundary = h.maximum;
    if (opts.clamp_percentile > 0.0) boundary = percentile_at(values, opts.clamp_percentile);
    if (opts.clamp_maximum > 0.0) boundary = opts.clamp_maximum;

    // ---- Spacing ----
    double first = h.minimum;
    double spacing = 1.0;
    const double span = boundary - h.minimum;
    if (span > 0.0) {
        if (opts.nice_range) {
            const double nice_span = nice_number(span, false);
            spacing = nice_number(nice_span / static_cast<double>(opts.bin_count - 1), true);
            first = std::floor(h.minimum / spacing) * spacing;
        } else {
            spacing = span / static_cast<double>(opts.bin_count);
        }
    }

    for (std::size_t i = 0; i < h.bins.size(); ++i) {
        h.bins[i].start = first + spacing * static_cast<double>(i);
    }

    // ---- Bucketing ----
    // Range checks stay in double: the quotient of a far outlier does not fit an integer.
    const std::size_t last = h.bins.size() - 1;
    for (double v : values) {
        const double pos = std::floor((v - first) / spacing);
        std::size_t k = 0;
        if (pos > static_cast<double>(last)) {
            k = last;
            h.bins[k].and_above = true;
        } else if (pos > 0.0) {
            k = static_cast<std::size_t>(pos);
        }
        h.bins[k].count++;
    }

    std::size_t fullest = 0;
    for (const auto& bin : h.bins) fullest = std::max(fullest, bin.count);
    for (auto& bin : h.bins) {
        bin.width = static_cast<double>(bin.count) / static_cast<double>(fullest);
    }

    return h;
}

Histogram make_duration_histogram(const std::vector<Duration>& laps, const HistogramOptions& opts) {
    std::vector<double> values;
    values.reserve(laps.size());
    for (const auto& lap : laps) {
        values.push_back(static_cast<double>(lap.count()));
    }

    Histogram h = make_histogram(std::move(values), opts);
    h.durations = true;
    return h;
}

std::string Histogram::str() const {
    std::ostringstream os;
    os << "  avg " << format_value(average, durations)
       << ";  min " << format_value(minimum, durations)
       << ";  p50 " << format_value(p50, durations)
       << ";  max " << format_value(maximum, durations) << ";\n";
    os << "  p90 " << format_value(p90, durations)
       << ";  p99 " << format_value(p99, durations)
       << ";  p999 " << format_value(p999, durations)
       << ";  p9999 " << format_value(p9999, durations) << ";\n";

    std::size_t count_width = 1;
    for (const auto& bin : bins) {
        count_width = std::max(count_width, std::to_string(bin.count).size());
    }

    for (const auto& bin : bins) {
        std::string label = format_value(bin.start, durations);
        if (bin.and_above) label += "+";

        const int bar = static_cast<int>(std::lround(bin.width * kBarWidth));
        os << std::setw(12) << label
           << " [" << std::setw(static_cast<int>(count_width)) << bin.count << "] "
           << std::string(static_cast<std::size_t>(bar), '#') << "\n";
    }
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Histogram& h) {
    return os << h.str();
}

} // namespace lapbench
