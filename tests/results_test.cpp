#include <gtest/gtest.h>

#include "lapbench/results.hpp"
#include "scripted_clock.hpp"

#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using lapbench::Config;
using lapbench::Duration;
using lapbench::LapTimer;
using lapbench::RunOutcome;
using lapbench::Platform;
using lapbench::json;
using lapbench_test::ScriptedClock;

namespace {

LapTimer finished(std::vector<long long> readings) {
    const int count = static_cast<int>(readings.size()) - 1;
    ScriptedClock clock(std::move(readings));
    LapTimer timer(count, clock.clock());
    lapbench_test::drive(timer);
    return timer;
}

} // namespace

class ResultsTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<LapTimer> workers{finished({0, 10, 30}), finished({100, 105})};
        auto merged = lapbench::merge_timers(workers);
        ASSERT_TRUE(merged.has_value());
        outcome_ = std::make_unique<RunOutcome>(RunOutcome{std::move(workers), std::move(*merged)});

        platform_.os = "Linux 6.0";
        platform_.arch = "x86_64";
        platform_.hardware_threads = 8;
        platform_.compiler = "GCC test";
        platform_.cpp_standard = 201703L;
        platform_.steady_clock = true;
        platform_.clock.reads = 1000;
        platform_.clock.read_cost_ns = 25;
        platform_.clock.granularity_ns = 1;
    }

    std::unique_ptr<RunOutcome> outcome_;
    Platform platform_;
};

TEST_F(ResultsTest, SummarizePicksClampedHistogram) {
    Config conf;
    conf.bins = 4;
    conf.clamp_min = Duration{12};
    conf.clamp_max = Duration{40};

    const auto h = lapbench::summarize(conf, outcome_->merged);
    EXPECT_DOUBLE_EQ(h.minimum, 12.0);
    EXPECT_DOUBLE_EQ(h.options.clamp_maximum, 40.0);
    EXPECT_DOUBLE_EQ(h.options.clamp_percentile, 0.0);

    conf.clamp_min.reset();
    conf.clamp_max.reset();
    const auto plain = lapbench::summarize(conf, outcome_->merged);
    EXPECT_DOUBLE_EQ(plain.minimum, 5.0);
    EXPECT_EQ(plain.bins.size(), 4u);
}

TEST_F(ResultsTest, ReportShape) {
    Config conf;
    conf.bins = 3;
    conf.workers = 2;
    conf.laps = 2;

    const auto report = lapbench::make_report(conf, *outcome_, platform_);
    const json j = report.to_json();

    EXPECT_FALSE(j["metadata"]["timestamp"].get<std::string>().empty());
    EXPECT_EQ(j["metadata"]["platform"]["os"], "Linux 6.0");
    EXPECT_EQ(j["metadata"]["platform"]["hardware_threads"], 8);
    EXPECT_EQ(j["metadata"]["platform"]["cpp_standard"], 201703L);
    EXPECT_EQ(j["metadata"]["platform"]["clock"]["read_cost_ns"], 25);

    EXPECT_EQ(j["config"]["workload"], "spin");
    EXPECT_EQ(j["config"]["bins"], 3);
    EXPECT_FALSE(j["config"].contains("clamp_max_ns"));

    ASSERT_EQ(j["workers"].size(), 2u);
    EXPECT_EQ(j["workers"][0]["laps"], 2);
    EXPECT_EQ(j["workers"][0]["elapsed_ns"], 30);
    EXPECT_EQ(j["workers"][1]["start_ns"], 100);
    EXPECT_EQ(j["workers"][1]["stats"]["samples"], 1);

    EXPECT_EQ(j["merged"]["laps"], 3);
    EXPECT_EQ(j["merged"]["start_ns"], 0);
    EXPECT_EQ(j["merged"]["stop_ns"], 105);
    EXPECT_EQ(j["merged"]["elapsed_ns"], 105);
    EXPECT_EQ(j["merged"]["histogram"]["bins"].size(), 3u);
    EXPECT_DOUBLE_EQ(j["merged"]["histogram"]["max_ns"].get<double>(), 20.0);
    EXPECT_FALSE(j["merged"].contains("laps_ns"));
}

TEST_F(ResultsTest, DumpLaps) {
    Config conf;
    conf.dump_laps = true;

    const json j = lapbench::make_report(conf, *outcome_, platform_).to_json();
    EXPECT_EQ(j["merged"]["laps_ns"], json::array({10, 20, 5}));
}

TEST_F(ResultsTest, SaveWritesJson) {
    Config conf;
    const auto report = lapbench::make_report(conf, *outcome_, platform_);

    const std::string path = ::testing::TempDir() + "lapbench_results_test.json";
    report.save(path);

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    const json loaded = json::parse(in);
    EXPECT_EQ(loaded["merged"]["laps"], 3);
    std::remove(path.c_str());
}

TEST_F(ResultsTest, SaveToBadPathThrows) {
    Config conf;
    const auto report = lapbench::make_report(conf, *outcome_, platform_);
    EXPECT_THROW(report.save("/nonexistent-dir/for/sure/out.json"), std::runtime_error);
}
