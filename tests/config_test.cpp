#include <gtest/gtest.h>

#include "lapbench/config.hpp"

#include <string>
#include <vector>

using lapbench::Config;
using lapbench::ConfigError;
using lapbench::Duration;

namespace {

Config parse(std::vector<std::string> args) {
    args.insert(args.begin(), "lapbench");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return lapbench::parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ConfigTest, Defaults) {
    const Config conf = parse({});
    EXPECT_EQ(conf.workload, "spin");
    EXPECT_EQ(conf.work, 1000);
    EXPECT_EQ(conf.laps, 1000);
    EXPECT_EQ(conf.workers, 1);
    EXPECT_EQ(conf.warmup, 10);
    EXPECT_EQ(conf.bins, 10);
    EXPECT_FALSE(conf.clamp_min.has_value());
    EXPECT_FALSE(conf.clamp_max.has_value());
    EXPECT_EQ(conf.out, "results.json");
    EXPECT_FALSE(conf.dump_laps);
    EXPECT_FALSE(conf.help);
}

TEST(ConfigTest, AllFlags) {
    const Config conf = parse({"--workload", "chase", "--work", "64", "--laps", "500",
                               "--workers", "4", "--warmup", "0", "--bins", "20",
                               "--clamp-min", "1us", "--clamp-max", "2ms",
                               "--out", "", "--seed", "7", "--dump-laps"});
    EXPECT_EQ(conf.workload, "chase");
    EXPECT_EQ(conf.work, 64);
    EXPECT_EQ(conf.laps, 500);
    EXPECT_EQ(conf.workers, 4);
    EXPECT_EQ(conf.warmup, 0);
    EXPECT_EQ(conf.bins, 20);
    EXPECT_EQ(conf.clamp_min, Duration{1000});
    EXPECT_EQ(conf.clamp_max, Duration{2000000});
    EXPECT_EQ(conf.out, "");
    EXPECT_EQ(conf.seed, 7);
    EXPECT_TRUE(conf.dump_laps);
}

TEST(ConfigTest, HelpStopsParsing) {
    const Config conf = parse({"--help", "--bogus"});
    EXPECT_TRUE(conf.help);
}

TEST(ConfigTest, RejectsBadInput) {
    EXPECT_THROW(parse({"--lapz", "10"}), ConfigError);
    EXPECT_THROW(parse({"--laps"}), ConfigError);
    EXPECT_THROW(parse({"--laps", "ten"}), ConfigError);
    EXPECT_THROW(parse({"--laps", "10x"}), ConfigError);
    EXPECT_THROW(parse({"--laps", "0"}), ConfigError);
    EXPECT_THROW(parse({"--workers", "0"}), ConfigError);
    EXPECT_THROW(parse({"--work", "0"}), ConfigError);
    EXPECT_THROW(parse({"--bins", "0"}), ConfigError);
    EXPECT_THROW(parse({"--warmup", "-1"}), ConfigError);
    EXPECT_THROW(parse({"--workload", "disk"}), ConfigError);
    EXPECT_THROW(parse({"--clamp-max", "soon"}), ConfigError);
}

TEST(ConfigTest, ClampRange) {
    EXPECT_THROW(parse({"--clamp-min", "1ms"}), ConfigError);
    EXPECT_THROW(parse({"--clamp-min", "2ms", "--clamp-max", "1ms"}), ConfigError);

    const Config conf = parse({"--clamp-max", "1ms"});
    EXPECT_FALSE(conf.clamp_min.has_value());
    EXPECT_EQ(conf.clamp_max, Duration{1000000});
}
