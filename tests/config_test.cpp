#include <gtest/gtest.h>

#include <fstream>

#include "foresight/config.hpp"
#include "foresight/errors.hpp"
#include "test_helpers.hpp"

using namespace foresight;
using namespace foresight::test;

namespace {

void write_file(const std::string& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
}

}  // namespace

TEST(ConfigTest, DefaultsAreValid)
{
    PipelineConfig config;
    EXPECT_NO_THROW(validate(config));
    EXPECT_EQ(config.temporal.min_eval_delay, hours(1));
    EXPECT_EQ(config.temporal.time_bucket, hours(24));
    EXPECT_EQ(config.temporal.holdout_window, hours(24 * 7));
    EXPECT_EQ(config.evaluator.horizons.size(), 3u);
}

TEST(ConfigTest, ReadsSecondsKeys)
{
    auto j = nlohmann::json::parse(R"({
        "database_path": "/tmp/ledger.db",
        "temporal": {"min_eval_delay_s": 7200, "creation_tolerance_s": 2},
        "evaluator": {"horizons_s": [3600, 14400], "max_concurrent_symbols": 8},
        "trainer": {"min_samples_per_class": 20},
        "labeling": {"buy_threshold_pct": 0.75, "strong_threshold_pct": 3.0},
        "engine": {"direction_abstain_threshold": 0.6}
    })");
    PipelineConfig config = config_from_json(j);

    EXPECT_EQ(config.database_path, "/tmp/ledger.db");
    EXPECT_EQ(config.temporal.min_eval_delay, seconds(7200));
    EXPECT_EQ(config.temporal.creation_tolerance, seconds(2));
    ASSERT_EQ(config.evaluator.horizons.size(), 2u);
    EXPECT_EQ(config.evaluator.horizons[1], seconds(14400));
    EXPECT_EQ(config.evaluator.max_concurrent_symbols, 8);
    EXPECT_EQ(config.trainer.min_samples_per_class, 20u);
    EXPECT_DOUBLE_EQ(config.trainer.labeling.buy_threshold_pct, 0.75);
    EXPECT_DOUBLE_EQ(config.engine.direction_abstain_threshold, 0.6);
    // Untouched sections keep their defaults
    EXPECT_EQ(config.temporal.time_bucket, seconds(86400));
}

TEST(ConfigTest, RejectsInvalidValues)
{
    EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"temporal": {"min_eval_delay_s": 0}})")), ConfigError);
    EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"evaluator": {"horizons_s": []}})")), ConfigError);
    EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"engine": {"direction_abstain_threshold": 0.3}})")),
                 ConfigError);
    EXPECT_THROW(
        config_from_json(nlohmann::json::parse(R"({"labeling": {"buy_threshold_pct": 2.0, "strong_threshold_pct": 1.0}})")),
        ConfigError);
}

TEST(ConfigTest, LookbackMustExceedHoldout)
{
    auto j = nlohmann::json::parse(R"({"temporal": {"holdout_window_s": 86400}, "trainer": {"training_lookback_s": 3600}})");
    EXPECT_THROW(config_from_json(j), ConfigError);
}

TEST(ConfigTest, AuditMustCoverExpiryWindow)
{
    auto short_audit = nlohmann::json::parse(R"({"evaluator": {"expire_after_s": 259200, "audit_lookback_s": 86400}})");
    EXPECT_THROW(config_from_json(short_audit), ConfigError);

    auto equal = nlohmann::json::parse(R"({"evaluator": {"expire_after_s": 259200, "audit_lookback_s": 259200}})");
    EXPECT_NO_THROW(config_from_json(equal));

    EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"evaluator": {"max_calls_in_flight": 0}})")), ConfigError);
}

TEST(ConfigTest, WrongTypeIsConfigError)
{
    EXPECT_THROW(config_from_json(nlohmann::json::parse(R"({"temporal": {"min_eval_delay_s": "an hour"}})")),
                 ConfigError);
}

TEST(ConfigTest, MissingFileUsesDefaults)
{
    TempDir dir;
    PipelineConfig config = load_config(dir.file("absent.json"));
    EXPECT_EQ(config.temporal.min_eval_delay, hours(1));
}

TEST(ConfigTest, MalformedFileIsConfigError)
{
    TempDir dir;
    write_file(dir.file("config.json"), "{ \"temporal\": ");
    EXPECT_THROW(load_config(dir.file("config.json")), ConfigError);
}

TEST(ConfigTest, LoadsFile)
{
    TempDir dir;
    write_file(dir.file("config.json"), R"({"models_dir": "/srv/models", "scheduler": {"train_interval_s": 3600}})");
    PipelineConfig config = load_config(dir.file("config.json"));
    EXPECT_EQ(config.models_dir, "/srv/models");
    EXPECT_EQ(config.scheduler.train_interval, seconds(3600));
}
