#include "foresight/config.hpp"

#include <fstream>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace foresight {

namespace {

void read_seconds(const nlohmann::json& j, const char* key, seconds& out)
{
    if (j.contains(key)) {
        out = seconds(j[key].get<int64_t>());
    }
}

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out)
{
    if (j.contains(key)) {
        out = j[key].get<T>();
    }
}

}  // namespace

PipelineConfig config_from_json(const nlohmann::json& j)
{
    PipelineConfig config;

    try {
        read_value(j, "database_path", config.database_path);
        read_value(j, "models_dir", config.models_dir);
        read_value(j, "training_lock_path", config.training_lock_path);
        read_value(j, "log_file", config.log_file);
        read_value(j, "log_level", config.log_level);

        if (j.contains("temporal")) {
            auto& t = j["temporal"];
            read_seconds(t, "min_eval_delay_s", config.temporal.min_eval_delay);
            read_seconds(t, "creation_tolerance_s", config.temporal.creation_tolerance);
            read_seconds(t, "time_bucket_s", config.temporal.time_bucket);
            read_seconds(t, "holdout_window_s", config.temporal.holdout_window);
            read_seconds(t, "future_skew_tolerance_s", config.temporal.future_skew_tolerance);
        }

        if (j.contains("evaluator")) {
            auto& e = j["evaluator"];
            if (e.contains("horizons_s")) {
                config.evaluator.horizons.clear();
                for (auto h : e["horizons_s"].get<std::vector<int64_t>>()) {
                    config.evaluator.horizons.emplace_back(h);
                }
            }
            read_seconds(e, "expire_after_s", config.evaluator.expire_after);
            read_value(e, "max_attempts", config.evaluator.max_attempts);
            read_value(e, "initial_backoff_ms", config.evaluator.initial_backoff_ms);
            read_value(e, "backoff_multiplier", config.evaluator.backoff_multiplier);
            read_value(e, "call_timeout_ms", config.evaluator.call_timeout_ms);
            read_value(e, "symbol_timeout_ms", config.evaluator.symbol_timeout_ms);
            read_value(e, "max_concurrent_symbols", config.evaluator.max_concurrent_symbols);
            read_value(e, "max_calls_in_flight", config.evaluator.max_calls_in_flight);
            read_seconds(e, "audit_lookback_s", config.evaluator.audit_lookback);
            read_value(e, "batch_limit", config.evaluator.batch_limit);
        }

        if (j.contains("trainer")) {
            auto& t = j["trainer"];
            read_seconds(t, "label_horizon_s", config.trainer.label_horizon);
            read_seconds(t, "training_lookback_s", config.trainer.training_lookback);
            read_value(t, "min_samples_per_class", config.trainer.min_samples_per_class);
            read_value(t, "min_holdout_rows", config.trainer.min_holdout_rows);
            read_value(t, "max_accuracy_regression", config.trainer.max_accuracy_regression);
            read_value(t, "max_mae_regression", config.trainer.max_mae_regression);
            read_value(t, "num_boost_rounds", config.trainer.num_boost_rounds);
            read_value(t, "max_depth", config.trainer.max_depth);
            read_value(t, "learning_rate", config.trainer.learning_rate);
            read_value(t, "nthread", config.trainer.nthread);
        }

        if (j.contains("labeling")) {
            auto& l = j["labeling"];
            read_value(l, "buy_threshold_pct", config.trainer.labeling.buy_threshold_pct);
            read_value(l, "strong_threshold_pct", config.trainer.labeling.strong_threshold_pct);
            read_value(l, "strong_min_confidence", config.trainer.labeling.strong_min_confidence);
        }

        if (j.contains("engine")) {
            read_value(j["engine"], "direction_abstain_threshold", config.engine.direction_abstain_threshold);
        }

        if (j.contains("market_data")) {
            auto& m = j["market_data"];
            read_value(m, "csv_path", config.market_data.csv_path);
            read_seconds(m, "max_staleness_s", config.market_data.max_staleness);
        }

        if (j.contains("scheduler")) {
            auto& s = j["scheduler"];
            read_seconds(s, "evaluate_interval_s", config.scheduler.evaluate_interval);
            read_seconds(s, "train_interval_s", config.scheduler.train_interval);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    validate(config);
    return config;
}

PipelineConfig load_config(const std::string& path)
{
    auto logger = log::get();

    std::ifstream config_stream(path);
    if (!config_stream.is_open()) {
        logger->info("Config file {} not found, using defaults", path);
        PipelineConfig config;
        validate(config);
        return config;
    }

    nlohmann::json config_json;
    try {
        config_stream >> config_json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("failed to parse config file " + path + ": " + e.what());
    }

    PipelineConfig config = config_from_json(config_json);
    logger->info("Loaded config from {}", path);
    return config;
}

void validate(const PipelineConfig& config)
{
    const auto& t = config.temporal;
    if (t.min_eval_delay.count() <= 0) throw ConfigError("temporal.min_eval_delay_s must be positive");
    if (t.creation_tolerance.count() < 0) throw ConfigError("temporal.creation_tolerance_s must not be negative");
    if (t.time_bucket.count() <= 0) throw ConfigError("temporal.time_bucket_s must be positive");
    if (t.holdout_window.count() <= 0) throw ConfigError("temporal.holdout_window_s must be positive");
    if (t.future_skew_tolerance.count() < 0) throw ConfigError("temporal.future_skew_tolerance_s must not be negative");

    const auto& e = config.evaluator;
    if (e.horizons.empty()) throw ConfigError("evaluator.horizons_s must list at least one horizon");
    for (auto h : e.horizons) {
        if (h.count() <= 0) throw ConfigError("evaluator.horizons_s entries must be positive");
    }
    if (e.expire_after.count() <= 0) throw ConfigError("evaluator.expire_after_s must be positive");
    if (e.max_attempts < 1) throw ConfigError("evaluator.max_attempts must be at least 1");
    if (e.initial_backoff_ms < 0) throw ConfigError("evaluator.initial_backoff_ms must not be negative");
    if (e.backoff_multiplier < 1.0) throw ConfigError("evaluator.backoff_multiplier must be >= 1");
    if (e.call_timeout_ms < 0) throw ConfigError("evaluator.call_timeout_ms must not be negative");
    if (e.symbol_timeout_ms <= 0) throw ConfigError("evaluator.symbol_timeout_ms must be positive");
    if (e.max_concurrent_symbols < 1) throw ConfigError("evaluator.max_concurrent_symbols must be at least 1");
    if (e.max_calls_in_flight < 1) throw ConfigError("evaluator.max_calls_in_flight must be at least 1");
    if (e.audit_lookback < e.expire_after) {
        throw ConfigError("evaluator.audit_lookback_s must be at least evaluator.expire_after_s");
    }
    if (e.batch_limit == 0) throw ConfigError("evaluator.batch_limit must be positive");

    const auto& tr = config.trainer;
    if (tr.label_horizon.count() <= 0) throw ConfigError("trainer.label_horizon_s must be positive");
    if (tr.training_lookback <= t.holdout_window) {
        throw ConfigError("trainer.training_lookback_s must exceed temporal.holdout_window_s");
    }
    if (tr.min_samples_per_class == 0) throw ConfigError("trainer.min_samples_per_class must be positive");
    if (tr.max_accuracy_regression < 0.0 || tr.max_mae_regression < 0.0) {
        throw ConfigError("trainer regression tolerances must not be negative");
    }
    if (tr.num_boost_rounds < 1) throw ConfigError("trainer.num_boost_rounds must be at least 1");
    if (tr.max_depth < 1) throw ConfigError("trainer.max_depth must be at least 1");
    if (tr.learning_rate <= 0.0) throw ConfigError("trainer.learning_rate must be positive");

    const auto& l = tr.labeling;
    if (l.buy_threshold_pct <= 0.0) throw ConfigError("labeling.buy_threshold_pct must be positive");
    if (l.strong_threshold_pct <= l.buy_threshold_pct) {
        throw ConfigError("labeling.strong_threshold_pct must exceed labeling.buy_threshold_pct");
    }
    if (l.strong_min_confidence < 0.0 || l.strong_min_confidence > 1.0) {
        throw ConfigError("labeling.strong_min_confidence must be within [0, 1]");
    }

    if (config.engine.direction_abstain_threshold < 0.5 || config.engine.direction_abstain_threshold > 1.0) {
        throw ConfigError("engine.direction_abstain_threshold must be within [0.5, 1]");
    }
    if (config.market_data.max_staleness.count() < 0) {
        throw ConfigError("market_data.max_staleness_s must not be negative");
    }
    if (config.scheduler.evaluate_interval.count() <= 0 || config.scheduler.train_interval.count() <= 0) {
        throw ConfigError("scheduler intervals must be positive");
    }
}

}  // namespace foresight
