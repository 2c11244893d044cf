#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace foresight {

using std::chrono::seconds;

struct TemporalConfig {
    seconds min_eval_delay{3600};
    seconds creation_tolerance{5};
    seconds time_bucket{86400};        // one prediction per symbol per day
    seconds holdout_window{7 * 86400};
    seconds future_skew_tolerance{0};
};

struct EvaluatorConfig {
    std::vector<seconds> horizons{seconds(3600), seconds(4 * 3600), seconds(86400)};
    seconds expire_after{72 * 3600};
    int max_attempts = 3;
    int initial_backoff_ms = 200;
    double backoff_multiplier = 2.0;
    int call_timeout_ms = 5000;        // 0 = call the market data source inline
    int symbol_timeout_ms = 30000;
    int max_concurrent_symbols = 4;
    int max_calls_in_flight = 16;      // timed calls, including ones that outlived their timeout
    seconds audit_lookback{30 * 86400};
    size_t batch_limit = 500;
};

// Training-time labeling policy; thresholds are configuration, not contract
struct LabelingConfig {
    double buy_threshold_pct = 0.5;
    double strong_threshold_pct = 2.0;
    double strong_min_confidence = 0.0;
};

struct TrainerConfig {
    seconds label_horizon{4 * 3600};
    seconds training_lookback{365 * 86400};
    size_t min_samples_per_class = 3;
    size_t min_holdout_rows = 5;
    double max_accuracy_regression = 0.02;
    double max_mae_regression = 0.10;
    int num_boost_rounds = 50;
    int max_depth = 4;
    double learning_rate = 0.1;
    int nthread = 0;
    LabelingConfig labeling;
};

struct EngineConfig {
    // Below this top-class probability the direction model abstains
    double direction_abstain_threshold = 0.55;
};

struct MarketDataConfig {
    std::string csv_path = "data/prices.csv";
    seconds max_staleness{300};
};

struct SchedulerConfig {
    seconds evaluate_interval{900};
    seconds train_interval{86400};
};

struct PipelineConfig {
    std::string database_path = "data/foresight.db";
    std::string models_dir = "models";
    std::string training_lock_path = "models/.train.lock";
    std::string log_file = "logs/foresight.log";
    std::string log_level = "info";

    TemporalConfig temporal;
    EvaluatorConfig evaluator;
    TrainerConfig trainer;
    EngineConfig engine;
    MarketDataConfig market_data;
    SchedulerConfig scheduler;
};

/**
 * @brief Load configuration from a JSON file
 *
 * A missing file yields defaults. Unparsable JSON or invalid values throw
 * ConfigError.
 */
PipelineConfig load_config(const std::string& path);

PipelineConfig config_from_json(const nlohmann::json& j);

// Throws ConfigError on the first invalid value
void validate(const PipelineConfig& config);

}  // namespace foresight
