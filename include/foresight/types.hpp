#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "foresight/feature_vector.hpp"

namespace foresight {

/**
 * @brief Action classes, in estimator class-index order
 */
enum class TradeAction : int8_t
{
    STRONG_SELL = 0,
    SELL = 1,
    HOLD = 2,
    BUY = 3,
    STRONG_BUY = 4
};

constexpr size_t NUM_ACTIONS = 5;

const char* to_string(TradeAction action);
TradeAction parse_action(const std::string& text);

/**
 * @brief Lifecycle of a prediction. Only PENDING -> EVALUATED and
 * PENDING -> EXPIRED are legal transitions; CREATED exists only in memory
 * between construction and the ledger append.
 */
enum class PredictionState : int8_t
{
    CREATED,
    PENDING,
    EVALUATED,
    EXPIRED
};

const char* to_string(PredictionState state);
PredictionState parse_state(const std::string& text);

struct Prediction {
    std::string prediction_id;
    std::string symbol;
    Timestamp prediction_timestamp{};
    Timestamp created_at{};
    int64_t time_bucket = 0;
    TradeAction predicted_action = TradeAction::HOLD;
    double action_confidence = 0.0;
    std::optional<int> predicted_direction;  // +1 / -1, empty when the direction model abstains
    double predicted_magnitude = 0.0;        // signed expected return in percent
    FeatureVector feature_snapshot;
    std::string model_version;
};

struct Outcome {
    std::string outcome_id;
    std::string prediction_id;
    std::chrono::seconds horizon{0};
    double actual_return_pct = 0.0;
    int actual_direction = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    Timestamp evaluation_timestamp{};
};

struct TrainingPair {
    Prediction prediction;
    Outcome outcome;
};

void to_json(nlohmann::json& j, const Prediction& p);
void to_json(nlohmann::json& j, const Outcome& o);

// Percentage return, 100 -> 105 gives 5.0
double compute_return_pct(double entry_price, double exit_price);

int sign_of(double value);

int64_t time_bucket_of(Timestamp t, std::chrono::seconds bucket);

// Random RFC 4122 version 4 identifier
std::string generate_id();

}  // namespace foresight
