#include "foresight/types.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace foresight {

const char* to_string(TradeAction action)
{
    switch (action) {
        case TradeAction::STRONG_SELL: return "STRONG_SELL";
        case TradeAction::SELL: return "SELL";
        case TradeAction::HOLD: return "HOLD";
        case TradeAction::BUY: return "BUY";
        case TradeAction::STRONG_BUY: return "STRONG_BUY";
        default: return "UNKNOWN";
    }
}

TradeAction parse_action(const std::string& text)
{
    if (text == "STRONG_SELL") return TradeAction::STRONG_SELL;
    if (text == "SELL") return TradeAction::SELL;
    if (text == "HOLD") return TradeAction::HOLD;
    if (text == "BUY") return TradeAction::BUY;
    if (text == "STRONG_BUY") return TradeAction::STRONG_BUY;
    throw std::invalid_argument("unknown trade action: " + text);
}

const char* to_string(PredictionState state)
{
    switch (state) {
        case PredictionState::CREATED: return "CREATED";
        case PredictionState::PENDING: return "PENDING";
        case PredictionState::EVALUATED: return "EVALUATED";
        case PredictionState::EXPIRED: return "EXPIRED";
        default: return "UNKNOWN";
    }
}

PredictionState parse_state(const std::string& text)
{
    if (text == "CREATED") return PredictionState::CREATED;
    if (text == "PENDING") return PredictionState::PENDING;
    if (text == "EVALUATED") return PredictionState::EVALUATED;
    if (text == "EXPIRED") return PredictionState::EXPIRED;
    throw std::invalid_argument("unknown prediction state: " + text);
}

void to_json(nlohmann::json& j, const Prediction& p)
{
    j = nlohmann::json{{"prediction_id", p.prediction_id},
                       {"symbol", p.symbol},
                       {"prediction_timestamp", format_utc(p.prediction_timestamp)},
                       {"prediction_timestamp_ns", to_epoch_ns(p.prediction_timestamp)},
                       {"created_at_ns", to_epoch_ns(p.created_at)},
                       {"time_bucket", p.time_bucket},
                       {"predicted_action", to_string(p.predicted_action)},
                       {"action_confidence", p.action_confidence},
                       {"predicted_magnitude", p.predicted_magnitude},
                       {"model_version", p.model_version},
                       {"feature_snapshot", p.feature_snapshot}};
    j["predicted_direction"] = p.predicted_direction ? nlohmann::json(*p.predicted_direction) : nlohmann::json();
}

void to_json(nlohmann::json& j, const Outcome& o)
{
    j = nlohmann::json{{"outcome_id", o.outcome_id},
                       {"prediction_id", o.prediction_id},
                       {"horizon_s", o.horizon.count()},
                       {"actual_return_pct", o.actual_return_pct},
                       {"actual_direction", o.actual_direction},
                       {"entry_price", o.entry_price},
                       {"exit_price", o.exit_price},
                       {"evaluation_timestamp", format_utc(o.evaluation_timestamp)}};
}

double compute_return_pct(double entry_price, double exit_price)
{
    if (!(entry_price > 0.0) || !std::isfinite(exit_price)) {
        throw std::invalid_argument("entry price must be positive and exit price finite");
    }
    return (exit_price - entry_price) / entry_price * 100.0;
}

int sign_of(double value)
{
    return (value > 0.0) - (value < 0.0);
}

int64_t time_bucket_of(Timestamp t, std::chrono::seconds bucket)
{
    const int64_t secs = to_epoch_seconds(t);
    const int64_t width = bucket.count() > 0 ? bucket.count() : 1;
    // Floor division so pre-epoch timestamps do not share bucket 0
    int64_t q = secs / width;
    if (secs % width != 0 && secs < 0) {
        --q;
    }
    return q;
}

std::string generate_id()
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10xx

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%012" PRIx64,
                  hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                  lo >> 48, lo & 0xFFFFFFFFFFFFULL);
    return buf;
}

}  // namespace foresight
