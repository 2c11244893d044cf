#include "foresight/engine/prediction_engine.hpp"

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace foresight {

namespace {

bool contradicts(TradeAction action, const std::optional<int>& direction)
{
    if (!direction) {
        return false;
    }
    bool bullish = action == TradeAction::BUY || action == TradeAction::STRONG_BUY;
    bool bearish = action == TradeAction::SELL || action == TradeAction::STRONG_SELL;
    return (bullish && *direction < 0) || (bearish && *direction > 0);
}

}  // namespace

PredictionEngine::PredictionEngine(PredictionLedger& ledger, const ModelRegistry& registry, const Clock& clock,
                                   const EngineConfig& config)
    : ledger_(ledger), registry_(registry), clock_(clock), config_(config)
{
}

Prediction PredictionEngine::predict(const std::string& symbol, const FeatureVector& features)
{
    auto logger = log::get();

    // One bundle for the whole call, even if a promotion lands meanwhile
    auto bundle = registry_.current();
    if (!bundle) {
        throw NoPromotedModelError("no model bundle has been promoted");
    }

    if (features.symbol != symbol) {
        throw FeatureSchemaError("feature snapshot is for " + features.symbol + ", not " + symbol);
    }

    for (const auto& fv : features.features) {
        if (fv.observed_at > features.collected_at) {
            throw TemporalIntegrityViolation("feature " + fv.name + " for " + symbol + " observed at " +
                                             format_utc(fv.observed_at) + ", after collection at " +
                                             format_utc(features.collected_at));
        }
    }

    std::vector<float> row = feature_row(features, bundle->schema);
    BundleInference inference = bundle->infer(row, 1, config_.direction_abstain_threshold).front();

    Prediction p;
    p.prediction_id = generate_id();
    p.symbol = symbol;
    p.prediction_timestamp = features.collected_at;
    p.created_at = clock_.now();
    p.time_bucket = time_bucket_of(p.prediction_timestamp, ledger_.temporal().time_bucket);
    p.predicted_action = inference.action;
    p.action_confidence = inference.action_confidence;
    p.predicted_direction = inference.direction;
    p.predicted_magnitude = inference.magnitude;
    p.feature_snapshot = features;
    p.model_version = bundle->version;

    if (contradicts(p.predicted_action, p.predicted_direction)) {
        logger->warn("{}: action {} contradicts predicted direction {:+d} (model {})", symbol,
                     to_string(p.predicted_action), *p.predicted_direction, bundle->version);
    }

    ledger_.append(p);

    logger->debug("{}: {} conf={:.3f} dir={} mag={:.3f}% model={} id={}", symbol, to_string(p.predicted_action),
                  p.action_confidence, p.predicted_direction ? std::to_string(*p.predicted_direction) : "abstain",
                  p.predicted_magnitude, p.model_version, p.prediction_id);
    return p;
}

}  // namespace foresight
