#pragma once

#include <string>

#include "foresight/clock.hpp"
#include "foresight/config.hpp"
#include "foresight/ledger/prediction_ledger.hpp"
#include "foresight/model/model_registry.hpp"

namespace foresight {

/**
 * @brief Turns a feature snapshot into a recorded Prediction
 *
 * Reads the promoted bundle once per call and runs all three estimators from
 * that bundle. Inference touches no shared mutable state, so calls for
 * different symbols may run concurrently; concurrent calls for the same
 * (symbol, time bucket) are serialized by the ledger's unique constraint.
 */
class PredictionEngine {
public:
    PredictionEngine(PredictionLedger& ledger, const ModelRegistry& registry, const Clock& clock,
                     const EngineConfig& config);

    /**
     * @brief Predict and append to the ledger
     *
     * prediction_timestamp is the snapshot's collected_at; created_at is the
     * clock's current time.
     *
     * @throws NoPromotedModelError when no bundle has been promoted
     * @throws FeatureSchemaError when the snapshot does not match the bundle schema
     * @throws TemporalIntegrityViolation when a value was observed after
     *         collected_at or the snapshot is not current
     * @throws DuplicatePredictionError when the bucket was already predicted
     */
    Prediction predict(const std::string& symbol, const FeatureVector& features);

private:
    PredictionLedger& ledger_;
    const ModelRegistry& registry_;
    const Clock& clock_;
    EngineConfig config_;
};

}  // namespace foresight
