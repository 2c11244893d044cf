#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "foresight/feature_vector.hpp"
#include "foresight/model/estimator.hpp"
#include "foresight/types.hpp"

namespace foresight {

/**
 * @brief Holdout performance of a bundle on pairs it was never fitted on
 */
struct HoldoutMetrics {
    size_t rows = 0;
    double action_accuracy = 0.0;
    double direction_accuracy = 0.0;  // over rows where the direction model did not abstain
    double direction_coverage = 0.0;  // share of rows with a direction call
    double magnitude_mae = 0.0;       // percentage points
};

void to_json(nlohmann::json& j, const HoldoutMetrics& m);
void from_json(const nlohmann::json& j, HoldoutMetrics& m);

struct BundleInference {
    TradeAction action = TradeAction::HOLD;
    double action_confidence = 0.0;
    std::array<float, NUM_ACTIONS> action_probabilities{};
    double up_probability = 0.5;
    std::optional<int> direction;
    double magnitude = 0.0;
};

/**
 * @brief Versioned set of the three fitted estimators
 *
 * Immutable once built and always handled through
 * std::shared_ptr<const ModelBundle>, so a reader holding a bundle sees one
 * consistent version for the whole call.
 */
struct ModelBundle {
    std::string version;
    FeatureSchema schema;
    std::shared_ptr<const Estimator> action_model;
    std::shared_ptr<const Estimator> direction_model;
    std::shared_ptr<const Estimator> magnitude_model;

    Timestamp created_at{};
    Timestamp train_from{};
    Timestamp train_to{};
    Timestamp cutoff{};
    HoldoutMetrics holdout;
    std::string artifact_dir;

    /**
     * @brief Run all three estimators on a row-major matrix in schema order
     *
     * The direction is left empty when max(p, 1 - p) is below
     * abstain_threshold.
     *
     * @throws ModelError when an estimator fails or returns an unexpected shape
     */
    std::vector<BundleInference> infer(const std::vector<float>& rows, size_t nrow,
                                       double abstain_threshold) const;
};

/**
 * @brief Feature values of a snapshot in schema column order
 *
 * @throws FeatureSchemaError on a schema version mismatch, missing, extra or
 *         duplicate names, or non-finite values
 */
std::vector<float> feature_row(const FeatureVector& features, const FeatureSchema& schema);

// Bundle description written next to the estimator files
nlohmann::json manifest_of(const ModelBundle& bundle);

/**
 * @brief Write the estimators and manifest.json into dir
 *
 * Files: action.ubj, direction.ubj, magnitude.ubj, manifest.json
 */
void save_bundle(const ModelBundle& bundle, const std::string& dir);

// Inverse of save_bundle; throws ModelError
std::shared_ptr<const ModelBundle> load_bundle(const std::string& dir);

}  // namespace foresight
