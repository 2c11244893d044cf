#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "foresight/cancellation.hpp"
#include "foresight/clock.hpp"
#include "foresight/config.hpp"
#include "foresight/guard/temporal_guard.hpp"
#include "foresight/ledger/prediction_ledger.hpp"
#include "foresight/model/model_registry.hpp"

namespace foresight {

/**
 * @brief Rows visible to one training run
 *
 * Every row has prediction_timestamp < cutoff. Rows are also dropped when
 * the audit quarantined them or their snapshot does not fit the schema.
 */
struct TrainingDataset {
    Timestamp cutoff{};
    FeatureSchema schema;
    std::vector<TrainingPair> rows;
    size_t excluded_quarantined = 0;
    size_t excluded_schema = 0;
};

/**
 * @brief Select the training rows from evaluated pairs
 *
 * @param pairs Evaluated (prediction, outcome) pairs, any order
 * @param cutoff Rows at or after the cutoff are never included
 * @param audit Report whose quarantined ids are excluded (may be null)
 * @param schema Schema to keep; defaults to the schema of the latest row before the cutoff
 */
TrainingDataset build_training_dataset(const std::vector<TrainingPair>& pairs, Timestamp cutoff,
                                       const AuditReport* audit,
                                       const std::optional<FeatureSchema>& schema = std::nullopt);

struct TrainingReport {
    std::string model_version;
    Timestamp started_at{};
    Timestamp finished_at{};
    Timestamp cutoff{};
    size_t training_rows = 0;
    size_t holdout_rows = 0;
    size_t excluded_quarantined = 0;
    size_t excluded_schema = 0;
    std::array<size_t, NUM_ACTIONS> class_counts{};
    std::array<size_t, 2> direction_counts{};  // down/flat, up
    HoldoutMetrics candidate_metrics;
    std::optional<HoldoutMetrics> incumbent_metrics;
    std::string incumbent_version;
    bool promoted = false;
    std::string reason;
};

void to_json(nlohmann::json& j, const TrainingReport& report);

enum class EstimatorRole : int8_t
{
    ACTION,
    DIRECTION,
    MAGNITUDE
};

/**
 * @brief Fits one estimator on a dense row-major matrix
 *
 * Must honor the cancellation token by throwing TrainingCancelledError.
 */
using EstimatorFitter = std::function<std::shared_ptr<const Estimator>(
    EstimatorRole role, const std::vector<float>& data, size_t nrow, size_t ncol, const std::vector<float>& labels,
    const CancellationToken* cancel)>;

// Fitter backed by XGBoostEstimator::train with the trainer's booster settings
EstimatorFitter xgboost_fitter(const TrainerConfig& config);

/**
 * @brief Builds, validates and promotes model bundles
 *
 * One run at a time per lock file: a second concurrent run fails with
 * TrainingInProgressError. The registry is only touched after the candidate
 * is fully trained, evaluated and written, so a cancelled or failed run
 * leaves the promoted bundle as it was.
 */
class ModelTrainer {
public:
    ModelTrainer(PredictionLedger& ledger, ModelRegistry& registry, const TemporalGuard& guard, const Clock& clock,
                 const PipelineConfig& config, EstimatorFitter fitter = nullptr);

    /**
     * @brief Train a candidate on rows before cutoff and validate it on
     * [cutoff, now)
     *
     * @param cutoff Defaults to now - holdout_window; later than now is rejected
     * @throws TrainingInProgressError when another run holds the lock
     * @throws TemporalIntegrityViolation when the audit has a critical violation
     * @throws InsufficientTrainingDataError when a class is below the sample floor
     * @throws TrainingCancelledError when cancelled before promotion
     */
    TrainingReport train(std::optional<Timestamp> cutoff = std::nullopt, const CancellationToken* cancel = nullptr);

private:
    HoldoutMetrics evaluate(const ModelBundle& bundle, const std::vector<TrainingPair>& holdout) const;

    // Empty when the candidate may replace the incumbent, otherwise the reason it may not
    std::string regression_reason(const HoldoutMetrics& candidate, const HoldoutMetrics& incumbent) const;

    PredictionLedger& ledger_;
    ModelRegistry& registry_;
    const TemporalGuard& guard_;
    const Clock& clock_;
    TemporalConfig temporal_;
    TrainerConfig config_;
    EngineConfig engine_;
    std::string lock_path_;
    EstimatorFitter fitter_;

    std::mutex run_mutex_;
};

}  // namespace foresight
