#include "foresight/trainer/model_trainer.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"
#ifdef HAVE_XGBOOST
#include "foresight/model/xgboost_estimator.hpp"
#endif
#include "foresight/trainer/labeling.hpp"

namespace fs = std::filesystem;

namespace foresight {

namespace {

/**
 * @brief Exclusive right to run training
 *
 * The mutex covers trainers sharing one process, the flock covers separate
 * processes (CLI runs, the serve loop).
 */
class TrainingLock {
public:
    TrainingLock(std::mutex& mutex, const std::string& path) : guard_(mutex, std::try_to_lock)
    {
        if (!guard_.owns_lock()) {
            throw TrainingInProgressError("a training run is already in progress");
        }

        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
        }

        fd_ = ::open(path.c_str(), O_CREAT | O_RDWR, 0644);
        if (fd_ < 0) {
            throw PipelineError("cannot open training lock " + path + ": " + std::strerror(errno));
        }
        if (::flock(fd_, LOCK_EX | LOCK_NB) < 0) {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            if (err == EWOULDBLOCK) {
                throw TrainingInProgressError("another training run holds " + path);
            }
            throw PipelineError("cannot lock " + path + ": " + std::strerror(err));
        }

        // Owner pid, for operators
        std::string pid = std::to_string(::getpid()) + "\n";
        if (::ftruncate(fd_, 0) != 0 || ::write(fd_, pid.data(), pid.size()) != static_cast<ssize_t>(pid.size())) {
            log::get()->debug("Could not record pid in {}", path);
        }
    }

    ~TrainingLock()
    {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    TrainingLock(const TrainingLock&) = delete;
    TrainingLock& operator=(const TrainingLock&) = delete;

private:
    std::unique_lock<std::mutex> guard_;
    int fd_ = -1;
};

// Removes a staging directory unless it was published
class StagingDir {
public:
    explicit StagingDir(std::string path) : path_(std::move(path))
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }

    ~StagingDir()
    {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
            if (ec) {
                log::get()->warn("Failed to remove staging directory {}: {}", path_, ec.message());
            }
        }
    }

    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const std::string& path() const { return path_; }

    // Move the contents to their final place; the directory is no longer ours to clean up
    void publish(const std::string& final_dir)
    {
        std::error_code ec;
        fs::create_directories(fs::path(final_dir).parent_path(), ec);
        fs::rename(path_, final_dir, ec);
        if (ec) {
            throw ModelError("cannot publish " + path_ + " to " + final_dir + ": " + ec.message());
        }
        path_.clear();
    }

private:
    std::string path_;
};

bool fits_schema(const FeatureVector& features, const FeatureSchema& schema)
{
    try {
        feature_row(features, schema);
        return true;
    } catch (const FeatureSchemaError&) {
        return false;
    }
}

bool quarantined(const TrainingPair& pair, const AuditReport* audit)
{
    return audit != nullptr && (audit->is_quarantined(pair.prediction.prediction_id) ||
                                audit->quarantined_outcome_ids.count(pair.outcome.outcome_id) > 0);
}

// Rows with from <= prediction_timestamp < to that pass the audit and fit the schema
std::vector<TrainingPair> select_rows(const std::vector<TrainingPair>& pairs, Timestamp from, Timestamp to,
                                      const AuditReport* audit, const FeatureSchema& schema,
                                      size_t* excluded_quarantined, size_t* excluded_schema)
{
    std::vector<TrainingPair> out;
    for (const auto& pair : pairs) {
        const Timestamp ts = pair.prediction.prediction_timestamp;
        if (ts < from || ts >= to) {
            continue;
        }
        if (quarantined(pair, audit)) {
            if (excluded_quarantined) ++*excluded_quarantined;
            continue;
        }
        if (!fits_schema(pair.prediction.feature_snapshot, schema)) {
            if (excluded_schema) ++*excluded_schema;
            continue;
        }
        out.push_back(pair);
    }
    std::sort(out.begin(), out.end(), [](const TrainingPair& a, const TrainingPair& b) {
        return a.prediction.prediction_timestamp < b.prediction.prediction_timestamp;
    });
    return out;
}

std::vector<float> feature_matrix(const std::vector<TrainingPair>& rows, const FeatureSchema& schema)
{
    std::vector<float> data;
    data.reserve(rows.size() * schema.size());
    for (const auto& row : rows) {
        auto values = feature_row(row.prediction.feature_snapshot, schema);
        data.insert(data.end(), values.begin(), values.end());
    }
    return data;
}

}  // namespace

TrainingDataset build_training_dataset(const std::vector<TrainingPair>& pairs, Timestamp cutoff,
                                       const AuditReport* audit, const std::optional<FeatureSchema>& schema)
{
    TrainingDataset dataset;
    dataset.cutoff = cutoff;

    if (schema) {
        dataset.schema = *schema;
    } else {
        const TrainingPair* latest = nullptr;
        for (const auto& pair : pairs) {
            if (pair.prediction.prediction_timestamp >= cutoff || quarantined(pair, audit)) {
                continue;
            }
            if (!latest || pair.prediction.prediction_timestamp > latest->prediction.prediction_timestamp) {
                latest = &pair;
            }
        }
        if (!latest) {
            return dataset;
        }
        dataset.schema = schema_of(latest->prediction.feature_snapshot);
    }

    dataset.rows = select_rows(pairs, Timestamp::min(), cutoff, audit, dataset.schema,
                               &dataset.excluded_quarantined, &dataset.excluded_schema);
    return dataset;
}

void to_json(nlohmann::json& j, const TrainingReport& report)
{
    nlohmann::json classes = nlohmann::json::object();
    for (size_t c = 0; c < NUM_ACTIONS; ++c) {
        classes[to_string(static_cast<TradeAction>(c))] = report.class_counts[c];
    }
    j = nlohmann::json{{"model_version", report.model_version},
                       {"started_at", format_utc(report.started_at)},
                       {"finished_at", format_utc(report.finished_at)},
                       {"cutoff", format_utc(report.cutoff)},
                       {"training_rows", report.training_rows},
                       {"holdout_rows", report.holdout_rows},
                       {"excluded_quarantined", report.excluded_quarantined},
                       {"excluded_schema", report.excluded_schema},
                       {"class_counts", classes},
                       {"direction_counts", {{"down", report.direction_counts[0]}, {"up", report.direction_counts[1]}}},
                       {"candidate_metrics", report.candidate_metrics},
                       {"incumbent_version", report.incumbent_version},
                       {"promoted", report.promoted},
                       {"reason", report.reason}};
    j["incumbent_metrics"] = report.incumbent_metrics ? nlohmann::json(*report.incumbent_metrics) : nlohmann::json();
}

EstimatorFitter xgboost_fitter(const TrainerConfig& config)
{
#ifdef HAVE_XGBOOST
    return [config](EstimatorRole role, const std::vector<float>& data, size_t nrow, size_t ncol,
                    const std::vector<float>& labels,
                    const CancellationToken* cancel) -> std::shared_ptr<const Estimator> {
        BoosterParams params;
        params.max_depth = config.max_depth;
        params.learning_rate = config.learning_rate;
        params.num_boost_rounds = config.num_boost_rounds;
        params.nthread = config.nthread;
        switch (role) {
            case EstimatorRole::ACTION:
                params.objective = "multi:softprob";
                params.num_class = static_cast<int>(NUM_ACTIONS);
                break;
            case EstimatorRole::DIRECTION:
                params.objective = "binary:logistic";
                break;
            case EstimatorRole::MAGNITUDE:
                params.objective = "reg:squarederror";
                break;
        }
        return std::make_shared<XGBoostEstimator>(XGBoostEstimator::train(data, nrow, ncol, labels, params, cancel));
    };
#else
    (void)config;
    return [](EstimatorRole, const std::vector<float>&, size_t, size_t, const std::vector<float>&,
              const CancellationToken*) -> std::shared_ptr<const Estimator> {
        throw ModelError("built without XGBoost, cannot fit estimators");
    };
#endif
}

ModelTrainer::ModelTrainer(PredictionLedger& ledger, ModelRegistry& registry, const TemporalGuard& guard,
                           const Clock& clock, const PipelineConfig& config, EstimatorFitter fitter)
    : ledger_(ledger),
      registry_(registry),
      guard_(guard),
      clock_(clock),
      temporal_(config.temporal),
      config_(config.trainer),
      engine_(config.engine),
      lock_path_(config.training_lock_path),
      fitter_(fitter ? std::move(fitter) : xgboost_fitter(config.trainer))
{
}

TrainingReport ModelTrainer::train(std::optional<Timestamp> cutoff_arg, const CancellationToken* cancel)
{
    auto logger = log::get();
    TrainingLock lock(run_mutex_, lock_path_);

    TrainingReport report;
    report.started_at = clock_.now();
    const Timestamp now = report.started_at;
    const Timestamp cutoff = cutoff_arg ? *cutoff_arg : now - temporal_.holdout_window;
    if (cutoff > now) {
        throw std::invalid_argument("training cutoff " + format_utc(cutoff) + " is later than now " + format_utc(now));
    }
    report.cutoff = cutoff;

    auto check_cancel = [&](const std::string& stage) {
        if (is_cancelled(cancel)) {
            throw TrainingCancelledError("training cancelled " + stage);
        }
    };

    // Open-ended audit window so future-dated rows are caught too
    const Timestamp from = cutoff - config_.training_lookback;
    AuditReport audit = guard_.audit(ledger_, from, Timestamp::max());
    require_no_critical(audit, "training");

    auto pairs = ledger_.evaluated_pairs(from, now, config_.label_horizon);
    TrainingDataset dataset = build_training_dataset(pairs, cutoff, &audit);
    auto holdout = select_rows(pairs, cutoff, now, &audit, dataset.schema, &report.excluded_quarantined,
                               &report.excluded_schema);

    report.training_rows = dataset.rows.size();
    report.holdout_rows = holdout.size();
    report.excluded_quarantined += dataset.excluded_quarantined;
    report.excluded_schema += dataset.excluded_schema;

    const auto& labeling = config_.labeling;
    std::vector<float> action_labels;
    std::vector<float> direction_labels;
    std::vector<float> magnitude_labels;
    for (const auto& row : dataset.rows) {
        double ret = row.outcome.actual_return_pct;
        auto action = label_action(ret, row.prediction.action_confidence, labeling);
        int up = label_direction(ret);
        ++report.class_counts[static_cast<size_t>(action)];
        ++report.direction_counts[static_cast<size_t>(up)];
        action_labels.push_back(static_cast<float>(action));
        direction_labels.push_back(static_cast<float>(up));
        magnitude_labels.push_back(static_cast<float>(ret));
    }

    std::string short_classes;
    for (size_t c = 0; c < NUM_ACTIONS; ++c) {
        if (report.class_counts[c] < config_.min_samples_per_class) {
            short_classes += std::string(short_classes.empty() ? "" : ", ") + to_string(static_cast<TradeAction>(c)) +
                             "=" + std::to_string(report.class_counts[c]);
        }
    }
    if (report.direction_counts[0] < config_.min_samples_per_class ||
        report.direction_counts[1] < config_.min_samples_per_class) {
        short_classes += std::string(short_classes.empty() ? "" : ", ") + "direction down=" +
                         std::to_string(report.direction_counts[0]) + "/up=" + std::to_string(report.direction_counts[1]);
    }
    if (!short_classes.empty()) {
        throw InsufficientTrainingDataError("insufficient training data before " + format_utc(cutoff) + " (" +
                                            std::to_string(dataset.rows.size()) + " rows, need " +
                                            std::to_string(config_.min_samples_per_class) +
                                            " per class): " + short_classes);
    }

    logger->info("Training on {} rows before {} (schema {}), {} holdout rows", dataset.rows.size(),
                 format_utc(cutoff), dataset.schema.version, holdout.size());

    const size_t nrow = dataset.rows.size();
    const size_t ncol = dataset.schema.size();
    const std::vector<float> data = feature_matrix(dataset.rows, dataset.schema);

    auto bundle = std::make_shared<ModelBundle>();
    bundle->version = "fs-" + format_utc_compact(now) + "-" + generate_id().substr(0, 8);
    bundle->schema = dataset.schema;
    bundle->created_at = now;
    bundle->train_from = dataset.rows.front().prediction.prediction_timestamp;
    bundle->train_to = dataset.rows.back().prediction.prediction_timestamp;
    bundle->cutoff = cutoff;
    report.model_version = bundle->version;

    check_cancel("before fitting");
    bundle->action_model = fitter_(EstimatorRole::ACTION, data, nrow, ncol, action_labels, cancel);
    check_cancel("after the action classifier");
    bundle->direction_model = fitter_(EstimatorRole::DIRECTION, data, nrow, ncol, direction_labels, cancel);
    check_cancel("after the direction classifier");
    bundle->magnitude_model = fitter_(EstimatorRole::MAGNITUDE, data, nrow, ncol, magnitude_labels, cancel);
    check_cancel("after the magnitude regressor");

    bundle->holdout = evaluate(*bundle, holdout);
    report.candidate_metrics = bundle->holdout;

    auto incumbent = registry_.current();
    if (holdout.size() < config_.min_holdout_rows) {
        report.reason = "holdout has " + std::to_string(holdout.size()) + " rows, need " +
                        std::to_string(config_.min_holdout_rows);
    } else if (incumbent) {
        report.incumbent_version = incumbent->version;
        // Same schema: score the incumbent on this holdout; otherwise its recorded report
        report.incumbent_metrics = incumbent->schema == bundle->schema ? evaluate(*incumbent, holdout)
                                                                       : incumbent->holdout;
        report.reason = regression_reason(report.candidate_metrics, *report.incumbent_metrics);
    }
    report.promoted = report.reason.empty();

    check_cancel("before publishing");

    StagingDir staging(registry_.staging_dir(bundle->version));
    save_bundle(*bundle, staging.path());
    const std::string final_dir = registry_.artifact_dir(bundle->version);
    staging.publish(final_dir);
    bundle->artifact_dir = final_dir;

    if (report.promoted) {
        report.reason = incumbent ? "no regression against " + incumbent->version : "first promoted bundle";
        registry_.promote(bundle);
    } else {
        registry_.record_rejected(*bundle, report.reason);
        logger->warn("Model bundle {} not promoted: {}", bundle->version, report.reason);
    }

    report.finished_at = clock_.now();
    logger->info("Training done: {} action_acc={:.3f} dir_acc={:.3f} cov={:.3f} mae={:.3f} promoted={}",
                 bundle->version, report.candidate_metrics.action_accuracy,
                 report.candidate_metrics.direction_accuracy, report.candidate_metrics.direction_coverage,
                 report.candidate_metrics.magnitude_mae, report.promoted);
    return report;
}

HoldoutMetrics ModelTrainer::evaluate(const ModelBundle& bundle, const std::vector<TrainingPair>& holdout) const
{
    HoldoutMetrics m;
    m.rows = holdout.size();
    if (holdout.empty()) {
        return m;
    }

    auto inferences = bundle.infer(feature_matrix(holdout, bundle.schema), holdout.size(),
                                   engine_.direction_abstain_threshold);

    size_t action_hits = 0;
    size_t covered = 0;
    size_t direction_hits = 0;
    double abs_error = 0.0;
    for (size_t i = 0; i < holdout.size(); ++i) {
        const auto& row = holdout[i];
        const auto& inf = inferences[i];
        double ret = row.outcome.actual_return_pct;

        if (inf.action == label_action(ret, row.prediction.action_confidence, config_.labeling)) {
            ++action_hits;
        }
        if (inf.direction) {
            ++covered;
            if ((*inf.direction > 0 ? 1 : 0) == label_direction(ret)) {
                ++direction_hits;
            }
        }
        abs_error += std::fabs(inf.magnitude - ret);
    }

    m.action_accuracy = static_cast<double>(action_hits) / m.rows;
    m.direction_coverage = static_cast<double>(covered) / m.rows;
    m.direction_accuracy = covered ? static_cast<double>(direction_hits) / covered : 0.0;
    m.magnitude_mae = abs_error / m.rows;
    return m;
}

std::string ModelTrainer::regression_reason(const HoldoutMetrics& candidate, const HoldoutMetrics& incumbent) const
{
    const double tol = config_.max_accuracy_regression;
    if (candidate.action_accuracy < incumbent.action_accuracy - tol) {
        return "action accuracy " + std::to_string(candidate.action_accuracy) + " regressed from " +
               std::to_string(incumbent.action_accuracy);
    }
    if (candidate.direction_accuracy < incumbent.direction_accuracy - tol) {
        return "direction accuracy " + std::to_string(candidate.direction_accuracy) + " regressed from " +
               std::to_string(incumbent.direction_accuracy);
    }
    if (candidate.magnitude_mae > incumbent.magnitude_mae * (1.0 + config_.max_mae_regression)) {
        return "magnitude MAE " + std::to_string(candidate.magnitude_mae) + " regressed from " +
               std::to_string(incumbent.magnitude_mae);
    }
    return {};
}

}  // namespace foresight
