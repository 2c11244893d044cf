#pragma once

// Shared fixtures for the foresight test suite: scratch directories, a
// fixed time line, feature snapshots and scripted estimators.

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "foresight/config.hpp"
#include "foresight/errors.hpp"
#include "foresight/feature_vector.hpp"
#include "foresight/model/estimator.hpp"
#include "foresight/model/model_bundle.hpp"
#include "foresight/types.hpp"

namespace foresight::test {

using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

// 2025-10-10T00:00:00Z, the start of a day bucket
inline Timestamp base_time()
{
    return from_epoch_seconds(1760054400);
}

inline Timestamp day(int n, int hour = 0)
{
    return base_time() + hours(24 * n + hour);
}

// Directory removed with everything in it when the fixture goes away
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("foresight-test-" + generate_id()))
    {
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline const std::vector<std::string>& feature_names()
{
    static const std::vector<std::string> names{"momentum_5d", "sentiment", "volume_z"};
    return names;
}

inline FeatureSchema test_schema(const std::string& version = "v1")
{
    return FeatureSchema{version, feature_names()};
}

// Snapshot with every value observed a minute before collection
inline FeatureVector make_features(const std::string& symbol, Timestamp collected_at,
                                   std::vector<double> values = {0.5, 0.1, -0.3},
                                   const std::string& schema_version = "v1")
{
    FeatureVector fv;
    fv.symbol = symbol;
    fv.collected_at = collected_at;
    fv.schema_version = schema_version;
    const auto& names = feature_names();
    for (size_t i = 0; i < names.size() && i < values.size(); ++i) {
        fv.features.push_back({names[i], values[i], collected_at - minutes(1)});
    }
    return fv;
}

inline Prediction make_prediction(const std::string& symbol, Timestamp pts, seconds bucket = seconds(86400),
                                  TradeAction action = TradeAction::BUY)
{
    Prediction p;
    p.prediction_id = generate_id();
    p.symbol = symbol;
    p.prediction_timestamp = pts;
    p.created_at = pts;
    p.time_bucket = time_bucket_of(pts, bucket);
    p.predicted_action = action;
    p.action_confidence = 0.7;
    p.predicted_direction = action == TradeAction::SELL || action == TradeAction::STRONG_SELL ? -1 : 1;
    p.predicted_magnitude = 1.2;
    p.feature_snapshot = make_features(symbol, pts);
    p.model_version = "fs-test";
    return p;
}

inline Outcome make_outcome(const Prediction& p, seconds horizon, Timestamp evaluated_at, double return_pct = 1.0)
{
    Outcome o;
    o.outcome_id = generate_id();
    o.prediction_id = p.prediction_id;
    o.horizon = horizon;
    o.entry_price = 100.0;
    o.exit_price = 100.0 + return_pct;
    o.actual_return_pct = return_pct;
    o.actual_direction = sign_of(return_pct);
    o.evaluation_timestamp = evaluated_at;
    return o;
}

/**
 * @brief Estimator whose output is computed per row by a callback
 *
 * The callback returns the values for one row (one value, or one per class).
 */
class ScriptedEstimator : public Estimator {
public:
    using RowFn = std::function<std::vector<float>(const float* row, size_t ncol)>;

    ScriptedEstimator(size_t num_features, RowFn fn, std::string tag = "scripted")
        : num_features_(num_features), fn_(std::move(fn)), tag_(std::move(tag))
    {
    }

    std::vector<float> predict_batch(const float* data, size_t nrow, size_t ncol) const override
    {
        if (ncol != num_features_) {
            throw ModelError("expected " + std::to_string(num_features_) + " features, got " + std::to_string(ncol));
        }
        std::vector<float> out;
        for (size_t r = 0; r < nrow; ++r) {
            auto values = fn_(data + r * ncol, ncol);
            out.insert(out.end(), values.begin(), values.end());
        }
        return out;
    }

    size_t num_features() const override { return num_features_; }

    void save(const std::string& path) const override
    {
        std::ofstream out(path);
        if (!out) {
            throw ModelError("cannot write " + path);
        }
        out << tag_ << "\n";
    }

    const std::string& tag() const { return tag_; }

private:
    size_t num_features_;
    RowFn fn_;
    std::string tag_;
};

inline std::vector<float> one_hot(TradeAction action, float p = 0.8f)
{
    std::vector<float> probs(NUM_ACTIONS, (1.0f - p) / static_cast<float>(NUM_ACTIONS - 1));
    probs[static_cast<size_t>(action)] = p;
    return probs;
}

/**
 * @brief Bundle whose estimators return the same answer for every row
 */
inline std::shared_ptr<ModelBundle> make_bundle(const std::string& version, TradeAction action = TradeAction::BUY,
                                                float action_prob = 0.8f, float up_prob = 0.9f,
                                                float magnitude = 2.5f, const FeatureSchema& schema = test_schema())
{
    auto bundle = std::make_shared<ModelBundle>();
    bundle->version = version;
    bundle->schema = schema;
    const size_t ncol = schema.size();
    bundle->action_model = std::make_shared<ScriptedEstimator>(
        ncol, [action, action_prob](const float*, size_t) { return one_hot(action, action_prob); }, version);
    bundle->direction_model = std::make_shared<ScriptedEstimator>(
        ncol, [up_prob](const float*, size_t) { return std::vector<float>{up_prob}; }, version);
    bundle->magnitude_model = std::make_shared<ScriptedEstimator>(
        ncol, [magnitude](const float*, size_t) { return std::vector<float>{magnitude}; }, version);
    bundle->created_at = base_time();
    bundle->train_from = base_time();
    bundle->train_to = base_time();
    bundle->cutoff = base_time();
    return bundle;
}

// Config with every path under dir
inline PipelineConfig test_config(const TempDir& dir)
{
    PipelineConfig config;
    config.database_path = dir.file("foresight.db");
    config.models_dir = dir.file("models");
    config.training_lock_path = dir.file("models/.train.lock");
    config.log_file.clear();
    return config;
}

}  // namespace foresight::test
