#include "foresight/model/model_bundle.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <unordered_set>

#include "foresight/errors.hpp"
#ifdef HAVE_XGBOOST
#include "foresight/model/xgboost_estimator.hpp"
#endif

namespace fs = std::filesystem;

namespace foresight {

namespace {

constexpr const char* ACTION_FILE = "action.ubj";
constexpr const char* DIRECTION_FILE = "direction.ubj";
constexpr const char* MAGNITUDE_FILE = "magnitude.ubj";
constexpr const char* MANIFEST_FILE = "manifest.json";

}  // namespace

void to_json(nlohmann::json& j, const HoldoutMetrics& m)
{
    j = nlohmann::json{{"rows", m.rows},
                       {"action_accuracy", m.action_accuracy},
                       {"direction_accuracy", m.direction_accuracy},
                       {"direction_coverage", m.direction_coverage},
                       {"magnitude_mae", m.magnitude_mae}};
}

void from_json(const nlohmann::json& j, HoldoutMetrics& m)
{
    m.rows = j.at("rows").get<size_t>();
    m.action_accuracy = j.at("action_accuracy").get<double>();
    m.direction_accuracy = j.at("direction_accuracy").get<double>();
    m.direction_coverage = j.at("direction_coverage").get<double>();
    m.magnitude_mae = j.at("magnitude_mae").get<double>();
}

std::vector<BundleInference> ModelBundle::infer(const std::vector<float>& rows, size_t nrow,
                                                double abstain_threshold) const
{
    if (!action_model || !direction_model || !magnitude_model) {
        throw ModelError("bundle " + version + " is missing an estimator");
    }
    const size_t ncol = schema.size();
    if (rows.size() != nrow * ncol) {
        throw ModelError("feature matrix does not match bundle schema " + schema.version);
    }
    if (nrow == 0) {
        return {};
    }

    auto action_probs = action_model->predict_batch(rows.data(), nrow, ncol);
    auto up_probs = direction_model->predict_batch(rows.data(), nrow, ncol);
    auto magnitudes = magnitude_model->predict_batch(rows.data(), nrow, ncol);

    if (action_probs.size() != nrow * NUM_ACTIONS || up_probs.size() != nrow || magnitudes.size() != nrow) {
        throw ModelError("bundle " + version + " returned an unexpected output shape");
    }

    std::vector<BundleInference> out(nrow);
    for (size_t r = 0; r < nrow; ++r) {
        auto& inf = out[r];
        const float* probs = action_probs.data() + r * NUM_ACTIONS;
        std::copy(probs, probs + NUM_ACTIONS, inf.action_probabilities.begin());

        size_t best = 0;
        for (size_t c = 1; c < NUM_ACTIONS; ++c) {
            if (probs[c] > probs[best]) {
                best = c;
            }
        }
        inf.action = static_cast<TradeAction>(best);
        inf.action_confidence = std::clamp(static_cast<double>(probs[best]), 0.0, 1.0);

        inf.up_probability = up_probs[r];
        double certainty = std::max(inf.up_probability, 1.0 - inf.up_probability);
        if (certainty >= abstain_threshold) {
            inf.direction = inf.up_probability >= 0.5 ? 1 : -1;
        }

        inf.magnitude = magnitudes[r];
    }
    return out;
}

std::vector<float> feature_row(const FeatureVector& features, const FeatureSchema& schema)
{
    if (features.schema_version != schema.version) {
        throw FeatureSchemaError("feature schema " + features.schema_version + " does not match model schema " +
                                 schema.version);
    }

    std::unordered_set<std::string> seen;
    for (const auto& fv : features.features) {
        if (!seen.insert(fv.name).second) {
            throw FeatureSchemaError("duplicate feature " + fv.name);
        }
        if (!std::isfinite(fv.value)) {
            throw FeatureSchemaError("feature " + fv.name + " is not finite");
        }
    }

    std::vector<float> row;
    row.reserve(schema.size());
    for (const auto& name : schema.names) {
        const FeatureValue* fv = features.find(name);
        if (!fv) {
            throw FeatureSchemaError("missing feature " + name);
        }
        row.push_back(static_cast<float>(fv->value));
    }

    if (features.features.size() != schema.size()) {
        for (const auto& fv : features.features) {
            if (std::find(schema.names.begin(), schema.names.end(), fv.name) == schema.names.end()) {
                throw FeatureSchemaError("unexpected feature " + fv.name);
            }
        }
    }
    return row;
}

nlohmann::json manifest_of(const ModelBundle& bundle)
{
    return nlohmann::json{{"model_version", bundle.version},
                          {"feature_schema", bundle.schema},
                          {"created_at_ns", to_epoch_ns(bundle.created_at)},
                          {"train_from_ns", to_epoch_ns(bundle.train_from)},
                          {"train_to_ns", to_epoch_ns(bundle.train_to)},
                          {"cutoff_ns", to_epoch_ns(bundle.cutoff)},
                          {"holdout", bundle.holdout},
                          {"estimators",
                           {{"action", ACTION_FILE}, {"direction", DIRECTION_FILE}, {"magnitude", MAGNITUDE_FILE}}}};
}

void save_bundle(const ModelBundle& bundle, const std::string& dir)
{
    fs::create_directories(dir);
    bundle.action_model->save((fs::path(dir) / ACTION_FILE).string());
    bundle.direction_model->save((fs::path(dir) / DIRECTION_FILE).string());
    bundle.magnitude_model->save((fs::path(dir) / MAGNITUDE_FILE).string());

    std::ofstream out(fs::path(dir) / MANIFEST_FILE);
    if (!out) {
        throw ModelError("cannot write manifest in " + dir);
    }
    out << manifest_of(bundle).dump(2) << "\n";
    if (!out) {
        throw ModelError("failed writing manifest in " + dir);
    }
}

std::shared_ptr<const ModelBundle> load_bundle(const std::string& dir)
{
    std::ifstream in(fs::path(dir) / MANIFEST_FILE);
    if (!in) {
        throw ModelError("no manifest in " + dir);
    }

    auto bundle = std::make_shared<ModelBundle>();
    try {
        nlohmann::json manifest;
        in >> manifest;
        bundle->version = manifest.at("model_version").get<std::string>();
        bundle->schema = manifest.at("feature_schema").get<FeatureSchema>();
        bundle->created_at = from_epoch_ns(manifest.at("created_at_ns").get<int64_t>());
        bundle->train_from = from_epoch_ns(manifest.at("train_from_ns").get<int64_t>());
        bundle->train_to = from_epoch_ns(manifest.at("train_to_ns").get<int64_t>());
        bundle->cutoff = from_epoch_ns(manifest.at("cutoff_ns").get<int64_t>());
        bundle->holdout = manifest.at("holdout").get<HoldoutMetrics>();
    } catch (const nlohmann::json::exception& e) {
        throw ModelError("invalid manifest in " + dir + ": " + e.what());
    }

#ifdef HAVE_XGBOOST
    const size_t ncol = bundle->schema.size();
    bundle->action_model = std::make_shared<XGBoostEstimator>(
        XGBoostEstimator::load((fs::path(dir) / ACTION_FILE).string(), ncol));
    bundle->direction_model = std::make_shared<XGBoostEstimator>(
        XGBoostEstimator::load((fs::path(dir) / DIRECTION_FILE).string(), ncol));
    bundle->magnitude_model = std::make_shared<XGBoostEstimator>(
        XGBoostEstimator::load((fs::path(dir) / MAGNITUDE_FILE).string(), ncol));
#else
    throw ModelError("built without XGBoost, cannot load estimators of " + bundle->version + " from " + dir);
#endif
    bundle->artifact_dir = dir;
    return bundle;
}

}  // namespace foresight
