#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "foresight/time_utils.hpp"

namespace foresight {

/**
 * @brief One named feature value with the time it was observed
 *
 * observed_at is the timestamp metadata the leakage check compares against
 * the prediction timestamp.
 */
struct FeatureValue {
    std::string name;
    double value = 0.0;
    Timestamp observed_at{};
};

/**
 * @brief Feature snapshot supplied by the feature collector
 *
 * Stored verbatim in the ledger alongside the prediction it produced.
 */
struct FeatureVector {
    std::string symbol;
    Timestamp collected_at{};
    std::string schema_version;
    std::vector<FeatureValue> features;

    const FeatureValue* find(const std::string& name) const;

    // Latest observed_at among all values (collected_at when empty)
    Timestamp latest_observation() const;
};

/**
 * @brief Versioned feature layout a model bundle was trained on
 *
 * The order of names is the estimator column order.
 */
struct FeatureSchema {
    std::string version;
    std::vector<std::string> names;

    size_t size() const { return names.size(); }

    bool operator==(const FeatureSchema& other) const
    {
        return version == other.version && names == other.names;
    }
    bool operator!=(const FeatureSchema& other) const { return !(*this == other); }
};

FeatureSchema schema_of(const FeatureVector& features);

void to_json(nlohmann::json& j, const FeatureValue& v);
void from_json(const nlohmann::json& j, FeatureValue& v);
void to_json(nlohmann::json& j, const FeatureVector& fv);
void from_json(const nlohmann::json& j, FeatureVector& fv);
void to_json(nlohmann::json& j, const FeatureSchema& schema);
void from_json(const nlohmann::json& j, FeatureSchema& schema);

}  // namespace foresight
