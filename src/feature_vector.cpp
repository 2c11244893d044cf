#include "foresight/feature_vector.hpp"

#include <algorithm>

namespace foresight {

const FeatureValue* FeatureVector::find(const std::string& name) const
{
    auto it = std::find_if(features.begin(), features.end(),
                           [&](const FeatureValue& v) { return v.name == name; });
    return it == features.end() ? nullptr : &*it;
}

Timestamp FeatureVector::latest_observation() const
{
    Timestamp latest = collected_at;
    bool first = true;
    for (const auto& v : features) {
        if (first || v.observed_at > latest) {
            latest = v.observed_at;
            first = false;
        }
    }
    return latest;
}

FeatureSchema schema_of(const FeatureVector& features)
{
    FeatureSchema schema;
    schema.version = features.schema_version;
    schema.names.reserve(features.features.size());
    for (const auto& v : features.features) {
        schema.names.push_back(v.name);
    }
    return schema;
}

void to_json(nlohmann::json& j, const FeatureValue& v)
{
    j = nlohmann::json{
        {"name", v.name},
        {"value", v.value},
        {"observed_at_ns", to_epoch_ns(v.observed_at)}};
}

void from_json(const nlohmann::json& j, FeatureValue& v)
{
    v.name = j.at("name").get<std::string>();
    v.value = j.at("value").get<double>();
    v.observed_at = from_epoch_ns(j.at("observed_at_ns").get<int64_t>());
}

void to_json(nlohmann::json& j, const FeatureVector& fv)
{
    j = nlohmann::json{
        {"symbol", fv.symbol},
        {"collected_at_ns", to_epoch_ns(fv.collected_at)},
        {"schema_version", fv.schema_version},
        {"features", fv.features}};
}

void from_json(const nlohmann::json& j, FeatureVector& fv)
{
    fv.symbol = j.at("symbol").get<std::string>();
    fv.collected_at = from_epoch_ns(j.at("collected_at_ns").get<int64_t>());
    fv.schema_version = j.value("schema_version", std::string{});
    fv.features.clear();
    for (const auto& item : j.at("features")) {
        FeatureValue v;
        v.name = item.at("name").get<std::string>();
        v.value = item.at("value").get<double>();
        // Collectors that do not tag individual values observed them at collection time
        v.observed_at = item.contains("observed_at_ns")
                            ? from_epoch_ns(item["observed_at_ns"].get<int64_t>())
                            : fv.collected_at;
        fv.features.push_back(std::move(v));
    }
}

void to_json(nlohmann::json& j, const FeatureSchema& schema)
{
    j = nlohmann::json{{"version", schema.version}, {"names", schema.names}};
}

void from_json(const nlohmann::json& j, FeatureSchema& schema)
{
    schema.version = j.at("version").get<std::string>();
    schema.names = j.at("names").get<std::vector<std::string>>();
}

}  // namespace foresight
