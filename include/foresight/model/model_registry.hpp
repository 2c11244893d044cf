#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "foresight/clock.hpp"
#include "foresight/model/model_bundle.hpp"
#include "foresight/storage/sqlite_db.hpp"

namespace foresight {

enum class BundleStatus : int8_t
{
    PROMOTED,
    SUPERSEDED,
    REJECTED
};

const char* to_string(BundleStatus status);

struct BundleRecord {
    std::string version;
    BundleStatus status = BundleStatus::REJECTED;
    std::string schema_version;
    Timestamp created_at{};
    Timestamp train_from{};
    Timestamp train_to{};
    Timestamp cutoff{};
    HoldoutMetrics holdout;
    std::string artifact_dir;
    std::string reason;
    Timestamp updated_at{};
};

void to_json(nlohmann::json& j, const BundleRecord& r);

/**
 * @brief Version history of model bundles and the promoted pointer
 *
 * current() hands out the promoted bundle as a shared_ptr to const; a
 * promotion commits the registry rows first and then swaps the pointer, so
 * readers see either the old or the new bundle, never a mix. Bundles are
 * never deleted, only superseded.
 */
class ModelRegistry {
public:
    ModelRegistry(const std::string& db_path, const std::string& models_dir, const Clock& clock);

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    // Promoted bundle, or nullptr before the first promotion
    std::shared_ptr<const ModelBundle> current() const;

    /**
     * @brief Load the promoted bundle recorded in the registry from disk
     *
     * @return false when nothing has been promoted yet
     * @throws ModelError when the recorded artifacts cannot be loaded
     */
    bool load_promoted();

    // Make bundle the promoted version; the previous one becomes SUPERSEDED
    void promote(std::shared_ptr<const ModelBundle> bundle);

    // Keep a candidate that failed validation in the history
    void record_rejected(const ModelBundle& bundle, const std::string& reason);

    /**
     * @brief Re-promote a retained bundle
     *
     * @throws PipelineError when the version is unknown or was rejected
     */
    void rollback(const std::string& version);

    // All bundles, newest first
    std::vector<BundleRecord> history() const;

    // Final artifact directory for a version
    std::string artifact_dir(const std::string& version) const;

    // Scratch directory a trainer writes into before publishing
    std::string staging_dir(const std::string& version) const;

    const std::string& models_dir() const { return models_dir_; }

private:
    void create_schema();
    void write_promotion(const ModelBundle& bundle);
    std::shared_ptr<const ModelBundle> resolve(const std::string& version);

    storage::Database db_;
    std::string models_dir_;
    const Clock& clock_;

    std::shared_ptr<const ModelBundle> current_;

    // Serializes promote/rollback; readers go through the atomic pointer
    std::mutex write_mutex_;
    std::map<std::string, std::shared_ptr<const ModelBundle>> retained_;
};

}  // namespace foresight
