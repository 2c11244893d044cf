#include "foresight/model/model_registry.hpp"

#include <atomic>
#include <filesystem>
#include <stdexcept>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace fs = std::filesystem;

namespace foresight {

namespace {

const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS model_bundles (
        version TEXT PRIMARY KEY,
        status TEXT NOT NULL CHECK (status IN ('PROMOTED', 'SUPERSEDED', 'REJECTED')),
        schema_version TEXT NOT NULL,
        created_at_ns INTEGER NOT NULL,
        train_from_ns INTEGER NOT NULL,
        train_to_ns INTEGER NOT NULL,
        cutoff_ns INTEGER NOT NULL,
        holdout_json TEXT NOT NULL,
        artifact_dir TEXT NOT NULL,
        reason TEXT,
        updated_at_ns INTEGER NOT NULL
    );
    CREATE TRIGGER IF NOT EXISTS model_bundles_retained BEFORE DELETE ON model_bundles
    BEGIN SELECT RAISE(ABORT, 'model bundles are retained for rollback and audit'); END;

    CREATE TABLE IF NOT EXISTS registry_state (
        id INTEGER PRIMARY KEY CHECK (id = 1),
        promoted_version TEXT NOT NULL REFERENCES model_bundles(version),
        updated_at_ns INTEGER NOT NULL
    );
)";

BundleStatus parse_status(const std::string& text)
{
    if (text == "PROMOTED") return BundleStatus::PROMOTED;
    if (text == "SUPERSEDED") return BundleStatus::SUPERSEDED;
    if (text == "REJECTED") return BundleStatus::REJECTED;
    throw StorageError("unknown bundle status " + text);
}

void bind_bundle(storage::Statement& stmt, const ModelBundle& bundle)
{
    stmt.bind(1, bundle.version)
        .bind(2, bundle.schema.version)
        .bind(3, to_epoch_ns(bundle.created_at))
        .bind(4, to_epoch_ns(bundle.train_from))
        .bind(5, to_epoch_ns(bundle.train_to))
        .bind(6, to_epoch_ns(bundle.cutoff))
        .bind(7, nlohmann::json(bundle.holdout).dump())
        .bind(8, bundle.artifact_dir);
}

}  // namespace

const char* to_string(BundleStatus status)
{
    switch (status) {
        case BundleStatus::PROMOTED: return "PROMOTED";
        case BundleStatus::SUPERSEDED: return "SUPERSEDED";
        case BundleStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

void to_json(nlohmann::json& j, const BundleRecord& r)
{
    j = nlohmann::json{{"model_version", r.version},
                       {"status", to_string(r.status)},
                       {"schema_version", r.schema_version},
                       {"created_at", format_utc(r.created_at)},
                       {"train_from", format_utc(r.train_from)},
                       {"train_to", format_utc(r.train_to)},
                       {"cutoff", format_utc(r.cutoff)},
                       {"holdout", r.holdout},
                       {"artifact_dir", r.artifact_dir},
                       {"reason", r.reason}};
}

ModelRegistry::ModelRegistry(const std::string& db_path, const std::string& models_dir, const Clock& clock)
    : db_(db_path), models_dir_(models_dir), clock_(clock)
{
    create_schema();
}

void ModelRegistry::create_schema()
{
    db_.exec(SCHEMA_SQL);
}

std::shared_ptr<const ModelBundle> ModelRegistry::current() const
{
    return std::atomic_load(&current_);
}

bool ModelRegistry::load_promoted()
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    storage::Statement stmt(db_, R"(
        SELECT b.version, b.artifact_dir FROM registry_state s
        JOIN model_bundles b ON b.version = s.promoted_version
        WHERE s.id = 1
    )");
    if (!stmt.step()) {
        log::get()->info("No promoted model bundle in registry");
        return false;
    }
    std::string version = stmt.column_text(0);
    std::string dir = stmt.column_text(1);

    auto bundle = load_bundle(dir);
    if (bundle->version != version) {
        throw ModelError("artifacts in " + dir + " belong to " + bundle->version + ", registry expects " + version);
    }
    retained_[version] = bundle;
    std::atomic_store(&current_, bundle);
    log::get()->info("Loaded promoted model bundle {} (schema {})", version, bundle->schema.version);
    return true;
}

void ModelRegistry::write_promotion(const ModelBundle& bundle)
{
    const int64_t now_ns = to_epoch_ns(clock_.now());

    storage::Transaction tx(db_);

    storage::Statement supersede(db_, R"(
        UPDATE model_bundles SET status = 'SUPERSEDED', updated_at_ns = ?
        WHERE status = 'PROMOTED' AND version <> ?
    )");
    supersede.bind(1, now_ns).bind(2, bundle.version);
    supersede.step();

    storage::Statement upsert(db_, R"(
        INSERT INTO model_bundles (
            version, schema_version, created_at_ns, train_from_ns, train_to_ns, cutoff_ns,
            holdout_json, artifact_dir, status, updated_at_ns
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, 'PROMOTED', ?)
        ON CONFLICT(version) DO UPDATE SET status = 'PROMOTED', updated_at_ns = excluded.updated_at_ns
    )");
    bind_bundle(upsert, bundle);
    upsert.bind(9, now_ns);
    upsert.step();

    storage::Statement pointer(db_, R"(
        INSERT INTO registry_state (id, promoted_version, updated_at_ns) VALUES (1, ?, ?)
        ON CONFLICT(id) DO UPDATE SET promoted_version = excluded.promoted_version,
                                      updated_at_ns = excluded.updated_at_ns
    )");
    pointer.bind(1, bundle.version).bind(2, now_ns);
    pointer.step();

    tx.commit();
}

void ModelRegistry::promote(std::shared_ptr<const ModelBundle> bundle)
{
    if (!bundle || !bundle->action_model || !bundle->direction_model || !bundle->magnitude_model) {
        throw std::invalid_argument("cannot promote an incomplete model bundle");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_promotion(*bundle);
    retained_[bundle->version] = bundle;

    auto previous = std::atomic_load(&current_);
    std::atomic_store(&current_, bundle);
    log::get()->info("Promoted model bundle {} (previous: {})", bundle->version,
                     previous ? previous->version : "none");
}

void ModelRegistry::record_rejected(const ModelBundle& bundle, const std::string& reason)
{
    storage::Statement stmt(db_, R"(
        INSERT INTO model_bundles (
            version, schema_version, created_at_ns, train_from_ns, train_to_ns, cutoff_ns,
            holdout_json, artifact_dir, status, reason, updated_at_ns
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, 'REJECTED', ?, ?)
    )");
    bind_bundle(stmt, bundle);
    stmt.bind(9, reason).bind(10, to_epoch_ns(clock_.now()));
    stmt.step();
    log::get()->info("Recorded rejected model bundle {}: {}", bundle.version, reason);
}

std::shared_ptr<const ModelBundle> ModelRegistry::resolve(const std::string& version)
{
    auto it = retained_.find(version);
    if (it != retained_.end()) {
        return it->second;
    }

    storage::Statement stmt(db_, "SELECT artifact_dir FROM model_bundles WHERE version = ?");
    stmt.bind(1, version);
    if (!stmt.step()) {
        throw PipelineError("unknown model version " + version);
    }
    auto bundle = load_bundle(stmt.column_text(0));
    retained_[version] = bundle;
    return bundle;
}

void ModelRegistry::rollback(const std::string& version)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    storage::Statement stmt(db_, "SELECT status FROM model_bundles WHERE version = ?");
    stmt.bind(1, version);
    if (!stmt.step()) {
        throw PipelineError("unknown model version " + version);
    }
    BundleStatus status = parse_status(stmt.column_text(0));
    if (status == BundleStatus::REJECTED) {
        throw PipelineError("model version " + version + " was rejected and cannot be promoted");
    }

    auto bundle = resolve(version);
    write_promotion(*bundle);
    std::atomic_store(&current_, bundle);
    log::get()->warn("Rolled back to model bundle {}", version);
}

std::vector<BundleRecord> ModelRegistry::history() const
{
    storage::Statement stmt(db_, R"(
        SELECT version, status, schema_version, created_at_ns, train_from_ns, train_to_ns, cutoff_ns,
               holdout_json, artifact_dir, reason, updated_at_ns
        FROM model_bundles ORDER BY created_at_ns DESC, version DESC
    )");

    std::vector<BundleRecord> out;
    while (stmt.step()) {
        BundleRecord r;
        r.version = stmt.column_text(0);
        r.status = parse_status(stmt.column_text(1));
        r.schema_version = stmt.column_text(2);
        r.created_at = from_epoch_ns(stmt.column_int64(3));
        r.train_from = from_epoch_ns(stmt.column_int64(4));
        r.train_to = from_epoch_ns(stmt.column_int64(5));
        r.cutoff = from_epoch_ns(stmt.column_int64(6));
        r.holdout = nlohmann::json::parse(stmt.column_text(7)).get<HoldoutMetrics>();
        r.artifact_dir = stmt.column_text(8);
        r.reason = stmt.column_text(9);
        r.updated_at = from_epoch_ns(stmt.column_int64(10));
        out.push_back(std::move(r));
    }
    return out;
}

std::string ModelRegistry::artifact_dir(const std::string& version) const
{
    return (fs::path(models_dir_) / version).string();
}

std::string ModelRegistry::staging_dir(const std::string& version) const
{
    return (fs::path(models_dir_) / ".staging" / version).string();
}

}  // namespace foresight
