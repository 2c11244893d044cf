#include "foresight/ledger/prediction_ledger.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace foresight {

namespace {

const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS predictions (
        prediction_id TEXT PRIMARY KEY,
        symbol TEXT NOT NULL,
        time_bucket INTEGER NOT NULL,
        prediction_timestamp_ns INTEGER NOT NULL,
        created_at_ns INTEGER NOT NULL,
        predicted_action TEXT NOT NULL,
        action_confidence REAL NOT NULL CHECK (action_confidence >= 0.0 AND action_confidence <= 1.0),
        predicted_direction INTEGER CHECK (predicted_direction IS NULL OR predicted_direction IN (-1, 1)),
        predicted_magnitude REAL NOT NULL,
        feature_snapshot TEXT NOT NULL,
        model_version TEXT NOT NULL,
        UNIQUE(symbol, time_bucket)
    );
    CREATE INDEX IF NOT EXISTS idx_predictions_ts ON predictions(prediction_timestamp_ns);

    CREATE TABLE IF NOT EXISTS outcomes (
        outcome_id TEXT PRIMARY KEY,
        prediction_id TEXT NOT NULL REFERENCES predictions(prediction_id),
        horizon_s INTEGER NOT NULL CHECK (horizon_s > 0),
        actual_return_pct REAL NOT NULL,
        actual_direction INTEGER NOT NULL CHECK (actual_direction IN (-1, 0, 1)),
        entry_price REAL NOT NULL,
        exit_price REAL NOT NULL,
        evaluation_timestamp_ns INTEGER NOT NULL,
        UNIQUE(prediction_id, horizon_s)
    );
    CREATE INDEX IF NOT EXISTS idx_outcomes_eval_ts ON outcomes(evaluation_timestamp_ns);

    CREATE TABLE IF NOT EXISTS prediction_status (
        prediction_id TEXT PRIMARY KEY REFERENCES predictions(prediction_id),
        state TEXT NOT NULL CHECK (state IN ('PENDING', 'EVALUATED', 'EXPIRED')),
        attempts INTEGER NOT NULL DEFAULT 0,
        last_error TEXT,
        updated_at_ns INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_status_state ON prediction_status(state);

    CREATE TRIGGER IF NOT EXISTS predictions_immutable BEFORE UPDATE ON predictions
    BEGIN SELECT RAISE(ABORT, 'predictions are immutable'); END;
    CREATE TRIGGER IF NOT EXISTS predictions_append_only BEFORE DELETE ON predictions
    BEGIN SELECT RAISE(ABORT, 'predictions are append-only'); END;
    CREATE TRIGGER IF NOT EXISTS outcomes_immutable BEFORE UPDATE ON outcomes
    BEGIN SELECT RAISE(ABORT, 'outcomes are immutable'); END;
    CREATE TRIGGER IF NOT EXISTS outcomes_append_only BEFORE DELETE ON outcomes
    BEGIN SELECT RAISE(ABORT, 'outcomes are append-only'); END;

    CREATE TRIGGER IF NOT EXISTS predictions_initial_status AFTER INSERT ON predictions
    BEGIN
        INSERT INTO prediction_status(prediction_id, state, attempts, updated_at_ns)
        VALUES (NEW.prediction_id, 'PENDING', 0, NEW.created_at_ns);
    END;
    CREATE TRIGGER IF NOT EXISTS status_forward_only BEFORE UPDATE OF state ON prediction_status
    WHEN OLD.state <> 'PENDING' AND NEW.state <> OLD.state
    BEGIN SELECT RAISE(ABORT, 'prediction state is terminal'); END;
)";

#define PREDICTION_COLUMNS                                                              \
    "p.prediction_id, p.symbol, p.time_bucket, p.prediction_timestamp_ns, p.created_at_ns, " \
    "p.predicted_action, p.action_confidence, p.predicted_direction, p.predicted_magnitude, " \
    "p.feature_snapshot, p.model_version"

#define OUTCOME_COLUMNS                                                                 \
    "o.outcome_id, o.prediction_id, o.horizon_s, o.actual_return_pct, o.actual_direction, " \
    "o.entry_price, o.exit_price, o.evaluation_timestamp_ns"

constexpr int PREDICTION_COLUMN_COUNT = 11;

Prediction read_prediction(const storage::Statement& stmt, int offset = 0)
{
    Prediction p;
    p.prediction_id = stmt.column_text(offset + 0);
    p.symbol = stmt.column_text(offset + 1);
    p.time_bucket = stmt.column_int64(offset + 2);
    p.prediction_timestamp = from_epoch_ns(stmt.column_int64(offset + 3));
    p.created_at = from_epoch_ns(stmt.column_int64(offset + 4));
    p.predicted_action = parse_action(stmt.column_text(offset + 5));
    p.action_confidence = stmt.column_double(offset + 6);
    if (!stmt.column_is_null(offset + 7)) {
        p.predicted_direction = stmt.column_int(offset + 7);
    }
    p.predicted_magnitude = stmt.column_double(offset + 8);
    p.feature_snapshot = nlohmann::json::parse(stmt.column_text(offset + 9)).get<FeatureVector>();
    p.model_version = stmt.column_text(offset + 10);
    return p;
}

Outcome read_outcome(const storage::Statement& stmt, int offset = 0)
{
    Outcome o;
    o.outcome_id = stmt.column_text(offset + 0);
    o.prediction_id = stmt.column_text(offset + 1);
    o.horizon = std::chrono::seconds(stmt.column_int64(offset + 2));
    o.actual_return_pct = stmt.column_double(offset + 3);
    o.actual_direction = stmt.column_int(offset + 4);
    o.entry_price = stmt.column_double(offset + 5);
    o.exit_price = stmt.column_double(offset + 6);
    o.evaluation_timestamp = from_epoch_ns(stmt.column_int64(offset + 7));
    return o;
}

}  // namespace

PredictionLedger::PredictionLedger(const std::string& db_path, const TemporalConfig& temporal)
    : db_(db_path), temporal_(temporal)
{
    create_schema();
    log::get()->debug("Prediction ledger opened: {}", db_path);
}

void PredictionLedger::create_schema()
{
    db_.exec(SCHEMA_SQL);
}

void PredictionLedger::append(const Prediction& prediction)
{
    if (prediction.prediction_id.empty() || prediction.symbol.empty()) {
        throw std::invalid_argument("prediction requires an id and a symbol");
    }
    if (prediction.time_bucket != time_bucket_of(prediction.prediction_timestamp, temporal_.time_bucket)) {
        throw std::invalid_argument("time_bucket does not match prediction_timestamp for " + prediction.prediction_id);
    }

    auto gap = prediction.created_at - prediction.prediction_timestamp;
    if (gap < -temporal_.creation_tolerance || gap > temporal_.creation_tolerance) {
        throw TemporalIntegrityViolation(
            "created_at differs from prediction_timestamp by " +
            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(gap).count()) +
            " ms for " + prediction.symbol + " (tolerance " +
            std::to_string(temporal_.creation_tolerance.count()) + " s)");
    }

    nlohmann::json snapshot = prediction.feature_snapshot;

    storage::Statement stmt(db_, R"(
        INSERT INTO predictions (
            prediction_id, symbol, time_bucket, prediction_timestamp_ns, created_at_ns,
            predicted_action, action_confidence, predicted_direction, predicted_magnitude,
            feature_snapshot, model_version
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bind(1, prediction.prediction_id)
        .bind(2, prediction.symbol)
        .bind(3, prediction.time_bucket)
        .bind(4, to_epoch_ns(prediction.prediction_timestamp))
        .bind(5, to_epoch_ns(prediction.created_at))
        .bind(6, std::string(to_string(prediction.predicted_action)))
        .bind(7, prediction.action_confidence)
        .bind(8, prediction.predicted_direction)
        .bind(9, prediction.predicted_magnitude)
        .bind(10, snapshot.dump())
        .bind(11, prediction.model_version);

    int rc;
    std::string err;
    {
        storage::Database::Lock lock(db_);
        rc = stmt.execute();
        if (rc != SQLITE_DONE) {
            err = sqlite3_errmsg(db_.handle());
        }
    }

    if (rc == SQLITE_CONSTRAINT_UNIQUE) {
        throw DuplicatePredictionError("prediction already recorded for " + prediction.symbol +
                                           " in time bucket " + std::to_string(prediction.time_bucket),
                                       prediction.symbol, prediction.time_bucket);
    }
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        throw DuplicatePredictionError("prediction_id " + prediction.prediction_id + " already recorded",
                                       prediction.symbol, prediction.time_bucket);
    }
    if (rc != SQLITE_DONE) {
        throw StorageError("failed to append prediction " + prediction.prediction_id + ": " + err, rc);
    }
}

bool PredictionLedger::record_outcome(const Outcome& outcome)
{
    if (outcome.horizon.count() <= 0) {
        throw std::invalid_argument("outcome horizon must be positive");
    }

    auto prediction = find_prediction(outcome.prediction_id);
    if (!prediction) {
        throw ReferentialIntegrityError("outcome " + outcome.outcome_id +
                                        " references unknown prediction " + outcome.prediction_id);
    }

    const auto required = std::max<std::chrono::nanoseconds>(temporal_.min_eval_delay, outcome.horizon);
    if (outcome.evaluation_timestamp - prediction->prediction_timestamp < required) {
        throw TemporalIntegrityViolation(
            "outcome for " + outcome.prediction_id + " evaluated at " + format_utc(outcome.evaluation_timestamp) +
            ", earlier than prediction_timestamp " + format_utc(prediction->prediction_timestamp) +
            " + " + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(required).count()) + " s");
    }

    storage::Statement stmt(db_, R"(
        INSERT INTO outcomes (
            outcome_id, prediction_id, horizon_s, actual_return_pct, actual_direction,
            entry_price, exit_price, evaluation_timestamp_ns
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bind(1, outcome.outcome_id)
        .bind(2, outcome.prediction_id)
        .bind(3, static_cast<int64_t>(outcome.horizon.count()))
        .bind(4, outcome.actual_return_pct)
        .bind(5, outcome.actual_direction)
        .bind(6, outcome.entry_price)
        .bind(7, outcome.exit_price)
        .bind(8, to_epoch_ns(outcome.evaluation_timestamp));

    int rc;
    std::string err;
    {
        storage::Database::Lock lock(db_);
        rc = stmt.execute();
        if (rc != SQLITE_DONE) {
            err = sqlite3_errmsg(db_.handle());
        }
    }

    if (rc == SQLITE_CONSTRAINT_UNIQUE) {
        // Another evaluator pass got there first
        return false;
    }
    if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) {
        throw ReferentialIntegrityError("outcome " + outcome.outcome_id +
                                        " references unknown prediction " + outcome.prediction_id);
    }
    if (rc != SQLITE_DONE) {
        throw StorageError("failed to record outcome " + outcome.outcome_id + ": " + err, rc);
    }
    return true;
}

bool PredictionLedger::mark_evaluated(const std::string& prediction_id, Timestamp at)
{
    storage::Statement stmt(db_, R"(
        UPDATE prediction_status SET state = 'EVALUATED', updated_at_ns = ?
        WHERE prediction_id = ? AND state = 'PENDING'
    )");
    stmt.bind(1, to_epoch_ns(at)).bind(2, prediction_id);

    storage::Database::Lock lock(db_);
    stmt.step();
    return db_.changes() == 1;
}

bool PredictionLedger::mark_expired(const std::string& prediction_id, Timestamp at, const std::string& reason)
{
    storage::Statement stmt(db_, R"(
        UPDATE prediction_status SET state = 'EXPIRED', last_error = ?, updated_at_ns = ?
        WHERE prediction_id = ? AND state = 'PENDING'
    )");
    stmt.bind(1, reason).bind(2, to_epoch_ns(at)).bind(3, prediction_id);

    storage::Database::Lock lock(db_);
    stmt.step();
    return db_.changes() == 1;
}

void PredictionLedger::record_attempt_failure(const std::string& prediction_id, Timestamp at, const std::string& error)
{
    storage::Statement stmt(db_, R"(
        UPDATE prediction_status SET attempts = attempts + 1, last_error = ?, updated_at_ns = ?
        WHERE prediction_id = ? AND state = 'PENDING'
    )");
    stmt.bind(1, error).bind(2, to_epoch_ns(at)).bind(3, prediction_id);
    stmt.step();
}

std::optional<Prediction> PredictionLedger::find_prediction(const std::string& prediction_id) const
{
    storage::Statement stmt(db_, "SELECT " PREDICTION_COLUMNS " FROM predictions p WHERE p.prediction_id = ?");
    stmt.bind(1, prediction_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_prediction(stmt);
}

std::optional<StatusRecord> PredictionLedger::status_of(const std::string& prediction_id) const
{
    storage::Statement stmt(db_, R"(
        SELECT state, attempts, last_error, updated_at_ns FROM prediction_status WHERE prediction_id = ?
    )");
    stmt.bind(1, prediction_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    StatusRecord status;
    status.state = parse_state(stmt.column_text(0));
    status.attempts = stmt.column_int(1);
    status.last_error = stmt.column_text(2);
    status.updated_at = from_epoch_ns(stmt.column_int64(3));
    return status;
}

std::vector<Outcome> PredictionLedger::outcomes_for(const std::string& prediction_id) const
{
    storage::Statement stmt(db_, "SELECT " OUTCOME_COLUMNS " FROM outcomes o WHERE o.prediction_id = ? ORDER BY o.horizon_s");
    stmt.bind(1, prediction_id);
    std::vector<Outcome> out;
    while (stmt.step()) {
        out.push_back(read_outcome(stmt));
    }
    return out;
}

std::vector<Prediction> PredictionLedger::query_predictions(const char* sql, const std::vector<int64_t>& args) const
{
    storage::Statement stmt(db_, sql);
    for (size_t i = 0; i < args.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), args[i]);
    }
    std::vector<Prediction> out;
    while (stmt.step()) {
        out.push_back(read_prediction(stmt));
    }
    return out;
}

std::vector<Prediction> PredictionLedger::pending_predictions(Timestamp due_before, size_t limit) const
{
    return query_predictions(
        "SELECT " PREDICTION_COLUMNS " FROM predictions p "
        "JOIN prediction_status s ON s.prediction_id = p.prediction_id "
        "WHERE s.state = 'PENDING' AND p.prediction_timestamp_ns <= ? "
        "ORDER BY p.prediction_timestamp_ns ASC LIMIT ?",
        {to_epoch_ns(due_before), static_cast<int64_t>(limit)});
}

LedgerWindow PredictionLedger::load_window(Timestamp from, Timestamp to) const
{
    LedgerWindow window;
    window.from = from;
    window.to = to;
    window.predictions = query_predictions(
        "SELECT " PREDICTION_COLUMNS " FROM predictions p "
        "WHERE p.prediction_timestamp_ns BETWEEN ? AND ? ORDER BY p.prediction_timestamp_ns",
        {to_epoch_ns(from), to_epoch_ns(to)});

    storage::Statement stmt(db_,
        "SELECT " OUTCOME_COLUMNS " FROM outcomes o "
        "WHERE o.prediction_id IN (SELECT prediction_id FROM predictions WHERE prediction_timestamp_ns BETWEEN ? AND ?) "
        "OR o.evaluation_timestamp_ns BETWEEN ? AND ? "
        "ORDER BY o.evaluation_timestamp_ns");
    stmt.bind(1, to_epoch_ns(from)).bind(2, to_epoch_ns(to)).bind(3, to_epoch_ns(from)).bind(4, to_epoch_ns(to));
    while (stmt.step()) {
        window.outcomes.push_back(read_outcome(stmt));
    }

    std::unordered_set<std::string> loaded;
    for (const auto& p : window.predictions) {
        loaded.insert(p.prediction_id);
    }
    for (const auto& o : window.outcomes) {
        if (loaded.count(o.prediction_id)) {
            continue;
        }
        if (auto p = find_prediction(o.prediction_id)) {
            window.predictions.push_back(std::move(*p));
        }
        loaded.insert(o.prediction_id);
    }
    return window;
}

std::vector<TrainingPair> PredictionLedger::evaluated_pairs(Timestamp from, Timestamp to, std::chrono::seconds horizon) const
{
    storage::Statement stmt(db_,
        "SELECT " PREDICTION_COLUMNS ", " OUTCOME_COLUMNS " FROM predictions p "
        "JOIN prediction_status s ON s.prediction_id = p.prediction_id "
        "JOIN outcomes o ON o.prediction_id = p.prediction_id "
        "WHERE s.state = 'EVALUATED' AND o.horizon_s = ? "
        "AND p.prediction_timestamp_ns >= ? AND p.prediction_timestamp_ns < ? "
        "ORDER BY p.prediction_timestamp_ns");
    stmt.bind(1, static_cast<int64_t>(horizon.count())).bind(2, to_epoch_ns(from)).bind(3, to_epoch_ns(to));

    std::vector<TrainingPair> out;
    while (stmt.step()) {
        TrainingPair pair;
        pair.prediction = read_prediction(stmt);
        pair.outcome = read_outcome(stmt, PREDICTION_COLUMN_COUNT);
        out.push_back(std::move(pair));
    }
    return out;
}

size_t PredictionLedger::prediction_count() const
{
    storage::Statement stmt(db_, "SELECT COUNT(*) FROM predictions");
    stmt.step();
    return static_cast<size_t>(stmt.column_int64(0));
}

size_t PredictionLedger::outcome_count() const
{
    storage::Statement stmt(db_, "SELECT COUNT(*) FROM outcomes");
    stmt.step();
    return static_cast<size_t>(stmt.column_int64(0));
}

}  // namespace foresight
