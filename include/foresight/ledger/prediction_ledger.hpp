#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "foresight/config.hpp"
#include "foresight/storage/sqlite_db.hpp"
#include "foresight/types.hpp"

namespace foresight {

/**
 * @brief Predictions and outcomes covering an audit window
 *
 * Closed under outcome references: every prediction an outcome points at is
 * included when it exists in the ledger, so an outcome whose prediction is
 * missing here is a true orphan.
 */
struct LedgerWindow {
    Timestamp from{};
    Timestamp to{};
    std::vector<Prediction> predictions;
    std::vector<Outcome> outcomes;
};

struct StatusRecord {
    PredictionState state = PredictionState::PENDING;
    int attempts = 0;
    std::string last_error;
    Timestamp updated_at{};
};

/**
 * @brief Append-only store of predictions and their outcomes (SQLite)
 *
 * Predictions and outcomes are immutable once written; the schema rejects
 * UPDATE and DELETE on both tables. Uniqueness of (symbol, time_bucket) and
 * (prediction_id, horizon) is enforced by the storage layer, so concurrent
 * writers race safely into a constraint failure rather than a merge.
 *
 * Lifecycle state lives in a separate status table and only moves forward
 * from PENDING.
 */
class PredictionLedger {
public:
    PredictionLedger(const std::string& db_path, const TemporalConfig& temporal);

    PredictionLedger(const PredictionLedger&) = delete;
    PredictionLedger& operator=(const PredictionLedger&) = delete;

    /**
     * @brief Append a new prediction in state PENDING
     *
     * @throws DuplicatePredictionError when the prediction_id or the
     *         (symbol, time_bucket) pair already exists
     * @throws TemporalIntegrityViolation when created_at and
     *         prediction_timestamp differ by more than the creation tolerance
     */
    void append(const Prediction& prediction);

    /**
     * @brief Store the outcome for one (prediction, horizon)
     *
     * @return false when an outcome for that horizon already exists (no-op)
     * @throws ReferentialIntegrityError when the prediction does not exist
     * @throws TemporalIntegrityViolation when the evaluation is earlier than
     *         prediction_timestamp + max(min_eval_delay, horizon)
     */
    bool record_outcome(const Outcome& outcome);

    // PENDING -> EVALUATED; false when the prediction was no longer PENDING
    bool mark_evaluated(const std::string& prediction_id, Timestamp at);

    // PENDING -> EXPIRED; false when the prediction was no longer PENDING
    bool mark_expired(const std::string& prediction_id, Timestamp at, const std::string& reason);

    // Count a failed evaluation attempt on a PENDING prediction
    void record_attempt_failure(const std::string& prediction_id, Timestamp at, const std::string& error);

    std::optional<Prediction> find_prediction(const std::string& prediction_id) const;
    std::optional<StatusRecord> status_of(const std::string& prediction_id) const;
    std::vector<Outcome> outcomes_for(const std::string& prediction_id) const;

    // PENDING predictions with prediction_timestamp <= due_before, oldest first
    std::vector<Prediction> pending_predictions(Timestamp due_before, size_t limit) const;

    // Predictions with from <= prediction_timestamp <= to, plus outcomes that
    // reference them or were evaluated inside the window
    LedgerWindow load_window(Timestamp from, Timestamp to) const;

    /**
     * @brief EVALUATED predictions paired with their outcome at one horizon
     *
     * Only predictions with from <= prediction_timestamp < to are returned.
     */
    std::vector<TrainingPair> evaluated_pairs(Timestamp from, Timestamp to, std::chrono::seconds horizon) const;

    size_t prediction_count() const;
    size_t outcome_count() const;

    const TemporalConfig& temporal() const { return temporal_; }
    const std::string& path() const { return db_.path(); }

private:
    void create_schema();
    std::vector<Prediction> query_predictions(const char* sql, const std::vector<int64_t>& args) const;

    storage::Database db_;
    TemporalConfig temporal_;
};

}  // namespace foresight
