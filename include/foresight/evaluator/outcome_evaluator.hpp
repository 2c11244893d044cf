#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "foresight/cancellation.hpp"
#include "foresight/clock.hpp"
#include "foresight/config.hpp"
#include "foresight/evaluator/market_data.hpp"
#include "foresight/guard/temporal_guard.hpp"
#include "foresight/ledger/prediction_ledger.hpp"

namespace foresight {

struct EvaluationFailure {
    std::string prediction_id;
    std::string symbol;
    std::string error;
};

/**
 * @brief Per-batch summary, one counter per prediction disposition
 */
struct EvaluationReport {
    Timestamp started_at{};
    Timestamp finished_at{};
    size_t candidates = 0;
    size_t outcomes_written = 0;
    size_t predictions_evaluated = 0;  // moved to EVALUATED in this batch
    size_t already_evaluated = 0;      // all horizons were already recorded
    size_t not_yet_due = 0;            // some horizon still inside its window
    size_t deferred = 0;               // market data missing, retried next tick
    size_t expired = 0;
    size_t quarantined_skipped = 0;
    size_t timed_out = 0;              // symbol deadline passed before the prediction was reached
    bool cancelled = false;
    std::vector<EvaluationFailure> failures;

    void merge(const EvaluationReport& other);
};

void to_json(nlohmann::json& j, const EvaluationReport& report);

/**
 * @brief Computes realized outcomes for PENDING predictions
 *
 * Each run audits the ledger first, back to the oldest candidate at least,
 * and refuses to proceed on a critical violation. Symbols are processed by a small worker pool; market data calls
 * are retried with backoff under a per-call timeout and a per-symbol
 * deadline. Every outcome is committed independently, so a cancelled or
 * failed batch keeps what it wrote and the next run picks up the rest.
 */
class OutcomeEvaluator {
public:
    OutcomeEvaluator(PredictionLedger& ledger, std::shared_ptr<const MarketDataSource> market_data,
                     const TemporalGuard& guard, const Clock& clock, const EvaluatorConfig& config);

    /**
     * @brief Evaluate every due PENDING prediction
     *
     * @throws TemporalIntegrityViolation when the audit reports a critical
     *         violation (nothing evaluated) or a write breaks an invariant
     */
    EvaluationReport evaluate_pending(const CancellationToken* cancel = nullptr);

private:
    using SteadyTime = std::chrono::steady_clock::time_point;

    EvaluationReport evaluate_symbol(const std::string& symbol, const std::vector<Prediction>& predictions,
                                     const AuditReport& audit, const CancellationToken* cancel);

    void evaluate_one(const Prediction& prediction, SteadyTime deadline, EvaluationReport& report);

    // Retries transient failures with backoff; throws MarketDataUnavailableError when exhausted
    std::optional<PriceBar> fetch_bar(const std::string& symbol, Timestamp t, SteadyTime deadline) const;

    /**
     * A call that outlives its timeout is left running on a detached thread
     * until the source returns. Such threads are capped process-wide by
     * max_calls_in_flight; past the cap the call fails fast with
     * MarketDataUnavailableError instead of starting another thread.
     */
    std::optional<PriceBar> call_with_timeout(const std::string& symbol, Timestamp t,
                                              std::chrono::milliseconds timeout) const;

    PredictionLedger& ledger_;
    std::shared_ptr<const MarketDataSource> market_data_;
    const TemporalGuard& guard_;
    const Clock& clock_;
    EvaluatorConfig config_;
};

}  // namespace foresight
