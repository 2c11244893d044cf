#pragma once

#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "foresight/clock.hpp"
#include "foresight/config.hpp"
#include "foresight/ledger/prediction_ledger.hpp"

namespace foresight {

enum class ViolationCategory : int8_t
{
    LEAKAGE,
    FUTURE_TIMESTAMP,
    MINIMUM_DELAY,
    CREATION_TIME,
    DUPLICATE,
    REFERENTIAL,
    CONSISTENCY
};

enum class Severity : int8_t
{
    LOW,
    HIGH,
    CRITICAL
};

const char* to_string(ViolationCategory category);
const char* to_string(Severity severity);

struct Violation {
    ViolationCategory category;
    Severity severity;
    std::string prediction_id;
    std::string outcome_id;
    std::string detail;
};

/**
 * @brief Result of one audit pass
 *
 * passed is false when any CRITICAL or HIGH violation was found. Rows named
 * in the quarantine sets are excluded from evaluation and training; the
 * audit itself never changes them.
 */
struct AuditReport {
    Timestamp audited_at{};
    Timestamp from{};
    Timestamp to{};
    size_t predictions_checked = 0;
    size_t outcomes_checked = 0;
    bool passed = true;
    std::vector<Violation> violations;
    std::set<std::string> quarantined_prediction_ids;
    std::set<std::string> quarantined_outcome_ids;

    bool has_critical() const;
    size_t count(ViolationCategory category) const;
    size_t count(Severity severity) const;

    bool is_quarantined(const std::string& prediction_id) const
    {
        return quarantined_prediction_ids.count(prediction_id) > 0;
    }
};

void to_json(nlohmann::json& j, const AuditReport& report);

/**
 * @brief Read-only validator of the ledger's temporal invariants
 *
 * Checks, each reported independently:
 *   - LEAKAGE          feature observed or collected after prediction_timestamp (critical)
 *   - FUTURE_TIMESTAMP prediction or evaluation time later than now (critical)
 *   - MINIMUM_DELAY    outcome earlier than prediction + max(min delay, horizon) (critical)
 *   - CREATION_TIME    created_at too far from prediction_timestamp (critical)
 *   - DUPLICATE        shared (symbol, time bucket), prediction id or (prediction, horizon) (high)
 *   - REFERENTIAL      outcome without a prediction (high)
 *   - CONSISTENCY      action contradicts predicted direction (low)
 *
 * Safe to run concurrently with writers.
 */
class TemporalGuard {
public:
    TemporalGuard(const TemporalConfig& config, const Clock& clock);

    AuditReport audit(const LedgerWindow& window) const;

    // Loads [from, to] from the ledger and audits it
    AuditReport audit(const PredictionLedger& ledger, Timestamp from, Timestamp to) const;

private:
    TemporalConfig config_;
    const Clock& clock_;
};

/**
 * @brief Stage gate used by the evaluator and trainer
 *
 * @throws TemporalIntegrityViolation carrying the report when it has a
 *         critical violation
 */
void require_no_critical(const AuditReport& report, const std::string& stage);

}  // namespace foresight
