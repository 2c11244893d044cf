#include "foresight/guard/temporal_guard.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>
#include <utility>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace foresight {

namespace {

std::string seconds_between(Timestamp later, Timestamp earlier)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(later - earlier).count();
    return std::to_string(ms / 1000.0) + " s";
}

class ReportBuilder {
public:
    explicit ReportBuilder(AuditReport& report) : report_(report) {}

    void add(ViolationCategory category, Severity severity, const std::string& prediction_id,
             const std::string& outcome_id, std::string detail)
    {
        report_.violations.push_back({category, severity, prediction_id, outcome_id, std::move(detail)});
    }

    void quarantine_prediction(const std::string& id) { report_.quarantined_prediction_ids.insert(id); }
    void quarantine_outcome(const std::string& id) { report_.quarantined_outcome_ids.insert(id); }

private:
    AuditReport& report_;
};

}  // namespace

const char* to_string(ViolationCategory category)
{
    switch (category) {
        case ViolationCategory::LEAKAGE: return "LEAKAGE";
        case ViolationCategory::FUTURE_TIMESTAMP: return "FUTURE_TIMESTAMP";
        case ViolationCategory::MINIMUM_DELAY: return "MINIMUM_DELAY";
        case ViolationCategory::CREATION_TIME: return "CREATION_TIME";
        case ViolationCategory::DUPLICATE: return "DUPLICATE";
        case ViolationCategory::REFERENTIAL: return "REFERENTIAL";
        case ViolationCategory::CONSISTENCY: return "CONSISTENCY";
    }
    return "UNKNOWN";
}

const char* to_string(Severity severity)
{
    switch (severity) {
        case Severity::LOW: return "LOW";
        case Severity::HIGH: return "HIGH";
        case Severity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

bool AuditReport::has_critical() const
{
    return count(Severity::CRITICAL) > 0;
}

size_t AuditReport::count(ViolationCategory category) const
{
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
                                             [&](const Violation& v) { return v.category == category; }));
}

size_t AuditReport::count(Severity severity) const
{
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
                                             [&](const Violation& v) { return v.severity == severity; }));
}

void to_json(nlohmann::json& j, const AuditReport& report)
{
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& v : report.violations) {
        violations.push_back({{"category", to_string(v.category)},
                              {"severity", to_string(v.severity)},
                              {"prediction_id", v.prediction_id},
                              {"outcome_id", v.outcome_id},
                              {"detail", v.detail}});
    }
    j = nlohmann::json{{"passed", report.passed},
                       {"audited_at", format_utc(report.audited_at)},
                       {"from", format_utc(report.from)},
                       {"to", format_utc(report.to)},
                       {"predictions_checked", report.predictions_checked},
                       {"outcomes_checked", report.outcomes_checked},
                       {"violations", violations},
                       {"quarantined_prediction_ids", report.quarantined_prediction_ids},
                       {"quarantined_outcome_ids", report.quarantined_outcome_ids}};
}

TemporalGuard::TemporalGuard(const TemporalConfig& config, const Clock& clock) : config_(config), clock_(clock)
{
}

AuditReport TemporalGuard::audit(const LedgerWindow& window) const
{
    AuditReport report;
    report.audited_at = clock_.now();
    report.from = window.from;
    report.to = window.to;
    report.predictions_checked = window.predictions.size();
    report.outcomes_checked = window.outcomes.size();

    ReportBuilder builder(report);
    const Timestamp latest_allowed = report.audited_at + config_.future_skew_tolerance;

    std::unordered_map<std::string, const Prediction*> by_id;
    std::map<std::pair<std::string, int64_t>, std::vector<std::string>> by_bucket;

    for (const auto& p : window.predictions) {
        const Timestamp pts = p.prediction_timestamp;

        if (!by_id.emplace(p.prediction_id, &p).second) {
            builder.add(ViolationCategory::DUPLICATE, Severity::HIGH, p.prediction_id, "",
                        "prediction_id appears more than once");
            builder.quarantine_prediction(p.prediction_id);
        }
        by_bucket[{p.symbol, time_bucket_of(pts, config_.time_bucket)}].push_back(p.prediction_id);

        if (p.feature_snapshot.collected_at > pts) {
            builder.add(ViolationCategory::LEAKAGE, Severity::CRITICAL, p.prediction_id, "",
                        "features collected at " + format_utc(p.feature_snapshot.collected_at) +
                            ", after prediction_timestamp " + format_utc(pts));
        }
        std::vector<std::string> late;
        for (const auto& fv : p.feature_snapshot.features) {
            if (fv.observed_at > pts) {
                late.push_back(fv.name);
            }
        }
        if (!late.empty()) {
            std::string names;
            for (const auto& n : late) {
                names += names.empty() ? n : ", " + n;
            }
            builder.add(ViolationCategory::LEAKAGE, Severity::CRITICAL, p.prediction_id, "",
                        "features observed after prediction_timestamp " + format_utc(pts) + ": " + names);
        }

        if (pts > latest_allowed) {
            builder.add(ViolationCategory::FUTURE_TIMESTAMP, Severity::CRITICAL, p.prediction_id, "",
                        "prediction_timestamp " + format_utc(pts) + " is after audit time " +
                            format_utc(report.audited_at));
        }

        auto gap = p.created_at - pts;
        if (gap > config_.creation_tolerance || -gap > config_.creation_tolerance) {
            builder.add(ViolationCategory::CREATION_TIME, Severity::CRITICAL, p.prediction_id, "",
                        "created_at differs from prediction_timestamp by " +
                            seconds_between(p.created_at, pts));
        }

        if (p.predicted_direction) {
            bool bullish = p.predicted_action == TradeAction::BUY || p.predicted_action == TradeAction::STRONG_BUY;
            bool bearish = p.predicted_action == TradeAction::SELL || p.predicted_action == TradeAction::STRONG_SELL;
            int dir = *p.predicted_direction;
            if ((bullish && dir < 0) || (bearish && dir > 0)) {
                builder.add(ViolationCategory::CONSISTENCY, Severity::LOW, p.prediction_id, "",
                            std::string("action ") + to_string(p.predicted_action) +
                                " contradicts predicted direction " + std::to_string(dir));
            }
        }
    }

    for (const auto& entry : by_bucket) {
        const auto& ids = entry.second;
        if (ids.size() < 2) {
            continue;
        }
        for (const auto& id : ids) {
            builder.add(ViolationCategory::DUPLICATE, Severity::HIGH, id, "",
                        std::to_string(ids.size()) + " predictions for " + entry.first.first + " in time bucket " +
                            std::to_string(entry.first.second));
            builder.quarantine_prediction(id);
        }
    }

    std::map<std::pair<std::string, int64_t>, std::string> seen_horizons;
    for (const auto& o : window.outcomes) {
        if (o.evaluation_timestamp > latest_allowed) {
            builder.add(ViolationCategory::FUTURE_TIMESTAMP, Severity::CRITICAL, o.prediction_id, o.outcome_id,
                        "evaluation_timestamp " + format_utc(o.evaluation_timestamp) + " is after audit time " +
                            format_utc(report.audited_at));
        }

        auto key = std::make_pair(o.prediction_id, static_cast<int64_t>(o.horizon.count()));
        auto inserted = seen_horizons.emplace(key, o.outcome_id);
        if (!inserted.second) {
            builder.add(ViolationCategory::DUPLICATE, Severity::HIGH, o.prediction_id, o.outcome_id,
                        "second outcome for horizon " + std::to_string(o.horizon.count()) + " s (first " +
                            inserted.first->second + ")");
            builder.quarantine_outcome(o.outcome_id);
            builder.quarantine_prediction(o.prediction_id);
        }

        auto it = by_id.find(o.prediction_id);
        if (it == by_id.end()) {
            builder.add(ViolationCategory::REFERENTIAL, Severity::HIGH, o.prediction_id, o.outcome_id,
                        "outcome references a prediction that does not exist");
            builder.quarantine_outcome(o.outcome_id);
            continue;
        }

        const Timestamp pts = it->second->prediction_timestamp;
        const std::chrono::nanoseconds required = std::max<std::chrono::nanoseconds>(config_.min_eval_delay, o.horizon);
        if (o.evaluation_timestamp - pts < required) {
            builder.add(ViolationCategory::MINIMUM_DELAY, Severity::CRITICAL, o.prediction_id, o.outcome_id,
                        "evaluated " + seconds_between(o.evaluation_timestamp, pts) +
                            " after prediction, minimum is " +
                            std::to_string(std::chrono::duration_cast<std::chrono::seconds>(required).count()) + " s");
        }
    }

    report.passed = report.count(Severity::CRITICAL) == 0 && report.count(Severity::HIGH) == 0;

    auto logger = log::get();
    for (const auto& v : report.violations) {
        if (v.severity == Severity::CRITICAL) {
            logger->critical("Audit {} [{}] prediction={} outcome={}: {}", to_string(v.category),
                             to_string(v.severity), v.prediction_id, v.outcome_id, v.detail);
        } else if (v.severity == Severity::HIGH) {
            logger->warn("Audit {} [{}] prediction={} outcome={}: {}", to_string(v.category), to_string(v.severity),
                         v.prediction_id, v.outcome_id, v.detail);
        } else {
            logger->info("Audit {} [{}] prediction={}: {}", to_string(v.category), to_string(v.severity),
                         v.prediction_id, v.detail);
        }
    }
    logger->info("Audit {}: {} predictions, {} outcomes, {} violations ({} critical, {} high)",
                 report.passed ? "passed" : "FAILED", report.predictions_checked, report.outcomes_checked,
                 report.violations.size(), report.count(Severity::CRITICAL), report.count(Severity::HIGH));
    return report;
}

AuditReport TemporalGuard::audit(const PredictionLedger& ledger, Timestamp from, Timestamp to) const
{
    return audit(ledger.load_window(from, to));
}

void require_no_critical(const AuditReport& report, const std::string& stage)
{
    if (!report.has_critical()) {
        return;
    }
    throw TemporalIntegrityViolation(stage + " halted: audit found " + std::to_string(report.count(Severity::CRITICAL)) +
                                         " critical temporal violation(s)",
                                     std::make_shared<AuditReport>(report));
}

}  // namespace foresight
