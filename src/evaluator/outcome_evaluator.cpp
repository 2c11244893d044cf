#include "foresight/evaluator/outcome_evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <map>
#include <set>
#include <system_error>
#include <thread>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace foresight {

namespace {

// Timed market data calls still running, across every evaluator in the process
std::atomic<int> g_calls_in_flight{0};

}  // namespace

void EvaluationReport::merge(const EvaluationReport& other)
{
    candidates += other.candidates;
    outcomes_written += other.outcomes_written;
    predictions_evaluated += other.predictions_evaluated;
    already_evaluated += other.already_evaluated;
    not_yet_due += other.not_yet_due;
    deferred += other.deferred;
    expired += other.expired;
    quarantined_skipped += other.quarantined_skipped;
    timed_out += other.timed_out;
    cancelled = cancelled || other.cancelled;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
}

void to_json(nlohmann::json& j, const EvaluationReport& report)
{
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& f : report.failures) {
        failures.push_back({{"prediction_id", f.prediction_id}, {"symbol", f.symbol}, {"error", f.error}});
    }
    j = nlohmann::json{{"started_at", format_utc(report.started_at)},
                       {"finished_at", format_utc(report.finished_at)},
                       {"candidates", report.candidates},
                       {"outcomes_written", report.outcomes_written},
                       {"predictions_evaluated", report.predictions_evaluated},
                       {"already_evaluated", report.already_evaluated},
                       {"not_yet_due", report.not_yet_due},
                       {"deferred", report.deferred},
                       {"expired", report.expired},
                       {"quarantined_skipped", report.quarantined_skipped},
                       {"timed_out", report.timed_out},
                       {"cancelled", report.cancelled},
                       {"failures", failures}};
}

OutcomeEvaluator::OutcomeEvaluator(PredictionLedger& ledger, std::shared_ptr<const MarketDataSource> market_data,
                                   const TemporalGuard& guard, const Clock& clock, const EvaluatorConfig& config)
    : ledger_(ledger), market_data_(std::move(market_data)), guard_(guard), clock_(clock), config_(config)
{
}

EvaluationReport OutcomeEvaluator::evaluate_pending(const CancellationToken* cancel)
{
    auto logger = log::get();

    EvaluationReport report;
    report.started_at = clock_.now();
    const Timestamp now = report.started_at;

    auto candidates = ledger_.pending_predictions(now - ledger_.temporal().min_eval_delay, config_.batch_limit);
    report.candidates = candidates.size();

    // The audit reaches back to the oldest candidate, and is open-ended so
    // future-dated rows are caught too
    Timestamp audit_from = now - config_.audit_lookback;
    if (!candidates.empty()) {
        audit_from = std::min(audit_from, candidates.front().prediction_timestamp);
    }
    AuditReport audit = guard_.audit(ledger_, audit_from, Timestamp::max());
    require_no_critical(audit, "outcome evaluation");

    std::map<std::string, std::vector<Prediction>> by_symbol;
    for (auto& p : candidates) {
        by_symbol[p.symbol].push_back(std::move(p));
    }
    std::vector<const std::pair<const std::string, std::vector<Prediction>>*> work;
    for (const auto& entry : by_symbol) {
        work.push_back(&entry);
    }

    logger->info("Evaluating {} pending predictions across {} symbols", report.candidates, work.size());

    std::atomic<size_t> next{0};
    std::atomic<bool> halted{false};
    auto worker = [&]() {
        EvaluationReport partial;
        while (!halted.load()) {
            size_t i = next.fetch_add(1);
            if (i >= work.size()) {
                break;
            }
            try {
                partial.merge(evaluate_symbol(work[i]->first, work[i]->second, audit, cancel));
            } catch (const TemporalIntegrityViolation&) {
                halted = true;
                throw;
            }
        }
        return partial;
    };

    const size_t pool = std::min(work.size(), static_cast<size_t>(config_.max_concurrent_symbols));
    std::vector<std::future<EvaluationReport>> workers;
    for (size_t i = 0; i < pool; ++i) {
        workers.push_back(std::async(std::launch::async, worker));
    }
    // get() rethrows a halting violation; the remaining futures join on destruction
    for (auto& w : workers) {
        report.merge(w.get());
    }

    report.finished_at = clock_.now();
    logger->info("Evaluation done: {} outcomes written, {} evaluated, {} deferred, {} expired, {} not yet due, "
                 "{} quarantined, {} timed out, {} failures{}",
                 report.outcomes_written, report.predictions_evaluated, report.deferred, report.expired,
                 report.not_yet_due, report.quarantined_skipped, report.timed_out, report.failures.size(),
                 report.cancelled ? " (cancelled)" : "");
    return report;
}

EvaluationReport OutcomeEvaluator::evaluate_symbol(const std::string& symbol,
                                                   const std::vector<Prediction>& predictions,
                                                   const AuditReport& audit, const CancellationToken* cancel)
{
    auto logger = log::get();
    EvaluationReport partial;
    const SteadyTime deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.symbol_timeout_ms);

    for (size_t i = 0; i < predictions.size(); ++i) {
        if (is_cancelled(cancel)) {
            partial.cancelled = true;
            break;
        }

        const Prediction& p = predictions[i];
        if (audit.is_quarantined(p.prediction_id)) {
            logger->warn("{}: skipping quarantined prediction {}", symbol, p.prediction_id);
            ++partial.quarantined_skipped;
            continue;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            partial.timed_out += predictions.size() - i;
            logger->warn("{}: symbol deadline of {} ms passed, {} predictions left for the next run", symbol,
                         config_.symbol_timeout_ms, predictions.size() - i);
            break;
        }

        try {
            evaluate_one(p, deadline, partial);
        } catch (const TemporalIntegrityViolation&) {
            throw;
        } catch (const std::exception& e) {
            logger->warn("{}: evaluation of {} failed: {}", symbol, p.prediction_id, e.what());
            partial.failures.push_back({p.prediction_id, symbol, e.what()});
        }
    }
    return partial;
}

void OutcomeEvaluator::evaluate_one(const Prediction& p, SteadyTime deadline, EvaluationReport& report)
{
    auto logger = log::get();
    const auto& temporal = ledger_.temporal();
    const std::set<std::chrono::seconds> horizons(config_.horizons.begin(), config_.horizons.end());

    std::set<std::chrono::seconds> done;
    for (const auto& o : ledger_.outcomes_for(p.prediction_id)) {
        done.insert(o.horizon);
    }

    bool waiting = false;
    bool missing = false;
    std::string problem;

    for (auto h : horizons) {
        if (done.count(h)) {
            continue;
        }

        const Timestamp now = clock_.now();
        if (now < p.prediction_timestamp + std::max(temporal.min_eval_delay, h)) {
            waiting = true;
            continue;
        }

        std::optional<PriceBar> entry;
        std::optional<PriceBar> exit;
        try {
            entry = fetch_bar(p.symbol, p.prediction_timestamp, deadline);
            if (entry) {
                exit = fetch_bar(p.symbol, p.prediction_timestamp + h, deadline);
            }
        } catch (const MarketDataUnavailableError& e) {
            missing = true;
            problem = e.what();
            continue;
        }
        if (!entry || !exit) {
            missing = true;
            problem = "no " + std::string(entry ? "exit" : "entry") + " price for " + p.symbol + " at " +
                      format_utc(entry ? p.prediction_timestamp + h : p.prediction_timestamp);
            continue;
        }

        Outcome o;
        o.outcome_id = generate_id();
        o.prediction_id = p.prediction_id;
        o.horizon = h;
        o.entry_price = entry->close;
        o.exit_price = exit->close;
        o.actual_return_pct = compute_return_pct(o.entry_price, o.exit_price);
        o.actual_direction = sign_of(o.actual_return_pct);
        o.evaluation_timestamp = now;

        if (ledger_.record_outcome(o)) {
            ++report.outcomes_written;
            logger->debug("{}: outcome {} horizon={}s entry={} exit={} return={:.4f}%", p.symbol, p.prediction_id,
                          h.count(), o.entry_price, o.exit_price, o.actual_return_pct);
        }
        done.insert(h);
    }

    const Timestamp now = clock_.now();
    if (done.size() == horizons.size()) {
        if (ledger_.mark_evaluated(p.prediction_id, now)) {
            ++report.predictions_evaluated;
        } else {
            ++report.already_evaluated;
        }
    } else if (missing) {
        if (now - p.prediction_timestamp >= config_.expire_after) {
            if (ledger_.mark_expired(p.prediction_id, now, problem)) {
                ++report.expired;
                logger->warn("{}: prediction {} expired: {}", p.symbol, p.prediction_id, problem);
            }
        } else {
            ledger_.record_attempt_failure(p.prediction_id, now, problem);
            ++report.deferred;
            report.failures.push_back({p.prediction_id, p.symbol, problem});
            logger->warn("{}: prediction {} deferred: {}", p.symbol, p.prediction_id, problem);
        }
    } else if (waiting) {
        ++report.not_yet_due;
    }
}

std::optional<PriceBar> OutcomeEvaluator::fetch_bar(const std::string& symbol, Timestamp t, SteadyTime deadline) const
{
    using std::chrono::milliseconds;

    milliseconds backoff(config_.initial_backoff_ms);
    std::string last_error;
    int attempt = 0;

    while (true) {
        ++attempt;
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            last_error = "symbol deadline passed";
            break;
        }

        try {
            milliseconds timeout(0);
            if (config_.call_timeout_ms > 0) {
                timeout = std::max(milliseconds(1), std::min(milliseconds(config_.call_timeout_ms), remaining));
            }
            return call_with_timeout(symbol, t, timeout);
        } catch (const MarketDataUnavailableError& e) {
            last_error = e.what();
        }

        if (attempt >= config_.max_attempts || std::chrono::steady_clock::now() + backoff >= deadline) {
            break;
        }
        log::get()->debug("{}: market data attempt {} failed ({}), retrying in {} ms", symbol, attempt, last_error,
                          backoff.count());
        std::this_thread::sleep_for(backoff);
        backoff = milliseconds(static_cast<int64_t>(static_cast<double>(backoff.count()) * config_.backoff_multiplier));
    }

    throw MarketDataUnavailableError("market data for " + symbol + " at " + format_utc(t) + " unavailable after " +
                                     std::to_string(attempt) + " attempt(s): " + last_error);
}

std::optional<PriceBar> OutcomeEvaluator::call_with_timeout(const std::string& symbol, Timestamp t,
                                                            std::chrono::milliseconds timeout) const
{
    if (timeout.count() <= 0) {
        return market_data_->bar_at(symbol, t);
    }

    // The call runs detached so a stalled source cannot hold up the batch; it
    // keeps its own reference to the source. Calls that outlive their timeout
    // stay counted until they return, and no new call starts past the cap.
    if (g_calls_in_flight.fetch_add(1) >= config_.max_calls_in_flight) {
        g_calls_in_flight.fetch_sub(1);
        throw MarketDataUnavailableError("market data call for " + symbol + " not started: " +
                                         std::to_string(config_.max_calls_in_flight) +
                                         " earlier calls still in flight");
    }
    auto source = market_data_;
    auto task = std::make_shared<std::packaged_task<std::optional<PriceBar>()>>(
        [source, symbol, t]() { return source->bar_at(symbol, t); });
    auto result = task->get_future();
    try {
        std::thread([task]() {
            (*task)();
            g_calls_in_flight.fetch_sub(1);
        }).detach();
    } catch (const std::system_error&) {
        g_calls_in_flight.fetch_sub(1);
        throw;
    }

    if (result.wait_for(timeout) != std::future_status::ready) {
        throw MarketDataUnavailableError("market data call for " + symbol + " timed out after " +
                                         std::to_string(timeout.count()) + " ms");
    }
    return result.get();
}

}  // namespace foresight
