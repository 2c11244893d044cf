#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "foresight/cancellation.hpp"
#include "foresight/clock.hpp"
#include "foresight/errors.hpp"
#include "foresight/evaluator/market_data.hpp"
#include "foresight/evaluator/outcome_evaluator.hpp"
#include "foresight/guard/temporal_guard.hpp"
#include "foresight/ledger/prediction_ledger.hpp"
#include "test_helpers.hpp"

using namespace foresight;
using namespace foresight::test;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// Fails the first `failures` calls, then answers from the wrapped bars
class FlakySource : public InMemoryMarketDataSource {
public:
    explicit FlakySource(int failures) : InMemoryMarketDataSource(minutes(5)), remaining_(failures) {}

    std::optional<PriceBar> bar_at(const std::string& symbol, Timestamp t) const override
    {
        ++calls_;
        if (remaining_.fetch_sub(1) > 0) {
            throw MarketDataUnavailableError("feed reset");
        }
        return InMemoryMarketDataSource::bar_at(symbol, t);
    }

    int calls() const { return calls_.load(); }

private:
    mutable std::atomic<int> remaining_;
    mutable std::atomic<int> calls_{0};
};

// Answers only after a delay, or for listed symbols without one
class SlowSource : public InMemoryMarketDataSource {
public:
    SlowSource(std::chrono::milliseconds delay, std::string slow_symbol)
        : InMemoryMarketDataSource(minutes(5)), delay_(delay), slow_symbol_(std::move(slow_symbol))
    {
    }

    std::optional<PriceBar> bar_at(const std::string& symbol, Timestamp t) const override
    {
        ++calls_;
        if (symbol == slow_symbol_) {
            std::this_thread::sleep_for(delay_);
        }
        return InMemoryMarketDataSource::bar_at(symbol, t);
    }

    int calls() const { return calls_.load(); }

private:
    mutable std::atomic<int> calls_{0};
    std::chrono::milliseconds delay_;
    std::string slow_symbol_;
};

}  // namespace

// ===========================================================================
// Fixture: one 1h horizon, inline market data calls, short backoff
// ===========================================================================
class EvaluatorTest : public ::testing::Test {
protected:
    TempDir dir;
    TemporalConfig temporal;
    EvaluatorConfig config;
    ManualClock clock{day(0, 10)};
    PredictionLedger ledger{dir.file("ledger.db"), temporal};
    TemporalGuard guard{temporal, clock};
    std::shared_ptr<InMemoryMarketDataSource> prices = std::make_shared<InMemoryMarketDataSource>(minutes(5));

    void SetUp() override
    {
        config.horizons = {hours(1)};
        config.call_timeout_ms = 0;
        config.initial_backoff_ms = 1;
        config.max_attempts = 2;
    }

    OutcomeEvaluator evaluator(std::shared_ptr<const MarketDataSource> source = nullptr)
    {
        return OutcomeEvaluator(ledger, source ? source : prices, guard, clock, config);
    }

    Prediction predict(const std::string& symbol, Timestamp pts)
    {
        Prediction p = make_prediction(symbol, pts, temporal.time_bucket);
        ledger.append(p);
        return p;
    }
};

// ===========================================================================
// Timing
// ===========================================================================

TEST_F(EvaluatorTest, TenMinuteOldPredictionNotEvaluated)
{
    Prediction p = predict("QBE", day(0, 10));
    prices->add_bar("QBE", day(0, 10), 100.0);
    prices->add_bar("QBE", day(0, 10) + minutes(10), 101.0);
    clock.set(day(0, 10) + minutes(10));

    EvaluationReport report = evaluator().evaluate_pending();
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_EQ(report.outcomes_written, 0u);
    EXPECT_EQ(ledger.outcome_count(), 0u);
    EXPECT_EQ(ledger.status_of(p.prediction_id)->state, PredictionState::PENDING);
}

TEST_F(EvaluatorTest, EvaluatesOnceDelayElapsed)
{
    Prediction p = predict("QBE", day(0, 10));
    prices->add_bar("QBE", day(0, 10), 100.0);
    prices->add_bar("QBE", day(0, 11), 105.0);
    clock.set(day(0, 11) + minutes(2));

    EvaluationReport report = evaluator().evaluate_pending();
    EXPECT_EQ(report.candidates, 1u);
    EXPECT_EQ(report.outcomes_written, 1u);
    EXPECT_EQ(report.predictions_evaluated, 1u);
    EXPECT_TRUE(report.failures.empty());

    auto outcomes = ledger.outcomes_for(p.prediction_id);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_DOUBLE_EQ(outcomes[0].actual_return_pct, 5.0);
    EXPECT_EQ(outcomes[0].actual_direction, 1);
    EXPECT_DOUBLE_EQ(outcomes[0].entry_price, 100.0);
    EXPECT_DOUBLE_EQ(outcomes[0].exit_price, 105.0);
    EXPECT_EQ(outcomes[0].evaluation_timestamp, day(0, 11) + minutes(2));
    EXPECT_EQ(ledger.status_of(p.prediction_id)->state, PredictionState::EVALUATED);

    // The prediction itself is untouched
    EXPECT_EQ(ledger.find_prediction(p.prediction_id)->predicted_magnitude, p.predicted_magnitude);
}

TEST_F(EvaluatorTest, LaterHorizonsWaitTheirTurn)
{
    config.horizons = {hours(1), hours(4)};
    Prediction p = predict("QBE", day(0, 10));
    prices->add_bar("QBE", day(0, 10), 100.0);
    prices->add_bar("QBE", day(0, 11), 99.0);
    prices->add_bar("QBE", day(0, 14), 103.0);

    clock.set(day(0, 12));
    EvaluationReport first = evaluator().evaluate_pending();
    EXPECT_EQ(first.outcomes_written, 1u);
    EXPECT_EQ(first.not_yet_due, 1u);
    EXPECT_EQ(ledger.status_of(p.prediction_id)->state, PredictionState::PENDING);

    clock.set(day(0, 14) + minutes(1));
    EvaluationReport second = evaluator().evaluate_pending();
    EXPECT_EQ(second.outcomes_written, 1u);
    EXPECT_EQ(second.predictions_evaluated, 1u);

    auto outcomes = ledger.outcomes_for(p.prediction_id);
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].horizon, hours(1));
    EXPECT_EQ(outcomes[0].actual_direction, -1);
    EXPECT_EQ(outcomes[1].horizon, hours(4));
    EXPECT_DOUBLE_EQ(outcomes[1].actual_return_pct, 3.0);
}

TEST_F(EvaluatorTest, RerunIsIdempotent)
{
    predict("QBE", day(0, 10));
    predict("BHP", day(0, 10));
    for (const char* s : {"QBE", "BHP"}) {
        prices->add_bar(s, day(0, 10), 50.0);
        prices->add_bar(s, day(0, 11), 51.0);
    }
    clock.set(day(0, 12));

    EvaluationReport first = evaluator().evaluate_pending();
    EvaluationReport second = evaluator().evaluate_pending();
    EXPECT_EQ(first.outcomes_written, 2u);
    EXPECT_EQ(second.candidates, 0u);
    EXPECT_EQ(second.outcomes_written, 0u);
    EXPECT_EQ(ledger.outcome_count(), 2u);
}

// ===========================================================================
// Missing data
// ===========================================================================

TEST_F(EvaluatorTest, MissingPriceDefers)
{
    Prediction p = predict("QBE", day(0, 10));
    prices->add_bar("QBE", day(0, 10), 100.0);
    clock.set(day(0, 12));

    EvaluationReport report = evaluator().evaluate_pending();
    EXPECT_EQ(report.deferred, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].prediction_id, p.prediction_id);

    auto status = ledger.status_of(p.prediction_id);
    EXPECT_EQ(status->state, PredictionState::PENDING);
    EXPECT_EQ(status->attempts, 1);
    EXPECT_NE(status->last_error.find("exit"), std::string::npos);
}

TEST_F(EvaluatorTest, ExpiresAfterWindow)
{
    Prediction p = predict("QBE", day(0, 10));
    clock.set(day(3, 11));

    EvaluationReport report = evaluator().evaluate_pending();
    EXPECT_EQ(report.expired, 1u);
    EXPECT_EQ(ledger.status_of(p.prediction_id)->state, PredictionState::EXPIRED);
    EXPECT_EQ(ledger.outcome_count(), 0u);

    // Terminal: not a candidate any more
    EXPECT_EQ(evaluator().evaluate_pending().candidates, 0u);
}

TEST_F(EvaluatorTest, TransientFailureRetried)
{
    auto flaky = std::make_shared<FlakySource>(1);
    flaky->add_bar("QBE", day(0, 10), 100.0);
    flaky->add_bar("QBE", day(0, 11), 102.0);
    predict("QBE", day(0, 10));
    clock.set(day(0, 12));

    EvaluationReport report = evaluator(flaky).evaluate_pending();
    EXPECT_EQ(report.outcomes_written, 1u);
    EXPECT_EQ(report.deferred, 0u);
    EXPECT_EQ(flaky->calls(), 3);
}

TEST_F(EvaluatorTest, ExhaustedRetriesDefer)
{
    auto flaky = std::make_shared<FlakySource>(100);
    flaky->add_bar("QBE", day(0, 10), 100.0);
    flaky->add_bar("QBE", day(0, 11), 102.0);
    Prediction p = predict("QBE", day(0, 10));
    clock.set(day(0, 12));

    EvaluationReport report = evaluator(flaky).evaluate_pending();
    EXPECT_EQ(report.deferred, 1u);
    EXPECT_EQ(flaky->calls(), config.max_attempts);
    EXPECT_EQ(ledger.status_of(p.prediction_id)->attempts, 1);
}

TEST_F(EvaluatorTest, StalledSymbolDoesNotHoldUpOthers)
{
    config.call_timeout_ms = 50;
    config.max_concurrent_symbols = 2;
    auto slow = std::make_shared<SlowSource>(std::chrono::milliseconds(2000), "QBE");
    for (const char* s : {"QBE", "BHP"}) {
        slow->add_bar(s, day(0, 10), 100.0);
        slow->add_bar(s, day(0, 11), 101.0);
    }
    Prediction stalled = predict("QBE", day(0, 10));
    Prediction healthy = predict("BHP", day(0, 10));
    clock.set(day(0, 12));

    auto started = std::chrono::steady_clock::now();
    EvaluationReport report = evaluator(slow).evaluate_pending();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    EXPECT_EQ(report.outcomes_written, 1u);
    EXPECT_EQ(report.deferred, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].symbol, "QBE");
    EXPECT_NE(report.failures[0].error.find("timed out"), std::string::npos);
    EXPECT_EQ(ledger.status_of(healthy.prediction_id)->state, PredictionState::EVALUATED);
    EXPECT_EQ(ledger.status_of(stalled.prediction_id)->state, PredictionState::PENDING);
}

TEST_F(EvaluatorTest, HungSourceGetsNoNewCallsPastCap)
{
    config.call_timeout_ms = 20;
    config.max_attempts = 1;
    config.max_calls_in_flight = 1;
    auto slow = std::make_shared<SlowSource>(std::chrono::milliseconds(300), "QBE");
    std::vector<Prediction> waiting;
    for (int d = 0; d < 3; ++d) {
        slow->add_bar("QBE", day(d, 10), 100.0);
        slow->add_bar("QBE", day(d, 11), 101.0);
        waiting.push_back(predict("QBE", day(d, 10)));
    }
    clock.set(day(2, 12));

    EvaluationReport report = evaluator(slow).evaluate_pending();

    // Only the first lookup reaches the source; the rest fail fast while it hangs
    EXPECT_LE(slow->calls(), 1);
    EXPECT_EQ(report.deferred, 3u);
    EXPECT_EQ(report.outcomes_written, 0u);
    bool refused = false;
    for (const auto& f : report.failures) {
        refused = refused || f.error.find("in flight") != std::string::npos;
    }
    EXPECT_TRUE(refused);
    for (const auto& p : waiting) {
        EXPECT_EQ(ledger.status_of(p.prediction_id)->state, PredictionState::PENDING);
    }
}

// ===========================================================================
// Batch behaviour
// ===========================================================================

TEST_F(EvaluatorTest, ManySymbolsAcrossWorkers)
{
    config.max_concurrent_symbols = 3;
    const std::vector<std::string> symbols{"AAA", "BBB", "CCC", "DDD", "EEE", "FFF", "GGG"};
    for (const auto& s : symbols) {
        predict(s, day(0, 10));
        prices->add_bar(s, day(0, 10), 10.0);
        prices->add_bar(s, day(0, 11), 11.0);
    }
    clock.set(day(0, 12));

    EvaluationReport report = evaluator().evaluate_pending();
    EXPECT_EQ(report.candidates, symbols.size());
    EXPECT_EQ(report.predictions_evaluated, symbols.size());
    EXPECT_EQ(ledger.outcome_count(), symbols.size());
}

TEST_F(EvaluatorTest, CancelledBatchWritesNothingMore)
{
    predict("QBE", day(0, 10));
    prices->add_bar("QBE", day(0, 10), 100.0);
    prices->add_bar("QBE", day(0, 11), 101.0);
    clock.set(day(0, 12));

    CancellationToken cancel;
    cancel.cancel();
    EvaluationReport report = evaluator().evaluate_pending(&cancel);
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(ledger.outcome_count(), 0u);

    // The next tick picks it up
    EXPECT_EQ(evaluator().evaluate_pending().outcomes_written, 1u);
}

TEST_F(EvaluatorTest, ReportJson)
{
    predict("QBE", day(0, 10));
    clock.set(day(0, 12));
    nlohmann::json j = evaluator().evaluate_pending();
    EXPECT_EQ(j["candidates"], 1);
    EXPECT_EQ(j["deferred"], 1);
    EXPECT_EQ(j["failures"].size(), 1u);
}

// ===========================================================================
// Integrity gate
// ===========================================================================

TEST_F(EvaluatorTest, RefusesToRunOnLeakage)
{
    Prediction clean = predict("BHP", day(0, 10));
    Prediction leaky = make_prediction("QBE", day(0, 10));
    leaky.feature_snapshot.features[0].observed_at = day(0, 10) + minutes(30);
    ledger.append(leaky);
    for (const char* s : {"QBE", "BHP"}) {
        prices->add_bar(s, day(0, 10), 100.0);
        prices->add_bar(s, day(0, 11), 101.0);
    }
    clock.set(day(0, 12));

    try {
        evaluator().evaluate_pending();
        FAIL() << "expected TemporalIntegrityViolation";
    } catch (const TemporalIntegrityViolation& e) {
        ASSERT_NE(e.report(), nullptr);
        EXPECT_EQ(e.report()->count(ViolationCategory::LEAKAGE), 1u);
    }
    EXPECT_EQ(ledger.outcome_count(), 0u);
    EXPECT_EQ(ledger.status_of(clean.prediction_id)->state, PredictionState::PENDING);
}

TEST_F(EvaluatorTest, AuditReachesPendingRowsOlderThanLookback)
{
    Prediction leaky = make_prediction("QBE", day(0, 10));
    leaky.feature_snapshot.features[0].observed_at = day(0, 10) + minutes(30);
    ledger.append(leaky);
    prices->add_bar("QBE", day(0, 10), 100.0);
    prices->add_bar("QBE", day(0, 11), 101.0);

    // Past the 30-day audit lookback, still a pending candidate
    clock.set(day(31, 12));

    EXPECT_THROW(evaluator().evaluate_pending(), TemporalIntegrityViolation);
    EXPECT_EQ(ledger.outcome_count(), 0u);
    EXPECT_EQ(ledger.status_of(leaky.prediction_id)->state, PredictionState::PENDING);
}
