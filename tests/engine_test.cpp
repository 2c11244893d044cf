#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "foresight/clock.hpp"
#include "foresight/engine/prediction_engine.hpp"
#include "foresight/errors.hpp"
#include "foresight/ledger/prediction_ledger.hpp"
#include "foresight/model/model_registry.hpp"
#include "test_helpers.hpp"

using namespace foresight;
using namespace foresight::test;

// ===========================================================================
// Fixture: engine over a fresh ledger, clock one second after collection
// ===========================================================================
class EngineTest : public ::testing::Test {
protected:
    TempDir dir;
    PipelineConfig config = test_config(dir);
    ManualClock clock{day(0, 10) + seconds(1)};
    PredictionLedger ledger{config.database_path, config.temporal};
    ModelRegistry registry{config.database_path, config.models_dir, clock};
    PredictionEngine engine{ledger, registry, clock, config.engine};

    FeatureVector snapshot(const std::string& symbol = "QBE") { return make_features(symbol, day(0, 10)); }
};

TEST_F(EngineTest, NoPromotedModel)
{
    EXPECT_THROW(engine.predict("QBE", snapshot()), NoPromotedModelError);
    EXPECT_EQ(ledger.prediction_count(), 0u);
}

TEST_F(EngineTest, RecordsPendingPrediction)
{
    registry.promote(make_bundle("fs-a", TradeAction::BUY, 0.8f, 0.9f, 2.5f));

    Prediction p = engine.predict("QBE", snapshot());
    EXPECT_EQ(p.symbol, "QBE");
    EXPECT_EQ(p.prediction_timestamp, day(0, 10));
    EXPECT_EQ(p.created_at, day(0, 10) + seconds(1));
    EXPECT_EQ(p.predicted_action, TradeAction::BUY);
    EXPECT_NEAR(p.action_confidence, 0.8, 1e-6);
    ASSERT_TRUE(p.predicted_direction.has_value());
    EXPECT_EQ(*p.predicted_direction, 1);
    EXPECT_NEAR(p.predicted_magnitude, 2.5, 1e-6);
    EXPECT_EQ(p.model_version, "fs-a");
    EXPECT_EQ(p.time_bucket, time_bucket_of(day(0, 10), config.temporal.time_bucket));

    auto stored = ledger.find_prediction(p.prediction_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->model_version, "fs-a");
    EXPECT_EQ(stored->feature_snapshot.features.size(), 3u);
    EXPECT_EQ(ledger.status_of(p.prediction_id)->state, PredictionState::PENDING);
}

TEST_F(EngineTest, SecondCallInBucketIsDuplicate)
{
    registry.promote(make_bundle("fs-a"));
    engine.predict("QBE", snapshot());

    clock.set(day(0, 15));
    EXPECT_THROW(engine.predict("QBE", make_features("QBE", day(0, 15))), DuplicatePredictionError);
    EXPECT_EQ(ledger.prediction_count(), 1u);

    // Another symbol in the same bucket is fine
    EXPECT_NO_THROW(engine.predict("BHP", make_features("BHP", day(0, 15))));
}

TEST_F(EngineTest, DirectionAbstainsWhenUncertain)
{
    registry.promote(make_bundle("fs-a", TradeAction::HOLD, 0.6f, 0.52f, 0.1f));

    Prediction p = engine.predict("QBE", snapshot());
    EXPECT_FALSE(p.predicted_direction.has_value());
    EXPECT_FALSE(ledger.find_prediction(p.prediction_id)->predicted_direction.has_value());
}

TEST_F(EngineTest, DownDirectionFromLowUpProbability)
{
    registry.promote(make_bundle("fs-a", TradeAction::SELL, 0.7f, 0.2f, -1.5f));

    Prediction p = engine.predict("QBE", snapshot());
    ASSERT_TRUE(p.predicted_direction.has_value());
    EXPECT_EQ(*p.predicted_direction, -1);
    EXPECT_EQ(p.predicted_action, TradeAction::SELL);
}

TEST_F(EngineTest, ContradictoryPairIsStillRecorded)
{
    registry.promote(make_bundle("fs-a", TradeAction::BUY, 0.7f, 0.1f, 1.0f));

    Prediction p = engine.predict("QBE", snapshot());
    EXPECT_EQ(p.predicted_action, TradeAction::BUY);
    EXPECT_EQ(*p.predicted_direction, -1);
    EXPECT_TRUE(ledger.find_prediction(p.prediction_id).has_value());
}

TEST_F(EngineTest, UsesOneBundleForAllEstimators)
{
    registry.promote(make_bundle("fs-a", TradeAction::BUY));
    Prediction first = engine.predict("QBE", snapshot());

    registry.promote(make_bundle("fs-b", TradeAction::SELL, 0.9f, 0.1f, -2.0f));
    Prediction second = engine.predict("BHP", snapshot("BHP"));

    EXPECT_EQ(first.model_version, "fs-a");
    EXPECT_EQ(second.model_version, "fs-b");
    EXPECT_EQ(second.predicted_action, TradeAction::SELL);
    EXPECT_EQ(*second.predicted_direction, -1);
}

// ===========================================================================
// Schema errors write nothing
// ===========================================================================

TEST_F(EngineTest, SchemaVersionMismatch)
{
    registry.promote(make_bundle("fs-a"));
    FeatureVector fv = make_features("QBE", day(0, 10), {0.5, 0.1, -0.3}, "v2");
    EXPECT_THROW(engine.predict("QBE", fv), FeatureSchemaError);
    EXPECT_EQ(ledger.prediction_count(), 0u);
}

TEST_F(EngineTest, MissingFeature)
{
    registry.promote(make_bundle("fs-a"));
    FeatureVector fv = snapshot();
    fv.features.pop_back();
    EXPECT_THROW(engine.predict("QBE", fv), FeatureSchemaError);
    EXPECT_EQ(ledger.prediction_count(), 0u);
}

TEST_F(EngineTest, UnexpectedFeature)
{
    registry.promote(make_bundle("fs-a"));
    FeatureVector fv = snapshot();
    fv.features.push_back({"insider_tip", 1.0, day(0, 9)});
    EXPECT_THROW(engine.predict("QBE", fv), FeatureSchemaError);
}

TEST_F(EngineTest, DuplicateFeatureName)
{
    registry.promote(make_bundle("fs-a"));
    FeatureVector fv = snapshot();
    fv.features[2].name = fv.features[1].name;
    EXPECT_THROW(engine.predict("QBE", fv), FeatureSchemaError);
}

TEST_F(EngineTest, NonFiniteValue)
{
    registry.promote(make_bundle("fs-a"));
    FeatureVector fv = snapshot();
    fv.features[0].value = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(engine.predict("QBE", fv), FeatureSchemaError);
}

TEST_F(EngineTest, SnapshotForOtherSymbol)
{
    registry.promote(make_bundle("fs-a"));
    EXPECT_THROW(engine.predict("QBE", snapshot("BHP")), FeatureSchemaError);
}

TEST_F(EngineTest, FeatureOrderDoesNotMatter)
{
    registry.promote(make_bundle("fs-a"));
    FeatureVector fv = snapshot();
    std::swap(fv.features[0], fv.features[2]);
    EXPECT_NO_THROW(engine.predict("QBE", fv));
}

// ===========================================================================
// Temporal rules at the write boundary
// ===========================================================================

TEST_F(EngineTest, ValueObservedAfterCollection)
{
    registry.promote(make_bundle("fs-a"));
    FeatureVector fv = snapshot();
    fv.features[1].observed_at = day(0, 10) + minutes(2);
    EXPECT_THROW(engine.predict("QBE", fv), TemporalIntegrityViolation);
    EXPECT_EQ(ledger.prediction_count(), 0u);
}

TEST_F(EngineTest, StaleSnapshotRejected)
{
    registry.promote(make_bundle("fs-a"));
    clock.set(day(0, 11));
    EXPECT_THROW(engine.predict("QBE", snapshot()), TemporalIntegrityViolation);
    EXPECT_EQ(ledger.prediction_count(), 0u);
}
