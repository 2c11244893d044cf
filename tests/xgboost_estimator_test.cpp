#include <gtest/gtest.h>

#include <filesystem>

#include "foresight/cancellation.hpp"
#include "foresight/errors.hpp"
#include "foresight/model/xgboost_estimator.hpp"
#include "test_helpers.hpp"

using namespace foresight;
using namespace foresight::test;

namespace {

// Two columns; the label is decided by the sign of the first
struct Separable {
    std::vector<float> data;
    std::vector<float> labels;
    size_t nrow = 0;
    static constexpr size_t ncol = 2;
};

Separable separable(size_t nrow)
{
    Separable s;
    s.nrow = nrow;
    for (size_t i = 0; i < nrow; ++i) {
        float x = (i % 2 == 0) ? 1.0f + 0.01f * i : -1.0f - 0.01f * i;
        s.data.push_back(x);
        s.data.push_back(0.5f);
        s.labels.push_back(x > 0.0f ? 1.0f : 0.0f);
    }
    return s;
}

BoosterParams binary_params()
{
    BoosterParams params;
    params.objective = "binary:logistic";
    params.max_depth = 2;
    params.num_boost_rounds = 20;
    params.nthread = 1;
    return params;
}

}  // namespace

TEST(XGBoostEstimatorTest, TrainSeparatesClasses)
{
    auto s = separable(40);
    auto model = XGBoostEstimator::train(s.data, s.nrow, s.ncol, s.labels, binary_params());
    EXPECT_EQ(model.num_features(), 2u);

    std::vector<float> rows{2.0f, 0.5f, -2.0f, 0.5f};
    auto out = model.predict_batch(rows.data(), 2, 2);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_GT(out[0], 0.5f);
    EXPECT_LT(out[1], 0.5f);
}

TEST(XGBoostEstimatorTest, MultiClassReturnsOneProbabilityPerClass)
{
    auto s = separable(40);
    BoosterParams params = binary_params();
    params.objective = "multi:softprob";
    params.num_class = static_cast<int>(NUM_ACTIONS);
    for (auto& label : s.labels) {
        label = label > 0.0f ? 3.0f : 1.0f;
    }

    auto model = XGBoostEstimator::train(s.data, s.nrow, s.ncol, s.labels, params);
    std::vector<float> row{2.0f, 0.5f};
    auto probs = model.predict_batch(row.data(), 1, 2);
    ASSERT_EQ(probs.size(), NUM_ACTIONS);
    float sum = 0.0f;
    for (float p : probs) {
        sum += p;
    }
    EXPECT_NEAR(sum, 1.0f, 1e-4);
}

TEST(XGBoostEstimatorTest, SaveAndLoadGiveSamePredictions)
{
    TempDir dir;
    auto s = separable(40);
    auto model = XGBoostEstimator::train(s.data, s.nrow, s.ncol, s.labels, binary_params());
    const std::string path = dir.file("direction.ubj");
    model.save(path);
    ASSERT_TRUE(std::filesystem::exists(path));

    auto loaded = XGBoostEstimator::load(path, 2);
    auto a = model.predict_batch(s.data.data(), s.nrow, s.ncol);
    auto b = loaded.predict_batch(s.data.data(), s.nrow, s.ncol);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_NEAR(a[i], b[i], 1e-6);
    }
}

TEST(XGBoostEstimatorTest, FeatureCountMismatch)
{
    TempDir dir;
    auto s = separable(20);
    auto model = XGBoostEstimator::train(s.data, s.nrow, s.ncol, s.labels, binary_params());
    model.save(dir.file("m.ubj"));

    EXPECT_THROW(XGBoostEstimator::load(dir.file("m.ubj"), 3), ModelError);

    std::vector<float> wide{1.0f, 2.0f, 3.0f};
    EXPECT_THROW(model.predict_batch(wide.data(), 1, 3), ModelError);
}

TEST(XGBoostEstimatorTest, LoadMissingFile)
{
    TempDir dir;
    EXPECT_THROW(XGBoostEstimator::load(dir.file("absent.ubj"), 2), ModelError);
}

TEST(XGBoostEstimatorTest, ShapeMismatchRejected)
{
    auto s = separable(10);
    s.labels.pop_back();
    EXPECT_THROW(XGBoostEstimator::train(s.data, s.nrow, s.ncol, s.labels, binary_params()), ModelError);
}

TEST(XGBoostEstimatorTest, CancelledTrainingStops)
{
    auto s = separable(20);
    CancellationToken cancel;
    cancel.cancel();
    EXPECT_THROW(XGBoostEstimator::train(s.data, s.nrow, s.ncol, s.labels, binary_params(), &cancel),
                 TrainingCancelledError);
}
