#pragma once
/**
 * @file xgboost_estimator.hpp
 * @brief Estimator backed by the XGBoost C API
 *
 * One booster per estimator. Models are stored in native XGBoost format
 * (.ubj, Universal Binary JSON) and inference goes through
 * XGBoosterPredictFromDMatrix.
 *
 * Objectives used by the pipeline:
 *   - multi:softprob    action classifier (5 classes)
 *   - binary:logistic   direction classifier
 *   - reg:squarederror  magnitude regressor
 */

#include <cstdint>
#include <string>
#include <vector>

#include <xgboost/c_api.h>

#include "foresight/cancellation.hpp"
#include "foresight/model/estimator.hpp"

namespace foresight
{

    /**
     * @brief Booster parameters for one training run
     */
    struct BoosterParams
    {
        std::string objective = "reg:squarederror";
        int num_class = 0; // only for multi:softprob
        int max_depth = 4;
        double learning_rate = 0.1;
        int num_boost_rounds = 50;
        int nthread = 0; // 0 = library default
        uint64_t seed = 0;
    };

    class XGBoostEstimator : public Estimator
    {
    public:
        ~XGBoostEstimator() override;

        // Non-copyable
        XGBoostEstimator(const XGBoostEstimator &) = delete;
        XGBoostEstimator &operator=(const XGBoostEstimator &) = delete;

        // Movable
        XGBoostEstimator(XGBoostEstimator &&other) noexcept;
        XGBoostEstimator &operator=(XGBoostEstimator &&other) noexcept;

        /**
         * @brief Load a model file (.ubj, .json)
         *
         * @param model_path Path to XGBoost model file
         * @param expected_features Column count the model must have been trained on
         * @throws ModelError on load failure or feature count mismatch
         */
        static XGBoostEstimator load(const std::string &model_path, size_t expected_features);

        /**
         * @brief Fit a new booster on a dense row-major matrix
         *
         * The token is checked between boosting rounds.
         *
         * @throws ModelError on any C API failure
         * @throws TrainingCancelledError when the token is cancelled
         */
        static XGBoostEstimator train(const std::vector<float> &data, size_t nrow, size_t ncol,
                                      const std::vector<float> &labels, const BoosterParams &params,
                                      const CancellationToken *cancel = nullptr);

        std::vector<float> predict_batch(const float *data, size_t nrow, size_t ncol) const override;

        size_t num_features() const override { return num_features_; }

        void save(const std::string &path) const override;

    private:
        XGBoostEstimator(BoosterHandle booster, size_t num_features)
            : booster_(booster), num_features_(num_features) {}

        BoosterHandle booster_ = nullptr;
        size_t num_features_ = 0;
    };

} // namespace foresight
