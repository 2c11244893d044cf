#pragma once
/**
 * @file estimator.hpp
 * @brief Fitted estimator interface used by model bundles
 *
 * Input is a dense row-major float matrix in feature schema order. Output
 * width depends on the objective:
 *   - multi-class: nrow * num_class probabilities
 *   - binary:      nrow probabilities of the positive class
 *   - regression:  nrow values
 */

#include <cstddef>
#include <string>
#include <vector>

namespace foresight
{

    class Estimator
    {
    public:
        virtual ~Estimator() = default;

        virtual std::vector<float> predict_batch(const float *data, size_t nrow, size_t ncol) const = 0;

        virtual size_t num_features() const = 0;

        // Persist the fitted model; throws ModelError
        virtual void save(const std::string &path) const = 0;
    };

} // namespace foresight
