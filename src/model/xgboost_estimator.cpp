#include "foresight/model/xgboost_estimator.hpp"

#include <cmath>
#include <string>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace foresight
{

    namespace
    {

        std::string last_error()
        {
            const char *err = XGBGetLastError();
            return err ? err : "unknown";
        }

        void check(int ret, const std::string &what)
        {
            if (ret != 0)
            {
                throw ModelError(what + ": " + last_error());
            }
        }

        // Frees the DMatrix on every exit path
        class DMatrix
        {
        public:
            DMatrix(const float *data, size_t nrow, size_t ncol)
            {
                check(XGDMatrixCreateFromMat(data,
                                             static_cast<bst_ulong>(nrow),
                                             static_cast<bst_ulong>(ncol),
                                             std::nanf(""), // missing value marker
                                             &handle_),
                      "XGDMatrixCreateFromMat failed");
            }

            ~DMatrix()
            {
                if (handle_)
                {
                    XGDMatrixFree(handle_);
                }
            }

            DMatrix(const DMatrix &) = delete;
            DMatrix &operator=(const DMatrix &) = delete;

            DMatrixHandle get() const { return handle_; }

        private:
            DMatrixHandle handle_ = nullptr;
        };

        // Frees a booster that has not been handed to an estimator yet
        struct BoosterGuard
        {
            BoosterHandle handle = nullptr;

            ~BoosterGuard()
            {
                if (handle)
                {
                    XGBoosterFree(handle);
                }
            }

            BoosterHandle release()
            {
                BoosterHandle h = handle;
                handle = nullptr;
                return h;
            }
        };

    } // namespace

    XGBoostEstimator::~XGBoostEstimator()
    {
        if (booster_)
        {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }
    }

    XGBoostEstimator::XGBoostEstimator(XGBoostEstimator &&other) noexcept
        : booster_(other.booster_), num_features_(other.num_features_)
    {
        other.booster_ = nullptr;
        other.num_features_ = 0;
    }

    XGBoostEstimator &XGBoostEstimator::operator=(XGBoostEstimator &&other) noexcept
    {
        if (this != &other)
        {
            if (booster_)
                XGBoosterFree(booster_);
            booster_ = other.booster_;
            num_features_ = other.num_features_;
            other.booster_ = nullptr;
            other.num_features_ = 0;
        }
        return *this;
    }

    XGBoostEstimator XGBoostEstimator::load(const std::string &model_path, size_t expected_features)
    {
        log::get()->debug("Loading XGBoost model: {}", model_path);

        BoosterGuard booster;
        check(XGBoosterCreate(nullptr, 0, &booster.handle), "XGBoosterCreate failed");
        check(XGBoosterSetParam(booster.handle, "verbosity", "0"), "XGBoosterSetParam(verbosity) failed");
        check(XGBoosterLoadModel(booster.handle, model_path.c_str()), "failed to load model " + model_path);

        // Inference runs on CPU
        if (XGBoosterSetParam(booster.handle, "device", "cpu") != 0)
        {
            log::get()->debug("device=cpu param not supported, using default CPU");
        }

        bst_ulong num_feature = 0;
        check(XGBoosterGetNumFeature(booster.handle, &num_feature), "XGBoosterGetNumFeature failed");
        if (static_cast<size_t>(num_feature) != expected_features)
        {
            throw ModelError("model " + model_path + " expects " + std::to_string(num_feature) +
                             " features, bundle schema has " + std::to_string(expected_features));
        }

        return XGBoostEstimator(booster.release(), expected_features);
    }

    XGBoostEstimator XGBoostEstimator::train(const std::vector<float> &data, size_t nrow, size_t ncol,
                                             const std::vector<float> &labels, const BoosterParams &params,
                                             const CancellationToken *cancel)
    {
        if (nrow == 0 || ncol == 0 || data.size() != nrow * ncol || labels.size() != nrow)
        {
            throw ModelError("training matrix shape mismatch: " + std::to_string(nrow) + "x" +
                             std::to_string(ncol) + " with " + std::to_string(data.size()) +
                             " values and " + std::to_string(labels.size()) + " labels");
        }

        DMatrix dtrain(data.data(), nrow, ncol);
        check(XGDMatrixSetFloatInfo(dtrain.get(), "label", labels.data(), static_cast<bst_ulong>(nrow)),
              "XGDMatrixSetFloatInfo(label) failed");

        BoosterGuard booster;
        DMatrixHandle cache[] = {dtrain.get()};
        check(XGBoosterCreate(cache, 1, &booster.handle), "XGBoosterCreate failed");

        auto set = [&](const char *name, const std::string &value)
        {
            check(XGBoosterSetParam(booster.handle, name, value.c_str()),
                  std::string("XGBoosterSetParam(") + name + ") failed");
        };
        set("verbosity", "0");
        set("objective", params.objective);
        if (params.num_class > 0)
        {
            set("num_class", std::to_string(params.num_class));
        }
        set("max_depth", std::to_string(params.max_depth));
        set("eta", std::to_string(params.learning_rate));
        set("seed", std::to_string(params.seed));
        if (params.nthread > 0)
        {
            set("nthread", std::to_string(params.nthread));
        }

        for (int iter = 0; iter < params.num_boost_rounds; ++iter)
        {
            if (is_cancelled(cancel))
            {
                throw TrainingCancelledError("training cancelled at boosting round " + std::to_string(iter));
            }
            check(XGBoosterUpdateOneIter(booster.handle, iter, dtrain.get()),
                  "XGBoosterUpdateOneIter failed at round " + std::to_string(iter));
        }

        log::get()->debug("Trained {} booster: {} rows x {} features, {} rounds",
                          params.objective, nrow, ncol, params.num_boost_rounds);
        return XGBoostEstimator(booster.release(), ncol);
    }

    std::vector<float> XGBoostEstimator::predict_batch(const float *data, size_t nrow, size_t ncol) const
    {
        if (!booster_)
        {
            throw ModelError("model not loaded");
        }
        if (ncol != num_features_)
        {
            throw ModelError("expected " + std::to_string(num_features_) + " features, got " +
                             std::to_string(ncol));
        }
        if (nrow == 0)
        {
            return {};
        }

        DMatrix dmat(data, nrow, ncol);

        // type 0 = normal prediction (probabilities for classifiers),
        // iteration_end 0 = use all trees
        const char *config_str =
            "{\"type\": 0, \"training\": false, \"iteration_begin\": 0, \"iteration_end\": 0, \"strict_shape\": false}";

        uint64_t const *out_shape = nullptr;
        uint64_t out_dim = 0;
        const float *out_result = nullptr;
        check(XGBoosterPredictFromDMatrix(booster_, dmat.get(), config_str, &out_shape, &out_dim, &out_result),
              "XGBoosterPredictFromDMatrix failed");

        // Result buffer is owned by the booster's thread-local storage; copy out now
        uint64_t total = out_shape[0] * (out_dim > 1 ? out_shape[1] : 1);
        return std::vector<float>(out_result, out_result + total);
    }

    void XGBoostEstimator::save(const std::string &path) const
    {
        if (!booster_)
        {
            throw ModelError("model not loaded");
        }
        check(XGBoosterSaveModel(booster_, path.c_str()), "failed to save model " + path);
    }

} // namespace foresight
