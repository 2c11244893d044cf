#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace foresight {

struct AuditReport;

class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Feature vector does not match the promoted bundle's schema; nothing written
class FeatureSchemaError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// (symbol, time-bucket) or prediction_id already recorded; callers treat as "already predicted"
class DuplicatePredictionError : public PipelineError {
public:
    DuplicatePredictionError(const std::string& what, std::string symbol, long long time_bucket)
        : PipelineError(what), symbol_(std::move(symbol)), time_bucket_(time_bucket) {}

    const std::string& symbol() const { return symbol_; }
    long long time_bucket() const { return time_bucket_; }

private:
    std::string symbol_;
    long long time_bucket_;
};

class MarketDataUnavailableError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/**
 * @brief A temporal invariant is broken
 *
 * When raised by a stage gate (evaluator, trainer) it carries the audit
 * report that failed; write-boundary rejections carry no report.
 */
class TemporalIntegrityViolation : public PipelineError {
public:
    explicit TemporalIntegrityViolation(const std::string& what,
                                        std::shared_ptr<const AuditReport> report = nullptr)
        : PipelineError(what), report_(std::move(report)) {}

    const std::shared_ptr<const AuditReport>& report() const { return report_; }

private:
    std::shared_ptr<const AuditReport> report_;
};

// Outcome refers to a prediction that does not exist
class ReferentialIntegrityError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class InsufficientTrainingDataError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class NoPromotedModelError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class TrainingInProgressError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class TrainingCancelledError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class StorageError : public PipelineError {
public:
    StorageError(const std::string& what, int code = 0) : PipelineError(what), code_(code) {}

    // SQLite extended result code, 0 when not from SQLite
    int code() const { return code_; }

private:
    int code_;
};

// XGBoost C API failure, message carries XGBGetLastError()
class ModelError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class ConfigError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

}  // namespace foresight
