#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "foresight/time_utils.hpp"

namespace foresight {

struct PriceBar {
    Timestamp timestamp{};
    double close = 0.0;
};

/**
 * @brief Historical close prices, consumed by the evaluator
 *
 * bar_at() returns the bar in effect at t and signals "no data" with an
 * empty optional (non-trading period, stale feed). It never returns a bar
 * from after t. Transient failures are reported with
 * MarketDataUnavailableError so the caller can retry.
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    virtual std::optional<PriceBar> bar_at(const std::string& symbol, Timestamp t) const = 0;
};

/**
 * @brief Bars held in memory, looked up as the last bar at or before t
 *
 * A bar older than max_staleness relative to t counts as missing.
 */
class InMemoryMarketDataSource : public MarketDataSource {
public:
    explicit InMemoryMarketDataSource(std::chrono::seconds max_staleness);

    void add_bar(const std::string& symbol, Timestamp t, double close);

    std::optional<PriceBar> bar_at(const std::string& symbol, Timestamp t) const override;

    size_t size() const;

private:
    std::chrono::seconds max_staleness_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<int64_t, double>> bars_;  // symbol -> epoch ns -> close
};

/**
 * @brief In-memory source filled from a CSV file
 *
 * Rows are "symbol,timestamp,close" with the timestamp in epoch seconds.
 * A header row, blank lines and lines starting with '#' are skipped.
 *
 * @throws PipelineError when the file cannot be read or a row is malformed
 */
class CsvMarketDataSource : public InMemoryMarketDataSource {
public:
    CsvMarketDataSource(const std::string& path, std::chrono::seconds max_staleness);
};

}  // namespace foresight
