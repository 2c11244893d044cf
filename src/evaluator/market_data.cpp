#include "foresight/evaluator/market_data.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#include "foresight/errors.hpp"
#include "foresight/logging.hpp"

namespace foresight {

namespace {

std::string trim(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) {
        return {};
    }
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

}  // namespace

InMemoryMarketDataSource::InMemoryMarketDataSource(std::chrono::seconds max_staleness)
    : max_staleness_(max_staleness)
{
}

void InMemoryMarketDataSource::add_bar(const std::string& symbol, Timestamp t, double close)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bars_[symbol][to_epoch_ns(t)] = close;
}

std::optional<PriceBar> InMemoryMarketDataSource::bar_at(const std::string& symbol, Timestamp t) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto sym = bars_.find(symbol);
    if (sym == bars_.end()) {
        return std::nullopt;
    }

    const auto& series = sym->second;
    auto it = series.upper_bound(to_epoch_ns(t));
    if (it == series.begin()) {
        return std::nullopt;
    }
    --it;

    PriceBar bar{from_epoch_ns(it->first), it->second};
    if (t - bar.timestamp > max_staleness_) {
        return std::nullopt;
    }
    return bar;
}

size_t InMemoryMarketDataSource::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& entry : bars_) {
        n += entry.second.size();
    }
    return n;
}

CsvMarketDataSource::CsvMarketDataSource(const std::string& path, std::chrono::seconds max_staleness)
    : InMemoryMarketDataSource(max_staleness)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw PipelineError("cannot open market data file " + path);
    }

    std::string line;
    size_t line_no = 0;
    size_t rows = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string symbol, ts_field, close_field;
        if (!std::getline(ss, symbol, ',') || !std::getline(ss, ts_field, ',') || !std::getline(ss, close_field)) {
            throw PipelineError(path + ":" + std::to_string(line_no) + ": expected symbol,timestamp,close");
        }
        symbol = trim(symbol);
        if (rows == 0 && symbol == "symbol") {
            continue;
        }

        try {
            int64_t ts = std::stoll(trim(ts_field));
            double close = std::stod(trim(close_field));
            if (!std::isfinite(close) || close <= 0.0) {
                throw std::invalid_argument("non-positive close");
            }
            add_bar(symbol, from_epoch_seconds(ts), close);
            ++rows;
        } catch (const std::logic_error& e) {
            throw PipelineError(path + ":" + std::to_string(line_no) + ": malformed row (" + e.what() + ")");
        }
    }

    log::get()->info("Loaded {} price bars from {}", rows, path);
}

}  // namespace foresight
