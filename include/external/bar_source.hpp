#pragma once

#include "../market/bar.hpp"
#include "http_client.hpp"
#include <string>
#include <vector>

namespace fxsig {
namespace external {

/**
 * Historical / live bar provider
 *
 * fetch() returns up to `count` most recent closed bars, oldest first.
 * Failures throw std::runtime_error.
 */
class IBarSource {
public:
    virtual ~IBarSource() = default;

    virtual std::vector<market::Bar> fetch(const std::string& symbol, size_t count) = 0;
};

/**
 * Reads <directory>/<symbol>.csv on every fetch
 */
class CsvBarSource : public IBarSource {
public:
    explicit CsvBarSource(std::string directory) : directory_(std::move(directory)) {}

    std::vector<market::Bar> fetch(const std::string& symbol, size_t count) override;

    std::string path_for(const std::string& symbol) const { return directory_ + "/" + symbol + ".csv"; }

private:
    std::string directory_;
};

// "1h" -> 3600; throws std::runtime_error on an unknown interval
int64_t interval_seconds(const std::string& interval);

/**
 * YahooBarSource - Yahoo Finance chart API
 *
 * Symbols use Yahoo notation ("EURUSD=X", "GC=F", "BTC-USD"). The bar
 * that is still forming is dropped.
 */
class YahooBarSource : public IBarSource {
public:
    static constexpr const char* BASE_URL = "https://query1.finance.yahoo.com/v8/finance/chart/";

    explicit YahooBarSource(std::string interval = "1h", std::string base_url = BASE_URL);

    std::vector<market::Bar> fetch(const std::string& symbol, size_t count) override;

    /**
     * Parse a chart API body into bars, skipping rows with null prices
     *
     * @throws std::runtime_error if the body carries an error or no result
     */
    static std::vector<market::Bar> parse_chart_json(const std::string& body);

    // Look-back window requested for the interval ("1h" -> "730d")
    static const char* range_for(const std::string& interval);

private:
    std::string interval_;
    std::string base_url_;
    HttpClient http_;
};

} // namespace external
} // namespace fxsig
