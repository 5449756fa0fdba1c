#include "../../include/external/bar_source.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/time_utils.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace fxsig::external {

using json = nlohmann::json;

namespace {

std::vector<market::Bar> tail(std::vector<market::Bar> bars, size_t count) {
    if (bars.size() > count)
        bars.erase(bars.begin(), bars.end() - static_cast<std::ptrdiff_t>(count));
    return bars;
}

} // namespace

std::vector<market::Bar> CsvBarSource::fetch(const std::string& symbol, size_t count) {
    return tail(market::load_bars_csv(path_for(symbol)), count);
}

int64_t interval_seconds(const std::string& interval) {
    if (interval == "1m")
        return 60;
    if (interval == "5m")
        return 300;
    if (interval == "15m")
        return 900;
    if (interval == "30m")
        return 1800;
    if (interval == "1h" || interval == "60m")
        return 3600;
    if (interval == "4h")
        return 14400;
    if (interval == "1d")
        return 86400;
    throw std::runtime_error("Unknown bar interval: " + interval);
}

YahooBarSource::YahooBarSource(std::string interval, std::string base_url)
    : interval_(std::move(interval)), base_url_(std::move(base_url)), http_(30) {
    interval_seconds(interval_); // validate early
}

const char* YahooBarSource::range_for(const std::string& interval) {
    if (interval == "1m")
        return "7d";
    if (interval == "1h" || interval == "60m")
        return "730d";
    if (interval == "1d")
        return "5y";
    return "60d";
}

std::vector<market::Bar> YahooBarSource::fetch(const std::string& symbol, size_t count) {
    std::string url = base_url_ + http_.escape(symbol) + "?interval=" + interval_ + "&range=" + range_for(interval_);

    HttpResponse resp = http_.get(url);
    if (resp.status != 200) {
        throw std::runtime_error("Bar fetch for " + symbol + " failed: HTTP " + std::to_string(resp.status));
    }

    std::vector<market::Bar> bars = parse_chart_json(resp.body);

    // Drop the bar that is still forming
    int64_t now = util::wall_clock_seconds();
    if (!bars.empty() && bars.back().timestamp + interval_seconds(interval_) > now) {
        bars.pop_back();
    }

    LOGF_DEBUG(Data, "Fetched %zu bars for %s (%s)", bars.size(), symbol.c_str(), interval_.c_str());
    return tail(std::move(bars), count);
}

std::vector<market::Bar> YahooBarSource::parse_chart_json(const std::string& body) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid chart response: ") + e.what());
    }

    const json& chart = data.at("chart");
    if (chart.contains("error") && !chart["error"].is_null()) {
        throw std::runtime_error("Chart API error: " + chart["error"].dump());
    }
    if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
        throw std::runtime_error("Chart API returned no result");
    }

    const json& result = chart["result"][0];
    if (!result.contains("timestamp")) {
        return {};
    }

    const json& timestamps = result.at("timestamp");
    const json& quote = result.at("indicators").at("quote").at(0);
    const json& opens = quote.at("open");
    const json& highs = quote.at("high");
    const json& lows = quote.at("low");
    const json& closes = quote.at("close");
    const json& volumes = quote.at("volume");

    const size_t n = timestamps.size();
    if (opens.size() != n || highs.size() != n || lows.size() != n || closes.size() != n ||
        volumes.size() != n) {
        throw std::runtime_error("Chart API quote arrays do not match timestamp count");
    }

    std::vector<market::Bar> bars;
    bars.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        if (opens[i].is_null() || highs[i].is_null() || lows[i].is_null() || closes[i].is_null())
            continue;

        market::Bar b;
        b.timestamp = timestamps[i].get<int64_t>();
        b.open = opens[i].get<double>();
        b.high = highs[i].get<double>();
        b.low = lows[i].get<double>();
        b.close = closes[i].get<double>();
        b.volume = volumes[i].is_null() ? 0.0 : volumes[i].get<double>();

        // Duplicate or out-of-order rows happen around session breaks
        if (!bars.empty() && b.timestamp <= bars.back().timestamp)
            continue;

        bars.push_back(b);
    }

    return bars;
}

} // namespace fxsig::external
