#pragma once

#include "../types.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fxsig {
namespace market {

/**
 * OHLCV bar for one fixed interval
 *
 * Sequences are ordered by strictly increasing timestamp and never
 * modified after they are produced.
 */
struct Bar {
    Timestamp timestamp = 0; // Bar open time (UTC seconds)
    Price open = 0;
    Price high = 0;
    Price low = 0;
    Price close = 0;
    double volume = 0;

    Price range() const { return high - low; }
    bool is_bullish() const { return close > open; }
    bool is_bearish() const { return close < open; }
};

inline bool is_strictly_increasing(const std::vector<Bar>& bars) {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp)
            return false;
    }
    return true;
}

/**
 * Load bars from CSV file
 *
 * Expected format (header optional):
 * timestamp,open,high,low,close,volume
 *
 * Millisecond timestamps (Binance kline dumps) are converted to seconds.
 * Rows with fewer than 5 numeric columns are skipped.
 */
inline std::vector<Bar> load_bars_csv(const std::string& filename) {
    std::vector<Bar> bars;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        // Header or comment row
        if (!std::isdigit(static_cast<unsigned char>(line[0])))
            continue;

        std::stringstream ss(line);
        std::string token;
        std::vector<std::string> tokens;
        while (std::getline(ss, token, ',')) {
            tokens.push_back(token);
        }

        if (tokens.size() < 5)
            continue;

        Bar b;
        try {
            b.timestamp = std::stoll(tokens[0]);
            b.open = std::stod(tokens[1]);
            b.high = std::stod(tokens[2]);
            b.low = std::stod(tokens[3]);
            b.close = std::stod(tokens[4]);
            b.volume = tokens.size() > 5 ? std::stod(tokens[5]) : 0.0;
        } catch (const std::exception&) {
            throw std::runtime_error("Malformed bar row in " + filename + ": " + line);
        }

        if (b.timestamp > 100'000'000'000LL)
            b.timestamp /= 1000;

        bars.push_back(b);
    }

    return bars;
}

/**
 * Save bars to CSV file
 */
inline void save_bars_csv(const std::string& filename, const std::vector<Bar>& bars) {
    std::ofstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << "timestamp,open,high,low,close,volume\n";
    file.precision(10);

    for (const auto& b : bars) {
        file << b.timestamp << "," << b.open << "," << b.high << "," << b.low << "," << b.close << "," << b.volume
             << "\n";
    }
}

} // namespace market
} // namespace fxsig
