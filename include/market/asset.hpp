#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fxsig {
namespace market {

enum class AssetClass : uint8_t { Forex, Metal, Crypto, Index };

inline const char* asset_class_to_string(AssetClass ac) {
    switch (ac) {
    case AssetClass::Forex:
        return "forex";
    case AssetClass::Metal:
        return "metal";
    case AssetClass::Crypto:
        return "crypto";
    case AssetClass::Index:
        return "index";
    }
    return "unknown";
}

inline AssetClass string_to_asset_class(const std::string& s) {
    if (s == "forex" || s == "fx")
        return AssetClass::Forex;
    if (s == "metal")
        return AssetClass::Metal;
    if (s == "crypto")
        return AssetClass::Crypto;
    if (s == "index")
        return AssetClass::Index;
    throw std::runtime_error("Unknown asset class: " + s);
}

/**
 * Contract and sizing constants for one asset class
 */
struct AssetSpec {
    double contract_multiplier; // units per lot
    double size_step;           // lot granularity
    double min_size;            // smallest tradable lot, a multiple of size_step
    double max_size;
    double pip_factor;          // price distance -> pips
};

inline AssetSpec asset_spec(AssetClass ac) {
    switch (ac) {
    case AssetClass::Forex:
        return {100000.0, 0.01, 0.01, 100.0, 10000.0};
    case AssetClass::Metal:
        return {100.0, 0.01, 0.01, 100.0, 10.0};
    case AssetClass::Crypto:
        return {1.0, 0.001, 0.001, 1000.0, 1.0};
    case AssetClass::Index:
        return {1.0, 0.1, 0.1, 1000.0, 1.0};
    }
    return {1.0, 0.01, 0.01, 100.0, 1.0};
}

/**
 * Guess the asset class from a data-provider symbol
 *
 *   "EURUSD=X", "GBPJPY"  -> Forex
 *   "GC=F", "XAUUSD"      -> Metal
 *   "BTC-USD", "ETHUSDT"  -> Crypto
 *   anything else         -> Index
 */
inline AssetClass infer_asset_class(const std::string& symbol) {
    std::string s = symbol;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

    if (s.rfind("GC", 0) == 0 || s.rfind("XAU", 0) == 0 || s.rfind("XAG", 0) == 0 || s.rfind("SI=", 0) == 0)
        return AssetClass::Metal;
    if (s.rfind("BTC", 0) == 0 || s.rfind("ETH", 0) == 0 || s.find("USDT") != std::string::npos)
        return AssetClass::Crypto;
    if (s.size() >= 2 && s.compare(s.size() - 2, 2, "=X") == 0)
        return AssetClass::Forex;

    bool six_letters = s.size() == 6 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalpha(c); });
    if (six_letters)
        return AssetClass::Forex;

    return AssetClass::Index;
}

// JPY crosses quote two decimals
inline double pip_factor_for(const std::string& symbol, AssetClass ac) {
    double f = asset_spec(ac).pip_factor;
    if (ac == AssetClass::Forex && symbol.find("JPY") != std::string::npos)
        f = 100.0;
    return f;
}

} // namespace market
} // namespace fxsig
