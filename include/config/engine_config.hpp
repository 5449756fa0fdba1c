#pragma once

/**
 * Engine Configuration
 *
 * JSON file, every key optional:
 *
 * {
 *   "symbols": ["EURUSD=X", {"symbol": "GC=F", "asset_class": "metal"}],
 *   "interval": "1h",
 *   "lookback_bars": 300,
 *   "poll_interval_seconds": 900,
 *   "cooldown_minutes": 60,
 *   "risk_amount": 100.0,
 *   "account_size": 20000.0,
 *   "profile": "optimized",          // or an inline profile object
 *   "lifecycle": {"trail_trigger_r": 1.5, "trail_lock_r": 0.2,
 *                 "breakeven_band": 5.0, "history_limit": 100},
 *   "state_file": "active_trades.json",
 *   "mode": "signal_only",           // or "execute"
 *   "data_source": {"type": "csv", "dir": "data"}   // or "yahoo"
 * }
 *
 * Secrets (API key, bot token) are read from the environment, never from
 * this file.
 */

#include "../market/asset.hpp"
#include "../strategy/scorer_profile.hpp"
#include "../trading/trade_rules.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fxsig {

namespace strategy {

// Profile round-trip. from_json starts from the named built-in profile when
// the name matches one, then applies every key present.
void to_json(nlohmann::json& j, const ScorerProfile& p);
void from_json(const nlohmann::json& j, ScorerProfile& p);

} // namespace strategy

namespace config {

enum class RunMode { SignalOnly, Execute };
enum class DataSourceKind { Csv, Yahoo };

inline const char* run_mode_to_string(RunMode m) {
    return m == RunMode::Execute ? "execute" : "signal_only";
}

inline const char* data_source_to_string(DataSourceKind k) {
    return k == DataSourceKind::Csv ? "csv" : "yahoo";
}

struct SymbolSettings {
    std::string symbol;
    market::AssetClass asset_class = market::AssetClass::Forex;
};

struct EngineConfig {
    static constexpr size_t MIN_LOOKBACK = 250;

    std::vector<SymbolSettings> symbols = {{"EURUSD=X", market::AssetClass::Forex},
                                           {"GBPUSD=X", market::AssetClass::Forex},
                                           {"GC=F", market::AssetClass::Metal}};
    std::string interval = "1h";
    size_t lookback_bars = 300;
    int poll_interval_seconds = 900;
    int cooldown_minutes = 60;
    double risk_amount = 100.0;
    double account_size = 20000.0;

    strategy::ScorerProfile profile;
    trading::LifecycleConfig lifecycle;

    std::string state_file = "active_trades.json";
    RunMode mode = RunMode::SignalOnly;
    DataSourceKind data_source = DataSourceKind::Yahoo;
    std::string csv_dir = "data";

    /**
     * @throws std::runtime_error naming the offending key
     */
    void validate() const;
};

class ConfigLoader {
public:
    // @throws std::runtime_error("Cannot open config file: <path>") and parse errors
    static EngineConfig load(const std::string& filename);

    static EngineConfig parse(const std::string& text);

    static EngineConfig from_json(const nlohmann::json& j);
    static nlohmann::json to_json(const EngineConfig& config);

    // @throws std::runtime_error if the file cannot be written
    static void save(const std::string& filename, const EngineConfig& config);
};

} // namespace config
} // namespace fxsig
