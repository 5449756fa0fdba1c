#include "../../include/config/engine_config.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fxsig {

using json = nlohmann::json;

namespace {

// Overwrite `out` with j[key] when present; wrong types name the key
template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Config key '") + key + "': " + e.what());
    }
}

const json* object_at(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return nullptr;
    if (!it->is_object())
        throw std::runtime_error(std::string("Config key '") + key + "' must be an object");
    return &*it;
}

} // namespace

namespace strategy {

void to_json(json& j, const ScorerProfile& p) {
    const auto& w = p.weights;
    j = json{{"name", p.name},
             {"adx_floor", p.adx_floor},
             {"rsi_extreme_low", p.rsi_extreme_low},
             {"rsi_extreme_high", p.rsi_extreme_high},
             {"max_extension_atr", p.max_extension_atr},
             {"rsi_oversold", p.rsi_oversold},
             {"rsi_overbought", p.rsi_overbought},
             {"stoch_oversold", p.stoch_oversold},
             {"stoch_overbought", p.stoch_overbought},
             {"bb_lower_zone", p.bb_lower_zone},
             {"bb_upper_zone", p.bb_upper_zone},
             {"adx_strong", p.adx_strong},
             {"volume_confirm_ratio", p.volume_confirm_ratio},
             {"weights",
              {{"ema_full_alignment", w.ema_full_alignment},
               {"ema_partial_alignment", w.ema_partial_alignment},
               {"rsi_recovery", w.rsi_recovery},
               {"rsi_extreme_turn", w.rsi_extreme_turn},
               {"macd_positive", w.macd_positive},
               {"macd_fresh_cross", w.macd_fresh_cross},
               {"macd_rising", w.macd_rising},
               {"stoch_cross_extreme", w.stoch_cross_extreme},
               {"stoch_cross_mid", w.stoch_cross_mid},
               {"bb_bounce", w.bb_bounce},
               {"adx_trend_bonus", w.adx_trend_bonus},
               {"volume_confirmation", w.volume_confirmation}}},
             {"use_rsi_zones", p.use_rsi_zones},
             {"use_macd_cross", p.use_macd_cross},
             {"use_stoch_cross", p.use_stoch_cross},
             {"use_bb_bounce", p.use_bb_bounce},
             {"use_volume", p.use_volume},
             {"min_score", p.min_score},
             {"margin", p.margin},
             {"strict_exhaustion", p.strict_exhaustion},
             {"trend_filter", p.trend_filter},
             {"allow_counter_trend", p.allow_counter_trend},
             {"counter_trend_extra", p.counter_trend_extra},
             {"counter_rsi_long_max", p.counter_rsi_long_max},
             {"counter_rsi_short_min", p.counter_rsi_short_min},
             {"stops",
              {{"strong_adx", p.stops.strong_adx},
               {"strong_multiplier", p.stops.strong_multiplier},
               {"moderate_adx", p.stops.moderate_adx},
               {"moderate_multiplier", p.stops.moderate_multiplier},
               {"weak_multiplier", p.stops.weak_multiplier}}},
             {"reward_risk", p.reward_risk},
             {"entry_band_pct", p.entry_band_pct}};
}

void from_json(const json& j, ScorerProfile& p) {
    std::string name = j.value("name", p.name);
    auto known = profile_names();
    if (std::find(known.begin(), known.end(), name) != known.end())
        p = profile_by_name(name);
    p.name = name;

    read(j, "adx_floor", p.adx_floor);
    read(j, "rsi_extreme_low", p.rsi_extreme_low);
    read(j, "rsi_extreme_high", p.rsi_extreme_high);
    read(j, "max_extension_atr", p.max_extension_atr);
    read(j, "rsi_oversold", p.rsi_oversold);
    read(j, "rsi_overbought", p.rsi_overbought);
    read(j, "stoch_oversold", p.stoch_oversold);
    read(j, "stoch_overbought", p.stoch_overbought);
    read(j, "bb_lower_zone", p.bb_lower_zone);
    read(j, "bb_upper_zone", p.bb_upper_zone);
    read(j, "adx_strong", p.adx_strong);
    read(j, "volume_confirm_ratio", p.volume_confirm_ratio);

    if (const json* w = object_at(j, "weights")) {
        read(*w, "ema_full_alignment", p.weights.ema_full_alignment);
        read(*w, "ema_partial_alignment", p.weights.ema_partial_alignment);
        read(*w, "rsi_recovery", p.weights.rsi_recovery);
        read(*w, "rsi_extreme_turn", p.weights.rsi_extreme_turn);
        read(*w, "macd_positive", p.weights.macd_positive);
        read(*w, "macd_fresh_cross", p.weights.macd_fresh_cross);
        read(*w, "macd_rising", p.weights.macd_rising);
        read(*w, "stoch_cross_extreme", p.weights.stoch_cross_extreme);
        read(*w, "stoch_cross_mid", p.weights.stoch_cross_mid);
        read(*w, "bb_bounce", p.weights.bb_bounce);
        read(*w, "adx_trend_bonus", p.weights.adx_trend_bonus);
        read(*w, "volume_confirmation", p.weights.volume_confirmation);
    }

    read(j, "use_rsi_zones", p.use_rsi_zones);
    read(j, "use_macd_cross", p.use_macd_cross);
    read(j, "use_stoch_cross", p.use_stoch_cross);
    read(j, "use_bb_bounce", p.use_bb_bounce);
    read(j, "use_volume", p.use_volume);

    read(j, "min_score", p.min_score);
    read(j, "margin", p.margin);
    read(j, "strict_exhaustion", p.strict_exhaustion);
    read(j, "trend_filter", p.trend_filter);
    read(j, "allow_counter_trend", p.allow_counter_trend);
    read(j, "counter_trend_extra", p.counter_trend_extra);
    read(j, "counter_rsi_long_max", p.counter_rsi_long_max);
    read(j, "counter_rsi_short_min", p.counter_rsi_short_min);

    if (const json* s = object_at(j, "stops")) {
        read(*s, "strong_adx", p.stops.strong_adx);
        read(*s, "strong_multiplier", p.stops.strong_multiplier);
        read(*s, "moderate_adx", p.stops.moderate_adx);
        read(*s, "moderate_multiplier", p.stops.moderate_multiplier);
        read(*s, "weak_multiplier", p.stops.weak_multiplier);
    }

    read(j, "reward_risk", p.reward_risk);
    read(j, "entry_band_pct", p.entry_band_pct);
}

} // namespace strategy

namespace config {

void EngineConfig::validate() const {
    if (symbols.empty())
        throw std::runtime_error("Config key 'symbols': at least one symbol is required");
    for (const auto& s : symbols) {
        if (s.symbol.empty())
            throw std::runtime_error("Config key 'symbols': empty symbol");
    }
    if (lookback_bars < MIN_LOOKBACK)
        throw std::runtime_error("Config key 'lookback_bars': must be at least " + std::to_string(MIN_LOOKBACK));
    if (poll_interval_seconds <= 0)
        throw std::runtime_error("Config key 'poll_interval_seconds': must be positive");
    if (cooldown_minutes < 0)
        throw std::runtime_error("Config key 'cooldown_minutes': must not be negative");
    if (!(risk_amount > 0))
        throw std::runtime_error("Config key 'risk_amount': must be positive");
    if (!(lifecycle.trail_trigger_r > lifecycle.trail_lock_r))
        throw std::runtime_error("Config key 'lifecycle': trail_trigger_r must exceed trail_lock_r");
    if (lifecycle.history_limit == 0)
        throw std::runtime_error("Config key 'lifecycle.history_limit': must be positive");
}

EngineConfig ConfigLoader::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

EngineConfig ConfigLoader::parse(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!j.is_object())
        throw std::runtime_error("Invalid config JSON: top level must be an object");
    return from_json(j);
}

EngineConfig ConfigLoader::from_json(const json& j) {
    EngineConfig cfg;

    auto sym_it = j.find("symbols");
    if (sym_it != j.end()) {
        if (!sym_it->is_array())
            throw std::runtime_error("Config key 'symbols' must be an array");
        cfg.symbols.clear();
        for (const auto& entry : *sym_it) {
            SymbolSettings s;
            if (entry.is_string()) {
                s.symbol = entry.get<std::string>();
                s.asset_class = market::infer_asset_class(s.symbol);
            } else if (entry.is_object()) {
                read(entry, "symbol", s.symbol);
                std::string ac;
                read(entry, "asset_class", ac);
                s.asset_class = ac.empty() ? market::infer_asset_class(s.symbol) : market::string_to_asset_class(ac);
            } else {
                throw std::runtime_error("Config key 'symbols': entries must be strings or objects");
            }
            cfg.symbols.push_back(s);
        }
    }

    read(j, "interval", cfg.interval);
    read(j, "lookback_bars", cfg.lookback_bars);
    read(j, "poll_interval_seconds", cfg.poll_interval_seconds);
    read(j, "cooldown_minutes", cfg.cooldown_minutes);
    read(j, "risk_amount", cfg.risk_amount);
    read(j, "account_size", cfg.account_size);

    auto prof_it = j.find("profile");
    if (prof_it != j.end()) {
        if (prof_it->is_string())
            cfg.profile = strategy::profile_by_name(prof_it->get<std::string>());
        else if (prof_it->is_object())
            cfg.profile = prof_it->get<strategy::ScorerProfile>();
        else
            throw std::runtime_error("Config key 'profile' must be a name or an object");
    }

    if (const json* lc = object_at(j, "lifecycle")) {
        read(*lc, "trail_trigger_r", cfg.lifecycle.trail_trigger_r);
        read(*lc, "trail_lock_r", cfg.lifecycle.trail_lock_r);
        read(*lc, "breakeven_band", cfg.lifecycle.breakeven_band);
        read(*lc, "history_limit", cfg.lifecycle.history_limit);
    }

    read(j, "state_file", cfg.state_file);

    std::string mode;
    read(j, "mode", mode);
    if (mode == "execute")
        cfg.mode = RunMode::Execute;
    else if (mode.empty() || mode == "signal_only")
        cfg.mode = RunMode::SignalOnly;
    else
        throw std::runtime_error("Config key 'mode': unknown value " + mode);

    auto src_it = j.find("data_source");
    if (src_it != j.end()) {
        std::string type;
        if (src_it->is_string()) {
            type = src_it->get<std::string>();
        } else if (src_it->is_object()) {
            read(*src_it, "type", type);
            read(*src_it, "dir", cfg.csv_dir);
        } else {
            throw std::runtime_error("Config key 'data_source' must be a name or an object");
        }
        if (type == "csv")
            cfg.data_source = DataSourceKind::Csv;
        else if (type == "yahoo")
            cfg.data_source = DataSourceKind::Yahoo;
        else
            throw std::runtime_error("Config key 'data_source': unknown type " + type);
    }

    cfg.validate();
    return cfg;
}

json ConfigLoader::to_json(const EngineConfig& cfg) {
    json symbols = json::array();
    for (const auto& s : cfg.symbols) {
        symbols.push_back({{"symbol", s.symbol}, {"asset_class", market::asset_class_to_string(s.asset_class)}});
    }

    return json{{"symbols", symbols},
                {"interval", cfg.interval},
                {"lookback_bars", cfg.lookback_bars},
                {"poll_interval_seconds", cfg.poll_interval_seconds},
                {"cooldown_minutes", cfg.cooldown_minutes},
                {"risk_amount", cfg.risk_amount},
                {"account_size", cfg.account_size},
                {"profile", cfg.profile},
                {"lifecycle",
                 {{"trail_trigger_r", cfg.lifecycle.trail_trigger_r},
                  {"trail_lock_r", cfg.lifecycle.trail_lock_r},
                  {"breakeven_band", cfg.lifecycle.breakeven_band},
                  {"history_limit", cfg.lifecycle.history_limit}}},
                {"state_file", cfg.state_file},
                {"mode", run_mode_to_string(cfg.mode)},
                {"data_source", {{"type", data_source_to_string(cfg.data_source)}, {"dir", cfg.csv_dir}}}};
}

void ConfigLoader::save(const std::string& filename, const EngineConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create config file: " + filename);
    }
    file << to_json(config).dump(2) << "\n";
}

} // namespace config
} // namespace fxsig
