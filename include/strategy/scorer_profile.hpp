#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace fxsig {
namespace strategy {

/**
 * Points added by each scoring check
 */
struct ScorerWeights {
    double ema_full_alignment = 2.0;    // price > ema20 > ema50 > ema200
    double ema_partial_alignment = 1.0; // ema50 > ema200 and price > ema200
    double rsi_recovery = 1.5;          // between zone edge and 50, turning
    double rsi_extreme_turn = 1.0;      // still inside the zone, turning
    double macd_positive = 0.5;
    double macd_fresh_cross = 1.0;
    double macd_rising = 0.5;
    double stoch_cross_extreme = 1.5;
    double stoch_cross_mid = 0.5;
    double bb_bounce = 1.0;
    double adx_trend_bonus = 0.5;
    double volume_confirmation = 0.5;
};

/**
 * Stop distance multiplier, in ATR units, keyed by trend strength
 */
struct StopTiers {
    double strong_adx = 35.0;
    double strong_multiplier = 2.0;
    double moderate_adx = 25.0;
    double moderate_multiplier = 1.5;
    double weak_multiplier = 1.2;

    double multiplier_for(double adx) const {
        if (adx > strong_adx)
            return strong_multiplier;
        if (adx > moderate_adx)
            return moderate_multiplier;
        return weak_multiplier;
    }

    // Tiers as fixed fractions of the strong multiplier (2.0 -> 2.0 / 1.5 / 1.2)
    static StopTiers scaled(double base) {
        StopTiers t;
        t.strong_multiplier = base;
        t.moderate_multiplier = base * 0.75;
        t.weak_multiplier = base * 0.6;
        return t;
    }
};

/**
 * Scorer Profile - thresholds, weights and trade shaping for one tuning
 *
 * Several tunings have been used over time; the engine takes one of
 * these as configuration instead of carrying separate scorer variants.
 */
struct ScorerProfile {
    std::string name = "optimized";

    // Pre-filters
    double adx_floor = 25.0;         // below this the market is ranging
    double rsi_extreme_low = 15.0;   // outer sixth of the RSI range
    double rsi_extreme_high = 85.0;
    double max_extension_atr = 3.0;  // |close - ema50| in ATR units

    // Zones
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;
    double stoch_oversold = 30.0;
    double stoch_overbought = 70.0;
    double bb_lower_zone = 0.3;
    double bb_upper_zone = 0.7;
    double adx_strong = 30.0;
    double volume_confirm_ratio = 1.2;

    ScorerWeights weights;

    // Check toggles
    bool use_rsi_zones = true;
    bool use_macd_cross = true;
    bool use_stoch_cross = true;
    bool use_bb_bounce = true;
    bool use_volume = true;

    // Decision
    double min_score = 5.0;
    double margin = 1.0;             // winning side must beat the other by more than this
    bool strict_exhaustion = true;   // no long with RSI >= overbought, no short with RSI <= oversold
    bool trend_filter = false;       // long only if ema50 > ema200, short only if below
    bool allow_counter_trend = false;
    double counter_trend_extra = 1.5;
    double counter_rsi_long_max = 45.0;
    double counter_rsi_short_min = 55.0;

    // Trade shaping
    StopTiers stops;
    double reward_risk = 2.5;
    double entry_band_pct = 0.0003; // +/- 3 bps around the trigger close
};

inline ScorerProfile optimized_profile() {
    return ScorerProfile{};
}

inline ScorerProfile conservative_profile() {
    ScorerProfile p;
    p.name = "conservative";
    p.adx_floor = 30.0;
    p.min_score = 5.5;
    p.margin = 1.5;
    p.reward_risk = 2.0;
    return p;
}

inline ScorerProfile aggressive_profile() {
    ScorerProfile p;
    p.name = "aggressive";
    p.adx_floor = 20.0;
    p.rsi_oversold = 35.0;
    p.rsi_overbought = 65.0;
    p.min_score = 4.0;
    return p;
}

inline ScorerProfile trend_filter_profile() {
    ScorerProfile p;
    p.name = "trend_filter";
    p.trend_filter = true;
    p.allow_counter_trend = true;
    return p;
}

inline std::vector<std::string> profile_names() {
    return {"optimized", "conservative", "aggressive", "trend_filter"};
}

inline ScorerProfile profile_by_name(const std::string& name) {
    if (name == "optimized" || name == "default")
        return optimized_profile();
    if (name == "conservative")
        return conservative_profile();
    if (name == "aggressive")
        return aggressive_profile();
    if (name == "trend_filter")
        return trend_filter_profile();
    throw std::runtime_error("Unknown scorer profile: " + name);
}

} // namespace strategy
} // namespace fxsig
