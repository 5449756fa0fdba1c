#pragma once

#include "../market/bar.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fxsig {
namespace indicators {

/**
 * Indicator values for one bar
 *
 * Every field is std::nullopt while the underlying series is still
 * warming up. Consumers treat an undefined field as "cannot evaluate",
 * never as zero.
 */
struct IndicatorSnapshot {
    // Trend
    std::optional<double> ema_20;
    std::optional<double> ema_50;
    std::optional<double> ema_200;
    std::optional<double> adx;

    // Momentum
    std::optional<double> rsi;
    std::optional<double> macd_hist;
    std::optional<double> stoch_k;
    std::optional<double> stoch_d;
    std::optional<double> momentum_score;

    // Volatility
    std::optional<double> atr;
    std::optional<double> bb_position; // 0 = lower band, 1 = upper band

    // Volume
    std::optional<double> volume_ratio;
    std::optional<double> obv_trend; // -1, 0, +1

    /**
     * All fields the scorer cannot work without.
     * Volume fields are bonus-only.
     */
    bool has_required() const {
        return ema_20 && ema_50 && ema_200 && rsi && macd_hist && adx && stoch_k && stoch_d && bb_position &&
               atr;
    }

    /**
     * Defined values keyed by name, for audit records and notifications
     */
    std::map<std::string, double> named_values() const {
        std::map<std::string, double> out;
        auto put = [&out](const char* name, const std::optional<double>& v) {
            if (v)
                out[name] = *v;
        };
        put("ema_20", ema_20);
        put("ema_50", ema_50);
        put("ema_200", ema_200);
        put("adx", adx);
        put("rsi", rsi);
        put("macd_hist", macd_hist);
        put("stoch_k", stoch_k);
        put("stoch_d", stoch_d);
        put("momentum_score", momentum_score);
        put("atr", atr);
        put("bb_position", bb_position);
        put("volume_ratio", volume_ratio);
        put("obv_trend", obv_trend);
        return out;
    }
};

/**
 * A bar together with the indicator values computed up to and including it
 */
struct IndicatorBar {
    market::Bar bar;
    IndicatorSnapshot ind;
};

using IndicatorSeries = std::vector<IndicatorBar>;

} // namespace indicators
} // namespace fxsig
