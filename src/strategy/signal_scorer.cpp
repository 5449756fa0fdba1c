#include "../../include/strategy/signal_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace fxsig::strategy {

using indicators::IndicatorBar;
using indicators::IndicatorSnapshot;

namespace {

void add(Signal& out, Direction side, const char* name, double weight) {
    if (side == Direction::Long)
        out.buy_score += weight;
    else
        out.sell_score += weight;
    out.reasons.push_back({name, side, weight});
}

} // namespace

Signal SignalScorer::evaluate(std::span<const IndicatorBar> window) const {
    Signal out;

    if (window.size() < MIN_BARS) {
        out.abstain_reason = "insufficient_history";
        return out;
    }

    const IndicatorBar& cur = window[window.size() - 1];
    const IndicatorBar& prev = window[window.size() - 2];
    const IndicatorBar& prev2 = window[window.size() - 3];

    if (!cur.ind.has_required() || !prev.ind.has_required() || !prev2.ind.has_required()) {
        out.abstain_reason = "indicators_undefined";
        return out;
    }

    if (const char* rejected = prefilter(cur)) {
        out.abstain_reason = rejected;
        return out;
    }

    score_trend(cur, out);
    if (profile_.use_rsi_zones)
        score_rsi(cur.ind, prev.ind, prev2.ind, out);
    if (profile_.use_macd_cross)
        score_macd(cur.ind, prev.ind, out);
    if (profile_.use_stoch_cross)
        score_stochastic(cur.ind, prev.ind, out);
    if (profile_.use_bb_bounce)
        score_bands(cur.ind, prev.ind, out);
    score_strength(cur.ind, out);
    if (profile_.use_volume)
        score_volume(cur, out);

    decide(cur.ind, out);
    return out;
}

const char* SignalScorer::prefilter(const IndicatorBar& current) const {
    const IndicatorSnapshot& ind = current.ind;

    if (*ind.adx < profile_.adx_floor)
        return "ranging_market";

    if (*ind.rsi < profile_.rsi_extreme_low || *ind.rsi > profile_.rsi_extreme_high)
        return "rsi_extreme";

    if (*ind.atr <= 0)
        return "no_volatility";

    if (std::abs(current.bar.close - *ind.ema_50) > profile_.max_extension_atr * *ind.atr)
        return "over_extended";

    return nullptr;
}

void SignalScorer::score_trend(const IndicatorBar& cur, Signal& out) const {
    const auto& w = profile_.weights;
    double price = cur.bar.close;
    double ema20 = *cur.ind.ema_20;
    double ema50 = *cur.ind.ema_50;
    double ema200 = *cur.ind.ema_200;

    if (price > ema20 && ema20 > ema50 && ema50 > ema200)
        add(out, Direction::Long, "ema_alignment_full", w.ema_full_alignment);
    else if (ema50 > ema200 && price > ema200)
        add(out, Direction::Long, "ema_alignment_partial", w.ema_partial_alignment);

    if (price < ema20 && ema20 < ema50 && ema50 < ema200)
        add(out, Direction::Short, "ema_alignment_full", w.ema_full_alignment);
    else if (ema50 < ema200 && price < ema200)
        add(out, Direction::Short, "ema_alignment_partial", w.ema_partial_alignment);
}

void SignalScorer::score_rsi(const IndicatorSnapshot& cur, const IndicatorSnapshot& prev,
                             const IndicatorSnapshot& prev2, Signal& out) const {
    const auto& w = profile_.weights;
    double rsi = *cur.rsi;

    // Turning against the two prior bars
    bool rising = rsi > *prev.rsi && rsi > *prev2.rsi;
    bool falling = rsi < *prev.rsi && rsi < *prev2.rsi;

    if (rsi > profile_.rsi_oversold && rsi < 50 && rising)
        add(out, Direction::Long, "rsi_recovery", w.rsi_recovery);
    else if (rsi < profile_.rsi_oversold && rising)
        add(out, Direction::Long, "rsi_oversold_turn", w.rsi_extreme_turn);

    if (rsi < profile_.rsi_overbought && rsi > 50 && falling)
        add(out, Direction::Short, "rsi_pullback", w.rsi_recovery);
    else if (rsi > profile_.rsi_overbought && falling)
        add(out, Direction::Short, "rsi_overbought_turn", w.rsi_extreme_turn);
}

void SignalScorer::score_macd(const IndicatorSnapshot& cur, const IndicatorSnapshot& prev, Signal& out) const {
    const auto& w = profile_.weights;
    double hist = *cur.macd_hist;
    double hist_prev = *prev.macd_hist;

    if (hist > 0) {
        add(out, Direction::Long, "macd_positive", w.macd_positive);
        if (hist_prev <= 0)
            add(out, Direction::Long, "macd_fresh_cross", w.macd_fresh_cross);
        else if (hist > hist_prev)
            add(out, Direction::Long, "macd_rising", w.macd_rising);
    }

    if (hist < 0) {
        add(out, Direction::Short, "macd_negative", w.macd_positive);
        if (hist_prev >= 0)
            add(out, Direction::Short, "macd_fresh_cross", w.macd_fresh_cross);
        else if (hist < hist_prev)
            add(out, Direction::Short, "macd_falling", w.macd_rising);
    }
}

void SignalScorer::score_stochastic(const IndicatorSnapshot& cur, const IndicatorSnapshot& prev,
                                    Signal& out) const {
    const auto& w = profile_.weights;
    double k = *cur.stoch_k;
    double d = *cur.stoch_d;
    double k_prev = *prev.stoch_k;
    double d_prev = *prev.stoch_d;

    if (k > d && k_prev <= d_prev) {
        if (k < profile_.stoch_oversold)
            add(out, Direction::Long, "stoch_cross_oversold", w.stoch_cross_extreme);
        else if (k < 50)
            add(out, Direction::Long, "stoch_cross_up", w.stoch_cross_mid);
    }

    if (k < d && k_prev >= d_prev) {
        if (k > profile_.stoch_overbought)
            add(out, Direction::Short, "stoch_cross_overbought", w.stoch_cross_extreme);
        else if (k > 50)
            add(out, Direction::Short, "stoch_cross_down", w.stoch_cross_mid);
    }
}

void SignalScorer::score_bands(const IndicatorSnapshot& cur, const IndicatorSnapshot& prev, Signal& out) const {
    double bb = *cur.bb_position;
    double bb_prev = *prev.bb_position;

    if (bb < profile_.bb_lower_zone && bb > bb_prev)
        add(out, Direction::Long, "bb_lower_bounce", profile_.weights.bb_bounce);
    if (bb > profile_.bb_upper_zone && bb < bb_prev)
        add(out, Direction::Short, "bb_upper_rejection", profile_.weights.bb_bounce);
}

void SignalScorer::score_strength(const IndicatorSnapshot& cur, Signal& out) const {
    if (*cur.adx <= profile_.adx_strong)
        return;

    if (*cur.ema_50 > *cur.ema_200)
        add(out, Direction::Long, "adx_strong_uptrend", profile_.weights.adx_trend_bonus);
    else
        add(out, Direction::Short, "adx_strong_downtrend", profile_.weights.adx_trend_bonus);
}

void SignalScorer::score_volume(const IndicatorBar& cur, Signal& out) const {
    if (!cur.ind.volume_ratio || *cur.ind.volume_ratio <= profile_.volume_confirm_ratio)
        return;

    if (cur.bar.is_bullish())
        add(out, Direction::Long, "volume_confirmation", profile_.weights.volume_confirmation);
    else if (cur.bar.is_bearish())
        add(out, Direction::Short, "volume_confirmation", profile_.weights.volume_confirmation);
}

void SignalScorer::decide(const IndicatorSnapshot& cur, Signal& out) const {
    const double buy = out.buy_score;
    const double sell = out.sell_score;
    const double rsi = *cur.rsi;
    const bool major_up = *cur.ema_50 > *cur.ema_200;

    bool long_ok = buy >= profile_.min_score && buy > sell + profile_.margin &&
                   (!profile_.strict_exhaustion || rsi < profile_.rsi_overbought);
    bool short_ok = sell >= profile_.min_score && sell > buy + profile_.margin &&
                    (!profile_.strict_exhaustion || rsi > profile_.rsi_oversold);

    if (profile_.trend_filter) {
        long_ok = long_ok && major_up;
        short_ok = short_ok && !major_up;
    }

    if (long_ok)
        out.direction = Direction::Long;
    else if (short_ok)
        out.direction = Direction::Short;

    if (out.direction == Direction::None && profile_.allow_counter_trend) {
        double counter_min = profile_.min_score + profile_.counter_trend_extra;
        double bb = *cur.bb_position;

        if (!major_up && buy >= counter_min && buy > sell + profile_.margin &&
            rsi < profile_.counter_rsi_long_max && bb < profile_.bb_lower_zone)
            out.direction = Direction::Long;
        else if (major_up && sell >= counter_min && sell > buy + profile_.margin &&
                 rsi > profile_.counter_rsi_short_min && bb > profile_.bb_upper_zone)
            out.direction = Direction::Short;
    }

    if (out.direction != Direction::None)
        return;

    if (std::max(buy, sell) < profile_.min_score)
        out.abstain_reason = "score_below_threshold";
    else if (std::abs(buy - sell) <= profile_.margin)
        out.abstain_reason = "insufficient_margin";
    else
        out.abstain_reason = "filtered_by_trend_or_exhaustion";
}

} // namespace fxsig::strategy
