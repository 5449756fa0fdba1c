#include "../include/strategy/signal_scorer.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace fxsig;
using namespace fxsig::strategy;
using namespace fxsig::indicators;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))
#define ASSERT_GT(a, b) assert((a) > (b))
#define ASSERT_LT(a, b) assert((a) < (b))

// =============================================================================
// Helpers
// =============================================================================

IndicatorBar make_bar(Timestamp t, double open, double close) {
    IndicatorBar b;
    b.bar.timestamp = t;
    b.bar.open = open;
    b.bar.close = close;
    b.bar.high = std::max(open, close) + 0.0005;
    b.bar.low = std::min(open, close) - 0.0005;
    b.bar.volume = 1000;

    b.ind.ema_20 = 1.1040;
    b.ind.ema_50 = 1.1020;
    b.ind.ema_200 = 1.1000;
    b.ind.adx = 32;
    b.ind.rsi = 45;
    b.ind.macd_hist = 0.0002;
    b.ind.stoch_k = 25;
    b.ind.stoch_d = 22;
    b.ind.bb_position = 0.25;
    b.ind.atr = 0.0025;
    b.ind.volume_ratio = 1.5;
    b.ind.momentum_score = 30;
    return b;
}

/**
 * Every long check fires on the last bar:
 *   ema full 2.0, rsi recovery 1.5, macd positive 0.5 + fresh cross 1.0,
 *   stoch oversold cross 1.5, bb bounce 1.0, adx uptrend 0.5, volume 0.5
 */
std::vector<IndicatorBar> bullish_window() {
    std::vector<IndicatorBar> w = {make_bar(1000, 1.1040, 1.1035), make_bar(4600, 1.1035, 1.1040),
                                   make_bar(8200, 1.1040, 1.1050)};
    w[0].ind.rsi = 38;
    w[1].ind.rsi = 40;
    w[1].ind.macd_hist = -0.0001;
    w[1].ind.stoch_k = 20;
    w[1].ind.stoch_d = 22;
    w[1].ind.bb_position = 0.20;
    return w;
}

// Mirror image of bullish_window()
std::vector<IndicatorBar> bearish_window() {
    std::vector<IndicatorBar> w = {make_bar(1000, 1.0960, 1.0965), make_bar(4600, 1.0965, 1.0960),
                                   make_bar(8200, 1.0960, 1.0950)};
    for (auto& b : w) {
        b.ind.ema_20 = 1.0960;
        b.ind.ema_50 = 1.0980;
        b.ind.ema_200 = 1.1000;
        b.ind.rsi = 55;
        b.ind.macd_hist = -0.0002;
        b.ind.stoch_k = 75;
        b.ind.stoch_d = 78;
        b.ind.bb_position = 0.75;
    }
    w[0].ind.rsi = 62;
    w[1].ind.rsi = 60;
    w[1].ind.macd_hist = 0.0001;
    w[1].ind.stoch_k = 80;
    w[1].ind.stoch_d = 78;
    w[1].ind.bb_position = 0.80;
    return w;
}

Signal evaluate(const SignalScorer& scorer, const std::vector<IndicatorBar>& w) {
    return scorer.evaluate(std::span<const IndicatorBar>(w));
}

bool has_reason(const Signal& s, const std::string& name, Direction side) {
    for (const auto& r : s.reasons) {
        if (r.name == name && r.side == side)
            return true;
    }
    return false;
}

// =============================================================================
// Abstention
// =============================================================================

TEST(fewer_than_three_bars_abstains) {
    SignalScorer scorer;
    auto w = bullish_window();
    w.erase(w.begin());

    Signal s = evaluate(scorer, w);
    ASSERT_FALSE(s.is_signal());
    ASSERT_EQ(s.abstain_reason, "insufficient_history");
}

TEST(undefined_indicator_on_any_bar_abstains) {
    SignalScorer scorer;

    const char* fields[] = {"rsi", "adx", "atr", "ema_20", "ema_200", "stoch_d", "bb_position", "macd_hist"};
    for (const char* field : fields) {
        for (size_t bar = 0; bar < 3; ++bar) {
            auto w = bullish_window();
            auto& ind = w[bar].ind;
            std::string f = field;
            if (f == "rsi")
                ind.rsi.reset();
            else if (f == "adx")
                ind.adx.reset();
            else if (f == "atr")
                ind.atr.reset();
            else if (f == "ema_20")
                ind.ema_20.reset();
            else if (f == "ema_200")
                ind.ema_200.reset();
            else if (f == "stoch_d")
                ind.stoch_d.reset();
            else if (f == "bb_position")
                ind.bb_position.reset();
            else
                ind.macd_hist.reset();

            Signal s = evaluate(scorer, w);
            ASSERT_FALSE(s.is_signal());
            ASSERT_EQ(s.abstain_reason, "indicators_undefined");
            ASSERT_EQ(s.buy_score, 0.0);
        }
    }
}

TEST(missing_volume_is_not_required) {
    SignalScorer scorer;
    auto w = bullish_window();
    w[2].ind.volume_ratio.reset();

    Signal s = evaluate(scorer, w);
    ASSERT_EQ(s.direction, Direction::Long);
    ASSERT_FALSE(has_reason(s, "volume_confirmation", Direction::Long));
}

TEST(ranging_market_never_signals) {
    SignalScorer scorer;

    // Ten bars with trend strength under the floor and every oscillator bullish
    std::vector<IndicatorBar> series;
    for (int i = 0; i < 10; ++i) {
        auto b = make_bar(1000 + i * 3600, 1.1040, 1.1050);
        b.ind.adx = 15;
        b.ind.rsi = 40 + i * 0.5;
        series.push_back(b);
    }

    for (size_t end = 1; end <= series.size(); ++end) {
        std::span<const IndicatorBar> window(series.data(), end);
        Signal s = scorer.evaluate(window);
        ASSERT_FALSE(s.is_signal());
        if (end >= 3)
            ASSERT_EQ(s.abstain_reason, "ranging_market");
    }
}

TEST(rsi_extreme_abstains) {
    SignalScorer scorer;
    auto w = bullish_window();
    w[2].ind.rsi = 12;
    ASSERT_EQ(evaluate(scorer, w).abstain_reason, "rsi_extreme");

    w[2].ind.rsi = 88;
    ASSERT_EQ(evaluate(scorer, w).abstain_reason, "rsi_extreme");
}

TEST(over_extension_abstains) {
    SignalScorer scorer;
    auto w = bullish_window();
    // 3 * ATR = 0.0075 away from ema50 is the limit
    w[2].bar.close = *w[2].ind.ema_50 + 0.0100;
    w[2].bar.high = w[2].bar.close + 0.0005;

    Signal s = evaluate(scorer, w);
    ASSERT_FALSE(s.is_signal());
    ASSERT_EQ(s.abstain_reason, "over_extended");
}

TEST(zero_atr_abstains) {
    SignalScorer scorer;
    auto w = bullish_window();
    w[2].ind.atr = 0.0;
    ASSERT_EQ(evaluate(scorer, w).abstain_reason, "no_volatility");
}

// =============================================================================
// Scoring
// =============================================================================

TEST(bullish_window_emits_long_with_itemized_reasons) {
    SignalScorer scorer;
    Signal s = evaluate(scorer, bullish_window());

    ASSERT_EQ(s.direction, Direction::Long);
    ASSERT_NEAR(s.buy_score, 8.5, 1e-9);
    ASSERT_NEAR(s.sell_score, 0.0, 1e-9);
    ASSERT_NEAR(s.score(), 8.5, 1e-9);

    ASSERT_TRUE(has_reason(s, "ema_alignment_full", Direction::Long));
    ASSERT_TRUE(has_reason(s, "rsi_recovery", Direction::Long));
    ASSERT_TRUE(has_reason(s, "macd_positive", Direction::Long));
    ASSERT_TRUE(has_reason(s, "macd_fresh_cross", Direction::Long));
    ASSERT_TRUE(has_reason(s, "stoch_cross_oversold", Direction::Long));
    ASSERT_TRUE(has_reason(s, "bb_lower_bounce", Direction::Long));
    ASSERT_TRUE(has_reason(s, "adx_strong_uptrend", Direction::Long));
    ASSERT_TRUE(has_reason(s, "volume_confirmation", Direction::Long));
    ASSERT_EQ(s.reasons.size(), 8u);
}

TEST(bearish_window_emits_short) {
    SignalScorer scorer;
    Signal s = evaluate(scorer, bearish_window());

    ASSERT_EQ(s.direction, Direction::Short);
    ASSERT_NEAR(s.sell_score, 8.5, 1e-9);
    ASSERT_NEAR(s.buy_score, 0.0, 1e-9);
    ASSERT_TRUE(has_reason(s, "rsi_pullback", Direction::Short));
    ASSERT_TRUE(has_reason(s, "stoch_cross_overbought", Direction::Short));
    ASSERT_TRUE(has_reason(s, "bb_upper_rejection", Direction::Short));
    ASSERT_TRUE(has_reason(s, "adx_strong_downtrend", Direction::Short));
}

TEST(score_below_threshold_abstains) {
    ScorerProfile p;
    p.min_score = 9.0;
    SignalScorer scorer(p);

    Signal s = evaluate(scorer, bullish_window());
    ASSERT_FALSE(s.is_signal());
    ASSERT_EQ(s.abstain_reason, "score_below_threshold");
    ASSERT_NEAR(s.buy_score, 8.5, 1e-9); // scores are still reported
}

TEST(margin_must_be_beaten_not_matched) {
    ScorerProfile p;
    p.margin = 8.5; // buy 8.5 vs sell 0.0: difference equals the margin
    SignalScorer scorer(p);

    Signal s = evaluate(scorer, bullish_window());
    ASSERT_FALSE(s.is_signal());
    ASSERT_EQ(s.abstain_reason, "insufficient_margin");

    p.margin = 8.4;
    ASSERT_EQ(evaluate(SignalScorer(p), bullish_window()).direction, Direction::Long);
}

TEST(strict_exhaustion_blocks_overbought_long) {
    auto w = bullish_window();
    w[0].ind.rsi = 65;
    w[1].ind.rsi = 60;
    w[2].ind.rsi = 72; // past overbought, below the extreme filter

    Signal strict = evaluate(SignalScorer(), w);
    ASSERT_FALSE(strict.is_signal());
    ASSERT_EQ(strict.abstain_reason, "filtered_by_trend_or_exhaustion");

    ScorerProfile relaxed;
    relaxed.strict_exhaustion = false;
    ASSERT_EQ(evaluate(SignalScorer(relaxed), w).direction, Direction::Long);
}

TEST(trend_filter_blocks_long_against_major_trend) {
    auto w = bullish_window();
    for (auto& b : w) {
        b.ind.ema_50 = 1.0990; // below ema200
        b.ind.ema_200 = 1.1000;
    }

    Signal plain = evaluate(SignalScorer(), w);
    ASSERT_EQ(plain.direction, Direction::Long);
    ASSERT_NEAR(plain.buy_score, 6.0, 1e-9);

    ScorerProfile filtered = trend_filter_profile();
    Signal s = evaluate(SignalScorer(filtered), w);
    ASSERT_FALSE(s.is_signal()); // 6.0 is under the counter-trend bar of 6.5
}

TEST(counter_trend_long_needs_extra_score) {
    auto w = bullish_window();
    for (auto& b : w) {
        b.ind.ema_50 = 1.0990;
        b.ind.ema_200 = 1.1000;
    }
    w[2].ind.rsi = 44; // counter-trend longs need RSI under 45

    ScorerProfile p = trend_filter_profile();
    p.counter_trend_extra = 1.0; // counter-trend bar becomes 6.0
    Signal s = evaluate(SignalScorer(p), w);
    ASSERT_EQ(s.direction, Direction::Long);
}

TEST(counter_trend_long_must_beat_margin) {
    auto w = bullish_window();
    for (auto& b : w) {
        b.ind.ema_50 = 1.0990;
        b.ind.ema_200 = 1.1000;
    }
    w[2].ind.rsi = 44;

    ScorerProfile p = trend_filter_profile();
    p.counter_trend_extra = 1.0;
    p.margin = 6.0; // buy 6.0 vs sell 0.0 only matches the margin
    Signal s = evaluate(SignalScorer(p), w);
    ASSERT_FALSE(s.is_signal());
    ASSERT_EQ(s.abstain_reason, "insufficient_margin");

    p.margin = 5.9;
    ASSERT_EQ(evaluate(SignalScorer(p), w).direction, Direction::Long);
}

TEST(disabled_checks_do_not_score) {
    ScorerProfile p;
    p.use_stoch_cross = false;
    p.use_bb_bounce = false;
    Signal s = evaluate(SignalScorer(p), bullish_window());

    ASSERT_NEAR(s.buy_score, 6.0, 1e-9);
    ASSERT_FALSE(has_reason(s, "stoch_cross_oversold", Direction::Long));
    ASSERT_FALSE(has_reason(s, "bb_lower_bounce", Direction::Long));
}

TEST(only_last_three_bars_matter) {
    SignalScorer scorer;
    auto w = bullish_window();

    std::vector<IndicatorBar> longer;
    for (int i = 0; i < 5; ++i) {
        auto b = make_bar(-20000 + i * 3600, 1.0, 1.0);
        b.ind = IndicatorSnapshot{}; // undefined history before the window
        longer.push_back(b);
    }
    longer.insert(longer.end(), w.begin(), w.end());

    Signal a = evaluate(scorer, w);
    Signal b = evaluate(scorer, longer);
    ASSERT_EQ(a.direction, b.direction);
    ASSERT_NEAR(a.buy_score, b.buy_score, 1e-12);
}

// =============================================================================
// Profiles
// =============================================================================

TEST(profiles_by_name) {
    for (const auto& name : profile_names()) {
        ScorerProfile p = profile_by_name(name);
        ASSERT_EQ(p.name, name);
    }
    ASSERT_NEAR(profile_by_name("conservative").adx_floor, 30.0, 1e-9);
    ASSERT_NEAR(profile_by_name("aggressive").min_score, 4.0, 1e-9);
    ASSERT_TRUE(profile_by_name("trend_filter").trend_filter);

    bool threw = false;
    try {
        profile_by_name("nope");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(stop_tiers_follow_trend_strength) {
    StopTiers t;
    ASSERT_NEAR(t.multiplier_for(40), 2.0, 1e-9);
    ASSERT_NEAR(t.multiplier_for(35), 1.5, 1e-9); // strictly above 35 for the top tier
    ASSERT_NEAR(t.multiplier_for(30), 1.5, 1e-9);
    ASSERT_NEAR(t.multiplier_for(25), 1.2, 1e-9);

    StopTiers s = StopTiers::scaled(2.5);
    ASSERT_NEAR(s.strong_multiplier, 2.5, 1e-9);
    ASSERT_NEAR(s.moderate_multiplier, 1.875, 1e-9);
    ASSERT_NEAR(s.weak_multiplier, 1.5, 1e-9);
}

int main() {
    std::cout << "\n=== Signal Scorer Tests ===\n\n";

    std::cout << "Abstention:\n";
    RUN_TEST(fewer_than_three_bars_abstains);
    RUN_TEST(undefined_indicator_on_any_bar_abstains);
    RUN_TEST(missing_volume_is_not_required);
    RUN_TEST(ranging_market_never_signals);
    RUN_TEST(rsi_extreme_abstains);
    RUN_TEST(over_extension_abstains);
    RUN_TEST(zero_atr_abstains);

    std::cout << "\nScoring:\n";
    RUN_TEST(bullish_window_emits_long_with_itemized_reasons);
    RUN_TEST(bearish_window_emits_short);
    RUN_TEST(score_below_threshold_abstains);
    RUN_TEST(margin_must_be_beaten_not_matched);
    RUN_TEST(strict_exhaustion_blocks_overbought_long);
    RUN_TEST(trend_filter_blocks_long_against_major_trend);
    RUN_TEST(counter_trend_long_needs_extra_score);
    RUN_TEST(counter_trend_long_must_beat_margin);
    RUN_TEST(disabled_checks_do_not_score);
    RUN_TEST(only_last_three_bars_matter);

    std::cout << "\nProfiles:\n";
    RUN_TEST(profiles_by_name);
    RUN_TEST(stop_tiers_follow_trend_strength);

    std::cout << "\n=== All tests PASSED! ===\n";
    return 0;
}
