#include "../include/external/notifier.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

using namespace fxsig;
using namespace fxsig::external;

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

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

strategy::TradeParams eurusd_long() {
    strategy::TradeParams p;
    p.symbol = "EURUSD=X";
    p.direction = Direction::Long;
    p.entry_price = 1.1000;
    p.entry_min = 1.0997;
    p.entry_max = 1.1003;
    p.stop_loss = 1.0975;
    p.take_profit = 1.1060;
    p.position_size = 0.4;
    p.risk_amount = 100;
    p.reward_estimate = 250;
    p.indicators.adx = 32;
    p.indicators.rsi = 45;
    p.indicators.momentum_score = 30;
    p.indicators.volume_ratio = 1.1;
    return p;
}

strategy::Signal long_signal() {
    strategy::Signal s;
    s.direction = Direction::Long;
    s.buy_score = 6.5;
    s.sell_score = 1.0;
    s.reasons = {{"ema_alignment_full", Direction::Long, 2.0},
                 {"macd_fresh_cross", Direction::Long, 1.0},
                 {"stoch_overbought_cross", Direction::Short, 1.0}};
    return s;
}

trading::Trade closed_trade() {
    trading::Trade t;
    t.id = "GBPUSD=X_20231114_221320";
    t.symbol = "GBPUSD=X";
    t.direction = Direction::Short;
    t.state = trading::TradeState::ClosedLoss;
    t.entry_price = 1.2500;
    t.exit_price = 1.2550;
    t.exit_reason = trading::ExitReason::StopHit;
    t.pnl = -100;
    return t;
}

// =============================================================================
// Helpers
// =============================================================================

TEST(readable_symbols) {
    ASSERT_EQ(readable_symbol("EURUSD=X"), "EUR/USD");
    ASSERT_EQ(readable_symbol("GC=F"), "GC=F");
    ASSERT_EQ(readable_symbol("BTC-USD"), "BTC-USD");
}

TEST(strength_levels) {
    indicators::IndicatorSnapshot ind;
    ind.adx = 35;
    ind.momentum_score = -45;
    ind.volume_ratio = 1.5;
    ASSERT_EQ(std::string(signal_strength(ind)), "STRONG");

    ind.volume_ratio = 1.0;
    ASSERT_EQ(std::string(signal_strength(ind)), "MODERATE");

    ind.adx = 20;
    ASSERT_EQ(std::string(signal_strength(ind)), "WEAK");

    // Undefined values count as weak
    ASSERT_EQ(std::string(signal_strength(indicators::IndicatorSnapshot{})), "WEAK");
}

TEST(reasoning_is_sanitized) {
    std::string text = sanitize_reasoning("<b>Risk</b> & reward look fine");
    ASSERT_FALSE(contains(text, "<"));
    ASSERT_FALSE(contains(text, ">"));
    ASSERT_TRUE(contains(text, "and reward"));

    std::string long_text(500, 'x');
    ASSERT_EQ(sanitize_reasoning(long_text).size(), 200u);
}

TEST(reasoning_cut_keeps_utf8_whole) {
    // Two-byte character straddling the 200-byte limit
    std::string text = std::string(199, 'a') + "\xC3\xA9" + "\xE2\x80\xA6";
    std::string cut = sanitize_reasoning(text);
    ASSERT_EQ(cut.size(), 199u);
    ASSERT_EQ(cut.back(), 'a');

    nlohmann::json payload;
    payload["text"] = cut;
    ASSERT_FALSE(payload.dump().empty());

    // Character ending exactly at the limit is kept
    std::string exact = std::string(198, 'a') + "\xC3\xA9" + "tail";
    ASSERT_EQ(sanitize_reasoning(exact).size(), 200u);
}

TEST(strip_html_removes_tags) {
    ASSERT_EQ(strip_html("<b>BUY</b> <code>1.1</code>"), "BUY 1.1");
}

// =============================================================================
// Messages
// =============================================================================

TEST(signal_message_fields) {
    std::string msg = format_signal_message(eurusd_long(), long_signal(), "Momentum <confirmed>");

    ASSERT_TRUE(contains(msg, "<b>BUY EUR/USD</b>"));
    ASSERT_TRUE(contains(msg, "Entry: <code>1.10000</code>"));
    ASSERT_TRUE(contains(msg, "SL: <code>1.09750</code> - 25 pips"));
    ASSERT_TRUE(contains(msg, "TP: <code>1.10600</code> - 60 pips"));
    ASSERT_TRUE(contains(msg, "Lot: <code>0.40</code>"));
    ASSERT_TRUE(contains(msg, "Risk: $100 | Reward: $250"));
    ASSERT_TRUE(contains(msg, "Strength: MODERATE | Score: 6.5"));
    ASSERT_TRUE(contains(msg, "ADX: 32 | RSI: 45"));
    // Only the long-side reasons
    ASSERT_TRUE(contains(msg, "Reasons: ema_alignment_full, macd_fresh_cross\n"));
    ASSERT_TRUE(contains(msg, "<b>AI:</b> Momentum confirmed"));
}

TEST(jpy_pips_use_two_decimals) {
    strategy::TradeParams p = eurusd_long();
    p.symbol = "USDJPY=X";
    p.direction = Direction::Short;
    p.entry_min = 150.00;
    p.entry_max = 150.00;
    p.stop_loss = 150.50;
    p.take_profit = 149.00;

    strategy::Signal s = long_signal();
    s.direction = Direction::Short;

    std::string msg = format_signal_message(p, s, "");
    ASSERT_TRUE(contains(msg, "<b>SELL USD/JPY</b>"));
    ASSERT_TRUE(contains(msg, "- 50 pips"));
    ASSERT_TRUE(contains(msg, "- 100 pips"));
}

TEST(pips_follow_configured_asset_class) {
    strategy::TradeParams p = eurusd_long();
    p.symbol = "GOLD";
    p.asset_class = market::AssetClass::Metal;
    p.entry_min = 2000.0;
    p.entry_max = 2000.0;
    p.stop_loss = 1995.0;
    p.take_profit = 2012.5;

    std::string msg = format_signal_message(p, long_signal(), "");
    ASSERT_TRUE(contains(msg, "- 50 pips"));
    ASSERT_TRUE(contains(msg, "- 125 pips"));
}

TEST(stop_moved_message) {
    trading::Trade t;
    t.symbol = "EURUSD=X";
    t.direction = Direction::Long;
    t.entry_price = 1.1000;
    trading::StopAdjustment adj{1700003600, 1.0950, 1.1010, "Breakeven move (1.5x risk reached)"};

    std::string msg = format_stop_trailed_message(t, adj, 1.1078);
    ASSERT_TRUE(contains(msg, "STOP MOVED EUR/USD"));
    ASSERT_TRUE(contains(msg, "(BUY)"));
    ASSERT_TRUE(contains(msg, "Old SL: <code>1.09500</code>"));
    ASSERT_TRUE(contains(msg, "New SL: <code>1.10100</code>"));
    ASSERT_TRUE(contains(msg, "Price: <code>1.10780</code>"));
    ASSERT_TRUE(contains(msg, "Breakeven move"));
}

TEST(closed_message) {
    std::string msg = format_trade_closed_message(closed_trade());
    ASSERT_TRUE(contains(msg, "TRADE CLOSED GBP/USD</b> - CLOSED_LOSS"));
    ASSERT_TRUE(contains(msg, "Direction: SELL"));
    ASSERT_TRUE(contains(msg, "P/L: $-100.00"));
    ASSERT_TRUE(contains(msg, "Reason: SL_HIT"));
    ASSERT_TRUE(contains(msg, "Trailing stop used: NO"));

    trading::Trade win = closed_trade();
    win.pnl = 20;
    win.stop_moved_to_breakeven = true;
    msg = format_trade_closed_message(win);
    ASSERT_TRUE(contains(msg, "P/L: $+20.00"));
    ASSERT_TRUE(contains(msg, "Trailing stop used: YES"));
}

TEST(log_notifier_always_delivers) {
    LogNotifier n;
    ASSERT_TRUE(n.signal_raised(eurusd_long(), long_signal(), "ok"));
    ASSERT_TRUE(n.trade_closed(closed_trade()));
}

int main() {
    std::cout << "\n=== Notifier Tests ===\n\n";

    std::cout << "Helpers:\n";
    RUN_TEST(readable_symbols);
    RUN_TEST(strength_levels);
    RUN_TEST(reasoning_is_sanitized);
    RUN_TEST(reasoning_cut_keeps_utf8_whole);
    RUN_TEST(strip_html_removes_tags);

    std::cout << "\nMessages:\n";
    RUN_TEST(signal_message_fields);
    RUN_TEST(jpy_pips_use_two_decimals);
    RUN_TEST(pips_follow_configured_asset_class);
    RUN_TEST(stop_moved_message);
    RUN_TEST(closed_message);
    RUN_TEST(log_notifier_always_delivers);

    std::cout << "\n=== All tests PASSED! ===\n";
    return 0;
}
