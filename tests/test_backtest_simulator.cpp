#include "../include/backtest/simulator.hpp"
#include "../include/indicators/indicator_provider.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace fxsig;
using namespace fxsig::backtest;
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

const Timestamp START = 1700000000;
const Timestamp HOUR = 3600;

// Fully defined indicators in a ranging market: the scorer never fires here
IndicatorBar quiet_bar(size_t i, double price = 1.1040) {
    IndicatorBar b;
    b.bar.timestamp = START + static_cast<Timestamp>(i) * HOUR;
    b.bar.open = price;
    b.bar.close = price;
    b.bar.high = price + 0.0005;
    b.bar.low = price - 0.0005;
    b.bar.volume = 1000;

    b.ind.ema_20 = 1.1040;
    b.ind.ema_50 = 1.1020;
    b.ind.ema_200 = 1.1000;
    b.ind.adx = 15;
    b.ind.rsi = 50;
    b.ind.macd_hist = 0.0002;
    b.ind.stoch_k = 50;
    b.ind.stoch_d = 50;
    b.ind.bb_position = 0.5;
    b.ind.atr = 0.0025;
    b.ind.volume_ratio = 1.0;
    b.ind.momentum_score = 0;
    return b;
}

/**
 * Three bars ending at `last` that score a long of 8.5 on the default profile.
 * Entry 1.1050, stop 1.09975 (low 1.1035 - 1.5 ATR), target 1.118125.
 */
void place_long_setup(IndicatorSeries& s, size_t last) {
    IndicatorBar& w0 = s[last - 2];
    IndicatorBar& w1 = s[last - 1];
    IndicatorBar& w2 = s[last];

    w0.bar.open = 1.1040;
    w0.bar.close = 1.1035;
    w0.ind.rsi = 38;
    w0.ind.stoch_k = 25;
    w0.ind.stoch_d = 22;
    w0.ind.bb_position = 0.25;

    w1.bar.open = 1.1035;
    w1.bar.close = 1.1040;
    w1.ind.rsi = 40;
    w1.ind.macd_hist = -0.0001;
    w1.ind.stoch_k = 20;
    w1.ind.stoch_d = 22;
    w1.ind.bb_position = 0.20;

    w2.bar.open = 1.1040;
    w2.bar.close = 1.1050;
    w2.bar.high = 1.1055;
    w2.bar.low = 1.1035;
    w2.ind.adx = 32;
    w2.ind.rsi = 45;
    w2.ind.stoch_k = 25;
    w2.ind.stoch_d = 22;
    w2.ind.bb_position = 0.25;
    w2.ind.volume_ratio = 1.5;
    w2.ind.momentum_score = 30;
}

void set_range(IndicatorBar& b, double high, double low) {
    b.bar.high = high;
    b.bar.low = low;
    b.bar.open = low;
    b.bar.close = high;
}

/**
 * 300 bars: a long that trails and reaches its target, then a long
 * stopped out at the original stop.
 */
IndicatorSeries two_trade_series() {
    IndicatorSeries s;
    for (size_t i = 0; i < 300; ++i)
        s.push_back(quiet_bar(i));

    place_long_setup(s, 255);
    set_range(s[256], 1.1100, 1.1045); // inside the bracket
    set_range(s[257], 1.1190, 1.1100); // trail trigger and target

    place_long_setup(s, 262);
    set_range(s[263], 1.1060, 1.0990); // original stop

    return s;
}

strategy::RiskProfile eurusd() {
    return strategy::RiskProfile::for_symbol("EURUSD=X", 100.0);
}

// =============================================================================
// Replay
// =============================================================================

TEST(flat_series_produces_no_trades) {
    std::vector<market::Bar> bars;
    for (int i = 0; i < 400; ++i) {
        market::Bar b;
        b.timestamp = START + i * HOUR;
        b.open = b.high = b.low = b.close = 1.1000;
        b.volume = 100;
        bars.push_back(b);
    }

    TechnicalIndicatorProvider provider;
    auto series = provider.compute(bars);
    ASSERT_TRUE(series.has_value());

    Simulator sim;
    BacktestStats stats = sim.run(*series, strategy::optimized_profile(), eurusd());
    ASSERT_EQ(stats.total_trades, 0);
    ASSERT_EQ(stats.max_drawdown_pct, 0.0);
    ASSERT_EQ(stats.profit_factor, 0.0);
    ASSERT_NEAR(stats.final_balance, 10000.0, 1e-9);
    ASSERT_EQ(stats.start_time, START + 250 * HOUR);
    ASSERT_EQ(stats.end_time, START + 399 * HOUR);
}

TEST(series_shorter_than_warmup_is_idle) {
    IndicatorSeries s;
    for (size_t i = 0; i < 100; ++i)
        s.push_back(quiet_bar(i));

    Simulator sim;
    BacktestStats stats = sim.run(s, strategy::optimized_profile(), eurusd());
    ASSERT_EQ(stats.total_trades, 0);
    ASSERT_EQ(stats.start_time, 0);
}

TEST(win_and_loss_are_recorded) {
    Simulator sim;
    BacktestStats stats = sim.run(two_trade_series(), strategy::optimized_profile(), eurusd());

    ASSERT_EQ(stats.total_trades, 2);
    const auto& trades = sim.trades();

    const BacktestTrade& win = trades[0];
    ASSERT_EQ(win.direction, Direction::Long);
    ASSERT_EQ(win.entry_bar, 255u);
    ASSERT_EQ(win.exit_bar, 257u);
    ASSERT_EQ(win.holding_bars, 2u);
    ASSERT_EQ(win.exit_reason, trading::ExitReason::TargetHit);
    ASSERT_TRUE(win.trailed);
    ASSERT_NEAR(win.original_stop, 1.09975, 1e-9);
    ASSERT_NEAR(win.exit_price, 1.118125, 1e-9);
    ASSERT_NEAR(win.pnl, 250.0, 1e-6);

    const BacktestTrade& loss = trades[1];
    ASSERT_EQ(loss.entry_bar, 262u);
    ASSERT_EQ(loss.exit_reason, trading::ExitReason::StopHit);
    ASSERT_EQ(loss.result, trading::TradeState::ClosedLoss);
    ASSERT_FALSE(loss.trailed);
    ASSERT_NEAR(loss.pnl, -100.0, 1e-6);
}

TEST(stats_from_trades) {
    Simulator sim;
    BacktestStats stats = sim.run(two_trade_series(), strategy::optimized_profile(), eurusd());

    ASSERT_EQ(stats.winning_trades, 1);
    ASSERT_EQ(stats.losing_trades, 1);
    ASSERT_NEAR(stats.win_rate, 50.0, 1e-9);
    ASSERT_NEAR(stats.gross_profit, 250.0, 1e-6);
    ASSERT_NEAR(stats.gross_loss, 100.0, 1e-6);
    ASSERT_NEAR(stats.net_pnl, 150.0, 1e-6);
    ASSERT_NEAR(stats.profit_factor, 2.5, 1e-6);
    ASSERT_NEAR(stats.final_balance, 10150.0, 1e-6);
    ASSERT_NEAR(stats.avg_holding_bars, 1.5, 1e-9);
    ASSERT_EQ(stats.long_trades, 2);
    ASSERT_EQ(stats.long_wins, 1);
    // Peak 10250 -> 10150
    ASSERT_NEAR(stats.max_drawdown_pct, 100.0 / 10250.0 * 100.0, 1e-6);
    // Everything but the trade count
    ASSERT_EQ(stats.rating, 4);
}

TEST(open_trade_at_end_is_excluded) {
    IndicatorSeries s;
    for (size_t i = 0; i < 260; ++i)
        s.push_back(quiet_bar(i));
    place_long_setup(s, 255);

    Simulator sim;
    BacktestStats stats = sim.run(s, strategy::optimized_profile(), eurusd());
    ASSERT_EQ(stats.total_trades, 0);
    ASSERT_NEAR(stats.final_balance, 10000.0, 1e-9);
}

TEST(profit_factor_without_losses_is_infinite) {
    IndicatorSeries s = two_trade_series();
    s.resize(262); // drop the losing setup

    Simulator sim;
    BacktestStats stats = sim.run(s, strategy::optimized_profile(), eurusd());
    ASSERT_EQ(stats.total_trades, 1);
    ASSERT_TRUE(std::isinf(stats.profit_factor));
}

// =============================================================================
// Rating and export
// =============================================================================

TEST(rating_components) {
    BacktestStats s;
    ASSERT_EQ(profitability_rating(s), 1); // zero drawdown only

    s.win_rate = 55;
    s.profit_factor = 1.8;
    s.max_drawdown_pct = 8;
    s.net_pnl = 900;
    s.total_trades = 25;
    ASSERT_EQ(profitability_rating(s), 5);

    s.max_drawdown_pct = 25;
    ASSERT_EQ(profitability_rating(s), 4);
    ASSERT_EQ(std::string(rating_label(5)).rfind("EXCELLENT", 0), 0u);
    ASSERT_EQ(std::string(rating_label(0)).rfind("FAILING", 0), 0u);
}

TEST(export_trades_csv) {
    const std::string path = "/tmp/test_fxsignal_trades.csv";
    Simulator sim;
    sim.run(two_trade_series(), strategy::optimized_profile(), eurusd());
    ASSERT_TRUE(sim.export_trades_csv(path));

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    std::getline(in, line);
    ASSERT_EQ(line.rfind("entry_time,exit_time,direction", 0), 0u);
    while (std::getline(in, line)) {
        ++lines;
        ASSERT_TRUE(line.find("LONG") != std::string::npos);
    }
    ASSERT_EQ(lines, 2);
    std::remove(path.c_str());

    ASSERT_FALSE(sim.export_trades_csv("/nonexistent_dir/trades.csv"));
}

int main() {
    std::cout << "\n=== Backtest Simulator Tests ===\n\n";

    std::cout << "Replay:\n";
    RUN_TEST(flat_series_produces_no_trades);
    RUN_TEST(series_shorter_than_warmup_is_idle);
    RUN_TEST(win_and_loss_are_recorded);
    RUN_TEST(stats_from_trades);
    RUN_TEST(open_trade_at_end_is_excluded);
    RUN_TEST(profit_factor_without_losses_is_infinite);

    std::cout << "\nRating and export:\n";
    RUN_TEST(rating_components);
    RUN_TEST(export_trades_csv);

    std::cout << "\n=== All tests PASSED! ===\n";
    return 0;
}
