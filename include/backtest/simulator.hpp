#pragma once

#include "../indicators/indicator_snapshot.hpp"
#include "../strategy/scorer_profile.hpp"
#include "../strategy/trade_params.hpp"
#include "../trading/trade_rules.hpp"
#include <string>
#include <vector>

namespace fxsig {
namespace backtest {

/**
 * Backtest Configuration
 */
struct BacktestConfig {
    size_t warmup_bars = 250;          // bars skipped while indicators settle
    double initial_balance = 10000.0;  // account currency
    trading::LifecycleConfig lifecycle; // same rules as the live manager
};

/**
 * Trade Record
 */
struct BacktestTrade {
    size_t entry_bar = 0;
    size_t exit_bar = 0;
    Timestamp entry_time = 0;
    Timestamp exit_time = 0;
    Direction direction = Direction::None;
    double entry_price = 0;
    double original_stop = 0;
    double final_stop = 0;
    double take_profit = 0;
    double exit_price = 0;
    trading::ExitReason exit_reason = trading::ExitReason::None;
    trading::TradeState result = trading::TradeState::ClosedBreakeven;
    double pnl = 0;
    size_t holding_bars = 0;
    bool trailed = false;
};

/**
 * Backtest Result
 */
struct BacktestStats {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    int breakeven_trades = 0;
    double win_rate = 0; // percent

    double gross_profit = 0;
    double gross_loss = 0; // positive number
    double net_pnl = 0;
    double profit_factor = 0; // +inf when there are gains and no losses
    double max_drawdown_pct = 0;
    double avg_holding_bars = 0;
    double avg_win = 0;
    double avg_loss = 0;

    int long_trades = 0;
    int long_wins = 0;
    int short_trades = 0;
    int short_wins = 0;

    double initial_balance = 0;
    double final_balance = 0;
    int rating = 0; // 0-5

    Timestamp start_time = 0;
    Timestamp end_time = 0;

    void print() const;
};

/**
 * +1 each for win rate >= 50%, profit factor >= 1.5, max drawdown < 20%,
 * net P/L > 0 and at least 20 trades
 */
int profitability_rating(const BacktestStats& stats);

const char* rating_label(int rating);

/**
 * Simulator - replays scorer, trade derivation and lifecycle over history
 *
 * One trade at a time. A signal on bar i opens at bar i's close; bars
 * after it advance the trade through trading::advance_trade, the same
 * function the live manager uses. A trade still open at the end of the
 * series is left out of the statistics.
 *
 * Drawdown is measured on realized balance after each bar.
 */
class Simulator {
public:
    explicit Simulator(const BacktestConfig& config = BacktestConfig()) : config_(config) {}

    BacktestStats run(const indicators::IndicatorSeries& series, const strategy::ScorerProfile& profile,
                      const strategy::RiskProfile& risk);

    const std::vector<BacktestTrade>& trades() const { return trades_; }
    const BacktestConfig& config() const { return config_; }

    /**
     * Write trade records as CSV. Returns false if the file cannot be opened.
     */
    bool export_trades_csv(const std::string& path) const;

private:
    BacktestConfig config_;
    std::vector<BacktestTrade> trades_;

    BacktestStats calculate_stats(double balance, double max_drawdown_pct) const;
};

} // namespace backtest
} // namespace fxsig
