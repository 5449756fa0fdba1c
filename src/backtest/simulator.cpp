#include "../../include/backtest/simulator.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/strategy/signal_scorer.hpp"
#include "../../include/util/time_utils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <span>

namespace fxsig::backtest {

namespace {

BacktestTrade make_record(const trading::Trade& t, size_t entry_bar, size_t exit_bar) {
    BacktestTrade r;
    r.entry_bar = entry_bar;
    r.exit_bar = exit_bar;
    r.entry_time = t.open_time;
    r.exit_time = t.exit_time;
    r.direction = t.direction;
    r.entry_price = t.entry_price;
    r.original_stop = t.original_stop;
    r.final_stop = t.current_stop;
    r.take_profit = t.take_profit;
    r.exit_price = t.exit_price;
    r.exit_reason = t.exit_reason;
    r.result = t.state;
    r.pnl = t.pnl;
    r.holding_bars = exit_bar - entry_bar;
    r.trailed = t.stop_moved_to_breakeven;
    return r;
}

} // namespace

BacktestStats Simulator::run(const indicators::IndicatorSeries& series, const strategy::ScorerProfile& profile,
                             const strategy::RiskProfile& risk) {
    trades_.clear();

    strategy::SignalScorer scorer(profile);
    double balance = config_.initial_balance;
    double peak_balance = config_.initial_balance;
    double max_drawdown = 0;

    std::optional<trading::Trade> active;
    size_t active_entry_bar = 0;

    for (size_t i = config_.warmup_bars; i < series.size(); ++i) {
        const auto& current = series[i];

        if (active) {
            trading::BarOutcome outcome = trading::advance_trade(*active, current.bar, config_.lifecycle);
            if (outcome.closed) {
                balance += active->pnl;
                trades_.push_back(make_record(*active, active_entry_bar, i));
                LOGF_DEBUG(Backtest, "%s closed bar %zu %s pnl %.2f", direction_to_string(active->direction), i,
                           trading::exit_reason_to_string(active->exit_reason), active->pnl);
                active.reset();
            }
        }

        if (balance > peak_balance)
            peak_balance = balance;
        double drawdown = (peak_balance - balance) / peak_balance * 100.0;
        if (drawdown > max_drawdown)
            max_drawdown = drawdown;

        if (active)
            continue;

        strategy::Signal signal = scorer.evaluate(std::span<const indicators::IndicatorBar>(series.data(), i + 1));
        if (!signal.is_signal())
            continue;

        try {
            strategy::TradeParams params = strategy::derive_trade_params(signal.direction, current, profile, risk);
            active = trading::make_trade(trading::make_trade_id(risk.symbol, current.bar.timestamp), risk.symbol,
                                         params.direction, current.bar.timestamp, params.entry_price,
                                         params.stop_loss, params.take_profit, params.position_size,
                                         params.risk_amount, config_.lifecycle);
            active_entry_bar = i;
        } catch (const strategy::DegenerateStopError& e) {
            LOGF_WARN(Backtest, "Skipping signal at bar %zu: %s", i, e.what());
        }
    }

    BacktestStats stats = calculate_stats(balance, max_drawdown);
    if (series.size() > config_.warmup_bars) {
        stats.start_time = series[config_.warmup_bars].bar.timestamp;
        stats.end_time = series.back().bar.timestamp;
    }
    return stats;
}

BacktestStats Simulator::calculate_stats(double balance, double max_drawdown_pct) const {
    BacktestStats stats;
    stats.initial_balance = config_.initial_balance;
    stats.final_balance = balance;
    stats.max_drawdown_pct = max_drawdown_pct;
    stats.total_trades = static_cast<int>(trades_.size());

    size_t holding = 0;
    for (const auto& t : trades_) {
        holding += t.holding_bars;
        bool win = t.result == trading::TradeState::ClosedWin;

        if (win)
            stats.winning_trades++;
        else if (t.result == trading::TradeState::ClosedLoss)
            stats.losing_trades++;
        else
            stats.breakeven_trades++;

        if (t.pnl > 0)
            stats.gross_profit += t.pnl;
        else
            stats.gross_loss += -t.pnl;

        if (t.direction == Direction::Long) {
            stats.long_trades++;
            if (win)
                stats.long_wins++;
        } else {
            stats.short_trades++;
            if (win)
                stats.short_wins++;
        }
    }

    stats.net_pnl = stats.gross_profit - stats.gross_loss;

    if (stats.total_trades > 0) {
        stats.win_rate = 100.0 * stats.winning_trades / stats.total_trades;
        stats.avg_holding_bars = static_cast<double>(holding) / stats.total_trades;
    }
    if (stats.winning_trades > 0)
        stats.avg_win = stats.gross_profit / stats.winning_trades;
    if (stats.losing_trades > 0)
        stats.avg_loss = stats.gross_loss / stats.losing_trades;

    if (stats.gross_loss > 0)
        stats.profit_factor = stats.gross_profit / stats.gross_loss;
    else if (stats.gross_profit > 0)
        stats.profit_factor = std::numeric_limits<double>::infinity();

    stats.rating = profitability_rating(stats);
    return stats;
}

bool Simulator::export_trades_csv(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        LOGF_ERROR(Backtest, "Cannot open trade export file: %s", path.c_str());
        return false;
    }

    out << "entry_time,exit_time,direction,entry,original_sl,final_sl,tp,exit,reason,result,pnl,holding_bars,trailed\n";
    out << std::fixed;
    for (const auto& t : trades_) {
        out << util::format_utc(t.entry_time) << ',' << util::format_utc(t.exit_time) << ','
            << direction_to_string(t.direction) << ',' << std::setprecision(5) << t.entry_price << ','
            << t.original_stop << ',' << t.final_stop << ',' << t.take_profit << ',' << t.exit_price << ','
            << trading::exit_reason_to_string(t.exit_reason) << ',' << trading::trade_state_to_string(t.result)
            << ',' << std::setprecision(2) << t.pnl << ',' << t.holding_bars << ',' << (t.trailed ? 1 : 0)
            << '\n';
    }
    return true;
}

int profitability_rating(const BacktestStats& stats) {
    int score = 0;
    if (stats.win_rate >= 50.0)
        score++;
    if (stats.profit_factor >= 1.5)
        score++;
    if (stats.max_drawdown_pct < 20.0)
        score++;
    if (stats.net_pnl > 0)
        score++;
    if (stats.total_trades >= 20)
        score++;
    return score;
}

const char* rating_label(int rating) {
    switch (rating) {
    case 5:
        return "EXCELLENT - ready for live testing";
    case 4:
        return "GOOD - minor refinements needed";
    case 3:
        return "MODERATE - some improvements needed";
    case 2:
        return "WEAK - significant changes required";
    case 1:
        return "POOR - strategy needs rework";
    default:
        return "FAILING - do not use";
    }
}

void BacktestStats::print() const {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n=== Backtest Results ===\n";
    std::cout << "Period: " << util::format_utc(start_time) << " - " << util::format_utc(end_time) << "\n";

    std::cout << "\n--- Balance ---\n";
    std::cout << "Initial: $" << initial_balance << "\n";
    std::cout << "Final:   $" << final_balance << "\n";
    std::cout << "Net P/L: $" << net_pnl << "\n";

    std::cout << "\n--- Risk ---\n";
    std::cout << "Max Drawdown:  " << max_drawdown_pct << "%\n";
    std::cout << "Profit Factor: ";
    if (std::isinf(profit_factor))
        std::cout << "inf\n";
    else
        std::cout << profit_factor << "\n";

    std::cout << "\n--- Trades ---\n";
    std::cout << "Total:     " << total_trades << "\n";
    std::cout << "Winning:   " << winning_trades << " (" << win_rate << "%)\n";
    std::cout << "Losing:    " << losing_trades << "\n";
    std::cout << "Breakeven: " << breakeven_trades << "\n";
    std::cout << "Long:      " << long_trades << " (" << long_wins << " wins)\n";
    std::cout << "Short:     " << short_trades << " (" << short_wins << " wins)\n";
    std::cout << "Avg Holding: " << std::setprecision(1) << avg_holding_bars << " bars\n";

    std::cout << "\n--- Average Trade ---\n";
    std::cout << std::setprecision(2);
    std::cout << "Gross Win:  $" << gross_profit << "\n";
    std::cout << "Gross Loss: $" << gross_loss << "\n";
    std::cout << "Avg Win:    $" << avg_win << "\n";
    std::cout << "Avg Loss:   $" << avg_loss << "\n";

    std::cout << "\n--- Rating ---\n";
    std::cout << rating << "/5 " << rating_label(rating) << "\n";
}

} // namespace fxsig::backtest
