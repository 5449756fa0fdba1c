#include "../../include/trading/trade_rules.hpp"
#include "../../include/strategy/trade_params.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace fxsig::trading {

Trade make_trade(const std::string& id, const std::string& symbol, Direction direction, Timestamp open_time,
                 double entry, double stop, double take_profit, double position_size, double risk_amount,
                 const LifecycleConfig& config) {
    if (direction == Direction::None) {
        throw std::invalid_argument("Trade needs a direction");
    }

    double risk_distance = std::abs(entry - stop);
    if (!(risk_distance > 0)) {
        throw strategy::DegenerateStopError(symbol + ": stop equals entry " + std::to_string(entry));
    }

    double sign = direction_sign(direction);
    if ((stop - entry) * sign > 0 || (take_profit - entry) * sign <= 0) {
        throw std::invalid_argument(symbol + ": stop/target on the wrong side of entry");
    }

    Trade t;
    t.id = id;
    t.symbol = symbol;
    t.direction = direction;
    t.state = TradeState::OpenArmed;
    t.open_time = open_time;
    t.last_update_time = open_time;
    t.entry_price = entry;
    t.original_stop = stop;
    t.current_stop = stop;
    t.take_profit = take_profit;
    t.position_size = position_size;
    t.risk_amount = risk_amount;
    t.risk_distance = risk_distance;
    t.breakeven_trigger = entry + sign * config.trail_trigger_r * risk_distance;
    t.favorable_extreme = entry;
    return t;
}

BarOutcome advance_trade(Trade& trade, const market::Bar& bar, const LifecycleConfig& config) {
    BarOutcome outcome;
    if (!trade.is_open() || bar.timestamp <= trade.last_update_time)
        return outcome;

    trade.last_update_time = bar.timestamp;
    const bool is_long = trade.is_long();

    if (is_long)
        trade.favorable_extreme = std::max(trade.favorable_extreme, bar.high);
    else
        trade.favorable_extreme = std::min(trade.favorable_extreme, bar.low);

    // One-way stop move once price has run trail_trigger_r in our favor
    if (trade.state == TradeState::OpenArmed) {
        bool reached = is_long ? bar.high >= trade.breakeven_trigger : bar.low <= trade.breakeven_trigger;
        if (reached) {
            double new_stop = trade.entry_price + direction_sign(trade.direction) * config.trail_lock_r * trade.risk_distance;
            bool improves = is_long ? new_stop > trade.current_stop : new_stop < trade.current_stop;
            if (improves) {
                char reason[64];
                std::snprintf(reason, sizeof(reason), "Breakeven move (%.1fx risk reached)", config.trail_trigger_r);
                StopAdjustment adj{bar.timestamp, trade.current_stop, new_stop, reason};
                trade.current_stop = new_stop;
                trade.stop_moved_to_breakeven = true;
                trade.state = TradeState::OpenTrailed;
                trade.stop_adjustments.push_back(adj);
                outcome.adjustment = adj;
            }
        }
    }

    // Stop before target
    bool stop_hit = is_long ? bar.low <= trade.current_stop : bar.high >= trade.current_stop;
    bool target_hit = is_long ? bar.high >= trade.take_profit : bar.low <= trade.take_profit;

    if (stop_hit) {
        close_trade(trade, trade.current_stop, ExitReason::StopHit, bar.timestamp, config);
        outcome.closed = true;
    } else if (target_hit) {
        close_trade(trade, trade.take_profit, ExitReason::TargetHit, bar.timestamp, config);
        outcome.closed = true;
    }

    return outcome;
}

double realized_pnl(const Trade& trade, double exit_price) {
    double r_multiple = (exit_price - trade.entry_price) * direction_sign(trade.direction) / trade.risk_distance;
    return r_multiple * trade.risk_amount;
}

TradeState classify_result(double pnl, double breakeven_band) {
    if (pnl > 0)
        return TradeState::ClosedWin;
    if (pnl < -breakeven_band)
        return TradeState::ClosedLoss;
    return TradeState::ClosedBreakeven;
}

void close_trade(Trade& trade, double exit_price, ExitReason reason, Timestamp time, const LifecycleConfig& config) {
    trade.exit_price = exit_price;
    trade.exit_time = time;
    trade.exit_reason = reason;
    trade.pnl = realized_pnl(trade, exit_price);
    trade.state = classify_result(trade.pnl, config.breakeven_band);
}

std::string make_trade_id(const std::string& symbol, Timestamp open_time) {
    std::time_t secs = static_cast<std::time_t>(open_time);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return symbol + "_" + buf;
}

} // namespace fxsig::trading
