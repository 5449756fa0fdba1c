#pragma once

#include "../market/bar.hpp"
#include "trade.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace fxsig {
namespace trading {

/**
 * Lifecycle constants, in units of the trade's risk distance (R)
 */
struct LifecycleConfig {
    double trail_trigger_r = 1.5; // favorable move that arms the stop move
    double trail_lock_r = 0.2;    // new stop, beyond entry
    double breakeven_band = 5.0;  // |P/L| in account currency below this is BREAKEVEN
    size_t history_limit = 100;   // closed trades kept in the state document
};

/**
 * What one bar did to a trade
 */
struct BarOutcome {
    std::optional<StopAdjustment> adjustment;
    bool closed = false;

    bool changed() const { return adjustment.has_value() || closed; }
};

/**
 * Build an armed trade
 *
 * @throws strategy::DegenerateStopError if entry == stop
 * @throws std::invalid_argument on a missing direction or a stop/target on the wrong side
 */
Trade make_trade(const std::string& id, const std::string& symbol, Direction direction, Timestamp open_time,
                 double entry, double stop, double take_profit, double position_size, double risk_amount,
                 const LifecycleConfig& config);

/**
 * Apply one bar to an open trade
 *
 * Order within the bar:
 *   1. stop move to entry +/- trail_lock_r * R once the favorable extreme
 *      reaches breakeven_trigger (only if it improves the stop)
 *   2. stop hit against the (possibly moved) stop, at the stop price
 *   3. otherwise take-profit hit, at the target price
 *
 * Checking the stop before the target when a bar spans both is a
 * conservative assumption about intrabar order, not observed fact.
 * Bars at or before last_update_time are ignored.
 */
BarOutcome advance_trade(Trade& trade, const market::Bar& bar, const LifecycleConfig& config);

/**
 * Close at exit_price and classify the result
 */
void close_trade(Trade& trade, double exit_price, ExitReason reason, Timestamp time, const LifecycleConfig& config);

// P/L in account currency: R multiple times risk_amount
double realized_pnl(const Trade& trade, double exit_price);

TradeState classify_result(double pnl, double breakeven_band);

// "<symbol>_<YYYYmmdd_HHMMSS>" in UTC
std::string make_trade_id(const std::string& symbol, Timestamp open_time);

} // namespace trading
} // namespace fxsig
