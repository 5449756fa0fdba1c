#pragma once

#include "../types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace fxsig {
namespace trading {

/**
 * Trade lifecycle states
 *
 *   OpenArmed -> OpenTrailed -> ClosedWin | ClosedLoss | ClosedBreakeven
 *   OpenArmed ---------------->  (any closed state)
 */
enum class TradeState : uint8_t { OpenArmed, OpenTrailed, ClosedWin, ClosedLoss, ClosedBreakeven };

inline const char* trade_state_to_string(TradeState s) {
    switch (s) {
    case TradeState::OpenArmed:
        return "OPEN_ARMED";
    case TradeState::OpenTrailed:
        return "OPEN_TRAILED";
    case TradeState::ClosedWin:
        return "CLOSED_WIN";
    case TradeState::ClosedLoss:
        return "CLOSED_LOSS";
    case TradeState::ClosedBreakeven:
        return "CLOSED_BREAKEVEN";
    }
    return "UNKNOWN";
}

inline TradeState string_to_trade_state(const std::string& s) {
    if (s == "OPEN_ARMED")
        return TradeState::OpenArmed;
    if (s == "OPEN_TRAILED")
        return TradeState::OpenTrailed;
    if (s == "CLOSED_WIN")
        return TradeState::ClosedWin;
    if (s == "CLOSED_LOSS")
        return TradeState::ClosedLoss;
    if (s == "CLOSED_BREAKEVEN")
        return TradeState::ClosedBreakeven;
    throw std::invalid_argument("Unknown trade state: " + s);
}

enum class ExitReason : uint8_t { None, StopHit, TargetHit, Manual };

inline const char* exit_reason_to_string(ExitReason r) {
    switch (r) {
    case ExitReason::StopHit:
        return "SL_HIT";
    case ExitReason::TargetHit:
        return "TP_HIT";
    case ExitReason::Manual:
        return "MANUAL";
    default:
        return "NONE";
    }
}

inline ExitReason string_to_exit_reason(const std::string& s) {
    if (s == "SL_HIT")
        return ExitReason::StopHit;
    if (s == "TP_HIT")
        return ExitReason::TargetHit;
    if (s == "MANUAL")
        return ExitReason::Manual;
    return ExitReason::None;
}

struct StopAdjustment {
    Timestamp time = 0;
    double old_stop = 0;
    double new_stop = 0;
    std::string reason;

    bool operator==(const StopAdjustment&) const = default;
};

/**
 * Trade
 *
 * original_stop is fixed at open and defines risk_distance. current_stop
 * only moves in the trade's favor: non-decreasing for longs,
 * non-increasing for shorts.
 */
struct Trade {
    std::string id; // <symbol>_<YYYYmmdd_HHMMSS>[_n]
    std::string symbol;
    Direction direction = Direction::None;
    TradeState state = TradeState::OpenArmed;
    std::string order_id;

    Timestamp open_time = 0;
    double entry_price = 0;
    double original_stop = 0;
    double current_stop = 0;
    double take_profit = 0;
    double position_size = 0;
    double risk_amount = 0;
    double risk_distance = 0;
    double breakeven_trigger = 0;
    bool stop_moved_to_breakeven = false;

    // Highest high (long) or lowest low (short) seen while open
    double favorable_extreme = 0;
    // Bars at or before this time have already been applied
    Timestamp last_update_time = 0;

    std::vector<StopAdjustment> stop_adjustments;

    // Set on close
    Timestamp exit_time = 0;
    double exit_price = 0;
    ExitReason exit_reason = ExitReason::None;
    double pnl = 0;

    bool is_open() const { return state == TradeState::OpenArmed || state == TradeState::OpenTrailed; }
    bool is_long() const { return direction == Direction::Long; }

    bool operator==(const Trade&) const = default;
};

} // namespace trading
} // namespace fxsig
