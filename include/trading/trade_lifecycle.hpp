#pragma once

/**
 * TradeLifecycleManager - owns every open trade of the live engine
 *
 * Each state change (open, stop move, close) is applied in memory first,
 * then the full state is rewritten through TradeStore. Notifier calls
 * happen after the save and cannot affect trade state.
 *
 * Usage:
 *   TradeLifecycleManager mgr(TradeStore("active_trades.json"), cfg, &notifier);
 *   mgr.load();
 *   mgr.open_trade(params, bar.timestamp, order_id);
 *   mgr.on_bar("EURUSD=X", newest_closed_bar);
 */

#include "../external/notifier.hpp"
#include "../strategy/trade_params.hpp"
#include "trade_rules.hpp"
#include "trade_store.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace fxsig {
namespace trading {

struct LifecycleStats {
    size_t total = 0;
    size_t wins = 0;
    size_t losses = 0;
    size_t breakevens = 0;
    double win_rate = 0;          // percent of total
    size_t trail_activations = 0; // closed trades whose stop was moved
    size_t trades_saved = 0;      // trailed and closed with pnl >= 0
    double total_pnl = 0;
};

class TradeLifecycleManager {
public:
    TradeLifecycleManager(TradeStore store, LifecycleConfig config, external::INotifier* notifier = nullptr);

    /**
     * Restore persisted state. Returns false if nothing was restored;
     * the manager then starts empty.
     */
    bool load();

    /**
     * Track a new trade whose entry order has been confirmed
     *
     * @throws strategy::DegenerateStopError / std::invalid_argument from make_trade
     */
    const Trade& open_trade(const strategy::TradeParams& params, Timestamp open_time, const std::string& order_id = "");

    const Trade& open_trade(const std::string& symbol, Direction direction, Timestamp open_time, double entry,
                            double stop, double take_profit, double position_size, double risk_amount,
                            const std::string& order_id = "");

    /**
     * Apply a closed bar to every open trade of the symbol
     *
     * Returns the trades that closed on this bar.
     */
    std::vector<Trade> on_bar(const std::string& symbol, const market::Bar& bar);

    /**
     * Operator / broker close at a known price. Returns false for an unknown id.
     */
    bool close_trade(const std::string& id, double exit_price, Timestamp time);

    bool has_open_trade(const std::string& symbol) const;
    const Trade* find(const std::string& id) const;
    std::vector<Trade> open_trades() const;
    const std::deque<Trade>& history() const { return state_.history; }
    const PersistedState& state() const { return state_; }
    const LifecycleConfig& config() const { return config_; }

    LifecycleStats stats() const;

private:
    TradeStore store_;
    LifecycleConfig config_;
    external::INotifier* notifier_;
    PersistedState state_;

    std::string unique_id(const std::string& symbol, Timestamp open_time) const;
    const Trade& insert(Trade trade);
    void archive(const Trade& trade);
    void persist();

    void notify_trailed(const Trade& trade, const StopAdjustment& adj, double price);
    void notify_closed(const Trade& trade);
};

} // namespace trading
} // namespace fxsig
