#include "../../include/trading/trade_lifecycle.hpp"
#include "../../include/logging/async_logger.hpp"

namespace fxsig::trading {

TradeLifecycleManager::TradeLifecycleManager(TradeStore store, LifecycleConfig config, external::INotifier* notifier)
    : store_(std::move(store)), config_(config), notifier_(notifier) {}

bool TradeLifecycleManager::load() {
    PersistedState restored;
    if (!store_.restore(restored)) {
        state_ = PersistedState{};
        return false;
    }
    state_ = std::move(restored);
    while (state_.history.size() > config_.history_limit)
        state_.history.pop_front();

    LOGF_INFO(Trade, "Restored %zu open trades, %zu closed", state_.open_trades.size(), state_.history.size());
    return true;
}

std::string TradeLifecycleManager::unique_id(const std::string& symbol, Timestamp open_time) const {
    std::string base = make_trade_id(symbol, open_time);
    auto taken = [this](const std::string& id) {
        if (state_.open_trades.count(id))
            return true;
        for (const auto& t : state_.history) {
            if (t.id == id)
                return true;
        }
        return false;
    };

    if (!taken(base))
        return base;
    for (int n = 2;; ++n) {
        std::string id = base + "_" + std::to_string(n);
        if (!taken(id))
            return id;
    }
}

const Trade& TradeLifecycleManager::open_trade(const strategy::TradeParams& params, Timestamp open_time,
                                               const std::string& order_id) {
    return open_trade(params.symbol, params.direction, open_time, params.entry_price, params.stop_loss,
                      params.take_profit, params.position_size, params.risk_amount, order_id);
}

const Trade& TradeLifecycleManager::open_trade(const std::string& symbol, Direction direction, Timestamp open_time,
                                               double entry, double stop, double take_profit, double position_size,
                                               double risk_amount, const std::string& order_id) {
    Trade t = make_trade(unique_id(symbol, open_time), symbol, direction, open_time, entry, stop, take_profit,
                         position_size, risk_amount, config_);
    t.order_id = order_id;

    if (has_open_trade(symbol)) {
        LOGF_WARN(Trade, "%s already has an open trade, tracking %s alongside it", symbol.c_str(), t.id.c_str());
    }

    const Trade& stored = insert(std::move(t));
    persist();

    LOGF_INFO(Trade, "Opened %s %s @ %.5f SL %.5f TP %.5f size %.3f", stored.id.c_str(),
              direction_to_string(stored.direction), stored.entry_price, stored.current_stop, stored.take_profit,
              stored.position_size);
    return stored;
}

const Trade& TradeLifecycleManager::insert(Trade trade) {
    std::string id = trade.id;
    auto [it, inserted] = state_.open_trades.emplace(id, std::move(trade));
    (void)inserted; // unique_id() guarantees a fresh key
    return it->second;
}

void TradeLifecycleManager::archive(const Trade& trade) {
    state_.history.push_back(trade);
    while (state_.history.size() > config_.history_limit)
        state_.history.pop_front();
}

void TradeLifecycleManager::persist() {
    if (!store_.save(state_)) {
        LOGF_ERROR(Store, "Failed to persist trade state to %s", store_.path().c_str());
    }
}

std::vector<Trade> TradeLifecycleManager::on_bar(const std::string& symbol, const market::Bar& bar) {
    std::vector<Trade> closed;
    std::vector<std::pair<std::string, StopAdjustment>> trailed;

    for (auto it = state_.open_trades.begin(); it != state_.open_trades.end();) {
        Trade& trade = it->second;
        if (trade.symbol != symbol) {
            ++it;
            continue;
        }

        BarOutcome outcome = advance_trade(trade, bar, config_);

        if (outcome.adjustment) {
            LOGF_INFO(Trade, "%s stop %.5f -> %.5f", trade.id.c_str(), outcome.adjustment->old_stop,
                      outcome.adjustment->new_stop);
            trailed.emplace_back(trade.id, *outcome.adjustment);
        }

        if (outcome.closed) {
            LOGF_INFO(Trade, "%s closed %s @ %.5f pnl %.2f (%s)", trade.id.c_str(),
                      exit_reason_to_string(trade.exit_reason), trade.exit_price, trade.pnl,
                      trade_state_to_string(trade.state));
            archive(trade);
            closed.push_back(trade);
            it = state_.open_trades.erase(it);
        } else {
            ++it;
        }
    }

    if (trailed.empty() && closed.empty())
        return closed;

    persist();

    // A trade can trail and close on the same bar; report the move first
    for (const auto& [id, adj] : trailed) {
        if (const Trade* t = find(id)) {
            notify_trailed(*t, adj, bar.close);
            continue;
        }
        for (const auto& c : closed) {
            if (c.id == id)
                notify_trailed(c, adj, bar.close);
        }
    }
    for (const auto& c : closed)
        notify_closed(c);

    return closed;
}

bool TradeLifecycleManager::close_trade(const std::string& id, double exit_price, Timestamp time) {
    auto it = state_.open_trades.find(id);
    if (it == state_.open_trades.end()) {
        LOGF_WARN(Trade, "Close requested for unknown trade %s", id.c_str());
        return false;
    }

    trading::close_trade(it->second, exit_price, ExitReason::Manual, time, config_);
    Trade done = it->second;
    archive(done);
    state_.open_trades.erase(it);
    persist();

    LOGF_INFO(Trade, "%s closed manually @ %.5f pnl %.2f", done.id.c_str(), done.exit_price, done.pnl);
    notify_closed(done);
    return true;
}

bool TradeLifecycleManager::has_open_trade(const std::string& symbol) const {
    for (const auto& [id, t] : state_.open_trades) {
        if (t.symbol == symbol)
            return true;
    }
    return false;
}

const Trade* TradeLifecycleManager::find(const std::string& id) const {
    auto it = state_.open_trades.find(id);
    return it == state_.open_trades.end() ? nullptr : &it->second;
}

std::vector<Trade> TradeLifecycleManager::open_trades() const {
    std::vector<Trade> out;
    out.reserve(state_.open_trades.size());
    for (const auto& [id, t] : state_.open_trades)
        out.push_back(t);
    return out;
}

LifecycleStats TradeLifecycleManager::stats() const {
    LifecycleStats s;
    for (const auto& t : state_.history) {
        ++s.total;
        s.total_pnl += t.pnl;
        switch (t.state) {
        case TradeState::ClosedWin:
            ++s.wins;
            break;
        case TradeState::ClosedLoss:
            ++s.losses;
            break;
        default:
            ++s.breakevens;
            break;
        }
        if (t.stop_moved_to_breakeven) {
            ++s.trail_activations;
            if (t.pnl >= 0)
                ++s.trades_saved;
        }
    }
    if (s.total > 0)
        s.win_rate = 100.0 * static_cast<double>(s.wins) / static_cast<double>(s.total);
    return s;
}

void TradeLifecycleManager::notify_trailed(const Trade& trade, const StopAdjustment& adj, double price) {
    if (!notifier_)
        return;
    try {
        if (!notifier_->stop_trailed(trade, adj, price))
            LOGF_WARN(External, "Stop-move notification not delivered for %s", trade.id.c_str());
    } catch (const std::exception& e) {
        LOGF_ERROR(External, "Stop-move notification failed for %s: %s", trade.id.c_str(), e.what());
    }
}

void TradeLifecycleManager::notify_closed(const Trade& trade) {
    if (!notifier_)
        return;
    try {
        if (!notifier_->trade_closed(trade))
            LOGF_WARN(External, "Close notification not delivered for %s", trade.id.c_str());
    } catch (const std::exception& e) {
        LOGF_ERROR(External, "Close notification failed for %s: %s", trade.id.c_str(), e.what());
    }
}

} // namespace fxsig::trading
