#include "../../include/trading/trade_store.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/time_utils.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>

namespace fxsig::trading {

using json = nlohmann::json;

void to_json(json& j, const StopAdjustment& a) {
    j = json{{"time", a.time}, {"old_sl", a.old_stop}, {"new_sl", a.new_stop}, {"reason", a.reason}};
}

void from_json(const json& j, StopAdjustment& a) {
    j.at("time").get_to(a.time);
    j.at("old_sl").get_to(a.old_stop);
    j.at("new_sl").get_to(a.new_stop);
    j.at("reason").get_to(a.reason);
}

void to_json(json& j, const Trade& t) {
    j = json{{"id", t.id},
             {"symbol", t.symbol},
             {"type", direction_to_string(t.direction)},
             {"state", trade_state_to_string(t.state)},
             {"order_id", t.order_id},
             {"entry_time", t.open_time},
             {"entry_price", t.entry_price},
             {"original_sl", t.original_stop},
             {"current_sl", t.current_stop},
             {"tp", t.take_profit},
             {"lot_size", t.position_size},
             {"risk_amount", t.risk_amount},
             {"risk_distance", t.risk_distance},
             {"breakeven_target", t.breakeven_trigger},
             {"sl_moved_to_be", t.stop_moved_to_breakeven},
             {"favorable_extreme", t.favorable_extreme},
             {"last_update_time", t.last_update_time},
             {"sl_updates", t.stop_adjustments}};

    if (!t.is_open()) {
        j["exit_time"] = t.exit_time;
        j["exit_price"] = t.exit_price;
        j["exit_reason"] = exit_reason_to_string(t.exit_reason);
        j["pnl"] = t.pnl;
    }
}

void from_json(const json& j, Trade& t) {
    j.at("id").get_to(t.id);
    j.at("symbol").get_to(t.symbol);
    t.direction = string_to_direction(j.at("type").get<std::string>());
    t.state = string_to_trade_state(j.at("state").get<std::string>());
    t.order_id = j.value("order_id", "");
    j.at("entry_time").get_to(t.open_time);
    j.at("entry_price").get_to(t.entry_price);
    j.at("original_sl").get_to(t.original_stop);
    j.at("current_sl").get_to(t.current_stop);
    j.at("tp").get_to(t.take_profit);
    j.at("lot_size").get_to(t.position_size);
    j.at("risk_amount").get_to(t.risk_amount);
    j.at("risk_distance").get_to(t.risk_distance);
    j.at("breakeven_target").get_to(t.breakeven_trigger);
    j.at("sl_moved_to_be").get_to(t.stop_moved_to_breakeven);
    t.favorable_extreme = j.value("favorable_extreme", t.entry_price);
    t.last_update_time = j.value("last_update_time", t.open_time);
    j.at("sl_updates").get_to(t.stop_adjustments);

    if (!t.is_open()) {
        j.at("exit_time").get_to(t.exit_time);
        j.at("exit_price").get_to(t.exit_price);
        t.exit_reason = string_to_exit_reason(j.at("exit_reason").get<std::string>());
        j.at("pnl").get_to(t.pnl);
    }

    if (t.direction == Direction::None) {
        throw std::runtime_error("Trade " + t.id + " has no direction");
    }
    if (!(t.risk_distance > 0)) {
        throw std::runtime_error("Trade " + t.id + " has non-positive risk distance");
    }
}

json TradeStore::to_document(const PersistedState& state) const {
    json active = json::object();
    for (const auto& [id, trade] : state.open_trades) {
        active[id] = trade;
    }

    json history = json::array();
    size_t skip = state.history.size() > history_limit_ ? state.history.size() - history_limit_ : 0;
    for (size_t i = skip; i < state.history.size(); ++i) {
        history.push_back(state.history[i]);
    }

    return json{{"version", FORMAT_VERSION},
                {"saved_at", static_cast<int64_t>(util::wall_clock_ns() / 1'000'000'000ULL)},
                {"active_trades", active},
                {"history", history}};
}

PersistedState TradeStore::from_document(const json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("State document is not a JSON object");
    }

    PersistedState state;
    for (const auto& [id, item] : doc.at("active_trades").items()) {
        Trade t = item.get<Trade>();
        if (t.id != id) {
            throw std::runtime_error("Trade key " + id + " does not match id " + t.id);
        }
        if (!t.is_open()) {
            throw std::runtime_error("Closed trade " + id + " listed as active");
        }
        state.open_trades.emplace(id, std::move(t));
    }

    for (const auto& item : doc.value("history", json::array())) {
        state.history.push_back(item.get<Trade>());
    }

    return state;
}

bool TradeStore::save(const PersistedState& state) const {
    std::string temp_path = path_ + ".tmp";
    {
        std::ofstream out(temp_path);
        if (!out.is_open()) {
            LOGF_ERROR(Store, "Cannot write %s", temp_path.c_str());
            return false;
        }
        out << to_document(state).dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            LOGF_ERROR(Store, "Write failed for %s", temp_path.c_str());
            std::remove(temp_path.c_str());
            return false;
        }
    }

    // Atomic rename
    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        LOGF_ERROR(Store, "Cannot replace %s", path_.c_str());
        std::remove(temp_path.c_str());
        return false;
    }

    return true;
}

bool TradeStore::restore(PersistedState& state) const {
    state = PersistedState{};

    std::ifstream in(path_);
    if (!in.is_open())
        return false;

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    try {
        state = from_document(json::parse(content));
    } catch (const json::exception& e) {
        state = PersistedState{};
        LOGF_ERROR(Store, "Corrupt state %s (%s); starting empty, open positions are UNTRACKED", path_.c_str(),
                   e.what());
        return false;
    } catch (const std::exception& e) {
        state = PersistedState{};
        LOGF_ERROR(Store, "Invalid state %s (%s); starting empty, open positions are UNTRACKED", path_.c_str(),
                   e.what());
        return false;
    }

    LOGF_INFO(Store, "Restored %zu open trades, %zu closed from %s", state.open_trades.size(), state.history.size(),
              path_.c_str());
    return true;
}

bool TradeStore::exists() const {
    std::ifstream f(path_);
    return f.good();
}

void TradeStore::clear() const {
    std::remove(path_.c_str());
}

} // namespace fxsig::trading
