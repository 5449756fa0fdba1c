#pragma once

/**
 * TradeStore - trade state persistence for crash recovery
 *
 * Saves every open trade plus a bounded tail of closed trades to one JSON
 * document. Each save is a full rewrite: write "<path>.tmp", then rename
 * over the old file, so a crash leaves either the previous document or
 * the new one.
 *
 * Usage:
 *   TradeStore store("active_trades.json");
 *   PersistedState state;
 *   if (!store.restore(state)) {
 *       // no file, or corrupt file (already logged)
 *   }
 *   ...
 *   store.save(state);  // after every open, stop move and close
 */

#include "trade.hpp"
#include <deque>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace fxsig {
namespace trading {

struct PersistedState {
    std::map<std::string, Trade> open_trades; // by trade id
    std::deque<Trade> history;                // oldest first

    bool operator==(const PersistedState&) const = default;
};

// nlohmann ADL hooks
void to_json(nlohmann::json& j, const StopAdjustment& a);
void from_json(const nlohmann::json& j, StopAdjustment& a);
void to_json(nlohmann::json& j, const Trade& t);
void from_json(const nlohmann::json& j, Trade& t);

class TradeStore {
public:
    static constexpr const char* DEFAULT_PATH = "active_trades.json";
    static constexpr int FORMAT_VERSION = 1;

    explicit TradeStore(std::string path = DEFAULT_PATH, size_t history_limit = 100)
        : path_(std::move(path)), history_limit_(history_limit) {}

    /**
     * Rewrite the whole document. Returns false if the file could not be written.
     */
    bool save(const PersistedState& state) const;

    /**
     * Load the document into state
     *
     * Returns false and leaves state empty if the file is missing or cannot
     * be parsed. A corrupt file is logged as an error, since trades placed
     * externally are no longer tracked.
     */
    bool restore(PersistedState& state) const;

    bool exists() const;
    void clear() const;
    const std::string& path() const { return path_; }
    size_t history_limit() const { return history_limit_; }

    nlohmann::json to_document(const PersistedState& state) const;

    // Throws nlohmann::json::exception or std::runtime_error on malformed input
    static PersistedState from_document(const nlohmann::json& doc);

private:
    std::string path_;
    size_t history_limit_;
};

} // namespace trading
} // namespace fxsig
