#pragma once

#include "../config/engine_config.hpp"
#include "../external/advisory.hpp"
#include "../external/bar_source.hpp"
#include "../external/executor.hpp"
#include "../external/notifier.hpp"
#include "../indicators/indicator_provider.hpp"
#include "../strategy/signal_scorer.hpp"
#include "../trading/trade_lifecycle.hpp"
#include <atomic>
#include <map>
#include <string>

namespace fxsig {
namespace live {

/**
 * What one tick did, summed over symbols
 */
struct TickReport {
    size_t symbols_checked = 0;
    size_t market_closed = 0;
    size_t cooling_down = 0;
    size_t trade_open = 0;
    size_t signals = 0;
    size_t approved = 0;
    size_t rejected = 0;
    size_t opened = 0;
    size_t closed = 0;
    size_t errors = 0;
};

/**
 * SignalEngine - single-threaded polling loop
 *
 * Per symbol and tick:
 *   fetch bars -> advance open trades -> (cooldown / open-trade check)
 *   -> indicators -> score -> trade params -> advisory review
 *   -> signal_raised -> [execute mode: place_order] -> open_trade
 *
 * A trade is only tracked after its external action succeeded: the order
 * in execute mode, the signal notification in signal-only mode.
 * Failures on one symbol are logged and never stop the pass.
 */
class SignalEngine {
public:
    SignalEngine(config::EngineConfig config, external::IBarSource& bars,
                 const indicators::IIndicatorProvider& indicators, external::IAdvisor& advisor,
                 external::INotifier& notifier, trading::TradeLifecycleManager& trades,
                 external::IOrderExecutor* executor = nullptr);

    TickReport tick(Timestamp now);

    /**
     * tick() every poll interval while running is true
     */
    void run(const std::atomic<bool>& running);

    bool in_cooldown(const std::string& symbol, Timestamp now) const;
    const config::EngineConfig& config() const { return config_; }

private:
    config::EngineConfig config_;
    external::IBarSource& bars_;
    const indicators::IIndicatorProvider& indicators_;
    external::IAdvisor& advisor_;
    external::INotifier& notifier_;
    trading::TradeLifecycleManager& trades_;
    external::IOrderExecutor* executor_;
    strategy::SignalScorer scorer_;

    std::map<std::string, Timestamp> last_alert_;

    void process_symbol(const config::SymbolSettings& symbol, Timestamp now, TickReport& report);
    bool confirm_entry(strategy::TradeParams& params, const strategy::Signal& signal,
                       const std::string& reasoning, std::string& order_id);
};

} // namespace live
} // namespace fxsig
