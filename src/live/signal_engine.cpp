#include "../../include/live/signal_engine.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/market_hours.hpp"
#include "../../include/util/time_utils.hpp"

#include <chrono>
#include <span>
#include <thread>

namespace fxsig::live {

SignalEngine::SignalEngine(config::EngineConfig config, external::IBarSource& bars,
                           const indicators::IIndicatorProvider& indicators, external::IAdvisor& advisor,
                           external::INotifier& notifier, trading::TradeLifecycleManager& trades,
                           external::IOrderExecutor* executor)
    : config_(std::move(config)), bars_(bars), indicators_(indicators), advisor_(advisor), notifier_(notifier),
      trades_(trades), executor_(executor), scorer_(config_.profile) {
    if (config_.mode == config::RunMode::Execute && !executor_) {
        throw std::invalid_argument("Execute mode needs an order executor");
    }
}

bool SignalEngine::in_cooldown(const std::string& symbol, Timestamp now) const {
    auto it = last_alert_.find(symbol);
    if (it == last_alert_.end())
        return false;
    return now - it->second < static_cast<Timestamp>(config_.cooldown_minutes) * 60;
}

TickReport SignalEngine::tick(Timestamp now) {
    TickReport report;

    for (const auto& symbol : config_.symbols) {
        if (!util::is_market_open(now, symbol.asset_class)) {
            report.market_closed++;
            LOGF_DEBUG(System, "Market closed for %s", symbol.symbol.c_str());
            continue;
        }

        report.symbols_checked++;
        try {
            process_symbol(symbol, now, report);
        } catch (const std::exception& e) {
            report.errors++;
            LOGF_ERROR(System, "Pass failed for %s: %s", symbol.symbol.c_str(), e.what());
        }
    }

    LOGF_INFO(System, "Tick done: %zu checked, %zu signals, %zu opened, %zu closed, %zu errors",
              report.symbols_checked, report.signals, report.opened, report.closed, report.errors);
    return report;
}

void SignalEngine::process_symbol(const config::SymbolSettings& symbol, Timestamp now, TickReport& report) {
    const std::string& sym = symbol.symbol;

    std::vector<market::Bar> bars = bars_.fetch(sym, config_.lookback_bars);
    if (bars.empty()) {
        LOGF_WARN(Data, "No bars for %s", sym.c_str());
        return;
    }

    // Bars already applied to a trade are skipped inside the manager
    for (const auto& bar : bars) {
        report.closed += trades_.on_bar(sym, bar).size();
    }

    if (in_cooldown(sym, now)) {
        report.cooling_down++;
        LOGF_DEBUG(Signal, "%s cooling down", sym.c_str());
        return;
    }
    if (trades_.has_open_trade(sym)) {
        report.trade_open++;
        LOGF_DEBUG(Signal, "%s already has an open trade", sym.c_str());
        return;
    }

    auto series = indicators_.compute(bars);
    if (!series) {
        LOGF_DEBUG(Data, "Indicators unavailable for %s", sym.c_str());
        return;
    }

    strategy::Signal signal = scorer_.evaluate(std::span<const indicators::IndicatorBar>(*series));
    if (!signal.is_signal()) {
        LOGF_DEBUG(Signal, "No signal for %s (%s)", sym.c_str(), signal.abstain_reason.c_str());
        return;
    }

    report.signals++;
    LOGF_INFO(Signal, "Signal for %s: %s buy %.1f sell %.1f", sym.c_str(), direction_to_string(signal.direction),
              signal.buy_score, signal.sell_score);

    strategy::RiskProfile risk = strategy::RiskProfile::for_symbol(sym, symbol.asset_class, config_.risk_amount);
    strategy::TradeParams params;
    try {
        params = strategy::derive_trade_params(signal.direction, series->back(), config_.profile, risk);
    } catch (const strategy::DegenerateStopError& e) {
        LOGF_WARN(Signal, "No trade for %s: %s", sym.c_str(), e.what());
        return;
    }

    external::AdvisoryDecision decision = advisor_.review(sym, signal, params);
    if (!decision.approved) {
        report.rejected++;
        LOGF_INFO(External, "Advisory rejected %s: %s", sym.c_str(), decision.reasoning.c_str());
        return;
    }
    report.approved++;

    std::string order_id;
    if (!confirm_entry(params, signal, decision.reasoning, order_id))
        return;

    trades_.open_trade(params, series->back().bar.timestamp, order_id);
    last_alert_[sym] = now;
    report.opened++;
}

bool SignalEngine::confirm_entry(strategy::TradeParams& params, const strategy::Signal& signal,
                                 const std::string& reasoning, std::string& order_id) {
    bool delivered = false;
    try {
        delivered = notifier_.signal_raised(params, signal, reasoning);
    } catch (const std::exception& e) {
        LOGF_ERROR(External, "Signal notification failed for %s: %s", params.symbol.c_str(), e.what());
    }

    if (config_.mode == config::RunMode::SignalOnly) {
        if (!delivered) {
            LOGF_WARN(External, "Signal for %s not delivered, trade not tracked", params.symbol.c_str());
        }
        return delivered;
    }

    external::OrderRequest request{params.symbol,    params.direction,   params.entry_price,
                                   params.stop_loss, params.take_profit, params.position_size,
                                   params.asset_class};
    external::OrderResult result;
    try {
        result = executor_->place_order(request);
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    if (!result.success) {
        LOGF_ERROR(External, "Order for %s failed: %s", params.symbol.c_str(), result.error.c_str());
        return false;
    }

    LOGF_INFO(Trade, "Order %s placed for %s", result.order_id.c_str(), params.symbol.c_str());
    order_id = result.order_id;
    if (result.filled_size > 0)
        params.position_size = result.filled_size;
    return true;
}

void SignalEngine::run(const std::atomic<bool>& running) {
    LOGF_INFO(System, "Engine started: %zu symbols, %s mode, poll %ds", config_.symbols.size(),
              config::run_mode_to_string(config_.mode), config_.poll_interval_seconds);

    while (running.load()) {
        tick(util::wall_clock_seconds());

        for (int waited = 0; waited < config_.poll_interval_seconds && running.load(); ++waited) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    LOG_INFO(System, "Engine stopped");
}

} // namespace fxsig::live
