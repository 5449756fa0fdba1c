/**
 * fxsignal engine
 *
 * Polls bars for every configured symbol, manages open trades and raises
 * new signals.
 *
 * Usage:
 *   ./fxsignal_engine --config engine.json
 *   ./fxsignal_engine --config engine.json --once
 */

#include "../include/config/engine_config.hpp"
#include "../include/external/advisory.hpp"
#include "../include/external/bar_source.hpp"
#include "../include/external/executor.hpp"
#include "../include/external/notifier.hpp"
#include "../include/indicators/indicator_provider.hpp"
#include "../include/live/signal_engine.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/trading/trade_lifecycle.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"
#include "../include/util/time_utils.hpp"

#include <atomic>
#include <iostream>
#include <memory>

using namespace fxsig;

std::atomic<bool> g_running{true};

std::unique_ptr<external::IBarSource> make_bar_source(const config::EngineConfig& cfg) {
    if (cfg.data_source == config::DataSourceKind::Csv)
        return std::make_unique<external::CsvBarSource>(cfg.csv_dir);
    return std::make_unique<external::YahooBarSource>(cfg.interval);
}

int run(const util::EngineArgs& args) {
    config::EngineConfig cfg;
    if (!args.config_path.empty())
        cfg = config::ConfigLoader::load(args.config_path);
    if (!args.state_path.empty())
        cfg.state_file = args.state_path;

    auto bars = make_bar_source(cfg);
    indicators::TechnicalIndicatorProvider provider;
    auto advisor = external::make_advisor_from_env();
    auto notifier = external::make_notifier_from_env();

    std::unique_ptr<external::IOrderExecutor> executor;
    if (cfg.mode == config::RunMode::Execute)
        executor = std::make_unique<external::PaperExecutor>();

    trading::TradeLifecycleManager trades(trading::TradeStore(cfg.state_file, cfg.lifecycle.history_limit),
                                          cfg.lifecycle, notifier.get());
    if (!trades.load())
        LOGF_INFO(Store, "Starting with empty trade state (%s)", cfg.state_file.c_str());

    std::cout << "=== fxsignal engine ===\n";
    std::cout << "Symbols: ";
    for (const auto& s : cfg.symbols)
        std::cout << s.symbol << " ";
    std::cout << "\nProfile: " << cfg.profile.name << "\n";
    std::cout << "Mode:    " << config::run_mode_to_string(cfg.mode) << "\n";
    std::cout << "State:   " << cfg.state_file << "\n\n";

    live::SignalEngine engine(cfg, *bars, provider, *advisor, *notifier, trades, executor.get());

    if (args.once) {
        live::TickReport report = engine.tick(util::wall_clock_seconds());
        return report.errors > 0 ? 2 : 0;
    }

    engine.run(g_running);

    auto stats = trades.stats();
    std::cout << "\nClosed trades: " << stats.total << " (" << stats.wins << " wins, " << stats.losses
              << " losses, " << stats.breakevens << " breakeven), P/L $" << stats.total_pnl << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    util::install_shutdown_handler(g_running);

    util::EngineArgs args;
    if (!util::parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        util::print_engine_help();
        return 0;
    }

    auto& logger = logging::global_logger();
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Info);
    logger.start();

    int rc = 0;
    try {
        rc = run(args);
    } catch (const std::exception& e) {
        LOGF_ERROR(System, "Fatal: %s", e.what());
        rc = 1;
    }

    logger.stop();
    return rc;
}
