/**
 * fxsignal backtest
 *
 * Replays one scorer profile over a bars CSV with the live trade rules.
 *
 * Usage:
 *   ./fxsignal_backtest --csv data/EURUSD=X.csv [--profile conservative]
 */

#include "../include/backtest/simulator.hpp"
#include "../include/config/engine_config.hpp"
#include "../include/indicators/indicator_provider.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/bar.hpp"
#include "../include/util/cli.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace fxsig;

// Built-in profile name, or a JSON file holding a profile object
strategy::ScorerProfile resolve_profile(const std::string& name_or_path) {
    auto names = strategy::profile_names();
    for (const auto& n : names) {
        if (n == name_or_path)
            return strategy::profile_by_name(n);
    }

    std::ifstream file(name_or_path);
    if (!file.is_open())
        throw std::runtime_error("Unknown scorer profile: " + name_or_path);
    return nlohmann::json::parse(file).get<strategy::ScorerProfile>();
}

int run(const util::BacktestArgs& args) {
    auto bars = market::load_bars_csv(args.csv_path);
    std::cout << "Loaded " << bars.size() << " bars from " << args.csv_path << "\n";

    backtest::BacktestConfig bt_config;
    if (bars.size() <= bt_config.warmup_bars) {
        std::cerr << "Error: need more than " << bt_config.warmup_bars << " bars\n";
        return 1;
    }

    indicators::TechnicalIndicatorProvider provider;
    auto series = provider.compute(bars);
    if (!series) {
        std::cerr << "Error: bar timestamps are not strictly increasing\n";
        return 1;
    }

    strategy::ScorerProfile profile = resolve_profile(args.profile);
    strategy::RiskProfile risk = strategy::RiskProfile::for_symbol(args.symbol, args.risk);
    bt_config.initial_balance = args.balance;

    std::cout << "Symbol:  " << args.symbol << " (" << market::asset_class_to_string(risk.asset_class) << ")\n";
    std::cout << "Profile: " << profile.name << "\n";
    std::cout << "Risk:    $" << args.risk << " per trade\n";

    backtest::Simulator sim(bt_config);
    backtest::BacktestStats stats = sim.run(*series, profile, risk);
    stats.print();

    const auto& trades = sim.trades();
    if (!trades.empty()) {
        std::cout << "\n--- Last Trades ---\n";
        size_t from = trades.size() > 5 ? trades.size() - 5 : 0;
        for (size_t i = from; i < trades.size(); ++i) {
            const auto& t = trades[i];
            std::cout << "  " << std::left << std::setw(6) << direction_to_string(t.direction) << std::right
                      << std::fixed << std::setprecision(5) << " entry " << t.entry_price << " exit "
                      << t.exit_price << " " << std::setw(7) << trading::exit_reason_to_string(t.exit_reason)
                      << std::setprecision(2) << " pnl $" << std::setw(8) << t.pnl << " (" << t.holding_bars
                      << " bars)\n";
        }
    }

    if (!args.trades_out.empty()) {
        if (!sim.export_trades_csv(args.trades_out))
            return 1;
        std::cout << "\nTrades written to " << args.trades_out << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    util::BacktestArgs args;
    if (!util::parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        util::print_backtest_help();
        return 0;
    }
    if (args.csv_path.empty()) {
        std::cerr << "Error: --csv is required\n\n";
        util::print_backtest_help();
        return 1;
    }

    logging::global_logger().set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Warn);

    try {
        return run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
