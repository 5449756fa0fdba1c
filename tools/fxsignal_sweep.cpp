/**
 * fxsignal parameter sweep
 *
 * Backtests every combination of the default grid over one bars CSV,
 * prints the best profitable settings and saves the winner as a profile.
 *
 * Usage:
 *   ./fxsignal_sweep --csv data/EURUSD=X.csv [--threads 8] [--top 10]
 */

#include "../include/backtest/parameter_sweep.hpp"
#include "../include/config/engine_config.hpp"
#include "../include/indicators/indicator_provider.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/bar.hpp"
#include "../include/util/cli.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace fxsig;

void print_table(const std::vector<backtest::SweepResult>& ranked, int top) {
    std::cout << "\n  " << std::left << std::setw(5) << "#" << std::right << std::setw(5) << "ADX" << std::setw(8)
              << "RSI" << std::setw(6) << "ATR" << std::setw(5) << "RR" << std::setw(6) << "Min" << std::setw(6)
              << "Trend" << std::setw(8) << "Trades" << std::setw(8) << "WinR" << std::setw(7) << "PF"
              << std::setw(11) << "P/L" << std::setw(8) << "MaxDD" << std::setw(6) << "Q" << "\n";
    std::cout << "  " << std::string(89, '-') << "\n";

    int shown = 0;
    for (const auto& r : ranked) {
        if (shown >= top)
            break;
        const auto& p = r.profile;
        const auto& s = r.stats;
        std::string rsi = std::to_string(static_cast<int>(p.rsi_oversold)) + "/" +
                          std::to_string(static_cast<int>(p.rsi_overbought));

        std::cout << "  " << std::left << std::setw(5) << (shown + 1) << std::right << std::fixed
                  << std::setprecision(0) << std::setw(5) << p.adx_floor << std::setw(8) << rsi
                  << std::setprecision(1) << std::setw(6) << p.stops.strong_multiplier << std::setw(5)
                  << p.reward_risk << std::setw(6) << p.min_score << std::setw(6) << (p.trend_filter ? "on" : "off")
                  << std::setw(8) << s.total_trades << std::setw(7) << s.win_rate << "%" << std::setprecision(2)
                  << std::setw(7) << s.profit_factor << std::setw(11) << s.net_pnl << std::setprecision(1)
                  << std::setw(7) << s.max_drawdown_pct << "%" << std::setw(4) << r.quality << "/11\n";
        ++shown;
    }
}

int run(const util::SweepArgs& args) {
    auto bars = market::load_bars_csv(args.csv_path);
    std::cout << "Loaded " << bars.size() << " bars from " << args.csv_path << "\n";

    indicators::TechnicalIndicatorProvider provider;
    auto series = provider.compute(bars);
    if (!series) {
        std::cerr << "Error: bar timestamps are not strictly increasing\n";
        return 1;
    }

    backtest::SweepConfig cfg;
    cfg.threads = args.threads;
    cfg.min_trades = args.min_trades;

    backtest::ParameterSweep sweep(backtest::SweepGrid(), cfg);
    strategy::RiskProfile risk = strategy::RiskProfile::for_symbol(args.symbol, args.risk);

    std::cout << "Combinations: " << sweep.grid().size() << " on " << sweep.worker_count() << " threads\n";

    auto started = std::chrono::steady_clock::now();
    auto results = sweep.run(*series, risk);
    double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    size_t qualifying = 0;
    for (const auto& r : results) {
        if (r.qualifies)
            ++qualifying;
    }

    auto ranked = backtest::ParameterSweep::rank(std::move(results));

    std::cout << std::fixed << std::setprecision(1) << "Finished in " << elapsed << "s: " << qualifying
              << " with >= " << args.min_trades << " trades, " << ranked.size() << " profitable\n";

    if (ranked.empty()) {
        std::cout << "\nNo profitable combination found.\n";
        return 0;
    }

    print_table(ranked, args.top);

    const auto& best = ranked.front();
    strategy::ScorerProfile winner = best.profile;
    winner.name = "sweep_best";

    std::ofstream out(args.output);
    if (!out.is_open()) {
        std::cerr << "Error: cannot write " << args.output << "\n";
        return 1;
    }
    out << nlohmann::json(winner).dump(2) << "\n";
    std::cout << "\nBest profile (sweep #" << best.index << ") written to " << args.output << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    util::SweepArgs args;
    if (!util::parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        util::print_sweep_help();
        return 0;
    }
    if (args.csv_path.empty()) {
        std::cerr << "Error: --csv is required\n\n";
        util::print_sweep_help();
        return 1;
    }

    logging::global_logger().set_min_level(logging::LogLevel::Info);

    try {
        return run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
