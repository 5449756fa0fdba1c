#pragma once

/**
 * CLI utilities for the fxsignal tools
 *
 * One argument struct, help text and parser per executable.
 */

#include <iostream>
#include <string>

namespace fxsig {
namespace util {

/**
 * Command-line arguments for fxsignal_engine.
 */
struct EngineArgs {
    std::string config_path;  // empty = built-in defaults
    std::string state_path;   // overrides the config's state_file
    bool once = false;        // single tick, then exit
    bool verbose = false;
    bool help = false;
};

/**
 * Command-line arguments for fxsignal_backtest.
 */
struct BacktestArgs {
    std::string csv_path;
    std::string profile = "optimized";
    std::string symbol = "EURUSD=X";
    double risk = 100.0;
    double balance = 10000.0;
    std::string trades_out; // empty = no export
    bool verbose = false;
    bool help = false;
};

/**
 * Command-line arguments for fxsignal_sweep.
 */
struct SweepArgs {
    std::string csv_path;
    std::string symbol = "EURUSD=X";
    double risk = 100.0;
    unsigned threads = 0; // 0 = all cores
    int top = 10;
    int min_trades = 15;
    std::string output = "best_profile.json";
    bool help = false;
};

inline void print_engine_help() {
    std::cout << R"(
fxsignal engine
===============

Usage: fxsignal_engine [options]

Options:
  -c, --config FILE      JSON config (default: built-in settings)
  -s, --state FILE       Trade state file (overrides config state_file)
  -1, --once             Run a single pass and exit
  -v, --verbose          Debug logging
  -h, --help             Show this help

Environment:
  ANTHROPIC_API_KEY      Advisory review of each signal (skipped if unset)
  FXSIGNAL_ADVISOR_MODEL Advisory model override
  TELEGRAM_BOT_TOKEN     Telegram notifications (log only if unset)
  TELEGRAM_CHAT_ID

Examples:
  fxsignal_engine --config engine.json
  fxsignal_engine --config engine.json --once --verbose
)";
}

inline void print_backtest_help() {
    std::cout << R"(
fxsignal backtest
=================

Usage: fxsignal_backtest --csv FILE [options]

Options:
  -f, --csv FILE         Bars CSV: timestamp,open,high,low,close,volume
  -p, --profile NAME     optimized | conservative | aggressive | trend_filter
                         or a profile JSON file (default: optimized)
  -s, --symbol SYM       Symbol for sizing and trade ids (default: EURUSD=X)
  -r, --risk USD         Risk per trade (default: 100)
  -b, --balance USD      Initial balance (default: 10000)
  -o, --trades-out FILE  Write trade records as CSV
  -v, --verbose          Debug logging
  -h, --help             Show this help

Examples:
  fxsignal_backtest -f data/EURUSD=X.csv
  fxsignal_backtest -f data/GC=F.csv -s GC=F -p conservative -o trades.csv
)";
}

inline void print_sweep_help() {
    std::cout << R"(
fxsignal parameter sweep
========================

Usage: fxsignal_sweep --csv FILE [options]

Options:
  -f, --csv FILE         Bars CSV: timestamp,open,high,low,close,volume
  -s, --symbol SYM       Symbol for sizing (default: EURUSD=X)
  -r, --risk USD         Risk per trade (default: 100)
  -t, --threads N        Worker threads (default: all cores)
  -n, --top N            Results to print (default: 10)
  -m, --min-trades N     Minimum trades for a result to rank (default: 15)
  -o, --output FILE      Best profile as JSON (default: best_profile.json)
  -h, --help             Show this help
)";
}

/**
 * Parse command-line arguments into EngineArgs.
 *
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], EngineArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if ((arg == "--state" || arg == "-s") && i + 1 < argc) {
            args.state_path = argv[++i];
        }
        else if (arg == "--once" || arg == "-1") {
            args.once = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

inline bool parse_args(int argc, char* argv[], BacktestArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if ((arg == "--csv" || arg == "-f") && i + 1 < argc) {
            args.csv_path = argv[++i];
        }
        else if ((arg == "--profile" || arg == "-p") && i + 1 < argc) {
            args.profile = argv[++i];
        }
        else if ((arg == "--symbol" || arg == "-s") && i + 1 < argc) {
            args.symbol = argv[++i];
        }
        else if ((arg == "--risk" || arg == "-r") && i + 1 < argc) {
            args.risk = std::stod(argv[++i]);
        }
        else if ((arg == "--balance" || arg == "-b") && i + 1 < argc) {
            args.balance = std::stod(argv[++i]);
        }
        else if ((arg == "--trades-out" || arg == "-o") && i + 1 < argc) {
            args.trades_out = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

inline bool parse_args(int argc, char* argv[], SweepArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if ((arg == "--csv" || arg == "-f") && i + 1 < argc) {
            args.csv_path = argv[++i];
        }
        else if ((arg == "--symbol" || arg == "-s") && i + 1 < argc) {
            args.symbol = argv[++i];
        }
        else if ((arg == "--risk" || arg == "-r") && i + 1 < argc) {
            args.risk = std::stod(argv[++i]);
        }
        else if ((arg == "--threads" || arg == "-t") && i + 1 < argc) {
            args.threads = static_cast<unsigned>(std::stoul(argv[++i]));
        }
        else if ((arg == "--top" || arg == "-n") && i + 1 < argc) {
            args.top = std::stoi(argv[++i]);
        }
        else if ((arg == "--min-trades" || arg == "-m") && i + 1 < argc) {
            args.min_trades = std::stoi(argv[++i]);
        }
        else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            args.output = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace fxsig
