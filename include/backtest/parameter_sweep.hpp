#pragma once

#include "simulator.hpp"
#include <string>
#include <vector>

namespace fxsig {
namespace backtest {

/**
 * Cartesian grid of scorer settings
 *
 * Combination index order: adx_floor varies slowest, trend_filter fastest.
 */
struct SweepGrid {
    std::vector<double> adx_floor = {20, 25, 30};
    std::vector<double> rsi_oversold = {30, 35};
    std::vector<double> rsi_overbought = {65, 70};
    std::vector<double> atr_multiplier = {1.5, 2.0, 2.5}; // strong tier; weaker tiers scale from it
    std::vector<double> reward_risk = {2.0, 2.5, 3.0};
    std::vector<double> min_score = {4.0, 4.5, 5.0};
    std::vector<bool> trend_filter = {true, false};

    size_t size() const;

    // Base profile with combination `index` applied
    strategy::ScorerProfile profile_at(size_t index, const strategy::ScorerProfile& base) const;
};

struct SweepConfig {
    BacktestConfig backtest;
    unsigned threads = 0; // 0 = hardware_concurrency()
    int min_trades = 15;
};

struct SweepResult {
    size_t index = 0;
    strategy::ScorerProfile profile;
    BacktestStats stats;
    int quality = 0;       // 0-11
    bool qualifies = false; // enough trades
    bool profitable = false; // net P/L > 0 and profit factor > 1.1
};

/**
 * 0-11 score used alongside the ranking:
 *   +1 win rate >= 45, +1 win rate >= 50,
 *   +1 profit factor >= 1.2, +2 profit factor >= 1.5,
 *   +1 max drawdown < 15, +1 max drawdown < 10,
 *   +2 net P/L > 0, +1 trades >= 30,
 *   +1 long share of trades strictly between 30% and 70%
 */
int quality_score(const BacktestStats& stats);

/**
 * ParameterSweep - runs the simulator over every grid combination
 *
 * Workers share the indicator series read-only, pull combination indices
 * from an atomic counter and write into pre-sized result slots, so results
 * come back in index order regardless of thread count.
 */
class ParameterSweep {
public:
    explicit ParameterSweep(SweepGrid grid = SweepGrid(), SweepConfig config = SweepConfig())
        : grid_(std::move(grid)), config_(config) {}

    std::vector<SweepResult> run(const indicators::IndicatorSeries& series, const strategy::RiskProfile& risk,
                                 const strategy::ScorerProfile& base = strategy::ScorerProfile()) const;

    /**
     * Keep qualifying profitable results, best first by
     * (profit factor, net P/L, -max drawdown)
     */
    static std::vector<SweepResult> rank(std::vector<SweepResult> results);

    unsigned worker_count() const;
    const SweepGrid& grid() const { return grid_; }

private:
    SweepGrid grid_;
    SweepConfig config_;
};

} // namespace backtest
} // namespace fxsig
