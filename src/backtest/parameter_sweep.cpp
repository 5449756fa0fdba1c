#include "../../include/backtest/parameter_sweep.hpp"
#include "../../include/logging/async_logger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace fxsig::backtest {

size_t SweepGrid::size() const {
    return adx_floor.size() * rsi_oversold.size() * rsi_overbought.size() * atr_multiplier.size() *
           reward_risk.size() * min_score.size() * trend_filter.size();
}

strategy::ScorerProfile SweepGrid::profile_at(size_t index, const strategy::ScorerProfile& base) const {
    strategy::ScorerProfile p = base;
    p.name = "sweep_" + std::to_string(index);

    // Mixed-radix decode, fastest axis first
    size_t rest = index;
    auto take = [&rest](size_t radix) {
        size_t digit = rest % radix;
        rest /= radix;
        return digit;
    };

    p.trend_filter = trend_filter[take(trend_filter.size())];
    p.min_score = min_score[take(min_score.size())];
    p.reward_risk = reward_risk[take(reward_risk.size())];
    p.stops = strategy::StopTiers::scaled(atr_multiplier[take(atr_multiplier.size())]);
    p.rsi_overbought = rsi_overbought[take(rsi_overbought.size())];
    p.rsi_oversold = rsi_oversold[take(rsi_oversold.size())];
    p.adx_floor = adx_floor[take(adx_floor.size())];
    return p;
}

int quality_score(const BacktestStats& stats) {
    int score = 0;
    if (stats.win_rate >= 45)
        score += 1;
    if (stats.win_rate >= 50)
        score += 1;
    if (stats.profit_factor >= 1.2)
        score += 1;
    if (stats.profit_factor >= 1.5)
        score += 2;
    if (stats.max_drawdown_pct < 15)
        score += 1;
    if (stats.max_drawdown_pct < 10)
        score += 1;
    if (stats.net_pnl > 0)
        score += 2;
    if (stats.total_trades >= 30)
        score += 1;
    if (stats.total_trades > 0) {
        double long_share = static_cast<double>(stats.long_trades) / stats.total_trades;
        if (long_share > 0.3 && long_share < 0.7)
            score += 1;
    }
    return score;
}

unsigned ParameterSweep::worker_count() const {
    unsigned n = config_.threads;
    if (n == 0)
        n = std::max(1u, std::thread::hardware_concurrency());
    size_t combos = grid_.size();
    if (combos > 0 && n > combos)
        n = static_cast<unsigned>(combos);
    return n;
}

std::vector<SweepResult> ParameterSweep::run(const indicators::IndicatorSeries& series,
                                             const strategy::RiskProfile& risk,
                                             const strategy::ScorerProfile& base) const {
    const size_t total = grid_.size();
    std::vector<SweepResult> results(total);
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};

    unsigned workers = worker_count();
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    LOGF_INFO(Backtest, "Sweeping %zu combinations on %u threads", total, workers);

    for (unsigned w = 0; w < workers; ++w) {
        threads.emplace_back([&, w] {
            try {
                Simulator sim(config_.backtest);
                for (size_t i = next.fetch_add(1); i < total; i = next.fetch_add(1)) {
                    SweepResult& r = results[i];
                    r.index = i;
                    r.profile = grid_.profile_at(i, base);
                    r.stats = sim.run(series, r.profile, risk);
                    r.quality = quality_score(r.stats);
                    r.qualifies = r.stats.total_trades >= config_.min_trades;
                    r.profitable = r.stats.net_pnl > 0 && r.stats.profit_factor > 1.1;

                    size_t finished = done.fetch_add(1) + 1;
                    if (finished % 100 == 0)
                        LOGF_DEBUG(Backtest, "Sweep progress %zu/%zu", finished, total);
                }
            } catch (...) {
                errors[w] = std::current_exception();
                next.store(total); // stop the other workers early
            }
        });
    }

    for (auto& t : threads)
        t.join();

    for (const auto& e : errors) {
        if (e)
            std::rethrow_exception(e);
    }
    return results;
}

std::vector<SweepResult> ParameterSweep::rank(std::vector<SweepResult> results) {
    std::vector<SweepResult> ranked;
    for (auto& r : results) {
        if (r.qualifies && r.profitable)
            ranked.push_back(std::move(r));
    }

    std::sort(ranked.begin(), ranked.end(), [](const SweepResult& a, const SweepResult& b) {
        if (a.stats.profit_factor != b.stats.profit_factor)
            return a.stats.profit_factor > b.stats.profit_factor;
        if (a.stats.net_pnl != b.stats.net_pnl)
            return a.stats.net_pnl > b.stats.net_pnl;
        if (a.stats.max_drawdown_pct != b.stats.max_drawdown_pct)
            return a.stats.max_drawdown_pct < b.stats.max_drawdown_pct;
        return a.index < b.index;
    });
    return ranked;
}

} // namespace fxsig::backtest
