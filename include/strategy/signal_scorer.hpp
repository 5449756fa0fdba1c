#pragma once

#include "../indicators/indicator_snapshot.hpp"
#include "scorer_profile.hpp"
#include "signal.hpp"
#include <span>

namespace fxsig {
namespace strategy {

/**
 * SignalScorer - weighted multi-indicator entry scoring
 *
 * evaluate() looks at the last three bars of the window. It abstains
 * (Direction::None with abstain_reason set) when history is too short,
 * a required indicator is undefined, or a pre-filter rejects the market.
 * Otherwise buy and sell scores are accumulated independently and at most
 * one direction is emitted.
 *
 * Pure function of the window and the profile.
 */
class SignalScorer {
public:
    static constexpr size_t MIN_BARS = 3;

    explicit SignalScorer(const ScorerProfile& profile = ScorerProfile()) : profile_(profile) {}

    Signal evaluate(std::span<const indicators::IndicatorBar> window) const;

    const ScorerProfile& profile() const { return profile_; }

private:
    ScorerProfile profile_;

    // Returns an abstain reason, or nullptr if the bar passes
    const char* prefilter(const indicators::IndicatorBar& current) const;

    void score_trend(const indicators::IndicatorBar& cur, Signal& out) const;
    void score_rsi(const indicators::IndicatorSnapshot& cur, const indicators::IndicatorSnapshot& prev,
                   const indicators::IndicatorSnapshot& prev2, Signal& out) const;
    void score_macd(const indicators::IndicatorSnapshot& cur, const indicators::IndicatorSnapshot& prev,
                    Signal& out) const;
    void score_stochastic(const indicators::IndicatorSnapshot& cur, const indicators::IndicatorSnapshot& prev,
                          Signal& out) const;
    void score_bands(const indicators::IndicatorSnapshot& cur, const indicators::IndicatorSnapshot& prev,
                     Signal& out) const;
    void score_strength(const indicators::IndicatorSnapshot& cur, Signal& out) const;
    void score_volume(const indicators::IndicatorBar& cur, Signal& out) const;

    void decide(const indicators::IndicatorSnapshot& cur, Signal& out) const;
};

} // namespace strategy
} // namespace fxsig
