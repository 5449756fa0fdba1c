#pragma once

#include "indicator_snapshot.hpp"
#include <optional>
#include <vector>

namespace fxsig {
namespace indicators {

/**
 * Indicator Provider Interface
 *
 * compute() returns the input bars augmented with indicator values, or
 * std::nullopt when the provider cannot produce a series at all
 * (UNAVAILABLE). Output has the same length and order as the input.
 */
class IIndicatorProvider {
public:
    virtual ~IIndicatorProvider() = default;

    virtual std::optional<IndicatorSeries> compute(const std::vector<market::Bar>& bars) const = 0;
};

/**
 * Technical Indicators Configuration
 * Periods follow the usual textbook defaults.
 */
struct TechnicalIndicatorsConfig {
    // Trend lines
    int ema_short_period = 20;
    int ema_medium_period = 50;
    int ema_long_period = 200;

    // J. Welles Wilder, 1978
    int rsi_period = 14;
    int atr_period = 14;
    int adx_period = 14;

    // MACD (Gerald Appel)
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;

    // Stochastic (George Lane)
    int stoch_period = 14;
    int stoch_k_smooth = 3;
    int stoch_d_period = 3;

    // Bollinger Bands
    int bb_period = 20;
    double bb_std_dev = 2.0;

    // Volume
    int volume_period = 20;
    int obv_ema_period = 20;

    // Close-to-close change over this many bars, in ATR units
    int momentum_lookback = 10;
    double momentum_scale = 10.0;
};

/**
 * TechnicalIndicatorProvider - reference implementation
 *
 * Single pass over the bars, running state per indicator. Values are
 * std::nullopt until each indicator has seen enough bars, so with the
 * default periods nothing the scorer requires is defined before bar 200.
 * Returns std::nullopt when timestamps are not strictly increasing.
 */
class TechnicalIndicatorProvider : public IIndicatorProvider {
public:
    using Config = TechnicalIndicatorsConfig;

    explicit TechnicalIndicatorProvider(const Config& config = Config()) : config_(config) {}

    std::optional<IndicatorSeries> compute(const std::vector<market::Bar>& bars) const override;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace indicators
} // namespace fxsig
