#include "../../include/strategy/trade_params.hpp"

#include <cmath>

namespace fxsig::strategy {

double size_position(double risk_amount, double stop_distance, const market::AssetSpec& spec) {
    if (!(stop_distance > 0) || !std::isfinite(stop_distance)) {
        throw DegenerateStopError("Stop distance must be positive, got " + std::to_string(stop_distance));
    }

    // Work in whole steps so the result is an exact multiple of size_step
    double raw = risk_amount / (spec.contract_multiplier * stop_distance);
    double steps = std::round(raw / spec.size_step);
    double min_steps = std::round(spec.min_size / spec.size_step);
    if (!std::isfinite(steps) || steps < min_steps)
        steps = min_steps;

    return steps * spec.size_step;
}

TradeParams derive_trade_params(Direction direction, const indicators::IndicatorBar& trigger,
                                const ScorerProfile& profile, const RiskProfile& risk) {
    if (direction == Direction::None) {
        throw std::invalid_argument("Cannot derive trade parameters without a direction");
    }
    if (!trigger.ind.atr || !trigger.ind.adx) {
        throw std::invalid_argument("Trigger bar has no ATR/ADX");
    }

    const market::Bar& bar = trigger.bar;
    const double atr = *trigger.ind.atr;
    const double multiplier = profile.stops.multiplier_for(*trigger.ind.adx);

    TradeParams p;
    p.symbol = risk.symbol;
    p.asset_class = risk.asset_class;
    p.direction = direction;
    p.signal_time = bar.timestamp;
    p.entry_price = bar.close;
    p.atr_multiplier = multiplier;

    // Stop beyond the trigger bar's extreme
    if (direction == Direction::Long)
        p.stop_loss = bar.low - multiplier * atr;
    else
        p.stop_loss = bar.high + multiplier * atr;

    p.stop_distance = std::abs(p.entry_price - p.stop_loss);
    if (!(p.stop_distance > 0)) {
        throw DegenerateStopError(risk.symbol + ": zero stop distance at " + std::to_string(p.entry_price));
    }

    p.take_profit = p.entry_price + direction_sign(direction) * profile.reward_risk * p.stop_distance;

    double band = p.entry_price * profile.entry_band_pct;
    p.entry_min = p.entry_price - band;
    p.entry_max = p.entry_price + band;

    p.position_size = size_position(risk.risk_amount, p.stop_distance, risk.spec);
    p.risk_amount = risk.risk_amount;
    p.reward_estimate = risk.risk_amount * profile.reward_risk;
    p.indicators = trigger.ind;

    return p;
}

} // namespace fxsig::strategy
