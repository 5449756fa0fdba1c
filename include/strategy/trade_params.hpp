#pragma once

#include "../indicators/indicator_snapshot.hpp"
#include "../market/asset.hpp"
#include "scorer_profile.hpp"
#include <stdexcept>
#include <string>

namespace fxsig {
namespace strategy {

/**
 * Thrown when the stop would sit at the entry price (zero risk distance).
 * No trade is derived.
 */
class DegenerateStopError : public std::runtime_error {
public:
    explicit DegenerateStopError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Per-symbol risk settings
 */
struct RiskProfile {
    std::string symbol;
    market::AssetClass asset_class = market::AssetClass::Forex;
    double risk_amount = 100.0; // account currency lost at the original stop
    market::AssetSpec spec = market::asset_spec(market::AssetClass::Forex);

    static RiskProfile for_symbol(const std::string& symbol, double risk_amount) {
        RiskProfile p;
        p.symbol = symbol;
        p.asset_class = market::infer_asset_class(symbol);
        p.risk_amount = risk_amount;
        p.spec = market::asset_spec(p.asset_class);
        return p;
    }

    static RiskProfile for_symbol(const std::string& symbol, market::AssetClass ac, double risk_amount) {
        RiskProfile p;
        p.symbol = symbol;
        p.asset_class = ac;
        p.risk_amount = risk_amount;
        p.spec = market::asset_spec(ac);
        return p;
    }
};

/**
 * Trade parameters derived once per signal
 *
 * indicators holds the snapshot the parameters were computed from, for
 * audit and notifications.
 */
struct TradeParams {
    std::string symbol;
    market::AssetClass asset_class = market::AssetClass::Forex;
    Direction direction = Direction::None;
    Timestamp signal_time = 0;

    double entry_price = 0;
    double entry_min = 0;
    double entry_max = 0;
    double stop_loss = 0;
    double take_profit = 0;
    double stop_distance = 0;
    double atr_multiplier = 0;

    double position_size = 0;
    double risk_amount = 0;
    double reward_estimate = 0;

    indicators::IndicatorSnapshot indicators;
};

/**
 * risk_amount / (contract_multiplier * stop_distance), rounded to the
 * size step and never below the minimum size.
 *
 * @throws DegenerateStopError if stop_distance is not a positive finite number
 */
double size_position(double risk_amount, double stop_distance, const market::AssetSpec& spec);

/**
 * Derive stop, target, entry band and size for a signal on the trigger bar
 *
 * @throws DegenerateStopError if the stop distance is zero
 * @throws std::invalid_argument if direction is None or the bar lacks ATR/ADX
 */
TradeParams derive_trade_params(Direction direction, const indicators::IndicatorBar& trigger,
                                const ScorerProfile& profile, const RiskProfile& risk);

} // namespace strategy
} // namespace fxsig
