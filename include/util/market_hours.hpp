#pragma once

#include "../market/asset.hpp"
#include "time_utils.hpp"

namespace fxsig {
namespace util {

/**
 * Spot FX / metals weekly session, UTC
 *
 * Closed all Saturday, Friday from 22:00, and Sunday before 22:00.
 * Crypto never closes.
 */
inline bool is_market_open(int64_t epoch_seconds, market::AssetClass asset_class) {
    if (asset_class == market::AssetClass::Crypto)
        return true;

    std::tm tm = utc_tm(epoch_seconds);
    int weekday = tm.tm_wday; // 0 = Sunday
    int hour = tm.tm_hour;

    if (weekday == 6)
        return false;
    if (weekday == 5 && hour >= 22)
        return false;
    if (weekday == 0 && hour < 22)
        return false;
    return true;
}

} // namespace util
} // namespace fxsig
