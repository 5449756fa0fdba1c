#pragma once

#include <cstdint>
#include <string>

namespace fxsig {

// Bar timestamps are UTC seconds since the Unix epoch
using Timestamp = int64_t;
using Price = double;

/**
 * Trade direction
 *
 * None is the scorer's abstention, never the direction of an open trade.
 */
enum class Direction : uint8_t { None = 0, Long = 1, Short = 2 };

inline const char* direction_to_string(Direction dir) {
    switch (dir) {
    case Direction::Long:
        return "LONG";
    case Direction::Short:
        return "SHORT";
    default:
        return "NONE";
    }
}

// Accepts the persisted names plus BUY/SELL from older state files
inline Direction string_to_direction(const std::string& s) {
    if (s == "LONG" || s == "BUY")
        return Direction::Long;
    if (s == "SHORT" || s == "SELL")
        return Direction::Short;
    return Direction::None;
}

// +1 for long, -1 for short, 0 for none
inline double direction_sign(Direction dir) {
    return dir == Direction::Long ? 1.0 : (dir == Direction::Short ? -1.0 : 0.0);
}

} // namespace fxsig
