#pragma once

#include "../types.hpp"
#include <string>
#include <vector>

namespace fxsig {
namespace strategy {

/**
 * One weighted check that fired during an evaluation
 */
struct SignalReason {
    std::string name;  // e.g. "ema_alignment_full"
    Direction side;    // which score it was added to
    double weight = 0; // amount added
};

/**
 * Trading Signal
 *
 * Produced fresh by every evaluation and never persisted on its own.
 * direction is None when the scorer abstains; abstain_reason then says why.
 */
struct Signal {
    Direction direction = Direction::None;
    double buy_score = 0;
    double sell_score = 0;
    std::vector<SignalReason> reasons;
    std::string abstain_reason;

    bool is_signal() const { return direction != Direction::None; }

    double score() const {
        if (direction == Direction::Long)
            return buy_score;
        if (direction == Direction::Short)
            return sell_score;
        return 0;
    }

    // Reason names for one side, in the order they fired
    std::string reasons_text(Direction side) const {
        std::string out;
        for (const auto& r : reasons) {
            if (r.side != side)
                continue;
            if (!out.empty())
                out += ", ";
            out += r.name;
        }
        return out;
    }
};

} // namespace strategy
} // namespace fxsig
