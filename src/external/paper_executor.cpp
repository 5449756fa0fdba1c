#include "../../include/external/executor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace fxsig::external {

double normalize_volume(double size, const market::AssetSpec& spec) {
    double steps = std::round(size / spec.size_step);
    double volume = steps * spec.size_step;
    return std::clamp(volume, spec.min_size, spec.max_size);
}

OrderResult PaperExecutor::place_order(const OrderRequest& request) {
    OrderResult result;

    if (request.direction == Direction::None) {
        result.error = "No direction";
        return result;
    }
    if (!(request.entry > 0) || !(request.size > 0)) {
        result.error = "Invalid entry price or size";
        return result;
    }

    double sign = direction_sign(request.direction);
    if ((request.entry - request.stop_loss) * sign <= 0) {
        result.error = "Stop loss on the wrong side of entry";
        return result;
    }
    if ((request.take_profit - request.entry) * sign <= 0) {
        result.error = "Take profit on the wrong side of entry";
        return result;
    }

    auto spec = market::asset_spec(request.asset_class);

    char id[32];
    std::snprintf(id, sizeof(id), "PAPER-%06llu", static_cast<unsigned long long>(next_id_++));

    OrderRequest accepted = request;
    accepted.size = normalize_volume(request.size, spec);
    orders_.push_back(accepted);
    while (orders_.size() > order_history_)
        orders_.pop_front();

    result.success = true;
    result.order_id = id;
    result.filled_size = accepted.size;
    return result;
}

} // namespace fxsig::external
