#pragma once

#include "../market/asset.hpp"
#include "../types.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace fxsig {
namespace external {

struct OrderRequest {
    std::string symbol;
    Direction direction = Direction::None;
    double entry = 0;
    double stop_loss = 0;
    double take_profit = 0;
    double size = 0;
    market::AssetClass asset_class = market::AssetClass::Forex; // picks the volume step
};

struct OrderResult {
    bool success = false;
    std::string order_id; // set on success
    std::string error;    // set on failure
    double filled_size = 0;
};

/**
 * Brokerage execution interface
 *
 * A trade is only tracked as open after place_order() reports success.
 */
class IOrderExecutor {
public:
    virtual ~IOrderExecutor() = default;

    virtual OrderResult place_order(const OrderRequest& request) = 0;
};

/**
 * Round to the volume step and clamp to [min_size, max_size]
 */
double normalize_volume(double size, const market::AssetSpec& spec);

/**
 * PaperExecutor - accepts valid orders without a broker
 *
 * Assigns sequential ids ("PAPER-000001", ...) and keeps the most recent
 * accepted orders for inspection, oldest dropped first.
 */
class PaperExecutor : public IOrderExecutor {
public:
    static constexpr size_t DEFAULT_ORDER_HISTORY = 1000;

    explicit PaperExecutor(size_t order_history = DEFAULT_ORDER_HISTORY) : order_history_(order_history) {}

    OrderResult place_order(const OrderRequest& request) override;

    const std::deque<OrderRequest>& orders() const { return orders_; }

private:
    uint64_t next_id_ = 1;
    size_t order_history_;
    std::deque<OrderRequest> orders_;
};

} // namespace external
} // namespace fxsig
