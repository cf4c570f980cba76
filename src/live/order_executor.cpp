// src/live/order_executor.cpp
#include "rebalancer/live/order_executor.hpp"
#include <cmath>
#include "rebalancer/core/logger.hpp"

namespace rebalancer {

namespace {
// Absorbs representation error such as 19.98 / 9.99 or 9.99 * 100 evaluating just below
// the whole number
constexpr double kRoundingEpsilon = 1e-9;
constexpr double kCentEpsilon = 1e-6;
}  // namespace

OrderExecutor::OrderExecutor(BrokerInterface& broker, double limit_price_discount)
    : broker_(broker), limit_price_discount_(limit_price_discount) {}

Result<Order> OrderExecutor::build_order(const std::string& symbol, Price reference_price,
                                         double amount) const {
    if (!(amount > 0.0)) {
        return make_error<Order>(ErrorCode::INVALID_ORDER,
                                 "Order amount for " + symbol + " must be positive, got " +
                                     std::to_string(amount),
                                 "OrderExecutor");
    }

    // Rounded down so the submitted limit never exceeds the reference price
    const double limit = reference_price * (1.0 - limit_price_discount_);
    const int64_t limit_cents = static_cast<int64_t>(std::floor(limit * 100.0 + kCentEpsilon));
    if (limit_cents <= 0) {
        return make_error<Order>(ErrorCode::INVALID_ORDER,
                                 "Limit price for " + symbol + " rounds to zero (reference " +
                                     std::to_string(reference_price) + ")",
                                 "OrderExecutor");
    }

    const int64_t quantity =
        static_cast<int64_t>(std::floor(amount / limit + kRoundingEpsilon));
    if (quantity <= 0) {
        return make_error<Order>(ErrorCode::INVALID_ORDER,
                                 "Amount " + std::to_string(amount) + " buys no unit of " +
                                     symbol + " at limit " + std::to_string(limit),
                                 "OrderExecutor");
    }

    Order order(symbol, Side::BUY, OrderType::LIMIT, quantity, limit_cents);
    order.time_in_force = TimeInForce::DAY;
    order.timestamp = std::chrono::system_clock::now();
    return Result<Order>(std::move(order));
}

Result<ExecutionSummary> OrderExecutor::execute(const PurchasePlan& plan,
                                                const std::vector<PositionSnapshot>& positions) {
    ExecutionSummary summary;

    for (const auto& purchase : plan.purchases) {
        if (purchase.asset_index >= positions.size()) {
            return make_error<ExecutionSummary>(
                ErrorCode::INVALID_ARGUMENT,
                "Planned asset index " + std::to_string(purchase.asset_index) +
                    " is outside the position snapshot of size " +
                    std::to_string(positions.size()),
                "OrderExecutor");
        }
        const PositionSnapshot& position = positions[purchase.asset_index];

        auto order = build_order(position.symbol, position.current_price, purchase.amount);
        if (order.is_error()) {
            ERROR("Aborting plan after " << summary.orders.size() << " of "
                                         << plan.purchases.size()
                                         << " orders: " << order.error()->what());
            return forward_error<ExecutionSummary>(order, "OrderExecutor");
        }

        auto submitted = broker_.submit_order(order.value());
        if (submitted.is_error()) {
            ERROR("Aborting plan after " << summary.orders.size() << " of "
                                         << plan.purchases.size()
                                         << " orders: " << submitted.error()->what());
            return forward_error<ExecutionSummary>(submitted, "OrderExecutor");
        }

        INFO("Submitted buy " << order.value().quantity << " " << position.symbol << " @ "
                              << order.value().limit_price() << " for $" << purchase.amount
                              << " (order " << submitted.value() << ")");
        summary.orders.push_back(order.value());
        summary.broker_order_ids.push_back(submitted.value());
    }

    return Result<ExecutionSummary>(std::move(summary));
}

}  // namespace rebalancer
