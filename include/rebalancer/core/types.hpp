// include/rebalancer/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace rebalancer {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Whole calendar days, used for funding intervals
 */
using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for order sizes
 */
using Quantity = double;

enum class Side { BUY, SELL, NONE };

enum class OrderType { MARKET, LIMIT, NONE };

enum class TimeInForce {
    DAY,
    GTC,  // Good Till Cancel
    IOC,  // Immediate or Cancel
    FOK,  // Fill or Kill
    NONE
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "buy";
        case Side::SELL:
            return "sell";
        default:
            return "none";
    }
}

inline std::string order_type_to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET:
            return "market";
        case OrderType::LIMIT:
            return "limit";
        default:
            return "none";
    }
}

inline std::string time_in_force_to_string(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::DAY:
            return "day";
        case TimeInForce::GTC:
            return "gtc";
        case TimeInForce::IOC:
            return "ioc";
        case TimeInForce::FOK:
            return "fok";
        default:
            return "none";
    }
}

/**
 * @brief Order structure
 * Limit prices are carried in whole cents to keep the wire value exact
 */
struct Order {
    std::string symbol;
    Side side{Side::NONE};
    OrderType type{OrderType::NONE};
    int64_t quantity{0};
    int64_t limit_price_cents{0};
    TimeInForce time_in_force{TimeInForce::DAY};
    Timestamp timestamp;

    Order() = default;
    Order(std::string sym, Side s, OrderType t, int64_t qty, int64_t limit_cents)
        : symbol(std::move(sym)),
          side(s),
          type(t),
          quantity(qty),
          limit_price_cents(limit_cents),
          time_in_force(TimeInForce::DAY) {}

    Price limit_price() const {
        return static_cast<Price>(limit_price_cents) / 100.0;
    }
};

/**
 * @brief Account figures for "now" as reported by the broker
 */
struct AccountSnapshot {
    double equity{0.0};
    double cash{0.0};
    double buying_power{0.0};
};

/**
 * @brief One held position as reported by the broker
 */
struct PositionSnapshot {
    std::string symbol;
    double market_value{0.0};
    Price current_price{0.0};

    PositionSnapshot() = default;
    PositionSnapshot(std::string sym, double value, Price price)
        : symbol(std::move(sym)), market_value(value), current_price(price) {}
};

/**
 * @brief A trading session from the market calendar
 * Date is "YYYY-MM-DD", open and close are "HH:MM" in exchange local time
 */
struct TradingSession {
    std::string date;
    std::string open;
    std::string close;
};

}  // namespace rebalancer
