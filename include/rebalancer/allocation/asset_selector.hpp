// include/rebalancer/allocation/asset_selector.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace rebalancer {

/**
 * @brief The asset chosen for the next funding increment
 */
struct AssetSelection {
    size_t index;   // Position of the asset in the input vectors
    double amount;  // Dollars to spend, equal to the asset's current price
};

/**
 * @brief Pick the asset whose one-unit purchase brings the portfolio closest to ideal
 *
 * Every asset with price <= budget is tried as a hypothetical purchase of exactly one
 * unit at its current price. The resulting equities are normalized by the new total and
 * scored with mean_squared_error against ideal_fractions. The strictly smallest error
 * wins; on ties the lowest index is kept.
 *
 * @param equities Current equity per asset
 * @param prices Current unit price per asset, same order as equities
 * @param ideal_fractions Target fraction per asset, same order as equities
 * @param budget Maximum dollars available for this increment
 * @return The selection, or std::nullopt when nothing is affordable or no candidate
 *         produces a defined error
 */
std::optional<AssetSelection> select_best_asset(const std::vector<double>& equities,
                                                const std::vector<double>& prices,
                                                const std::vector<double>& ideal_fractions,
                                                double budget);

}  // namespace rebalancer
