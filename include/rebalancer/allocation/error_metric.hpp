// include/rebalancer/allocation/error_metric.hpp
#pragma once

#include <optional>
#include <vector>

namespace rebalancer {

/**
 * @brief Mean squared difference between a candidate and the ideal allocation
 *
 * Elements are paired by asset index up to the shorter of the two sequences.
 *
 * @param candidate_fractions Fractional holdings being evaluated
 * @param ideal_fractions Target fractional holdings
 * @return The error, or std::nullopt when either sequence is empty
 */
std::optional<double> mean_squared_error(const std::vector<double>& candidate_fractions,
                                         const std::vector<double>& ideal_fractions);

}  // namespace rebalancer
