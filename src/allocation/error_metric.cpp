// src/allocation/error_metric.cpp
#include "rebalancer/allocation/error_metric.hpp"
#include <algorithm>

namespace rebalancer {

std::optional<double> mean_squared_error(const std::vector<double>& candidate_fractions,
                                         const std::vector<double>& ideal_fractions) {
    const size_t n = std::min(candidate_fractions.size(), ideal_fractions.size());
    if (n == 0) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double diff = candidate_fractions[i] - ideal_fractions[i];
        sum += diff * diff;
    }
    return sum / static_cast<double>(n);
}

}  // namespace rebalancer
