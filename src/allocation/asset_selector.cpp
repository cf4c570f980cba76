// src/allocation/asset_selector.cpp
#include "rebalancer/allocation/asset_selector.hpp"
#include <algorithm>
#include <limits>
#include <numeric>
#include "rebalancer/allocation/error_metric.hpp"

namespace rebalancer {

std::optional<AssetSelection> select_best_asset(const std::vector<double>& equities,
                                                const std::vector<double>& prices,
                                                const std::vector<double>& ideal_fractions,
                                                double budget) {
    const double total_equity = std::accumulate(equities.begin(), equities.end(), 0.0);

    std::optional<AssetSelection> best;
    double best_error = std::numeric_limits<double>::infinity();
    std::vector<double> candidate(equities.size());

    const size_t n = std::min(prices.size(), equities.size());
    for (size_t i = 0; i < n; ++i) {
        const double price = prices[i];
        if (!(price <= budget)) {
            continue;
        }

        const double new_total = total_equity + price;
        for (size_t j = 0; j < equities.size(); ++j) {
            double equity = (j == i) ? equities[j] + price : equities[j];
            candidate[j] = equity / new_total;
        }

        std::optional<double> err = mean_squared_error(candidate, ideal_fractions);
        if (!err) {
            continue;
        }
        // Strict comparison keeps the first index on ties and never picks NaN
        if (*err < best_error) {
            best_error = *err;
            best = AssetSelection{i, price};
        }
    }

    return best;
}

}  // namespace rebalancer
