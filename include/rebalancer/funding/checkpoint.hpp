// include/rebalancer/funding/checkpoint.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "rebalancer/core/config_base.hpp"
#include "rebalancer/core/types.hpp"

namespace rebalancer {

/**
 * @brief Persisted scheduling state and ideal allocation
 *
 * Serialized as a JSON document with the keys last_funding_date,
 * reference_equities, ideal_allocations, target_investment_equity_ratio and
 * finish_date. Timestamps are ISO-8601 UTC strings; last_funding_date is null
 * until the first successful funding cycle. All keys are required on load.
 */
struct Checkpoint : public ConfigBase {
    std::optional<Timestamp> last_funding_date;
    std::map<std::string, double> reference_equities;
    std::map<std::string, double> ideal_allocations;
    double target_investment_equity_ratio{1.0};
    Timestamp finish_date;

    /**
     * @brief Build the initial checkpoint from the live portfolio
     *
     * The ideal allocation is each position's share of total market value, so the
     * current composition becomes the target.
     *
     * @param positions Live positions
     * @param now Current time
     * @param target_ratio Fraction of account equity to have invested by finish_date
     * @param horizon_days Days from now until finish_date
     */
    static Checkpoint from_positions(const std::vector<PositionSnapshot>& positions,
                                     Timestamp now, double target_ratio, int horizon_days);

    /**
     * @brief Ideal fraction for a symbol, 0 when the symbol is not tracked
     */
    double ideal_fraction(const std::string& symbol) const;

    nlohmann::json to_json() const override;

    /**
     * @throws RebalanceError or nlohmann::json::exception on a missing or malformed key
     */
    void from_json(const nlohmann::json& j) override;
};

}  // namespace rebalancer
