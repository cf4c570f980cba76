// include/rebalancer/live/agent_config.hpp
#pragma once

#include <string>
#include "rebalancer/broker/alpaca_client.hpp"
#include "rebalancer/core/config_base.hpp"
#include "rebalancer/core/logger.hpp"

namespace rebalancer {

/**
 * @brief Settings for the rebalancing agent process
 */
struct AgentConfig : public ConfigBase {
    std::string checkpoint_path{"state.json"};
    std::string credentials_path{"credentials.json"};

    // Used only when a new checkpoint is created
    double default_target_ratio{1.0};
    int default_horizon_days{365};

    double limit_price_discount{0.001};  // Limit sits 0.1% under the reference price
    int open_offset_minutes{60};         // Fund one hour after the session opens
    int poll_interval_seconds{10};
    int calendar_lookahead_days{7};

    AlpacaConfig broker;
    LoggerConfig logging;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check value ranges
     * @return INVALID_ARGUMENT naming the first offending field
     */
    Result<void> validate() const;
};

}  // namespace rebalancer
