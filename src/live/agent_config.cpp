// src/live/agent_config.cpp
#include "rebalancer/live/agent_config.hpp"

namespace rebalancer {

nlohmann::json AgentConfig::to_json() const {
    nlohmann::json j;
    j["checkpoint_path"] = checkpoint_path;
    j["credentials_path"] = credentials_path;
    j["default_target_ratio"] = default_target_ratio;
    j["default_horizon_days"] = default_horizon_days;
    j["limit_price_discount"] = limit_price_discount;
    j["open_offset_minutes"] = open_offset_minutes;
    j["poll_interval_seconds"] = poll_interval_seconds;
    j["calendar_lookahead_days"] = calendar_lookahead_days;
    j["broker"] = broker.to_json();
    j["logging"] = logging.to_json();
    return j;
}

void AgentConfig::from_json(const nlohmann::json& j) {
    if (j.contains("checkpoint_path"))
        checkpoint_path = j.at("checkpoint_path").get<std::string>();
    if (j.contains("credentials_path"))
        credentials_path = j.at("credentials_path").get<std::string>();
    if (j.contains("default_target_ratio"))
        default_target_ratio = j.at("default_target_ratio").get<double>();
    if (j.contains("default_horizon_days"))
        default_horizon_days = j.at("default_horizon_days").get<int>();
    if (j.contains("limit_price_discount"))
        limit_price_discount = j.at("limit_price_discount").get<double>();
    if (j.contains("open_offset_minutes"))
        open_offset_minutes = j.at("open_offset_minutes").get<int>();
    if (j.contains("poll_interval_seconds"))
        poll_interval_seconds = j.at("poll_interval_seconds").get<int>();
    if (j.contains("calendar_lookahead_days"))
        calendar_lookahead_days = j.at("calendar_lookahead_days").get<int>();
    if (j.contains("broker"))
        broker.from_json(j.at("broker"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
}

Result<void> AgentConfig::validate() const {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "AgentConfig");
    };

    if (checkpoint_path.empty()) {
        return invalid("checkpoint_path must not be empty");
    }
    if (default_target_ratio < 0.0 || default_target_ratio > 1.0) {
        return invalid("default_target_ratio must be in [0, 1]");
    }
    if (default_horizon_days <= 0) {
        return invalid("default_horizon_days must be positive");
    }
    if (limit_price_discount < 0.0 || limit_price_discount >= 1.0) {
        return invalid("limit_price_discount must be in [0, 1)");
    }
    if (poll_interval_seconds <= 0) {
        return invalid("poll_interval_seconds must be positive");
    }
    if (calendar_lookahead_days <= 0) {
        return invalid("calendar_lookahead_days must be positive");
    }
    if (broker.base_url.empty()) {
        return invalid("broker.base_url must not be empty");
    }
    return Result<void>();
}

}  // namespace rebalancer
