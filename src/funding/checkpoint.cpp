// src/funding/checkpoint.cpp
#include "rebalancer/funding/checkpoint.hpp"
#include "rebalancer/core/time_utils.hpp"

namespace rebalancer {

namespace {

Timestamp timestamp_field(const nlohmann::json& j, const std::string& key) {
    auto parsed = core::parse_iso8601(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        throw RebalanceError(ErrorCode::INVALID_DATA,
                             "Checkpoint field '" + key + "': " + parsed.error()->what(),
                             "Checkpoint");
    }
    return parsed.value();
}

}  // namespace

Checkpoint Checkpoint::from_positions(const std::vector<PositionSnapshot>& positions,
                                      Timestamp now, double target_ratio, int horizon_days) {
    Checkpoint checkpoint;

    double total_invested = 0.0;
    for (const auto& position : positions) {
        total_invested += position.market_value;
    }

    for (const auto& position : positions) {
        checkpoint.reference_equities[position.symbol] = position.market_value;
        checkpoint.ideal_allocations[position.symbol] =
            total_invested > 0.0 ? position.market_value / total_invested : 0.0;
    }

    checkpoint.last_funding_date.reset();
    checkpoint.target_investment_equity_ratio = target_ratio;
    checkpoint.finish_date = now + Days(horizon_days);
    return checkpoint;
}

double Checkpoint::ideal_fraction(const std::string& symbol) const {
    auto it = ideal_allocations.find(symbol);
    return it != ideal_allocations.end() ? it->second : 0.0;
}

nlohmann::json Checkpoint::to_json() const {
    nlohmann::json j;
    if (last_funding_date) {
        j["last_funding_date"] = core::format_iso8601(*last_funding_date);
    } else {
        j["last_funding_date"] = nullptr;
    }
    j["reference_equities"] = reference_equities;
    j["ideal_allocations"] = ideal_allocations;
    j["target_investment_equity_ratio"] = target_investment_equity_ratio;
    j["finish_date"] = core::format_iso8601(finish_date);
    return j;
}

void Checkpoint::from_json(const nlohmann::json& j) {
    const nlohmann::json& last = j.at("last_funding_date");
    if (last.is_null()) {
        last_funding_date.reset();
    } else {
        last_funding_date = timestamp_field(j, "last_funding_date");
    }

    reference_equities = j.at("reference_equities").get<std::map<std::string, double>>();
    ideal_allocations = j.at("ideal_allocations").get<std::map<std::string, double>>();
    target_investment_equity_ratio = j.at("target_investment_equity_ratio").get<double>();
    finish_date = timestamp_field(j, "finish_date");

    if (target_investment_equity_ratio < 0.0 || target_investment_equity_ratio > 1.0) {
        throw RebalanceError(ErrorCode::INVALID_DATA,
                             "target_investment_equity_ratio must be in [0, 1], got " +
                                 std::to_string(target_investment_equity_ratio),
                             "Checkpoint");
    }
}

}  // namespace rebalancer
