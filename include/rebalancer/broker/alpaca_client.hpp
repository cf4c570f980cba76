// include/rebalancer/broker/alpaca_client.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "rebalancer/broker/broker_interface.hpp"
#include "rebalancer/broker/http_client.hpp"
#include "rebalancer/core/config_base.hpp"

namespace rebalancer {

/**
 * @brief Connection settings for the Alpaca trading API
 * Credentials are never serialized.
 */
struct AlpacaConfig : public ConfigBase {
    std::string base_url{"https://paper-api.alpaca.markets"};
    long timeout_seconds{30};
    bool verify_ssl{true};

    std::string api_key_id;
    std::string api_secret_key;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief BrokerInterface backed by the Alpaca v2 REST API
 */
class AlpacaClient : public BrokerInterface {
public:
    explicit AlpacaClient(AlpacaConfig config);

    Result<AccountSnapshot> get_account() override;
    Result<std::vector<PositionSnapshot>> get_positions() override;
    Result<std::vector<TradingSession>> get_calendar(const std::string& start_date,
                                                     const std::string& end_date) override;
    Result<std::string> submit_order(const Order& order) override;

    // Response decoding, exposed for tests
    static Result<AccountSnapshot> parse_account(const std::string& body);
    static Result<std::vector<PositionSnapshot>> parse_positions(const std::string& body);
    static Result<std::vector<TradingSession>> parse_calendar(const std::string& body);
    static Result<std::string> parse_order_id(const std::string& body);

    /**
     * @brief Request body for POST /v2/orders
     */
    static nlohmann::json order_to_json(const Order& order);

    /**
     * @brief Render whole cents as a decimal string, e.g. 999 -> "9.99"
     */
    static std::string format_cents(int64_t cents);

    /**
     * @brief Read a decimal money string as whole cents without going through binary
     * floating point, e.g. "1000.255" -> 100026 (half away from zero)
     * @return CONVERSION_ERROR unless text is an optionally signed decimal number
     */
    static Result<int64_t> parse_cents(const std::string& text);

private:
    std::string url(const std::string& path) const;

    AlpacaConfig config_;
    std::unique_ptr<HttpClient> http_;
};

}  // namespace rebalancer
