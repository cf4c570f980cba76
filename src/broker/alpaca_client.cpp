// src/broker/alpaca_client.cpp
#include "rebalancer/broker/alpaca_client.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>
#include "rebalancer/core/logger.hpp"

namespace rebalancer {

namespace {

// Alpaca sends money as decimal strings; accept plain numbers too
double decimal_field(const nlohmann::json& object, const std::string& key) {
    if (!object.contains(key) || object.at(key).is_null()) {
        throw RebalanceError(ErrorCode::INVALID_DATA, "Missing field '" + key + "'",
                             "AlpacaClient");
    }
    const nlohmann::json& field = object.at(key);
    if (field.is_number()) {
        return field.get<double>();
    }
    const std::string text = field.get<std::string>();
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw RebalanceError(ErrorCode::CONVERSION_ERROR,
                             "Field '" + key + "' is not a decimal: '" + text + "'",
                             "AlpacaClient");
    }
    return value;
}

// Account balances and position values are quantized to cents at the boundary
double money_field(const nlohmann::json& object, const std::string& key) {
    if (!object.contains(key) || object.at(key).is_null()) {
        throw RebalanceError(ErrorCode::INVALID_DATA, "Missing field '" + key + "'",
                             "AlpacaClient");
    }
    const nlohmann::json& field = object.at(key);
    if (field.is_number()) {
        return static_cast<double>(std::llround(field.get<double>() * 100.0)) / 100.0;
    }
    auto cents = AlpacaClient::parse_cents(field.get<std::string>());
    if (cents.is_error()) {
        throw RebalanceError(cents.error()->code(),
                             "Field '" + key + "': " + cents.error()->what(), "AlpacaClient");
    }
    return static_cast<double>(cents.value()) / 100.0;
}

template <typename T, typename Fn>
Result<T> decode(const std::string& body, const std::string& what, Fn&& fn) {
    try {
        return Result<T>(fn(nlohmann::json::parse(body)));
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<T>(ErrorCode::JSON_PARSE_ERROR,
                             "Failed to parse " + what + " response: " + e.what(),
                             "AlpacaClient");
    } catch (const RebalanceError& e) {
        return make_error<T>(e.code(), "Invalid " + what + " response: " + e.what(),
                             "AlpacaClient");
    } catch (const nlohmann::json::exception& e) {
        return make_error<T>(ErrorCode::INVALID_DATA,
                             "Invalid " + what + " response: " + e.what(), "AlpacaClient");
    }
}

}  // namespace

nlohmann::json AlpacaConfig::to_json() const {
    nlohmann::json j;
    j["base_url"] = base_url;
    j["timeout_seconds"] = timeout_seconds;
    j["verify_ssl"] = verify_ssl;
    return j;
}

void AlpacaConfig::from_json(const nlohmann::json& j) {
    if (j.contains("base_url"))
        base_url = j.at("base_url").get<std::string>();
    if (j.contains("timeout_seconds"))
        timeout_seconds = j.at("timeout_seconds").get<long>();
    if (j.contains("verify_ssl"))
        verify_ssl = j.at("verify_ssl").get<bool>();
}

AlpacaClient::AlpacaClient(AlpacaConfig config)
    : config_(std::move(config)),
      http_(std::make_unique<HttpClient>(
          std::vector<std::string>{"APCA-API-KEY-ID: " + config_.api_key_id,
                                   "APCA-API-SECRET-KEY: " + config_.api_secret_key},
          config_.timeout_seconds, config_.verify_ssl)) {}

std::string AlpacaClient::url(const std::string& path) const {
    std::string base = config_.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

Result<AccountSnapshot> AlpacaClient::get_account() {
    auto response = http_->get(url("/v2/account"));
    if (response.is_error()) {
        return forward_error<AccountSnapshot>(response, "AlpacaClient");
    }
    return parse_account(response.value().body);
}

Result<std::vector<PositionSnapshot>> AlpacaClient::get_positions() {
    auto response = http_->get(url("/v2/positions"));
    if (response.is_error()) {
        return forward_error<std::vector<PositionSnapshot>>(response, "AlpacaClient");
    }
    return parse_positions(response.value().body);
}

Result<std::vector<TradingSession>> AlpacaClient::get_calendar(const std::string& start_date,
                                                               const std::string& end_date) {
    auto response = http_->get(url("/v2/calendar?start=" + start_date + "&end=" + end_date));
    if (response.is_error()) {
        return forward_error<std::vector<TradingSession>>(response, "AlpacaClient");
    }
    return parse_calendar(response.value().body);
}

Result<std::string> AlpacaClient::submit_order(const Order& order) {
    const std::string body = order_to_json(order).dump();
    DEBUG("POST /v2/orders " << body);
    auto response = http_->post(url("/v2/orders"), body);
    if (response.is_error()) {
        return make_error<std::string>(ErrorCode::ORDER_REJECTED,
                                       "Order for " + order.symbol +
                                           " failed: " + response.error()->what(),
                                       "AlpacaClient");
    }
    return parse_order_id(response.value().body);
}

Result<AccountSnapshot> AlpacaClient::parse_account(const std::string& body) {
    return decode<AccountSnapshot>(body, "account", [](const nlohmann::json& j) {
        AccountSnapshot account;
        account.equity = money_field(j, "equity");
        account.cash = money_field(j, "cash");
        account.buying_power = money_field(j, "buying_power");
        return account;
    });
}

Result<std::vector<PositionSnapshot>> AlpacaClient::parse_positions(const std::string& body) {
    return decode<std::vector<PositionSnapshot>>(body, "positions", [](const nlohmann::json& j) {
        if (!j.is_array()) {
            throw RebalanceError(ErrorCode::INVALID_DATA, "Expected an array", "AlpacaClient");
        }
        std::vector<PositionSnapshot> positions;
        positions.reserve(j.size());
        for (const auto& item : j) {
            positions.emplace_back(item.at("symbol").get<std::string>(),
                                   money_field(item, "market_value"),
                                   decimal_field(item, "current_price"));
        }
        return positions;
    });
}

Result<std::vector<TradingSession>> AlpacaClient::parse_calendar(const std::string& body) {
    return decode<std::vector<TradingSession>>(body, "calendar", [](const nlohmann::json& j) {
        if (!j.is_array()) {
            throw RebalanceError(ErrorCode::INVALID_DATA, "Expected an array", "AlpacaClient");
        }
        std::vector<TradingSession> sessions;
        sessions.reserve(j.size());
        for (const auto& item : j) {
            TradingSession session;
            session.date = item.at("date").get<std::string>();
            session.open = item.at("open").get<std::string>();
            session.close = item.value("close", std::string());
            sessions.push_back(std::move(session));
        }
        return sessions;
    });
}

Result<std::string> AlpacaClient::parse_order_id(const std::string& body) {
    return decode<std::string>(body, "order", [](const nlohmann::json& j) {
        return j.at("id").get<std::string>();
    });
}

std::string AlpacaClient::format_cents(int64_t cents) {
    std::string sign = cents < 0 ? "-" : "";
    int64_t magnitude = cents < 0 ? -cents : cents;
    std::string fraction = std::to_string(magnitude % 100);
    if (fraction.size() < 2) {
        fraction.insert(0, "0");
    }
    return sign + std::to_string(magnitude / 100) + "." + fraction;
}

Result<int64_t> AlpacaClient::parse_cents(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t whole = 0;
    size_t whole_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        whole = whole * 10 + (text[pos] - '0');
        ++whole_digits;
        ++pos;
    }

    int64_t fraction = 0;
    size_t fraction_digits = 0;
    bool round_up = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (fraction_digits < 2) {
                fraction = fraction * 10 + (text[pos] - '0');
            } else if (fraction_digits == 2) {
                round_up = text[pos] >= '5';
            }
            ++fraction_digits;
            ++pos;
        }
    }

    // Sixteen whole digits keep whole * 100 inside int64_t
    if (pos != text.size() || whole_digits + fraction_digits == 0 || whole_digits > 16) {
        return make_error<int64_t>(ErrorCode::CONVERSION_ERROR,
                                   "Not a decimal amount: '" + text + "'", "AlpacaClient");
    }

    if (fraction_digits == 1) {
        fraction *= 10;
    }
    int64_t cents = whole * 100 + fraction + (round_up ? 1 : 0);
    return Result<int64_t>(negative ? -cents : cents);
}

nlohmann::json AlpacaClient::order_to_json(const Order& order) {
    nlohmann::json j;
    j["symbol"] = order.symbol;
    j["qty"] = std::to_string(order.quantity);
    j["side"] = side_to_string(order.side);
    j["type"] = order_type_to_string(order.type);
    j["time_in_force"] = time_in_force_to_string(order.time_in_force);
    if (order.type == OrderType::LIMIT) {
        j["limit_price"] = format_cents(order.limit_price_cents);
    }
    return j;
}

}  // namespace rebalancer
