#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace nonkyc {

enum class Side { Buy, Sell };

enum class OrderType { Limit, Market };

enum class OrderStatus {
    Unknown,
    Open,
    PartiallyFilled,
    Filled,
    Cancelled,
    Rejected,
    Expired
};

const char* to_string(Side side) noexcept;
const char* to_string(OrderType type) noexcept;
const char* to_string(OrderStatus status) noexcept;

Side parse_side(const std::string& value);

// Accepts the spellings the venue uses ("Active", "Partly Filled", "closed",
// "canceled", ...). Unrecognized values map to Unknown.
OrderStatus parse_order_status(const std::string& value);

bool is_terminal(OrderStatus status) noexcept;

struct Balance {
    std::string asset;
    double available = 0.0;
    double held = 0.0;
};

struct Ticker {
    std::string symbol;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> last_price;

    // Midpoint of bid/ask when both are present, otherwise last price.
    [[nodiscard]] std::optional<double> mid() const;
};

struct Order {
    std::string order_id;
    std::string client_reference_id;
    std::string symbol;
    Side side = Side::Buy;
    double price = 0.0;
    double quantity = 0.0;
    double executed_quantity = 0.0;
    std::optional<double> average_price;
    OrderStatus status = OrderStatus::Unknown;
};

struct OrderRequest {
    std::string symbol;
    Side side = Side::Buy;
    OrderType type = OrderType::Limit;
    std::string price;        // omitted from market orders
    std::string quantity;
    std::string client_reference_id;
    bool strict_validate = true;

    [[nodiscard]] nlohmann::json to_payload() const;
};

// Unwraps {"data": ...} or {"result": ...} envelopes.
const nlohmann::json& extract_payload(const nlohmann::json& response);

double json_number(const nlohmann::json& value);
std::optional<double> json_number_field(const nlohmann::json& obj, const char* key);
std::string json_string_field(const nlohmann::json& obj, const char* key);

Balance parse_balance(const nlohmann::json& item);
std::vector<Balance> parse_balances(const nlohmann::json& response);
Order parse_order(const nlohmann::json& payload);
std::vector<Order> parse_orders(const nlohmann::json& response);
Ticker parse_ticker(const nlohmann::json& payload, const std::string& symbol);

} // namespace nonkyc
