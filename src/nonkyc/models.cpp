#include "nonkyc/models.hpp"
#include "nonkyc/errors.hpp"
#include "nonkyc/util.hpp"

#include <stdexcept>

namespace nonkyc {

const char* to_string(Side side) noexcept {
    return side == Side::Buy ? "buy" : "sell";
}

const char* to_string(OrderType type) noexcept {
    return type == OrderType::Limit ? "limit" : "market";
}

const char* to_string(OrderStatus status) noexcept {
    switch (status) {
        case OrderStatus::Open:
            return "open";
        case OrderStatus::PartiallyFilled:
            return "partially_filled";
        case OrderStatus::Filled:
            return "filled";
        case OrderStatus::Cancelled:
            return "cancelled";
        case OrderStatus::Rejected:
            return "rejected";
        case OrderStatus::Expired:
            return "expired";
        case OrderStatus::Unknown:
            break;
    }
    return "unknown";
}

Side parse_side(const std::string& value) {
    const auto lowered = to_lower_copy(value);
    if (lowered == "buy") {
        return Side::Buy;
    }
    if (lowered == "sell") {
        return Side::Sell;
    }
    throw ValidationError("Unknown order side: '" + value + "'");
}

OrderStatus parse_order_status(const std::string& value) {
    std::string key;
    for (unsigned char c : to_lower_copy(value)) {
        if (c == ' ' || c == '-') {
            key.push_back('_');
        } else {
            key.push_back(static_cast<char>(c));
        }
    }

    if (key == "new" || key == "active" || key == "open" || key == "pending") {
        return OrderStatus::Open;
    }
    if (key == "partly_filled" || key == "partially_filled" || key == "partiallyfilled") {
        return OrderStatus::PartiallyFilled;
    }
    if (key == "filled" || key == "closed" || key == "done") {
        return OrderStatus::Filled;
    }
    if (key == "cancelled" || key == "canceled") {
        return OrderStatus::Cancelled;
    }
    if (key == "rejected") {
        return OrderStatus::Rejected;
    }
    if (key == "expired") {
        return OrderStatus::Expired;
    }
    return OrderStatus::Unknown;
}

bool is_terminal(OrderStatus status) noexcept {
    return status == OrderStatus::Filled || status == OrderStatus::Cancelled
           || status == OrderStatus::Rejected || status == OrderStatus::Expired;
}

std::optional<double> Ticker::mid() const {
    if (bid && ask && *bid > 0.0 && *ask > 0.0) {
        return (*bid + *ask) / 2.0;
    }
    if (last_price && *last_price > 0.0) {
        return last_price;
    }
    return std::nullopt;
}

nlohmann::json OrderRequest::to_payload() const {
    nlohmann::json payload = {
        {"symbol", symbol},
        {"side", to_string(side)},
        {"type", to_string(type)},
        {"quantity", quantity}
    };
    if (type == OrderType::Limit) {
        payload["price"] = price;
    }
    if (!client_reference_id.empty()) {
        payload["userProvidedId"] = client_reference_id;
    }
    payload["strictValidate"] = strict_validate;
    return payload;
}

const nlohmann::json& extract_payload(const nlohmann::json& response) {
    if (response.is_object()) {
        for (const char* key : {"data", "result"}) {
            const auto it = response.find(key);
            if (it != response.end()) {
                return *it;
            }
        }
    }
    return response;
}

double json_number(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text.empty()) {
            return 0.0;
        }
        try {
            return std::stod(text);
        } catch (const std::exception&) {
            throw ValidationError("Expected a decimal value, got '" + text + "'");
        }
    }
    if (value.is_null()) {
        return 0.0;
    }
    throw ValidationError("Expected a decimal value, got " + value.dump());
}

std::optional<double> json_number_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null() || (it->is_string() && it->get<std::string>().empty())) {
        return std::nullopt;
    }
    return json_number(*it);
}

std::string json_string_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return {};
    }
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return it->dump();
}

Balance parse_balance(const nlohmann::json& item) {
    Balance balance;
    balance.asset = json_string_field(item, "asset");
    if (balance.asset.empty()) {
        throw ValidationError("Balance entry without asset: " + item.dump());
    }
    balance.available = json_number_field(item, "available").value_or(0.0);
    balance.held = json_number_field(item, "held").value_or(0.0);
    return balance;
}

std::vector<Balance> parse_balances(const nlohmann::json& response) {
    const auto& payload = extract_payload(response);
    if (!payload.is_array()) {
        throw ValidationError("Balances response is not a list: " + response.dump());
    }
    std::vector<Balance> balances;
    balances.reserve(payload.size());
    for (const auto& item : payload) {
        balances.push_back(parse_balance(item));
    }
    return balances;
}

Order parse_order(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw ValidationError("Order payload is not an object: " + payload.dump());
    }
    Order order;
    order.order_id = json_string_field(payload, "id");
    if (order.order_id.empty()) {
        order.order_id = json_string_field(payload, "orderId");
    }
    order.client_reference_id = json_string_field(payload, "userProvidedId");
    order.symbol = json_string_field(payload, "symbol");
    const auto side = json_string_field(payload, "side");
    if (!side.empty()) {
        order.side = parse_side(side);
    }
    order.price = json_number_field(payload, "price").value_or(0.0);
    order.quantity = json_number_field(payload, "quantity").value_or(0.0);
    order.executed_quantity = json_number_field(payload, "executedQuantity")
                                  .value_or(json_number_field(payload, "filled").value_or(0.0));
    order.average_price = json_number_field(payload, "averagePrice");
    if (!order.average_price) {
        order.average_price = json_number_field(payload, "avgPrice");
    }
    order.status = parse_order_status(json_string_field(payload, "status"));
    return order;
}

std::vector<Order> parse_orders(const nlohmann::json& response) {
    const auto& payload = extract_payload(response);
    if (!payload.is_array()) {
        throw ValidationError("Orders response is not a list: " + response.dump());
    }
    std::vector<Order> orders;
    orders.reserve(payload.size());
    for (const auto& item : payload) {
        orders.push_back(parse_order(item));
    }
    return orders;
}

Ticker parse_ticker(const nlohmann::json& payload, const std::string& symbol) {
    Ticker ticker;
    ticker.symbol = json_string_field(payload, "symbol");
    if (ticker.symbol.empty()) {
        ticker.symbol = symbol;
    }
    ticker.bid = json_number_field(payload, "bid");
    ticker.ask = json_number_field(payload, "ask");
    for (const char* key : {"last_price", "last", "lastPrice", "price"}) {
        ticker.last_price = json_number_field(payload, key);
        if (ticker.last_price) {
            break;
        }
    }
    if (!ticker.last_price && ticker.bid && ticker.ask) {
        ticker.last_price = (*ticker.bid + *ticker.ask) / 2.0;
    }
    return ticker;
}

} // namespace nonkyc
