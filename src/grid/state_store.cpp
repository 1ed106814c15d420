#include "grid/state_store.hpp"
#include "grid/config.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace grid {
namespace {

template <typename T>
T json_value_or(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

std::optional<double> optional_price(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

nlohmann::json price_or_null(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

nlohmann::json tracked_order_to_json(const TrackedOrder& tracked) {
    const auto& order = tracked.order;
    nlohmann::json json = {
        {"order_id", order.order_id},
        {"client_reference_id", order.client_reference_id},
        {"symbol", order.symbol},
        {"side", nonkyc::to_string(order.side)},
        {"price", order.price},
        {"quantity", order.quantity},
        {"executed_quantity", order.executed_quantity},
        {"status", nonkyc::to_string(order.status)},
        {"created_at", tracked.created_at_ms}
    };
    json["cost_basis"] = price_or_null(tracked.cost_basis);
    return json;
}

TrackedOrder tracked_order_from_json(const nlohmann::json& json) {
    TrackedOrder tracked;
    auto& order = tracked.order;
    order.order_id = json_value_or<std::string>(json, "order_id", "");
    order.client_reference_id = json_value_or<std::string>(json, "client_reference_id", "");
    order.symbol = json_value_or<std::string>(json, "symbol", "");
    order.side = nonkyc::parse_side(json_value_or<std::string>(json, "side", "buy"));
    order.price = json_value_or<double>(json, "price", 0.0);
    order.quantity = json_value_or<double>(json, "quantity", 0.0);
    order.executed_quantity = json_value_or<double>(json, "executed_quantity", 0.0);
    order.status = nonkyc::parse_order_status(json_value_or<std::string>(json, "status", "open"));
    tracked.cost_basis = optional_price(json, "cost_basis");
    tracked.created_at_ms = json_value_or<std::int64_t>(json, "created_at", 0);
    return tracked;
}

nlohmann::json engine_state_to_json(const EngineState& state) {
    nlohmann::json json;
    json["reference_price"] = price_or_null(state.reference_price);
    json["lowest_buy_price"] = price_or_null(state.lowest_buy_price);
    json["highest_sell_price"] = price_or_null(state.highest_sell_price);

    json["open_orders"] = nlohmann::json::array();
    for (const auto& tracked : state.open_orders) {
        json["open_orders"].push_back(tracked_order_to_json(tracked));
    }
    json["unresolved_placements"] = nlohmann::json::array();
    for (const auto& tracked : state.unresolved_placements) {
        json["unresolved_placements"].push_back(tracked_order_to_json(tracked));
    }

    json["cumulative_sell_revenue"] = state.cumulative_sell_revenue;
    json["cumulative_sell_revenue_kind"] = "gross";
    json["realized_net_profit"] = state.realized_net_profit;
    json["is_running"] = state.is_running;
    json["last_error"] = state.last_error;
    json["config"] = redact_sensitive(state.config);
    json["updated_at"] = state.updated_at_ms;
    return json;
}

EngineState engine_state_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("State snapshot must be a JSON object");
    }
    EngineState state;
    state.reference_price = optional_price(json, "reference_price");
    state.lowest_buy_price = optional_price(json, "lowest_buy_price");
    state.highest_sell_price = optional_price(json, "highest_sell_price");

    for (const char* key : {"open_orders", "unresolved_placements"}) {
        if (!json.contains(key)) {
            continue;
        }
        if (!json[key].is_array()) {
            throw std::runtime_error(std::string("State field '") + key + "' must be an array");
        }
        auto& target = std::string(key) == "open_orders" ? state.open_orders : state.unresolved_placements;
        for (const auto& item : json[key]) {
            target.push_back(tracked_order_from_json(item));
        }
    }

    state.cumulative_sell_revenue = json_value_or<double>(json, "cumulative_sell_revenue", 0.0);
    state.realized_net_profit = json_value_or<double>(json, "realized_net_profit", 0.0);
    state.is_running = json_value_or<bool>(json, "is_running", false);
    state.last_error = json_value_or<std::string>(json, "last_error", "");
    if (json.contains("config") && json["config"].is_object()) {
        state.config = json["config"];
    }
    state.updated_at_ms = json_value_or<std::int64_t>(json, "updated_at", 0);
    return state;
}

StateStore::StateStore(std::filesystem::path path)
    : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::invalid_argument("StateStore path not set");
    }
}

std::optional<EngineState> StateStore::load() const {
    std::ifstream input(path_);
    if (!input.good()) {
        return std::nullopt;
    }
    try {
        nlohmann::json json;
        input >> json;
        auto state = engine_state_from_json(json);
        std::cout << "[State] Loaded " << path_.string() << " with " << state.open_orders.size()
                  << " open orders" << std::endl;
        return state;
    } catch (const std::exception& ex) {
        std::cerr << "[State] Ignoring unreadable snapshot " << path_.string() << ": " << ex.what()
                  << std::endl;
        return std::nullopt;
    }
}

void StateStore::save(const EngineState& state) const {
    ensure_directory();

    auto json = engine_state_to_json(state);
    json["updated_at"] = now_ms();

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream output(tmp, std::ios::trunc);
        if (!output.good()) {
            throw std::runtime_error("Failed to open " + tmp.string() + " for writing");
        }
        output << json.dump(2) << '\n';
        output.flush();
        if (!output.good()) {
            output.close();
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw std::runtime_error("Failed to write state snapshot to " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::runtime_error("Failed to replace " + path_.string() + ": " + ec.message());
    }
}

void StateStore::ensure_directory() const {
    const auto dir = path_.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

} // namespace grid
