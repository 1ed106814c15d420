#pragma once

#include "nonkyc/models.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace grid {

struct TrackedOrder {
    nonkyc::Order order;
    // Buy price this sell was paired with; drives realized net profit.
    std::optional<double> cost_basis;
    std::int64_t created_at_ms = 0;
};

struct EngineState {
    std::optional<double> reference_price;
    std::optional<double> lowest_buy_price;
    std::optional<double> highest_sell_price;
    std::vector<TrackedOrder> open_orders;
    // Placements whose outcome is unknown after a transient failure.
    std::vector<TrackedOrder> unresolved_placements;
    double cumulative_sell_revenue = 0.0;   // gross proceeds, not profit
    double realized_net_profit = 0.0;
    bool is_running = false;
    std::string last_error;
    nlohmann::json config = nlohmann::json::object();
    std::int64_t updated_at_ms = 0;
};

nlohmann::json tracked_order_to_json(const TrackedOrder& tracked);
TrackedOrder tracked_order_from_json(const nlohmann::json& json);

// Credentials never appear: config passes through redact_sensitive().
nlohmann::json engine_state_to_json(const EngineState& state);
EngineState engine_state_from_json(const nlohmann::json& json);

class StateStore {
public:
    explicit StateStore(std::filesystem::path path);

    // nullopt when the file is missing or unreadable; a corrupt file is
    // reported and left in place until the next successful save.
    std::optional<EngineState> load() const;

    // Write-to-temp then rename. Throws std::runtime_error on I/O failure,
    // leaving the previous snapshot untouched.
    void save(const EngineState& state) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void ensure_directory() const;

    std::filesystem::path path_;
};

} // namespace grid
