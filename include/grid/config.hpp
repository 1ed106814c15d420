#pragma once

#include "nonkyc/rest_client.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace grid {

enum class RunMode { Live, DryRun, Monitor };
enum class LadderVariant { Bounded, Unbounded };
enum class StepMode { Pct, Abs };
enum class SizingMode { Fixed, Quote };

const char* to_string(RunMode mode) noexcept;
const char* to_string(LadderVariant variant) noexcept;

struct LadderConfig {
    std::string symbol = "BTC_USDT";
    LadderVariant variant = LadderVariant::Bounded;
    StepMode step_mode = StepMode::Pct;
    double step_pct = 0.01;
    double step_abs = 0.0;
    int buy_levels = 5;
    int sell_levels = 5;             // unbounded: initial sell window only
    SizingMode sizing_mode = SizingMode::Fixed;
    double base_order_size = 0.0;    // base units per order (Fixed)
    double quote_per_order = 0.0;    // quote value per order (Quote)
    double fee_rate = 0.002;
    double safety_buffer = 0.0001;
    double min_notional_quote = 1.0;
    double tick_size = 0.01;
    double step_size = 0.00000001;
    std::optional<double> lowest_buy_price;
    int poll_interval_ms = 5000;
    int reconcile_interval_ms = 60000;
    int fetch_backoff_ms = 15000;
    int fetch_backoff_max_ms = 240000;
    bool startup_cancel_all = false;
    bool extend_buy_levels_on_restart = false;
    // Trade toward rebalance_target_base_pct of portfolio value before seeding.
    bool startup_rebalance = false;
    double rebalance_target_base_pct = 0.5;
    double rebalance_slippage_pct = 0.002;
    int rebalance_max_attempts = 2;
    RunMode mode = RunMode::Live;
    std::string state_path = "state/ladder_state.json";
};

struct ClientSettings {
    nonkyc::RestClientConfig rest;
    double rate_limit_capacity = 10.0;
    double rate_limit_refill_per_second = 5.0;
    long timeout_ms = 10000;
    bool use_server_time = false;
};

struct StreamSettings {
    bool enabled = false;
    std::string url = "wss://ws.nonkyc.io";
    int reconnect_base_ms = 1000;
    int reconnect_max_ms = 30000;
    int max_consecutive_failures = 10;
    int orderbook_depth = 0;         // 0 disables the orderbook channel
};

struct BotConfig {
    LadderConfig ladder;
    ClientSettings client;
    StreamSettings stream;
    // Input document with sensitive keys removed; embedded in snapshots.
    nlohmann::json redacted_source = nlohmann::json::object();
};

// Builds and validates the typed configuration. Throws
// nonkyc::ConfigurationError naming the offending key.
BotConfig load_config(const nlohmann::json& document);

BotConfig load_config_file(const std::filesystem::path& path);

void validate(const BotConfig& config);

bool is_sensitive_key(const std::string& key);

// Recursively drops every key that looks like a credential.
nlohmann::json redact_sensitive(const nlohmann::json& document);

} // namespace grid
