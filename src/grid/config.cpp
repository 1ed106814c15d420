#include "grid/config.hpp"
#include "nonkyc/errors.hpp"
#include "nonkyc/util.hpp"

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>

namespace grid {
namespace {

using nonkyc::ConfigurationError;

const nlohmann::json* find_key(const nlohmann::json& obj, std::initializer_list<const char*> keys,
                               std::string* found = nullptr) {
    if (!obj.is_object()) {
        return nullptr;
    }
    for (const char* key : keys) {
        const auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            if (found) {
                *found = key;
            }
            return &*it;
        }
    }
    return nullptr;
}

double as_double(const nlohmann::json& value, const std::string& key) {
    if (value.is_number()) {
        return value.get<double>();
    }
    const auto not_a_number = ConfigurationError("Config key '" + key + "' must be a number, got " + value.dump());
    if (!value.is_string()) {
        throw not_a_number;
    }
    const auto text = value.get<std::string>();
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw not_a_number;
    }
    if (consumed != text.size()) {
        throw not_a_number;
    }
    return parsed;
}

void read_double(const nlohmann::json& obj, std::initializer_list<const char*> keys, double& target) {
    std::string key;
    if (const auto* value = find_key(obj, keys, &key)) {
        target = as_double(*value, key);
    }
}

void read_int(const nlohmann::json& obj, std::initializer_list<const char*> keys, int& target) {
    std::string key;
    if (const auto* value = find_key(obj, keys, &key)) {
        if (!value->is_number_integer()) {
            throw ConfigurationError("Config key '" + key + "' must be an integer, got " + value->dump());
        }
        target = value->get<int>();
    }
}

void read_seconds_as_ms(const nlohmann::json& obj, std::initializer_list<const char*> keys, int& target_ms) {
    std::string key;
    if (const auto* value = find_key(obj, keys, &key)) {
        const double ms = as_double(*value, key) * 1000.0;
        if (!std::isfinite(ms) || std::fabs(ms) > static_cast<double>(std::numeric_limits<int>::max())) {
            throw ConfigurationError("Config key '" + key + "' is out of range: " + value->dump());
        }
        target_ms = static_cast<int>(ms);
    }
}

void read_bool(const nlohmann::json& obj, std::initializer_list<const char*> keys, bool& target) {
    std::string key;
    if (const auto* value = find_key(obj, keys, &key)) {
        if (!value->is_boolean()) {
            throw ConfigurationError("Config key '" + key + "' must be true or false");
        }
        target = value->get<bool>();
    }
}

void read_string(const nlohmann::json& obj, std::initializer_list<const char*> keys, std::string& target) {
    std::string key;
    if (const auto* value = find_key(obj, keys, &key)) {
        if (!value->is_string()) {
            throw ConfigurationError("Config key '" + key + "' must be a string");
        }
        target = value->get<std::string>();
    }
}

RunMode parse_run_mode(const std::string& value) {
    const auto lowered = nonkyc::to_lower_copy(value);
    if (lowered == "live") {
        return RunMode::Live;
    }
    if (lowered == "dry-run" || lowered == "dry_run" || lowered == "dryrun") {
        return RunMode::DryRun;
    }
    if (lowered == "monitor") {
        return RunMode::Monitor;
    }
    throw ConfigurationError("Unknown mode '" + value + "' (expected live, dry-run or monitor)");
}

LadderVariant parse_variant(const std::string& value) {
    const auto lowered = nonkyc::to_lower_copy(value);
    if (lowered == "bounded" || lowered == "ladder") {
        return LadderVariant::Bounded;
    }
    if (lowered == "unbounded" || lowered == "infinity" || lowered == "infinity_ladder") {
        return LadderVariant::Unbounded;
    }
    throw ConfigurationError("Unknown variant '" + value + "' (expected bounded or unbounded)");
}

void load_ladder(const nlohmann::json& doc, LadderConfig& ladder) {
    std::string symbol = ladder.symbol;
    read_string(doc, {"symbol", "trading_pair"}, symbol);
    try {
        ladder.symbol = nonkyc::normalize_symbol(symbol);
    } catch (const nonkyc::ValidationError& ex) {
        throw ConfigurationError(std::string("Config key 'symbol': ") + ex.what());
    }

    std::string variant;
    read_string(doc, {"variant", "strategy"}, variant);
    if (!variant.empty()) {
        ladder.variant = parse_variant(variant);
    }

    std::string step_mode;
    read_string(doc, {"step_mode"}, step_mode);
    if (!step_mode.empty()) {
        const auto lowered = nonkyc::to_lower_copy(step_mode);
        if (lowered == "pct") {
            ladder.step_mode = StepMode::Pct;
        } else if (lowered == "abs") {
            ladder.step_mode = StepMode::Abs;
        } else {
            throw ConfigurationError("Config key 'step_mode' must be pct or abs");
        }
    }
    read_double(doc, {"step_pct", "grid_spread"}, ladder.step_pct);
    read_double(doc, {"step_abs"}, ladder.step_abs);

    if (const auto* levels = find_key(doc, {"grid_levels"})) {
        if (!levels->is_number_integer()) {
            throw ConfigurationError("Config key 'grid_levels' must be an integer");
        }
        ladder.buy_levels = levels->get<int>();
        ladder.sell_levels = levels->get<int>();
    }
    read_int(doc, {"buy_levels", "n_buy_levels"}, ladder.buy_levels);
    read_int(doc, {"sell_levels", "n_sell_levels", "initial_sell_levels"}, ladder.sell_levels);

    std::string sizing;
    read_string(doc, {"sizing_mode"}, sizing);
    if (!sizing.empty()) {
        const auto lowered = nonkyc::to_lower_copy(sizing);
        if (lowered == "fixed") {
            ladder.sizing_mode = SizingMode::Fixed;
        } else if (lowered == "quote" || lowered == "dynamic") {
            ladder.sizing_mode = SizingMode::Quote;
        } else {
            throw ConfigurationError("Config key 'sizing_mode' must be fixed or quote");
        }
    }
    read_double(doc, {"base_order_size", "fixed_base_order_qty"}, ladder.base_order_size);
    read_double(doc, {"quote_per_order", "target_quote_per_order"}, ladder.quote_per_order);

    read_double(doc, {"fee_rate", "total_fee_rate"}, ladder.fee_rate);
    read_double(doc, {"safety_buffer", "fee_buffer_pct"}, ladder.safety_buffer);
    read_double(doc, {"min_notional_quote", "min_notional_usd"}, ladder.min_notional_quote);
    read_double(doc, {"tick_size"}, ladder.tick_size);
    read_double(doc, {"step_size"}, ladder.step_size);

    std::string key;
    if (const auto* floor = find_key(doc, {"lowest_buy_price"}, &key)) {
        ladder.lowest_buy_price = as_double(*floor, key);
    }

    read_int(doc, {"poll_interval_ms"}, ladder.poll_interval_ms);
    read_seconds_as_ms(doc, {"poll_interval_sec"}, ladder.poll_interval_ms);
    read_int(doc, {"reconcile_interval_ms"}, ladder.reconcile_interval_ms);
    read_seconds_as_ms(doc, {"reconcile_interval_sec"}, ladder.reconcile_interval_ms);
    read_int(doc, {"fetch_backoff_ms"}, ladder.fetch_backoff_ms);
    read_seconds_as_ms(doc, {"fetch_backoff_sec"}, ladder.fetch_backoff_ms);
    read_int(doc, {"fetch_backoff_max_ms"}, ladder.fetch_backoff_max_ms);

    read_bool(doc, {"startup_cancel_all"}, ladder.startup_cancel_all);
    read_bool(doc, {"extend_buy_levels_on_restart"}, ladder.extend_buy_levels_on_restart);
    read_bool(doc, {"startup_rebalance"}, ladder.startup_rebalance);
    read_double(doc, {"rebalance_target_base_pct"}, ladder.rebalance_target_base_pct);
    read_double(doc, {"rebalance_slippage_pct"}, ladder.rebalance_slippage_pct);
    read_int(doc, {"rebalance_max_attempts"}, ladder.rebalance_max_attempts);

    std::string mode;
    read_string(doc, {"mode"}, mode);
    if (!mode.empty()) {
        ladder.mode = parse_run_mode(mode);
    }
    read_string(doc, {"state_path"}, ladder.state_path);
}

void load_client(const nlohmann::json& doc, ClientSettings& client) {
    read_string(doc, {"base_url"}, client.rest.base_url);
    read_int(doc, {"max_retries"}, client.rest.max_retries);

    int backoff_base_ms = static_cast<int>(client.rest.backoff_base.count());
    int backoff_max_ms = static_cast<int>(client.rest.backoff_max.count());
    read_int(doc, {"backoff_base_ms"}, backoff_base_ms);
    read_int(doc, {"backoff_max_ms"}, backoff_max_ms);
    client.rest.backoff_base = std::chrono::milliseconds(backoff_base_ms);
    client.rest.backoff_max = std::chrono::milliseconds(backoff_max_ms);

    read_double(doc, {"nonce_multiplier"}, client.rest.nonce_multiplier);
    bool sign_absolute_url = client.rest.signing_mode == nonkyc::SigningMode::AbsoluteUrl;
    read_bool(doc, {"sign_absolute_url"}, sign_absolute_url);
    client.rest.signing_mode = sign_absolute_url ? nonkyc::SigningMode::AbsoluteUrl
                                                 : nonkyc::SigningMode::PathOnly;
    read_bool(doc, {"debug_auth"}, client.rest.debug_auth);

    read_double(doc, {"rate_limit_capacity"}, client.rate_limit_capacity);
    read_double(doc, {"rate_limit_refill_per_second", "rate_limit_per_second"},
                client.rate_limit_refill_per_second);
    int timeout_ms = static_cast<int>(client.timeout_ms);
    read_int(doc, {"timeout_ms"}, timeout_ms);
    client.timeout_ms = timeout_ms;
    read_bool(doc, {"use_server_time"}, client.use_server_time);
}

void load_stream(const nlohmann::json& doc, StreamSettings& stream) {
    read_bool(doc, {"enabled"}, stream.enabled);
    read_string(doc, {"url"}, stream.url);
    read_int(doc, {"reconnect_base_ms"}, stream.reconnect_base_ms);
    read_int(doc, {"reconnect_max_ms"}, stream.reconnect_max_ms);
    read_int(doc, {"max_consecutive_failures"}, stream.max_consecutive_failures);
    read_int(doc, {"orderbook_depth"}, stream.orderbook_depth);
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationError(message);
    }
}

} // namespace

const char* to_string(RunMode mode) noexcept {
    switch (mode) {
        case RunMode::Live:
            return "live";
        case RunMode::DryRun:
            return "dry-run";
        case RunMode::Monitor:
            return "monitor";
    }
    return "unknown";
}

const char* to_string(LadderVariant variant) noexcept {
    return variant == LadderVariant::Bounded ? "bounded" : "unbounded";
}

bool is_sensitive_key(const std::string& key) {
    const auto lowered = nonkyc::to_lower_copy(key);
    for (const char* pattern : {"api_key", "apikey", "api_secret", "secret", "password",
                                "passphrase", "token", "private_key", "credential"}) {
        if (lowered.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

nlohmann::json redact_sensitive(const nlohmann::json& document) {
    if (document.is_object()) {
        nlohmann::json cleaned = nlohmann::json::object();
        for (const auto& [key, value] : document.items()) {
            if (!is_sensitive_key(key)) {
                cleaned[key] = redact_sensitive(value);
            }
        }
        return cleaned;
    }
    if (document.is_array()) {
        nlohmann::json cleaned = nlohmann::json::array();
        for (const auto& value : document) {
            cleaned.push_back(redact_sensitive(value));
        }
        return cleaned;
    }
    return document;
}

void validate(const BotConfig& config) {
    const auto& ladder = config.ladder;
    require(ladder.buy_levels >= 0 && ladder.sell_levels >= 0, "Level counts must not be negative");
    require(ladder.buy_levels + ladder.sell_levels > 0, "At least one buy or sell level is required");
    if (ladder.step_mode == StepMode::Pct) {
        require(ladder.step_pct > 0.0 && ladder.step_pct < 1.0, "step_pct must be in (0, 1)");
    } else {
        require(ladder.step_abs > 0.0, "step_abs must be positive in abs step mode");
    }
    if (ladder.sizing_mode == SizingMode::Fixed) {
        require(ladder.base_order_size > 0.0, "base_order_size must be positive");
    } else {
        require(ladder.quote_per_order > 0.0, "quote_per_order must be positive");
    }
    require(ladder.fee_rate >= 0.0 && ladder.fee_rate < 0.5, "fee_rate must be in [0, 0.5)");
    require(ladder.safety_buffer >= 0.0, "safety_buffer must not be negative");
    require(ladder.fee_rate + ladder.safety_buffer < 1.0, "fee_rate + safety_buffer must be below 1");
    require(ladder.min_notional_quote >= 0.0, "min_notional_quote must not be negative");
    require(ladder.tick_size > 0.0, "tick_size must be positive");
    require(ladder.step_size > 0.0, "step_size must be positive");
    require(ladder.poll_interval_ms > 0, "poll_interval_ms must be positive");
    require(ladder.reconcile_interval_ms >= 0, "reconcile_interval_ms must not be negative");
    require(ladder.fetch_backoff_ms > 0 && ladder.fetch_backoff_max_ms >= ladder.fetch_backoff_ms,
            "fetch backoff needs 0 < fetch_backoff_ms <= fetch_backoff_max_ms");
    require(!ladder.state_path.empty(), "state_path must not be empty");
    if (ladder.lowest_buy_price) {
        require(*ladder.lowest_buy_price > 0.0, "lowest_buy_price must be positive");
    }
    if (ladder.startup_rebalance) {
        require(ladder.rebalance_target_base_pct > 0.0 && ladder.rebalance_target_base_pct < 1.0,
                "rebalance_target_base_pct must be in (0, 1)");
        require(ladder.rebalance_slippage_pct >= 0.0 && ladder.rebalance_slippage_pct < 1.0,
                "rebalance_slippage_pct must be in [0, 1)");
        require(ladder.rebalance_max_attempts >= 1, "rebalance_max_attempts must be at least 1");
    }

    const auto& client = config.client;
    require(client.rest.base_url.rfind("https://", 0) == 0 || client.rest.base_url.rfind("http://", 0) == 0,
            "client.base_url must be an absolute http(s) URL");
    require(client.rest.max_retries >= 0, "client.max_retries must not be negative");
    require(client.rest.backoff_base.count() > 0 && client.rest.backoff_max >= client.rest.backoff_base,
            "client backoff needs 0 < backoff_base_ms <= backoff_max_ms");
    require(client.rest.nonce_multiplier > 0.0, "client.nonce_multiplier must be positive");
    require(client.rate_limit_capacity >= 1.0, "client.rate_limit_capacity must be at least 1");
    require(client.rate_limit_refill_per_second > 0.0, "client.rate_limit_refill_per_second must be positive");
    require(client.timeout_ms > 0, "client.timeout_ms must be positive");

    const auto& stream = config.stream;
    if (stream.enabled) {
        require(stream.url.rfind("wss://", 0) == 0 || stream.url.rfind("ws://", 0) == 0,
                "stream.url must be a ws:// or wss:// URL");
        require(stream.reconnect_base_ms > 0 && stream.reconnect_max_ms >= stream.reconnect_base_ms,
                "stream backoff needs 0 < reconnect_base_ms <= reconnect_max_ms");
        require(stream.max_consecutive_failures >= 1, "stream.max_consecutive_failures must be at least 1");
    }
}

BotConfig load_config(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("Configuration must be a JSON object");
    }

    BotConfig config;
    load_ladder(document, config.ladder);
    if (const auto* client = find_key(document, {"client"})) {
        load_client(*client, config.client);
    }
    if (const auto* stream = find_key(document, {"stream"})) {
        load_stream(*stream, config.stream);
    }
    validate(config);
    config.redacted_source = redact_sensitive(document);
    return config;
}

BotConfig load_config_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigurationError("Cannot open config file " + path.string());
    }
    nlohmann::json document;
    try {
        input >> document;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigurationError("Config file " + path.string() + " is not valid JSON: " + ex.what());
    }
    auto config = load_config(document);
    std::cout << "[Config] Loaded " << path.string() << " -> " << config.ladder.symbol << " "
              << to_string(config.ladder.variant) << " ladder, mode " << to_string(config.ladder.mode)
              << std::endl;
    return config;
}

} // namespace grid
