#pragma once

#include "nonkyc/models.hpp"

#include <optional>
#include <string>

namespace grid {

// Smallest relative spacing at which a buy at P and a sell at P*(1+step)
// clear both fees plus the safety buffer.
double min_profitable_step(double fee_rate, double safety_buffer);

double min_profitable_sell_price(double buy_price, double fee_rate, double safety_buffer);

// Quote proceeds of the sell leg minus cost of the buy leg, fees on both.
double round_trip_net(double buy_price, double sell_price, double quantity, double fee_rate);

bool is_profitable_level(double buy_price, double sell_price, double fee_rate, double safety_buffer);

struct OrderCheck {
    nonkyc::Side side = nonkyc::Side::Buy;
    double price = 0.0;
    double quantity = 0.0;
    // Price of the paired counter-order, when there is one.
    std::optional<double> opposing_price;
    double fee_rate = 0.0;
    double safety_buffer = 0.0;
    double min_notional = 0.0;
};

// Returns the reason the order must not be placed, or nullopt when it passes.
std::optional<std::string> check_order(const OrderCheck& check);

struct RebalanceNeed {
    nonkyc::Side side = nonkyc::Side::Buy;
    double quantity = 0.0;   // base units
};

// Trade that moves base value to target_base_pct of base + quote value at
// mid. nullopt when the account is empty or already on target. Throws
// nonkyc::ConfigurationError for a non-positive mid or a target outside (0, 1).
std::optional<RebalanceNeed> rebalance_need(double base_available, double quote_available,
                                            double mid, double target_base_pct);

} // namespace grid
