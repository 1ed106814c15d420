#include "grid/pricing.hpp"
#include "nonkyc/errors.hpp"
#include "nonkyc/util.hpp"

#include <cmath>

namespace grid {
namespace {

constexpr double kPriceTolerance = 1e-9;

} // namespace

double min_profitable_step(double fee_rate, double safety_buffer) {
    return (1.0 + fee_rate) / (1.0 - fee_rate - safety_buffer) - 1.0;
}

double min_profitable_sell_price(double buy_price, double fee_rate, double safety_buffer) {
    return buy_price * (1.0 + min_profitable_step(fee_rate, safety_buffer));
}

double round_trip_net(double buy_price, double sell_price, double quantity, double fee_rate) {
    return sell_price * quantity * (1.0 - fee_rate) - buy_price * quantity * (1.0 + fee_rate);
}

bool is_profitable_level(double buy_price, double sell_price, double fee_rate, double safety_buffer) {
    if (buy_price <= 0.0 || sell_price <= 0.0) {
        return false;
    }
    const double required = min_profitable_sell_price(buy_price, fee_rate, safety_buffer);
    return sell_price + required * kPriceTolerance >= required;
}

std::optional<std::string> check_order(const OrderCheck& check) {
    if (check.price <= 0.0) {
        return "price " + nonkyc::format_decimal(check.price, 8) + " is not positive";
    }
    if (check.quantity <= 0.0) {
        return "quantity rounds to zero";
    }

    const double notional = check.price * check.quantity;
    if (notional + kPriceTolerance < check.min_notional) {
        return "notional " + nonkyc::format_decimal(notional, 8) + " below minimum "
            + nonkyc::format_decimal(check.min_notional, 8);
    }

    if (check.opposing_price) {
        const double buy = check.side == nonkyc::Side::Buy ? check.price : *check.opposing_price;
        const double sell = check.side == nonkyc::Side::Buy ? *check.opposing_price : check.price;
        if (!is_profitable_level(buy, sell, check.fee_rate, check.safety_buffer)) {
            return "spread between buy " + nonkyc::format_decimal(buy, 8) + " and sell "
                + nonkyc::format_decimal(sell, 8) + " does not cover fees";
        }
    }
    return std::nullopt;
}

std::optional<RebalanceNeed> rebalance_need(double base_available, double quote_available,
                                            double mid, double target_base_pct) {
    if (mid <= 0.0) {
        throw nonkyc::ConfigurationError("Mid price must be positive to rebalance");
    }
    if (target_base_pct <= 0.0 || target_base_pct >= 1.0) {
        throw nonkyc::ConfigurationError("rebalance_target_base_pct must be in (0, 1)");
    }
    const double base_value = base_available * mid;
    const double total_value = base_value + quote_available;
    if (total_value <= 0.0) {
        return std::nullopt;
    }
    const double delta_base = (total_value * target_base_pct - base_value) / mid;
    if (std::fabs(delta_base) * mid <= total_value * kPriceTolerance) {
        return std::nullopt;
    }
    return RebalanceNeed{delta_base > 0.0 ? nonkyc::Side::Buy : nonkyc::Side::Sell, std::fabs(delta_base)};
}

} // namespace grid
