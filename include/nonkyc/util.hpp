#pragma once

#include <string>
#include <utility>
#include <vector>

namespace nonkyc {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct SymbolParts {
    std::string base;
    std::string quote;
};

std::string url_encode(const std::string& value);

QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

// Same as build_query_string but with keys in lexicographic order, which is
// the form the venue expects inside a signed GET message.
std::string build_sorted_query_string(const QueryParams& params);

std::string to_upper_copy(std::string value);

std::string to_lower_copy(std::string value);

// BTC/USDT, btc-usdt and BTC_USDT all become BTC_USDT.
std::string normalize_symbol(const std::string& symbol);

SymbolParts split_symbol(const std::string& symbol);

// Floors to a whole number of increments. Values a hair below a boundary
// (1e-9 increments, or 1e-12 relative for large counts) are treated as on
// it, so 89963.99999999999 with a 0.01 tick stays 89964.
double round_down_to_tick(double price, double tick_size);

double round_down_to_step(double quantity, double step_size);

int precision_from_increment(double increment);

std::string format_decimal(double value, int precision);

} // namespace nonkyc
