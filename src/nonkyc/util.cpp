#include "nonkyc/util.hpp"
#include "nonkyc/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace nonkyc {
namespace {

constexpr double kIncrementTolerance = 1e-9;

double floor_to_increment(double value, double increment) {
    if (increment <= 0.0 || !std::isfinite(value)) {
        return value;
    }
    const double raw = value / increment;
    const double units = std::floor(raw + std::max(kIncrementTolerance, std::fabs(raw) * 1e-12));
    const double floored = units * increment;
    const int precision = precision_from_increment(increment);
    const double scale = std::pow(10.0, precision);
    return std::round(floored * scale) / scale;
}

} // namespace

std::string url_encode(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped.push_back(static_cast<char>(c));
        } else {
            escaped.push_back('%');
            constexpr char hex_chars[] = "0123456789ABCDEF";
            escaped.push_back(hex_chars[(c >> 4) & 0x0F]);
            escaped.push_back(hex_chars[c & 0x0F]);
        }
    }
    return escaped;
}

QueryParams filter_empty(const QueryParams& params) {
    QueryParams filtered;
    filtered.reserve(params.size());
    for (const auto& [key, value] : params) {
        if (!value.empty()) {
            filtered.emplace_back(key, value);
        }
    }
    return filtered;
}

std::string build_query_string(const QueryParams& params) {
    const auto filtered = filter_empty(params);
    std::ostringstream oss;
    for (std::size_t i = 0; i < filtered.size(); ++i) {
        if (i != 0) {
            oss << '&';
        }
        oss << url_encode(filtered[i].first) << '=' << url_encode(filtered[i].second);
    }
    return oss.str();
}

std::string build_sorted_query_string(const QueryParams& params) {
    auto sorted = params;
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });
    return build_query_string(sorted);
}

std::string to_upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string normalize_symbol(const std::string& symbol) {
    std::string normalized;
    normalized.reserve(symbol.size());
    for (unsigned char c : symbol) {
        if (std::isspace(c)) {
            continue;
        }
        if (c == '/' || c == '-') {
            normalized.push_back('_');
        } else {
            normalized.push_back(static_cast<char>(std::toupper(c)));
        }
    }

    const auto pos = normalized.find('_');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= normalized.size()
        || normalized.find('_', pos + 1) != std::string::npos) {
        throw ValidationError("Symbol must look like BASE_QUOTE: '" + symbol + "'");
    }
    return normalized;
}

SymbolParts split_symbol(const std::string& symbol) {
    const auto normalized = normalize_symbol(symbol);
    const auto pos = normalized.find('_');
    return SymbolParts{normalized.substr(0, pos), normalized.substr(pos + 1)};
}

double round_down_to_tick(double price, double tick_size) {
    return floor_to_increment(price, tick_size);
}

double round_down_to_step(double quantity, double step_size) {
    return floor_to_increment(quantity, step_size);
}

int precision_from_increment(double increment) {
    if (increment <= 0.0) {
        return 0;
    }
    int precision = 0;
    double value = increment;
    while (precision < 12 && std::fabs(value - std::round(value)) > 1e-9) {
        value *= 10.0;
        ++precision;
    }
    return precision;
}

std::string format_decimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(std::max(precision, 0)) << value;
    return oss.str();
}

} // namespace nonkyc
