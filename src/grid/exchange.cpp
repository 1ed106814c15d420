#include "grid/exchange.hpp"

#include <utility>

namespace grid {
namespace {

constexpr int kHistoryLookupLimit = 100;

} // namespace

std::vector<nonkyc::OrderLookup> ExchangeClient::get_orders(const std::vector<std::string>& order_ids) {
    std::vector<nonkyc::OrderLookup> results;
    results.reserve(order_ids.size());
    for (const auto& id : order_ids) {
        nonkyc::OrderLookup lookup{id, std::nullopt, nullptr};
        try {
            lookup.order = get_order(id);
        } catch (const std::exception&) {
            lookup.error = std::current_exception();
        }
        results.push_back(std::move(lookup));
    }
    return results;
}

NonkycExchange::NonkycExchange(std::shared_ptr<nonkyc::RestClient> client, std::size_t max_in_flight)
    : client_(client), async_(std::move(client)), max_in_flight_(max_in_flight) {}

nonkyc::Ticker NonkycExchange::get_ticker(const std::string& symbol) {
    return client_->get_ticker(symbol, client_->make_correlation_id());
}

double NonkycExchange::get_mid_price(const std::string& symbol) {
    const auto ticker = get_ticker(symbol);
    const auto mid = ticker.mid();
    if (!mid || *mid <= 0.0) {
        throw nonkyc::TransientApiError("Ticker for " + ticker.symbol + " has no usable price");
    }
    return *mid;
}

nonkyc::Order NonkycExchange::place_limit(const nonkyc::OrderRequest& request) {
    auto limit = request;
    limit.type = nonkyc::OrderType::Limit;
    return client_->place_order(limit, client_->make_correlation_id());
}

nonkyc::Order NonkycExchange::place_market(const nonkyc::OrderRequest& request) {
    auto market = request;
    market.type = nonkyc::OrderType::Market;
    market.price.clear();
    return client_->place_order(market, client_->make_correlation_id());
}

void NonkycExchange::cancel_order(const std::string& order_id) {
    client_->cancel_order(order_id, client_->make_correlation_id());
}

bool NonkycExchange::cancel_all(const std::string& symbol) {
    return client_->cancel_all_orders(symbol, std::nullopt, client_->make_correlation_id());
}

nonkyc::Order NonkycExchange::get_order(const std::string& order_id) {
    return client_->get_order(order_id, client_->make_correlation_id());
}

std::vector<nonkyc::Order> NonkycExchange::list_open_orders(const std::string& symbol) {
    return client_->list_open_orders(symbol, client_->make_correlation_id());
}

std::vector<nonkyc::Balance> NonkycExchange::get_balances() {
    return client_->get_balances(client_->make_correlation_id());
}

std::optional<nonkyc::Order> NonkycExchange::find_order_by_client_id(const std::string& symbol,
                                                                     const std::string& client_reference_id) {
    for (const char* status : {"active", "filled", "cancelled"}) {
        const auto orders = client_->list_orders(symbol, status, kHistoryLookupLimit, client_->make_correlation_id());
        for (const auto& order : orders) {
            if (order.client_reference_id == client_reference_id) {
                return order;
            }
        }
    }
    return std::nullopt;
}

std::vector<nonkyc::OrderLookup> NonkycExchange::get_orders(const std::vector<std::string>& order_ids) {
    return async_.get_orders(order_ids, max_in_flight_);
}

} // namespace grid
