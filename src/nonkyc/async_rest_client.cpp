#include "nonkyc/async_rest_client.hpp"

#include <algorithm>
#include <utility>

namespace nonkyc {

AsyncRestClient::AsyncRestClient(std::shared_ptr<RestClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw ConfigurationError("AsyncRestClient requires a RestClient");
    }
}

std::future<nlohmann::json> AsyncRestClient::send(RestRequest request) {
    return std::async(std::launch::async, [client = client_, request = std::move(request)]() mutable {
        return client->send(std::move(request));
    });
}

std::future<std::vector<Balance>> AsyncRestClient::get_balances() {
    return std::async(std::launch::async, [client = client_] {
        return client->get_balances(client->make_correlation_id());
    });
}

std::future<Order> AsyncRestClient::place_order(OrderRequest order) {
    return std::async(std::launch::async, [client = client_, order = std::move(order)] {
        return client->place_order(order, client->make_correlation_id());
    });
}

std::future<Order> AsyncRestClient::get_order(std::string order_id) {
    return std::async(std::launch::async, [client = client_, order_id = std::move(order_id)] {
        return client->get_order(order_id, client->make_correlation_id());
    });
}

std::future<void> AsyncRestClient::cancel_order(std::string order_id) {
    return std::async(std::launch::async, [client = client_, order_id = std::move(order_id)] {
        client->cancel_order(order_id, client->make_correlation_id());
    });
}

std::future<bool> AsyncRestClient::cancel_all_orders(std::string symbol, std::optional<Side> side) {
    return std::async(std::launch::async, [client = client_, symbol = std::move(symbol), side] {
        return client->cancel_all_orders(symbol, side, client->make_correlation_id());
    });
}

std::future<Ticker> AsyncRestClient::get_ticker(std::string symbol) {
    return std::async(std::launch::async, [client = client_, symbol = std::move(symbol)] {
        return client->get_ticker(symbol, client->make_correlation_id());
    });
}

std::future<std::vector<Order>> AsyncRestClient::list_open_orders(std::string symbol) {
    return std::async(std::launch::async, [client = client_, symbol = std::move(symbol)] {
        return client->list_open_orders(symbol, client->make_correlation_id());
    });
}

std::vector<OrderLookup> AsyncRestClient::get_orders(const std::vector<std::string>& order_ids,
                                                     std::size_t max_in_flight) {
    std::vector<OrderLookup> results;
    results.reserve(order_ids.size());
    for (const auto& id : order_ids) {
        results.push_back(OrderLookup{id, std::nullopt, nullptr});
    }

    const std::size_t window = std::max<std::size_t>(1, max_in_flight);
    for (std::size_t start = 0; start < order_ids.size(); start += window) {
        const std::size_t end = std::min(order_ids.size(), start + window);
        std::vector<std::future<Order>> batch;
        batch.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            batch.push_back(get_order(order_ids[i]));
        }
        for (std::size_t i = start; i < end; ++i) {
            try {
                results[i].order = batch[i - start].get();
            } catch (const std::exception&) {
                results[i].error = std::current_exception();
            }
        }
    }
    return results;
}

} // namespace nonkyc
