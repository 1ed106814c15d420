#pragma once

#include "nonkyc/rest_client.hpp"

#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nonkyc {

struct OrderLookup {
    std::string order_id;
    std::optional<Order> order;
    // Set when the lookup failed; order is empty then.
    std::exception_ptr error;
};

// Concurrent front end over a RestClient. Every call runs on its own task but
// goes through the wrapped client's send(), so it draws from the same rate
// limiter and nonce sequence and fails with the same error types.
class AsyncRestClient {
public:
    explicit AsyncRestClient(std::shared_ptr<RestClient> client);

    std::future<nlohmann::json> send(RestRequest request);
    std::future<std::vector<Balance>> get_balances();
    std::future<Order> place_order(OrderRequest order);
    std::future<Order> get_order(std::string order_id);
    std::future<void> cancel_order(std::string order_id);
    std::future<bool> cancel_all_orders(std::string symbol, std::optional<Side> side = std::nullopt);
    std::future<Ticker> get_ticker(std::string symbol);
    std::future<std::vector<Order>> list_open_orders(std::string symbol);

    // Looks up every id, keeping at most max_in_flight requests outstanding.
    // Results come back in input order.
    std::vector<OrderLookup> get_orders(const std::vector<std::string>& order_ids,
                                        std::size_t max_in_flight = 4);

    [[nodiscard]] RestClient& client() noexcept { return *client_; }

private:
    std::shared_ptr<RestClient> client_;
};

} // namespace nonkyc
