#pragma once

#include "nonkyc/async_rest_client.hpp"
#include "nonkyc/models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace grid {

// Venue operations the ladder engine depends on. Implementations throw the
// nonkyc::ApiError family on failure.
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    virtual double get_mid_price(const std::string& symbol) = 0;
    virtual nonkyc::Ticker get_ticker(const std::string& symbol) = 0;
    virtual nonkyc::Order place_limit(const nonkyc::OrderRequest& request) = 0;
    virtual nonkyc::Order place_market(const nonkyc::OrderRequest& request) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;
    virtual bool cancel_all(const std::string& symbol) = 0;
    virtual nonkyc::Order get_order(const std::string& order_id) = 0;
    virtual std::vector<nonkyc::Order> list_open_orders(const std::string& symbol) = 0;
    virtual std::vector<nonkyc::Balance> get_balances() = 0;

    // Searches open and recent closed orders for our own reference id.
    // nullopt means the venue has no record of it.
    virtual std::optional<nonkyc::Order> find_order_by_client_id(const std::string& symbol,
                                                                 const std::string& client_reference_id) = 0;

    // Status of many orders. Errors are captured per id, never thrown.
    virtual std::vector<nonkyc::OrderLookup> get_orders(const std::vector<std::string>& order_ids);
};

class NonkycExchange : public ExchangeClient {
public:
    explicit NonkycExchange(std::shared_ptr<nonkyc::RestClient> client, std::size_t max_in_flight = 4);

    double get_mid_price(const std::string& symbol) override;
    nonkyc::Ticker get_ticker(const std::string& symbol) override;
    nonkyc::Order place_limit(const nonkyc::OrderRequest& request) override;
    nonkyc::Order place_market(const nonkyc::OrderRequest& request) override;
    void cancel_order(const std::string& order_id) override;
    bool cancel_all(const std::string& symbol) override;
    nonkyc::Order get_order(const std::string& order_id) override;
    std::vector<nonkyc::Order> list_open_orders(const std::string& symbol) override;
    std::vector<nonkyc::Balance> get_balances() override;
    std::optional<nonkyc::Order> find_order_by_client_id(const std::string& symbol,
                                                         const std::string& client_reference_id) override;
    std::vector<nonkyc::OrderLookup> get_orders(const std::vector<std::string>& order_ids) override;

private:
    std::shared_ptr<nonkyc::RestClient> client_;
    nonkyc::AsyncRestClient async_;
    std::size_t max_in_flight_;
};

} // namespace grid
