#pragma once

#include "nonkyc/errors.hpp"
#include "nonkyc/http_client.hpp"
#include "nonkyc/models.hpp"
#include "nonkyc/rate_limiter.hpp"
#include "nonkyc/signer.hpp"
#include "nonkyc/util.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nonkyc {

struct RestClientConfig {
    std::string base_url = "https://api.nonkyc.io/api/v2";
    int max_retries = 3;
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_max{8000};
    double nonce_multiplier = 1.0;
    SigningMode signing_mode = SigningMode::AbsoluteUrl;
    // Prints the signed message shape with secrets redacted. Development only.
    bool debug_auth = false;
};

// One outbound call. The correlation id travels with the request and is the
// only place log lines for this call take it from.
struct RestRequest {
    std::string method = "GET";
    std::string path;
    QueryParams params;
    std::optional<nlohmann::json> body;
    bool requires_auth = true;
    std::string correlation_id;
};

class RestClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RestClient(Credentials credentials,
               std::shared_ptr<HttpTransport> transport,
               std::shared_ptr<RateLimiter> rate_limiter,
               RestClientConfig config = {},
               Sleeper sleeper = {});

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    // Rate-limit, sign, send, classify and retry. Throws AuthenticationError,
    // RateLimitError, TransientApiError or ValidationError.
    nlohmann::json send(RestRequest request);

    std::vector<Balance> get_balances(const std::string& correlation_id = {});
    Order place_order(const OrderRequest& order, const std::string& correlation_id = {});
    Order get_order(const std::string& order_id, const std::string& correlation_id = {});
    void cancel_order(const std::string& order_id, const std::string& correlation_id = {});
    void cancel_order_by_client_id(const std::string& client_reference_id,
                                   const std::string& correlation_id = {});
    bool cancel_all_orders(const std::string& symbol,
                           std::optional<Side> side = std::nullopt,
                           const std::string& correlation_id = {});
    Ticker get_ticker(const std::string& symbol, const std::string& correlation_id = {});
    std::vector<Order> list_open_orders(const std::string& symbol, const std::string& correlation_id = {});
    // Order history filtered by venue status ("active", "filled", "cancelled").
    std::vector<Order> list_orders(const std::string& symbol, const std::string& status, int limit = 0,
                                   const std::string& correlation_id = {});

    std::int64_t server_time_ms(const std::string& correlation_id = {});

    // Measures the venue clock offset and applies it to the nonce generator.
    void sync_server_time();

    std::string make_correlation_id();

    [[nodiscard]] const RestClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::shared_ptr<RateLimiter> rate_limiter() const noexcept { return rate_limiter_; }

    [[nodiscard]] std::chrono::milliseconds backoff_for_attempt(int attempt) const;

private:
    nlohmann::json send_once(const RestRequest& request);
    [[noreturn]] void raise_for_status(const HttpResponse& response, const RestRequest& request) const;
    void log_auth_debug(const SignedRequest& signed_request, const std::string& url,
                        const std::string& body, const RestRequest& request) const;

    Credentials credentials_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    RestClientConfig config_;
    Sleeper sleeper_;
    Signer signer_;
    NonceGenerator nonce_generator_;
    std::atomic<std::uint64_t> request_counter_{0};
};

// Builds the 4xx message the operator sees, with a hint when the venue
// complained about the minimum order value.
std::string describe_http_error(long status_code, const std::string& payload);

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& header_value);

} // namespace nonkyc
