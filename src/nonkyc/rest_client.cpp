#include "nonkyc/rest_client.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace nonkyc {
namespace {

constexpr const char* kMinNotionalMessage = "Minimum order notional requirement not met.";

std::string unauthorized_message(const std::string& payload, const std::string& path) {
    std::string message =
        "HTTP error 401: Not Authorized. Verify API key/secret, ensure the key has trading "
        "permissions, confirm any IP whitelist includes your current egress IP, and check for "
        "clock skew on this machine. If balance queries succeed but order endpoints fail, the key "
        "is missing trade permission. Endpoint: " + path;
    if (!payload.empty()) {
        message += " Response payload: " + payload;
    }
    return message;
}

std::optional<std::string> extract_error_code(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"code", "error_code", "errorCode"}) {
        if (payload.contains(key)) {
            return json_string_field(payload, key);
        }
    }
    for (const char* key : {"error", "errors"}) {
        const auto it = payload.find(key);
        if (it != payload.end() && it->is_object()) {
            for (const char* nested : {"code", "error_code", "errorCode"}) {
                if (it->contains(nested)) {
                    return json_string_field(*it, nested);
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> extract_error_message(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"message", "error", "detail", "details"}) {
        const auto it = payload.find(key);
        if (it == payload.end()) {
            continue;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
            return (*it)["message"].get<std::string>();
        }
    }
    return std::nullopt;
}

bool contains_word(const std::string& text, const std::string& word) {
    std::size_t pos = text.find(word);
    while (pos != std::string::npos) {
        const bool left_ok = pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
        const auto end = pos + word.size();
        const bool right_ok = end >= text.size() || !std::isalnum(static_cast<unsigned char>(text[end]));
        if (left_ok && right_ok) {
            return true;
        }
        pos = text.find(word, pos + 1);
    }
    return false;
}

bool mentions_min_notional(const std::string& message) {
    const auto lowered = to_lower_copy(message);
    for (const char* keyword : {"notional", "minimum", "amount"}) {
        if (lowered.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return contains_word(lowered, "min");
}

bool detect_min_notional(const std::string& payload) {
    if (payload.empty()) {
        return false;
    }
    const auto parsed = nlohmann::json::parse(payload, nullptr, false);
    if (!parsed.is_discarded()) {
        if (const auto code = extract_error_code(parsed)) {
            const auto lowered = to_lower_copy(*code);
            if (lowered == "min_notional" || lowered == "min_notional_not_met") {
                return true;
            }
        }
        if (const auto message = extract_error_message(parsed)) {
            if (mentions_min_notional(*message)) {
                return true;
            }
        }
    }
    return mentions_min_notional(payload);
}

std::string redacted(const std::string& secret) {
    return "[REDACTED - " + std::to_string(secret.size()) + " chars]";
}

} // namespace

std::string describe_http_error(long status_code, const std::string& payload) {
    std::string message = "HTTP error " + std::to_string(status_code);
    if (detect_min_notional(payload)) {
        return message + ": " + kMinNotionalMessage + " Response payload: " + payload;
    }
    if (!payload.empty()) {
        message += ": " + payload;
    }
    return message;
}

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& header_value) {
    if (header_value.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double seconds = std::stod(header_value, &consumed);
        if (consumed != header_value.size() || !(seconds >= 0.0) || !std::isfinite(seconds)) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    } catch (const std::exception&) {
        // HTTP-date form; fall back to computed backoff.
        return std::nullopt;
    }
}

RestClient::RestClient(Credentials credentials,
                       std::shared_ptr<HttpTransport> transport,
                       std::shared_ptr<RateLimiter> rate_limiter,
                       RestClientConfig config,
                       Sleeper sleeper)
    : credentials_(std::move(credentials)),
      transport_(std::move(transport)),
      rate_limiter_(std::move(rate_limiter)),
      config_(std::move(config)),
      sleeper_(sleeper ? std::move(sleeper)
                       : Sleeper([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })),
      signer_(config_.signing_mode),
      nonce_generator_(config_.nonce_multiplier) {
    if (!transport_) {
        throw ConfigurationError("RestClient requires an HTTP transport");
    }
    if (!rate_limiter_) {
        throw ConfigurationError("RestClient requires a rate limiter");
    }
    if (config_.max_retries < 0) {
        throw ConfigurationError("max_retries must not be negative");
    }
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

std::string RestClient::make_correlation_id() {
    return "rq-" + std::to_string(request_counter_.fetch_add(1, std::memory_order_relaxed) + 1);
}

std::chrono::milliseconds RestClient::backoff_for_attempt(int attempt) const {
    const int exponent = std::clamp(attempt - 1, 0, 30);
    const double delay = static_cast<double>(config_.backoff_base.count()) * std::pow(2.0, exponent);
    const double capped = std::min(delay, static_cast<double>(config_.backoff_max.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

nlohmann::json RestClient::send(RestRequest request) {
    if (request.correlation_id.empty()) {
        request.correlation_id = make_correlation_id();
    }

    int attempt = 0;
    while (true) {
        rate_limiter_->acquire();
        try {
            return send_once(request);
        } catch (const RateLimitError& ex) {
            ++attempt;
            if (attempt > config_.max_retries) {
                std::cerr << "[REST] " << request.correlation_id << " " << request.method << ' '
                          << request.path << " still rate limited after " << config_.max_retries
                          << " retries" << std::endl;
                throw;
            }
            const auto delay = ex.retry_after().value_or(backoff_for_attempt(attempt));
            std::cerr << "[RateLimit] " << request.correlation_id << " " << request.path
                      << " -> 429; retry " << attempt << '/' << config_.max_retries
                      << " in " << delay.count() << " ms" << std::endl;
            sleeper_(delay);
        } catch (const TransientApiError& ex) {
            ++attempt;
            if (attempt > config_.max_retries) {
                std::cerr << "[REST] " << request.correlation_id << " " << request.method << ' '
                          << request.path << " failed after " << config_.max_retries
                          << " retries: " << ex.what() << std::endl;
                throw;
            }
            const auto delay = backoff_for_attempt(attempt);
            std::cerr << "[REST] " << request.correlation_id << " " << request.path
                      << " transient failure (" << ex.what() << "); retry " << attempt << '/'
                      << config_.max_retries << " in " << delay.count() << " ms" << std::endl;
            sleeper_(delay);
        }
    }
}

nlohmann::json RestClient::send_once(const RestRequest& request) {
    const auto method = to_upper_copy(request.method);
    const auto base_url = config_.base_url + request.path;

    std::string url = base_url;
    if (method == "GET") {
        const auto query = build_sorted_query_string(request.params);
        if (!query.empty()) {
            url += '?' + query;
        }
    }

    std::string body;
    HttpHeaders headers = {{"Accept", "application/json"}};
    if (method != "GET" && request.body && !request.body->is_null()) {
        body = serialize_body(*request.body);
        headers.emplace_back("Content-Type", "application/json");
    }

    if (request.requires_auth) {
        const auto& url_to_sign = config_.signing_mode == SigningMode::PathOnly ? request.path : base_url;
        const auto signed_request = signer_.sign(method, url_to_sign, request.params,
                                                 method == "GET" ? std::optional<nlohmann::json>{} : request.body,
                                                 credentials_, nonce_generator_.next());
        const auto auth_headers = Signer::headers(signed_request, credentials_);
        headers.insert(headers.end(), auth_headers.begin(), auth_headers.end());
        if (config_.debug_auth) {
            log_auth_debug(signed_request, url, body, request);
        }
    }

    HttpResponse response;
    try {
        response = transport_->request(method, url, headers, body);
    } catch (const HttpError& ex) {
        throw TransientApiError(std::string(ex.timed_out() ? "Request timed out: " : "Network error: ") + ex.what());
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        raise_for_status(response, request);
    }

    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ValidationError("Malformed JSON from " + request.path + ": " + ex.what(), response.status_code);
    }
}

void RestClient::raise_for_status(const HttpResponse& response, const RestRequest& request) const {
    const auto status = response.status_code;
    if (status == 401) {
        throw AuthenticationError(unauthorized_message(response.body, request.path));
    }
    if (status == 429) {
        throw RateLimitError("Rate limit exceeded on " + request.path,
                             parse_retry_after(response.header("Retry-After")));
    }
    if (status >= 500) {
        throw TransientApiError("Transient HTTP error " + std::to_string(status) + " on " + request.path, status);
    }
    if (status >= 400) {
        throw ValidationError(describe_http_error(status, response.body), status);
    }
    throw ValidationError("Unexpected HTTP status " + std::to_string(status) + " on " + request.path, status);
}

void RestClient::log_auth_debug(const SignedRequest& signed_request, const std::string& url,
                                const std::string& body, const RestRequest& request) const {
    std::ostringstream oss;
    oss << "[Auth] " << request.correlation_id << " DEBUG (development only)\n"
        << "  method=" << signed_request.method << '\n'
        << "  url=" << url << '\n'
        << "  signed_url=" << signed_request.url << '\n'
        << "  nonce=" << signed_request.nonce << '\n'
        << "  body=" << body << '\n'
        << "  signature=" << redacted(signed_request.signature) << '\n'
        << "  api_key=" << redacted(credentials_.api_key);
    std::cout << oss.str() << std::endl;
}

std::vector<Balance> RestClient::get_balances(const std::string& correlation_id) {
    RestRequest request;
    request.method = "GET";
    request.path = "/balances";
    request.correlation_id = correlation_id;
    return parse_balances(send(std::move(request)));
}

Order RestClient::place_order(const OrderRequest& order, const std::string& correlation_id) {
    RestRequest request;
    request.method = "POST";
    request.path = "/createorder";
    request.body = order.to_payload();
    request.correlation_id = correlation_id;

    const auto response = send(std::move(request));
    auto placed = parse_order(extract_payload(response));
    if (placed.order_id.empty()) {
        throw ValidationError("Order response missing id: " + response.dump());
    }
    if (placed.client_reference_id.empty()) {
        placed.client_reference_id = order.client_reference_id;
    }
    if (placed.symbol.empty()) {
        placed.symbol = order.symbol;
    }
    placed.side = order.side;
    if (placed.price <= 0.0 && !order.price.empty()) {
        placed.price = std::stod(order.price);
    }
    if (placed.quantity <= 0.0) {
        placed.quantity = std::stod(order.quantity);
    }
    if (placed.status == OrderStatus::Unknown) {
        placed.status = OrderStatus::Open;
    }
    return placed;
}

Order RestClient::get_order(const std::string& order_id, const std::string& correlation_id) {
    RestRequest request;
    request.method = "GET";
    request.path = "/getorder/" + url_encode(order_id);
    request.correlation_id = correlation_id;
    auto order = parse_order(extract_payload(send(std::move(request))));
    if (order.order_id.empty()) {
        order.order_id = order_id;
    }
    return order;
}

void RestClient::cancel_order(const std::string& order_id, const std::string& correlation_id) {
    RestRequest request;
    request.method = "POST";
    request.path = "/cancelorder";
    request.body = nlohmann::json{{"id", order_id}};
    request.correlation_id = correlation_id;
    send(std::move(request));
}

void RestClient::cancel_order_by_client_id(const std::string& client_reference_id,
                                           const std::string& correlation_id) {
    RestRequest request;
    request.method = "POST";
    request.path = "/cancelorder";
    request.body = nlohmann::json{{"userProvidedId", client_reference_id}};
    request.correlation_id = correlation_id;
    send(std::move(request));
}

bool RestClient::cancel_all_orders(const std::string& symbol, std::optional<Side> side,
                                   const std::string& correlation_id) {
    nlohmann::json body = {{"symbol", normalize_symbol(symbol)}};
    if (side) {
        body["side"] = to_string(*side);
    }

    RestRequest request;
    request.method = "POST";
    request.path = "/cancelallorders";
    request.body = std::move(body);
    request.correlation_id = correlation_id;

    const auto response = send(std::move(request));
    const auto& payload = extract_payload(response);
    if (payload.is_object() && payload.contains("success") && payload["success"].is_boolean()) {
        return payload["success"].get<bool>();
    }
    return true;
}

Ticker RestClient::get_ticker(const std::string& symbol, const std::string& correlation_id) {
    const auto normalized = normalize_symbol(symbol);
    RestRequest request;
    request.method = "GET";
    request.path = "/ticker/" + url_encode(normalized);
    request.requires_auth = false;
    request.correlation_id = correlation_id;
    return parse_ticker(extract_payload(send(std::move(request))), normalized);
}

std::vector<Order> RestClient::list_orders(const std::string& symbol, const std::string& status, int limit,
                                           const std::string& correlation_id) {
    RestRequest request;
    request.method = "GET";
    request.path = "/getorders";
    request.params = {{"symbol", normalize_symbol(symbol)}, {"status", status}};
    if (limit > 0) {
        request.params.emplace_back("limit", std::to_string(limit));
    }
    request.correlation_id = correlation_id;
    return parse_orders(send(std::move(request)));
}

std::vector<Order> RestClient::list_open_orders(const std::string& symbol, const std::string& correlation_id) {
    auto orders = list_orders(symbol, "active", 0, correlation_id);
    orders.erase(std::remove_if(orders.begin(), orders.end(), [](const Order& order) {
        return is_terminal(order.status);
    }), orders.end());
    return orders;
}

std::int64_t RestClient::server_time_ms(const std::string& correlation_id) {
    RestRequest request;
    request.method = "GET";
    request.path = "/getservertime";
    request.requires_auth = false;
    request.correlation_id = correlation_id;

    const auto response = send(std::move(request));
    const nlohmann::json* source = &response;
    if (response.is_object()) {
        const auto& payload = extract_payload(response);
        source = &payload;
        for (const char* key : {"serverTime", "server_time", "time", "timestamp"}) {
            if (const auto value = json_number_field(*source, key)) {
                return static_cast<std::int64_t>(*value);
            }
        }
    }
    if (source->is_number()) {
        return source->get<std::int64_t>();
    }
    throw ValidationError("Server time response not understood: " + response.dump());
}

void RestClient::sync_server_time() {
    using namespace std::chrono;
    const auto before = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const auto server = server_time_ms();
    const auto after = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const auto offset = server - (before + after) / 2;
    nonce_generator_.set_clock_offset_ms(offset);
    std::cout << "[REST] Server clock offset " << offset << " ms" << std::endl;
}

} // namespace nonkyc
