#include "nonkyc/async_rest_client.hpp"
#include "nonkyc/rest_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

struct RecordedRequest {
    std::string method;
    std::string url;
    nonkyc::HttpHeaders headers;
    std::string body;

    std::string header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (key == name) {
                return value;
            }
        }
        return {};
    }
};

// Scripted transport: each call pops the next canned outcome.
class FakeTransport : public nonkyc::HttpTransport {
public:
    struct Outcome {
        long status = 200;
        std::string body;
        std::map<std::string, std::string> headers;
        bool network_error = false;
    };

    void push(long status, std::string body = "{}", std::map<std::string, std::string> headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(Outcome{status, std::move(body), std::move(headers), false});
    }

    void push_network_error() {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(Outcome{0, {}, {}, true});
    }

    nonkyc::HttpResponse request(const std::string& method, const std::string& url,
                                 const nonkyc::HttpHeaders& headers, const std::string& body) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(RecordedRequest{method, url, headers, body});
        if (outcomes_.empty()) {
            throw nonkyc::HttpError("no scripted response", true);
        }
        auto outcome = outcomes_.front();
        outcomes_.pop_front();
        if (outcome.network_error) {
            throw nonkyc::HttpError("Connection reset by peer");
        }
        nonkyc::HttpResponse response;
        response.status_code = outcome.status;
        response.body = outcome.body;
        response.headers = outcome.headers;
        return response;
    }

    std::vector<RecordedRequest> requests;

private:
    std::mutex mutex_;
    std::deque<Outcome> outcomes_;
};

struct Harness {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::vector<std::chrono::milliseconds> sleeps;
    std::shared_ptr<nonkyc::RestClient> client;

    explicit Harness(nonkyc::RestClientConfig config = {}) {
        auto limiter = std::make_shared<nonkyc::RateLimiter>(1000.0, 1000.0);
        client = std::make_shared<nonkyc::RestClient>(
            nonkyc::Credentials{"key", "secret"}, transport, limiter, config,
            [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
    }
};

} // namespace

TEST_CASE("RestClient treats 401 as fatal and does not retry", "[rest]") {
    Harness harness;
    harness.transport->push(401, R"({"error":"Not Authorized"})");

    try {
        harness.client->get_balances();
        FAIL("expected AuthenticationError");
    } catch (const nonkyc::AuthenticationError& ex) {
        CHECK(ex.status_code() == 401);
        CHECK(std::string(ex.what()).find("/balances") != std::string::npos);
    }
    CHECK(harness.transport->requests.size() == 1);
    CHECK(harness.sleeps.empty());
}

TEST_CASE("RestClient honours Retry-After on 429 and then succeeds", "[rest]") {
    Harness harness;
    harness.transport->push(429, "{}", {{"retry-after", "2"}});
    harness.transport->push(200, R"([{"asset":"USDT","available":"100.5","held":"1"}])");

    const auto balances = harness.client->get_balances();

    REQUIRE(balances.size() == 1);
    CHECK(balances[0].asset == "USDT");
    CHECK(balances[0].available == 100.5);
    CHECK(balances[0].held == 1.0);
    REQUIRE(harness.sleeps.size() == 1);
    CHECK(harness.sleeps[0] == std::chrono::milliseconds(2000));
}

TEST_CASE("RestClient retries 5xx with exponential backoff", "[rest]") {
    Harness harness;
    harness.transport->push(503, "unavailable");
    harness.transport->push(502, "bad gateway");
    harness.transport->push(200, R"({"symbol":"BTC_USDT","bid":"89990","ask":"90010"})");

    const auto ticker = harness.client->get_ticker("btc/usdt");

    CHECK(ticker.symbol == "BTC_USDT");
    REQUIRE(ticker.mid());
    CHECK(*ticker.mid() == 90000.0);
    REQUIRE(harness.sleeps.size() == 2);
    CHECK(harness.sleeps[0] == std::chrono::milliseconds(500));
    CHECK(harness.sleeps[1] == std::chrono::milliseconds(1000));
}

TEST_CASE("RestClient gives up on persistent transient failures", "[rest]") {
    nonkyc::RestClientConfig config;
    config.max_retries = 2;
    Harness harness{config};
    harness.transport->push_network_error();
    harness.transport->push(500, "oops");
    harness.transport->push_network_error();

    CHECK_THROWS_AS(harness.client->get_order("abc"), nonkyc::TransientApiError);
    CHECK(harness.transport->requests.size() == 3);
    CHECK(harness.sleeps.size() == 2);
}

TEST_CASE("RestClient cancel-all raises the same transient errors as other calls", "[rest]") {
    nonkyc::RestClientConfig config;
    config.max_retries = 1;
    Harness harness{config};
    harness.transport->push_network_error();
    harness.transport->push(504, "gateway timeout");

    CHECK_THROWS_AS(harness.client->cancel_all_orders("BTC_USDT"), nonkyc::TransientApiError);

    harness.transport->push(200, R"({"success":true})");
    CHECK(harness.client->cancel_all_orders("BTC-USDT", nonkyc::Side::Sell));
    const auto& last = harness.transport->requests.back();
    CHECK(last.method == "POST");
    CHECK(last.url == "https://api.nonkyc.io/api/v2/cancelallorders");
    CHECK(last.body == R"({"side":"sell","symbol":"BTC_USDT"})");
}

TEST_CASE("RestClient surfaces 4xx as ValidationError with a min-notional hint", "[rest]") {
    Harness harness;
    harness.transport->push(400, R"({"error":{"code":"MIN_NOTIONAL","message":"Order value too small"}})");

    nonkyc::OrderRequest order;
    order.symbol = "BTC_USDT";
    order.side = nonkyc::Side::Buy;
    order.price = "88200.00";
    order.quantity = "0.00000001";

    try {
        harness.client->place_order(order);
        FAIL("expected ValidationError");
    } catch (const nonkyc::ValidationError& ex) {
        CHECK(ex.status_code() == 400);
        CHECK(std::string(ex.what()).find("Minimum order notional requirement not met.") != std::string::npos);
    }
    CHECK(harness.transport->requests.size() == 1);

    CHECK(nonkyc::describe_http_error(404, R"({"error":"Order not found"})")
          == R"(HTTP error 404: {"error":"Order not found"})");
}

TEST_CASE("RestClient signs authenticated calls and leaves public ones unsigned", "[rest]") {
    Harness harness;
    harness.transport->push(200, R"([])");
    harness.transport->push(200, R"({"symbol":"BTC_USDT","last_price":"90000"})");

    const auto open = harness.client->list_open_orders("BTC_USDT");
    CHECK(open.empty());
    const auto& signed_call = harness.transport->requests[0];
    CHECK(signed_call.url == "https://api.nonkyc.io/api/v2/getorders?status=active&symbol=BTC_USDT");
    CHECK(signed_call.header("X-API-KEY") == "key");
    CHECK_FALSE(signed_call.header("X-API-NONCE").empty());
    CHECK(signed_call.header("X-API-SIGN").size() == 64);

    harness.client->get_ticker("BTC_USDT");
    const auto& public_call = harness.transport->requests[1];
    CHECK(public_call.url == "https://api.nonkyc.io/api/v2/ticker/BTC_USDT");
    CHECK(public_call.header("X-API-KEY").empty());
}

TEST_CASE("RestClient nonces increase across consecutive signed calls", "[rest]") {
    Harness harness;
    harness.transport->push(200, "[]");
    harness.transport->push(200, "[]");

    harness.client->get_balances();
    harness.client->get_balances();

    const auto first = std::stoull(harness.transport->requests[0].header("X-API-NONCE"));
    const auto second = std::stoull(harness.transport->requests[1].header("X-API-NONCE"));
    CHECK(second > first);
}

TEST_CASE("RestClient place_order sends the venue payload and completes the result", "[rest]") {
    Harness harness;
    harness.transport->push(200, R"({"id":"ord-1","status":"New"})");

    nonkyc::OrderRequest order;
    order.symbol = "BTC_USDT";
    order.side = nonkyc::Side::Sell;
    order.price = "91800.00";
    order.quantity = "0.00100000";
    order.client_reference_id = "GBS17000000000000001";

    const auto placed = harness.client->place_order(order);

    CHECK(placed.order_id == "ord-1");
    CHECK(placed.client_reference_id == "GBS17000000000000001");
    CHECK(placed.side == nonkyc::Side::Sell);
    CHECK(placed.price == 91800.0);
    CHECK(placed.quantity == 0.001);
    CHECK(placed.status == nonkyc::OrderStatus::Open);

    const auto body = nlohmann::json::parse(harness.transport->requests[0].body);
    CHECK(body["type"] == "limit");
    CHECK(body["userProvidedId"] == "GBS17000000000000001");
    CHECK(body["strictValidate"] == true);

    harness.transport->push(200, R"({"status":"New"})");
    CHECK_THROWS_AS(harness.client->place_order(order), nonkyc::ValidationError);
}

TEST_CASE("RestClient list_open_orders drops terminal orders", "[rest]") {
    Harness harness;
    harness.transport->push(200, R"([
        {"id":"a","side":"buy","price":"88200","quantity":"0.001","status":"Active"},
        {"id":"b","side":"sell","price":"91800","quantity":"0.001","status":"Filled"},
        {"id":"c","side":"sell","price":"93600","quantity":"0.001","status":"Partly Filled","executedQuantity":"0.0004"}
    ])");

    const auto open = harness.client->list_open_orders("BTC_USDT");

    REQUIRE(open.size() == 2);
    CHECK(open[0].order_id == "a");
    CHECK(open[1].status == nonkyc::OrderStatus::PartiallyFilled);
    CHECK(open[1].executed_quantity == 0.0004);
}

TEST_CASE("RestClient backoff doubles up to the cap", "[rest]") {
    nonkyc::RestClientConfig config;
    config.backoff_base = std::chrono::milliseconds(500);
    config.backoff_max = std::chrono::milliseconds(3000);
    Harness harness{config};

    CHECK(harness.client->backoff_for_attempt(1) == std::chrono::milliseconds(500));
    CHECK(harness.client->backoff_for_attempt(2) == std::chrono::milliseconds(1000));
    CHECK(harness.client->backoff_for_attempt(3) == std::chrono::milliseconds(2000));
    CHECK(harness.client->backoff_for_attempt(4) == std::chrono::milliseconds(3000));
    CHECK(harness.client->backoff_for_attempt(10) == std::chrono::milliseconds(3000));

    CHECK(nonkyc::parse_retry_after("1.5") == std::chrono::milliseconds(1500));
    CHECK_FALSE(nonkyc::parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT"));
    CHECK_FALSE(nonkyc::parse_retry_after(""));
}

TEST_CASE("AsyncRestClient looks up many orders and captures per-order errors", "[rest][async]") {
    Harness harness;
    nonkyc::AsyncRestClient async_client{harness.client};

    // Lookups run concurrently, so every scripted response is the same shape.
    harness.transport->push(200, R"({"status":"Active"})");
    harness.transport->push(200, R"({"status":"Active"})");

    const auto results = async_client.get_orders({"a", "b"}, 1);

    REQUIRE(results.size() == 2);
    CHECK(results[0].order_id == "a");
    REQUIRE(results[0].order);
    CHECK(results[0].order->order_id == "a");
    CHECK(results[0].order->status == nonkyc::OrderStatus::Open);
    CHECK(results[1].order_id == "b");
    REQUIRE(results[1].order);
    CHECK(results[1].order->order_id == "b");

    nonkyc::RestClientConfig config;
    config.max_retries = 0;
    Harness failing{config};
    failing.transport->push(404, R"({"error":"Order not found"})");
    nonkyc::AsyncRestClient failing_async{failing.client};
    const auto missing = failing_async.get_orders({"zzz"});
    REQUIRE(missing.size() == 1);
    CHECK_FALSE(missing[0].order);
    CHECK(missing[0].error != nullptr);
}
