#include "nonkyc/errors.hpp"
#include "nonkyc/reconnect_policy.hpp"
#include "nonkyc/stream_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

// In-memory socket. connect() succeeds immediately unless told otherwise and
// login requests are answered from the script.
class FakeWsTransport : public nonkyc::WsTransport {
public:
    bool connect() override {
        ++connect_attempts;
        if (!accept_connections) {
            return false;
        }
        connected_ = true;
        emit_state(nonkyc::WsConnectionState::Connected);
        return true;
    }

    void disconnect() override {
        connected_ = false;
    }

    bool send(const std::string& message) override {
        if (!connected_) {
            return false;
        }
        const auto payload = nlohmann::json::parse(message);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(payload);
        }
        if (payload.value("method", std::string{}) == "login") {
            nlohmann::json reply = {{"id", payload["id"]}};
            if (reject_login) {
                reply["error"] = {{"code", 1002}, {"message", "Authorization failed"}};
            } else {
                reply["result"] = true;
            }
            inject(reply.dump());
        }
        return true;
    }

    bool is_connected() const noexcept override { return connected_; }

    void set_message_callback(nonkyc::WsMessageCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_message_ = std::move(callback);
    }

    void set_error_callback(nonkyc::WsErrorCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_error_ = std::move(callback);
    }

    void set_state_callback(nonkyc::WsStateCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_state_ = std::move(callback);
    }

    void inject(const std::string& raw) {
        nonkyc::WsMessageCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = on_message_;
        }
        if (callback) {
            callback(raw);
        }
    }

    void drop() {
        connected_ = false;
        emit_state(nonkyc::WsConnectionState::Disconnected);
    }

    std::vector<std::string> sent_methods() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> methods;
        for (const auto& payload : sent_) {
            methods.push_back(payload.value("method", std::string{}));
        }
        return methods;
    }

    std::atomic<bool> accept_connections{true};
    std::atomic<bool> reject_login{false};
    std::atomic<int> connect_attempts{0};

private:
    void emit_state(nonkyc::WsConnectionState state) {
        nonkyc::WsStateCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = on_state_;
        }
        if (callback) {
            callback(state);
        }
    }

    std::atomic<bool> connected_{false};
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> sent_;
    nonkyc::WsMessageCallback on_message_;
    nonkyc::WsErrorCallback on_error_;
    nonkyc::WsStateCallback on_state_;
};

bool wait_for(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

nonkyc::StreamClientConfig fast_config(int max_failures = 5) {
    nonkyc::StreamClientConfig config;
    config.reconnect_base = 5ms;
    config.reconnect_max = 20ms;
    config.max_consecutive_failures = max_failures;
    config.connect_timeout = 500ms;
    config.login_timeout = 500ms;
    return config;
}

long count_of(const std::vector<std::string>& values, const std::string& needle) {
    long count = 0;
    for (const auto& value : values) {
        if (value == needle) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST_CASE("ReconnectPolicy doubles the delay up to the cap", "[stream][reconnect]") {
    nonkyc::ReconnectPolicy policy{1000ms, 30000ms, 10};

    CHECK(policy.current_backoff() == 1000ms);
    CHECK(policy.record_failure() == 1000ms);
    CHECK(policy.record_failure() == 2000ms);
    CHECK(policy.record_failure() == 4000ms);
    CHECK(policy.record_failure() == 8000ms);
    CHECK(policy.record_failure() == 16000ms);
    CHECK(policy.record_failure() == 30000ms);
    CHECK(policy.current_backoff() == 30000ms);
    CHECK(policy.consecutive_failures() == 6);
    CHECK_FALSE(policy.circuit_open());

    policy.record_success();
    CHECK(policy.consecutive_failures() == 0);
    CHECK(policy.current_backoff() == 1000ms);
}

TEST_CASE("ReconnectPolicy opens the circuit after the failure threshold", "[stream][reconnect]") {
    nonkyc::ReconnectPolicy policy{100ms, 1000ms, 3};
    policy.record_failure();
    policy.record_failure();
    CHECK_FALSE(policy.circuit_open());
    policy.record_failure();
    CHECK(policy.circuit_open());

    const auto state = policy.state();
    CHECK(state.consecutive_failures == 3);
    CHECK(state.current_backoff == 800ms);
    CHECK(state.max_backoff == 1000ms);

    CHECK_THROWS_AS((nonkyc::ReconnectPolicy{0ms, 1000ms, 3}), nonkyc::ConfigurationError);
    CHECK_THROWS_AS((nonkyc::ReconnectPolicy{2000ms, 1000ms, 3}), nonkyc::ConfigurationError);
    CHECK_THROWS_AS((nonkyc::ReconnectPolicy{100ms, 1000ms, 0}), nonkyc::ConfigurationError);
}

TEST_CASE("StreamClient logs in and replays subscriptions on every session", "[stream]") {
    auto transport = std::make_shared<FakeWsTransport>();
    nonkyc::StreamClient client{transport, nonkyc::Credentials{"key", "secret"}, fast_config()};
    client.subscribe_reports();
    client.subscribe_orderbook("BTC_USDT", 20);
    client.subscribe_balances();

    client.start();
    REQUIRE(wait_for([&] { return client.state() == nonkyc::StreamState::Streaming; }));
    CHECK(client.sessions() == 1);

    transport->drop();
    REQUIRE(wait_for([&] { return client.sessions() == 2; }));
    REQUIRE(wait_for([&] { return client.state() == nonkyc::StreamState::Streaming; }));

    const auto methods = transport->sent_methods();
    CHECK(count_of(methods, "login") == 2);
    CHECK(count_of(methods, "subscribeReports") == 2);
    CHECK(count_of(methods, "subscribeOrderbook") == 2);
    CHECK(count_of(methods, "subscribeBalances") == 2);
    CHECK(client.reconnect_state().consecutive_failures == 0);
    CHECK_FALSE(client.is_fatal());

    client.stop();
    CHECK(client.state() == nonkyc::StreamState::Disconnected);
}

TEST_CASE("StreamClient skips login without credentials", "[stream]") {
    auto transport = std::make_shared<FakeWsTransport>();
    nonkyc::StreamClient client{transport, std::nullopt, fast_config()};
    client.subscribe_trades("BTC_USDT");

    client.start();
    REQUIRE(wait_for([&] { return client.state() == nonkyc::StreamState::Streaming; }));
    client.stop();

    const auto methods = transport->sent_methods();
    CHECK(count_of(methods, "login") == 0);
    CHECK(count_of(methods, "subscribeTrades") == 1);
}

TEST_CASE("StreamClient keeps dispatching after a handler throws", "[stream]") {
    auto transport = std::make_shared<FakeWsTransport>();
    nonkyc::StreamClient client{transport, nonkyc::Credentials{"key", "secret"}, fast_config()};

    std::atomic<int> reports{0};
    std::atomic<int> fallbacks{0};
    client.on("report", [&](const nlohmann::json& message) {
        if (message["params"].value("boom", false)) {
            throw std::runtime_error("handler failure");
        }
        ++reports;
    });
    client.set_default_handler([&](const nlohmann::json&) { ++fallbacks; });
    std::mutex error_mutex;
    std::string reported_error;
    client.set_error_handler([&](const std::string& method, const std::string& error) {
        std::lock_guard<std::mutex> lock(error_mutex);
        reported_error = method + ": " + error;
    });

    client.start();
    REQUIRE(wait_for([&] { return client.state() == nonkyc::StreamState::Streaming; }));

    transport->inject(R"({"method":"report","params":{"boom":true}})");
    transport->inject("not json");
    transport->inject(R"({"method":"report","params":{"id":"ord-1","status":"Filled"}})");
    transport->inject(R"({"method":"ticker","params":{}})");

    REQUIRE(wait_for([&] { return reports == 1 && fallbacks == 1; }));
    CHECK(client.handler_errors() == 1);
    CHECK(client.state() == nonkyc::StreamState::Streaming);
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        CHECK(reported_error == "report: handler failure");
    }
    client.stop();
}

TEST_CASE("StreamClient survives non-standard throws from handlers and error callbacks", "[stream]") {
    auto transport = std::make_shared<FakeWsTransport>();
    nonkyc::StreamClient client{transport, std::nullopt, fast_config()};

    std::atomic<int> reports{0};
    client.on("report", [&](const nlohmann::json& message) {
        if (message["params"].value("boom", false)) {
            throw 42;
        }
        ++reports;
    });
    std::atomic<int> error_calls{0};
    std::mutex error_mutex;
    std::string reported_error;
    client.set_error_handler([&](const std::string&, const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(error_mutex);
            reported_error = error;
        }
        ++error_calls;
        throw std::runtime_error("error sink unavailable");
    });

    client.start();
    REQUIRE(wait_for([&] { return client.state() == nonkyc::StreamState::Streaming; }));

    transport->inject(R"({"method":"report","params":{"boom":true}})");
    transport->inject(R"({"method":"report","params":{"id":"ord-2","status":"Active"}})");

    REQUIRE(wait_for([&] { return reports == 1 && error_calls == 1; }));
    CHECK(client.handler_errors() == 1);
    CHECK(client.state() == nonkyc::StreamState::Streaming);
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        CHECK(reported_error == "unknown exception");
    }
    client.stop();
}

TEST_CASE("StreamClient reports fatal once the circuit breaker opens", "[stream]") {
    auto transport = std::make_shared<FakeWsTransport>();
    transport->accept_connections = false;
    nonkyc::StreamClient client{transport, nonkyc::Credentials{"key", "secret"}, fast_config(3)};

    std::string fatal_reason;
    client.set_fatal_callback([&](const std::string& reason) { fatal_reason = reason; });

    client.run();

    CHECK(client.is_fatal());
    CHECK(transport->connect_attempts == 3);
    CHECK(fatal_reason.find("circuit breaker") != std::string::npos);
    CHECK(client.last_error() == fatal_reason);
    CHECK(client.sessions() == 0);
}

TEST_CASE("StreamClient treats a rejected login as fatal", "[stream]") {
    auto transport = std::make_shared<FakeWsTransport>();
    transport->reject_login = true;
    nonkyc::StreamClient client{transport, nonkyc::Credentials{"key", "secret"}, fast_config()};
    client.subscribe_reports();

    bool fatal_called = false;
    client.set_fatal_callback([&](const std::string&) { fatal_called = true; });

    client.run();

    CHECK(fatal_called);
    CHECK(client.is_fatal());
    CHECK(client.last_error().find("login rejected") != std::string::npos);
    CHECK(transport->connect_attempts == 1);
    CHECK(count_of(transport->sent_methods(), "subscribeReports") == 0);
}
