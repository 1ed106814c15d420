#pragma once

#include "nonkyc/reconnect_policy.hpp"
#include "nonkyc/signer.hpp"
#include "nonkyc/ws_client.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace nonkyc {

enum class StreamState {
    Disconnected,
    Connecting,
    Authenticated,
    Subscribed,
    Streaming
};

const char* to_string(StreamState state) noexcept;

struct StreamClientConfig {
    std::chrono::milliseconds reconnect_base{1000};
    std::chrono::milliseconds reconnect_max{30000};
    int max_consecutive_failures = 10;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds login_timeout{10000};
    bool auto_reconnect = true;
};

using StreamHandler = std::function<void(const nlohmann::json& message)>;
using StreamFatalCallback = std::function<void(const std::string& reason)>;
using StreamErrorCallback = std::function<void(const std::string& method, const std::string& error)>;
using StreamStateCallback = std::function<void(StreamState state)>;

// Supervises one streaming session at a time: connect, login, subscribe,
// dispatch, and reconnect with backoff until stopped or the circuit breaker
// opens. Login and every subscription are sent again on each new session.
class StreamClient {
public:
    StreamClient(std::shared_ptr<WsTransport> transport,
                 std::optional<Credentials> credentials,
                 StreamClientConfig config = {});
    ~StreamClient();

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;

    void subscribe_orderbook(const std::string& symbol, std::optional<int> limit = std::nullopt);
    void subscribe_trades(const std::string& symbol);
    void subscribe_reports();
    void subscribe_balances();

    // Handlers are keyed by the inbound "method" (or "channel") field.
    void on(const std::string& method, StreamHandler handler);
    void set_default_handler(StreamHandler handler);
    // Called after a handler throws; dispatch continues either way.
    void set_error_handler(StreamErrorCallback callback);
    void set_fatal_callback(StreamFatalCallback callback);
    void set_state_callback(StreamStateCallback callback);

    // Blocks until stop() or a fatal condition.
    void run();
    void start();
    void stop();

    [[nodiscard]] StreamState state() const noexcept { return state_; }
    [[nodiscard]] ReconnectState reconnect_state() const;
    [[nodiscard]] bool is_fatal() const noexcept { return fatal_; }
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] std::uint64_t handler_errors() const noexcept { return handler_errors_; }
    [[nodiscard]] std::uint64_t sessions() const noexcept { return sessions_; }

private:
    enum class LinkState { Connecting, Connected, Disconnected };

    void add_subscription(nlohmann::json payload);
    bool establish_session();
    void pump_until_disconnect();
    std::optional<nlohmann::json> wait_for_response(std::int64_t id, std::chrono::milliseconds timeout);
    void dispatch(const std::string& raw);
    bool send_with_id(nlohmann::json payload, std::int64_t* id_out = nullptr);
    void set_state(StreamState next);
    void report_fatal(const std::string& reason);
    void wait_for_stop(std::chrono::milliseconds delay);

    std::shared_ptr<WsTransport> transport_;
    std::optional<Credentials> credentials_;
    StreamClientConfig config_;
    ReconnectPolicy policy_;

    std::atomic<StreamState> state_{StreamState::Disconnected};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> fatal_{false};
    std::atomic<std::int64_t> next_id_{1};
    std::atomic<std::uint64_t> handler_errors_{0};
    std::atomic<std::uint64_t> sessions_{0};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> inbound_;
    LinkState link_ = LinkState::Disconnected;

    mutable std::mutex subscriptions_mutex_;
    std::vector<nlohmann::json> subscriptions_;

    mutable std::mutex handlers_mutex_;
    std::unordered_map<std::string, StreamHandler> handlers_;
    StreamHandler default_handler_;
    StreamErrorCallback error_handler_;
    StreamFatalCallback fatal_callback_;
    StreamStateCallback state_callback_;

    mutable std::mutex status_mutex_;
    std::string last_error_;

    std::thread worker_;
};

} // namespace nonkyc
