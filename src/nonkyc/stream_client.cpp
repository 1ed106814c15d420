#include "nonkyc/stream_client.hpp"
#include "nonkyc/errors.hpp"

#include <iostream>
#include <utility>

namespace nonkyc {
namespace {

std::string dispatch_key(const nlohmann::json& message) {
    for (const char* key : {"method", "channel"}) {
        const auto it = message.find(key);
        if (it != message.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

} // namespace

const char* to_string(StreamState state) noexcept {
    switch (state) {
        case StreamState::Disconnected:
            return "disconnected";
        case StreamState::Connecting:
            return "connecting";
        case StreamState::Authenticated:
            return "authenticated";
        case StreamState::Subscribed:
            return "subscribed";
        case StreamState::Streaming:
            return "streaming";
    }
    return "unknown";
}

StreamClient::StreamClient(std::shared_ptr<WsTransport> transport,
                           std::optional<Credentials> credentials,
                           StreamClientConfig config)
    : transport_(std::move(transport)),
      credentials_(std::move(credentials)),
      config_(config),
      policy_(config_.reconnect_base, config_.reconnect_max, config_.max_consecutive_failures) {
    if (!transport_) {
        throw ConfigurationError("StreamClient requires a WebSocket transport");
    }

    transport_->set_message_callback([this](const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            inbound_.push_back(message);
        }
        queue_cv_.notify_all();
    });

    transport_->set_error_callback([](const std::string& error) {
        std::cerr << "[WS] " << error << std::endl;
    });

    transport_->set_state_callback([this](WsConnectionState ws_state) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (ws_state == WsConnectionState::Connected) {
                link_ = LinkState::Connected;
            } else if (ws_state == WsConnectionState::Disconnected) {
                link_ = LinkState::Disconnected;
            }
        }
        queue_cv_.notify_all();
    });
}

StreamClient::~StreamClient() {
    stop();
    transport_->set_message_callback({});
    transport_->set_state_callback({});
    transport_->set_error_callback({});
}

void StreamClient::add_subscription(nlohmann::json payload) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_.push_back(payload);
    }
    if (state_ == StreamState::Streaming) {
        if (!send_with_id(std::move(payload))) {
            std::cerr << "[Stream] Subscription will be sent on the next session" << std::endl;
        }
    }
}

void StreamClient::subscribe_orderbook(const std::string& symbol, std::optional<int> limit) {
    nlohmann::json params = {{"symbol", symbol}};
    if (limit) {
        params["limit"] = *limit;
    }
    add_subscription({{"method", "subscribeOrderbook"}, {"params", std::move(params)}});
}

void StreamClient::subscribe_trades(const std::string& symbol) {
    add_subscription({{"method", "subscribeTrades"}, {"params", {{"symbol", symbol}}}});
}

void StreamClient::subscribe_reports() {
    add_subscription({{"method", "subscribeReports"}, {"params", nlohmann::json::object()}});
}

void StreamClient::subscribe_balances() {
    add_subscription({{"method", "subscribeBalances"}, {"params", nlohmann::json::object()}});
}

void StreamClient::on(const std::string& method, StreamHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[method] = std::move(handler);
}

void StreamClient::set_default_handler(StreamHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    default_handler_ = std::move(handler);
}

void StreamClient::set_error_handler(StreamErrorCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    error_handler_ = std::move(callback);
}

void StreamClient::set_fatal_callback(StreamFatalCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    fatal_callback_ = std::move(callback);
}

void StreamClient::set_state_callback(StreamStateCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    state_callback_ = std::move(callback);
}

ReconnectState StreamClient::reconnect_state() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return policy_.state();
}

std::string StreamClient::last_error() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_error_;
}

void StreamClient::set_state(StreamState next) {
    const auto previous = state_.exchange(next);
    if (previous == next) {
        return;
    }
    std::cout << "[Stream] " << to_string(previous) << " -> " << to_string(next) << std::endl;
    StreamStateCallback callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = state_callback_;
    }
    if (callback) {
        callback(next);
    }
}

void StreamClient::report_fatal(const std::string& reason) {
    if (fatal_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        last_error_ = reason;
    }
    std::cerr << "[Stream] FATAL: " << reason << std::endl;
    StreamFatalCallback callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = fatal_callback_;
    }
    if (callback) {
        callback(reason);
    }
}

void StreamClient::wait_for_stop(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

bool StreamClient::send_with_id(nlohmann::json payload, std::int64_t* id_out) {
    const auto id = next_id_.fetch_add(1);
    payload["id"] = id;
    if (id_out) {
        *id_out = id;
    }
    return transport_->send(payload.dump());
}

void StreamClient::run() {
    while (!stop_requested_ && !fatal_) {
        if (establish_session()) {
            {
                std::lock_guard<std::mutex> lock(status_mutex_);
                policy_.record_success();
            }
            ++sessions_;
            set_state(StreamState::Streaming);
            pump_until_disconnect();
        }

        transport_->disconnect();
        set_state(StreamState::Disconnected);
        if (stop_requested_ || fatal_) {
            break;
        }
        if (!config_.auto_reconnect) {
            std::cout << "[Stream] Auto-reconnect disabled; stream stopped" << std::endl;
            break;
        }

        std::chrono::milliseconds delay{0};
        int failures = 0;
        bool open = false;
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            delay = policy_.record_failure();
            failures = policy_.consecutive_failures();
            open = policy_.circuit_open();
        }
        if (open) {
            report_fatal("Stream reconnect failed " + std::to_string(failures)
                         + " consecutive times; circuit breaker open");
            break;
        }
        std::cerr << "[Stream] Reconnecting in " << delay.count() << " ms (failure " << failures
                  << '/' << config_.max_consecutive_failures << ")" << std::endl;
        wait_for_stop(delay);
    }
}

void StreamClient::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this] { run(); });
}

void StreamClient::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool StreamClient::establish_session() {
    set_state(StreamState::Connecting);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        inbound_.clear();
        link_ = LinkState::Connecting;
    }

    if (!transport_->connect()) {
        std::cerr << "[Stream] Connect could not be started" << std::endl;
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait_for(lock, config_.connect_timeout, [this] {
            return stop_requested_.load() || link_ != LinkState::Connecting;
        });
        if (link_ != LinkState::Connected || stop_requested_) {
            if (!stop_requested_) {
                std::cerr << "[Stream] Connection not established" << std::endl;
            }
            return false;
        }
    }

    if (credentials_ && !credentials_->empty()) {
        std::int64_t login_id = 0;
        if (!send_with_id(Signer::ws_login_payload(*credentials_), &login_id)) {
            std::cerr << "[Stream] Failed to send login" << std::endl;
            return false;
        }
        const auto response = wait_for_response(login_id, config_.login_timeout);
        if (!response) {
            if (!stop_requested_) {
                std::cerr << "[Stream] No login response within "
                          << config_.login_timeout.count() << " ms" << std::endl;
            }
            return false;
        }
        const auto error = response->find("error");
        if (error != response->end() && !error->is_null()) {
            report_fatal("Stream login rejected: " + error->dump());
            return false;
        }
        const auto result = response->find("result");
        if (result != response->end() && result->is_boolean() && !result->get<bool>()) {
            report_fatal("Stream login rejected: " + response->dump());
            return false;
        }
        set_state(StreamState::Authenticated);
    }

    std::vector<nlohmann::json> subscriptions;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions = subscriptions_;
    }
    for (auto& subscription : subscriptions) {
        const auto method = subscription.value("method", std::string{});
        if (!send_with_id(std::move(subscription))) {
            std::cerr << "[Stream] Failed to send " << method << std::endl;
            return false;
        }
    }
    set_state(StreamState::Subscribed);
    return true;
}

std::optional<nlohmann::json> StreamClient::wait_for_response(std::int64_t id,
                                                              std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        std::string raw;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            const bool ready = queue_cv_.wait_until(lock, deadline, [this] {
                return stop_requested_.load() || !inbound_.empty() || link_ == LinkState::Disconnected;
            });
            if (!ready || stop_requested_ || inbound_.empty()) {
                return std::nullopt;
            }
            raw = std::move(inbound_.front());
            inbound_.pop_front();
        }

        const auto message = nlohmann::json::parse(raw, nullptr, false);
        if (!message.is_discarded() && message.is_object()) {
            const auto it = message.find("id");
            if (it != message.end() && it->is_number_integer() && it->get<std::int64_t>() == id) {
                return message;
            }
        }
        dispatch(raw);
    }
}

void StreamClient::pump_until_disconnect() {
    while (true) {
        std::deque<std::string> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stop_requested_.load() || !inbound_.empty() || link_ == LinkState::Disconnected;
            });
            if (stop_requested_) {
                return;
            }
            if (inbound_.empty() && link_ == LinkState::Disconnected) {
                std::cerr << "[Stream] Connection lost" << std::endl;
                return;
            }
            batch.swap(inbound_);
        }
        for (const auto& raw : batch) {
            dispatch(raw);
        }
    }
}

void StreamClient::dispatch(const std::string& raw) {
    const auto message = nlohmann::json::parse(raw, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        std::cerr << "[Stream] Dropping malformed frame: " << raw.substr(0, 200) << std::endl;
        return;
    }

    const auto key = dispatch_key(message);
    if (key.empty() && message.contains("id")) {
        const auto error = message.find("error");
        if (error != message.end() && !error->is_null()) {
            std::cerr << "[Stream] Request " << message["id"].dump() << " failed: " << error->dump() << std::endl;
        }
        return;
    }

    StreamHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        const auto it = handlers_.find(key);
        handler = it != handlers_.end() ? it->second : default_handler_;
    }
    if (!handler) {
        return;
    }

    std::string failure;
    try {
        handler(message);
        return;
    } catch (const std::exception& ex) {
        failure = ex.what();
    } catch (...) {
        failure = "unknown exception";
    }

    ++handler_errors_;
    std::cerr << "[Stream] Handler for '" << key << "' threw: " << failure << std::endl;
    StreamErrorCallback on_error;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        on_error = error_handler_;
    }
    if (!on_error) {
        return;
    }
    // Runs on the supervisor thread; nothing may escape it.
    try {
        on_error(key, failure);
    } catch (const std::exception& ex) {
        std::cerr << "[Stream] Error handler threw: " << ex.what() << std::endl;
    } catch (...) {
        std::cerr << "[Stream] Error handler threw an unknown exception" << std::endl;
    }
}

} // namespace nonkyc
