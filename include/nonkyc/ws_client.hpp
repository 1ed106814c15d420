#pragma once

#include <functional>
#include <memory>
#include <string>

namespace nonkyc {

enum class WsConnectionState {
    Disconnected,
    Connecting,
    Connected
};

// Callback types for WebSocket events
using WsMessageCallback = std::function<void(const std::string& message)>;
using WsErrorCallback = std::function<void(const std::string& error)>;
using WsStateCallback = std::function<void(WsConnectionState state)>;

// One physical connection. Reconnect policy lives above this, in StreamClient.
class WsTransport {
public:
    virtual ~WsTransport() = default;

    // Starts connecting; completion is reported through the state callback.
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool send(const std::string& message) = 0;
    virtual bool is_connected() const noexcept = 0;

    virtual void set_message_callback(WsMessageCallback callback) = 0;
    virtual void set_error_callback(WsErrorCallback callback) = 0;
    virtual void set_state_callback(WsStateCallback callback) = 0;
};

class WsClient : public WsTransport {
public:
    explicit WsClient(const std::string& url);
    ~WsClient() override;

    WsClient(const WsClient&) = delete;
    WsClient& operator=(const WsClient&) = delete;
    WsClient(WsClient&&) noexcept = delete;
    WsClient& operator=(WsClient&&) noexcept = delete;

    bool connect() override;
    void disconnect() override;
    bool send(const std::string& message) override;
    bool is_connected() const noexcept override;

    void set_message_callback(WsMessageCallback callback) override;
    void set_error_callback(WsErrorCallback callback) override;
    void set_state_callback(WsStateCallback callback) override;

    WsConnectionState state() const noexcept;

    // Public for callback access (implementation detail)
    struct Impl;

private:
    std::unique_ptr<Impl> pimpl_;
};

} // namespace nonkyc
