#include "nonkyc/ws_client.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace nonkyc {

struct WsClient::Impl {
    std::string url;
    std::string host;
    std::string path;
    ::lws_context* context = nullptr;
    ::lws* wsi = nullptr;
    std::thread service_thread;
    std::atomic<bool> stop_service{false};
    std::atomic<bool> established{false};
    std::atomic<WsConnectionState> state{WsConnectionState::Disconnected};

    WsMessageCallback message_callback;
    WsErrorCallback error_callback;
    WsStateCallback state_callback;

    std::mutex callback_mutex;
    std::mutex outbox_mutex;
    std::queue<std::string> outbox;
    std::string rx_fragments;

    void notify_state(WsConnectionState next) {
        state = next;
        std::lock_guard<std::mutex> lock(callback_mutex);
        if (state_callback) {
            state_callback(next);
        }
    }

    void notify_error(const std::string& error) {
        std::lock_guard<std::mutex> lock(callback_mutex);
        if (error_callback) {
            error_callback(error);
        }
    }
};

} // namespace nonkyc

namespace {

struct ParsedUrl {
    bool ssl = false;
    std::string host;
    std::string path;
    int port = 0;
};

std::optional<ParsedUrl> parse_ws_url(const std::string& url) {
    ParsedUrl parsed;
    std::size_t start = 0;
    if (url.rfind("wss://", 0) == 0) {
        parsed.ssl = true;
        parsed.port = 443;
        start = 6;
    } else if (url.rfind("ws://", 0) == 0) {
        parsed.port = 80;
        start = 5;
    } else {
        return std::nullopt;
    }

    const auto slash = url.find('/', start);
    if (slash == std::string::npos) {
        parsed.host = url.substr(start);
        parsed.path = "/";
    } else {
        parsed.host = url.substr(start, slash - start);
        parsed.path = url.substr(slash);
    }

    const auto colon = parsed.host.find(':');
    if (colon != std::string::npos) {
        try {
            parsed.port = std::stoi(parsed.host.substr(colon + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        parsed.host = parsed.host.substr(0, colon);
    }
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

int callback_ws_client(struct lws* wsi, enum lws_callback_reasons reason,
                       void* /*user*/, void* in, size_t len) {
    auto* impl = static_cast<nonkyc::WsClient::Impl*>(lws_get_opaque_user_data(wsi));
    if (!impl) {
        impl = static_cast<nonkyc::WsClient::Impl*>(lws_context_user(lws_get_context(wsi)));
        if (!impl) {
            return 0;
        }
        lws_set_opaque_user_data(wsi, impl);
    }

    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED: {
            impl->established = true;
            impl->notify_state(nonkyc::WsConnectionState::Connected);
            break;
        }

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            impl->established = false;
            impl->wsi = nullptr;
            const char* error_msg = in ? static_cast<const char*>(in) : "Connection error";
            impl->notify_error(in ? std::string(error_msg, len) : std::string(error_msg));
            impl->notify_state(nonkyc::WsConnectionState::Disconnected);
            break;
        }

        case LWS_CALLBACK_CLIENT_CLOSED:
        case LWS_CALLBACK_CLOSED: {
            if (impl->established.exchange(false)) {
                impl->wsi = nullptr;
                impl->notify_state(nonkyc::WsConnectionState::Disconnected);
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_RECEIVE: {
            if (in && len > 0 && !lws_frame_is_binary(wsi)) {
                impl->rx_fragments.append(static_cast<const char*>(in), len);
                if (lws_is_final_fragment(wsi)) {
                    std::lock_guard<std::mutex> lock(impl->callback_mutex);
                    if (impl->message_callback) {
                        impl->message_callback(impl->rx_fragments);
                    }
                    impl->rx_fragments.clear();
                }
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_WRITEABLE: {
            std::string message;
            bool more = false;
            {
                std::lock_guard<std::mutex> lock(impl->outbox_mutex);
                if (impl->outbox.empty()) {
                    break;
                }
                message = std::move(impl->outbox.front());
                impl->outbox.pop();
                more = !impl->outbox.empty();
            }

            std::vector<unsigned char> buf(LWS_PRE + message.size());
            std::memcpy(buf.data() + LWS_PRE, message.data(), message.size());
            const int n = lws_write(wsi, buf.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
            if (n < static_cast<int>(message.size())) {
                impl->notify_error("Failed to send WebSocket message");
                return -1;
            }
            if (more) {
                lws_callback_on_writable(wsi);
            }
            break;
        }

        default:
            break;
    }

    return 0;
}

const struct lws_protocols protocols[] = {
    {
        "nonkyc-stream",
        callback_ws_client,
        0,
        65536, // rx_buffer_size
    },
    {nullptr, nullptr, 0, 0}
};

} // anonymous namespace

namespace nonkyc {

WsClient::WsClient(const std::string& url)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->url = url;
}

WsClient::~WsClient() {
    disconnect();
}

bool WsClient::connect() {
    if (pimpl_->established) {
        return true;
    }
    if (pimpl_->state == WsConnectionState::Connecting) {
        return false;
    }

    // A previous session may still own a service thread and context.
    disconnect();

    const auto parsed = parse_ws_url(pimpl_->url);
    if (!parsed) {
        pimpl_->notify_error("Unsupported WebSocket URL: " + pimpl_->url);
        return false;
    }
    pimpl_->host = parsed->host;
    pimpl_->path = parsed->path;

    pimpl_->notify_state(WsConnectionState::Connecting);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));

    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = pimpl_.get();

    pimpl_->context = lws_create_context(&info);
    if (!pimpl_->context) {
        pimpl_->notify_state(WsConnectionState::Disconnected);
        return false;
    }

    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = pimpl_->context;
    ccinfo.address = pimpl_->host.c_str();
    ccinfo.port = parsed->port;
    ccinfo.path = pimpl_->path.c_str();
    ccinfo.host = pimpl_->host.c_str();
    ccinfo.origin = pimpl_->host.c_str();
    ccinfo.protocol = protocols[0].name;
    ccinfo.ssl_connection = parsed->ssl ? LCCSCF_USE_SSL : 0;
    ccinfo.opaque_user_data = pimpl_.get();

    pimpl_->wsi = lws_client_connect_via_info(&ccinfo);
    if (!pimpl_->wsi) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
        pimpl_->notify_state(WsConnectionState::Disconnected);
        return false;
    }

    pimpl_->stop_service = false;
    pimpl_->service_thread = std::thread([impl = pimpl_.get()]() {
        while (!impl->stop_service) {
            lws_service(impl->context, 50);
        }
    });

    return true;
}

void WsClient::disconnect() {
    pimpl_->stop_service = true;

    if (pimpl_->context) {
        lws_cancel_service(pimpl_->context);
    }

    if (pimpl_->service_thread.joinable()) {
        pimpl_->service_thread.join();
    }

    if (pimpl_->context) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl_->outbox_mutex);
        std::queue<std::string>().swap(pimpl_->outbox);
    }
    pimpl_->rx_fragments.clear();
    pimpl_->wsi = nullptr;
    pimpl_->established = false;
    pimpl_->state = WsConnectionState::Disconnected;
}

bool WsClient::send(const std::string& message) {
    if (!pimpl_->established || !pimpl_->wsi || !pimpl_->context) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl_->outbox_mutex);
        pimpl_->outbox.push(message);
    }

    // Wakes lws_service so the writeable request is picked up from the service thread.
    lws_cancel_service(pimpl_->context);
    lws_callback_on_writable(pimpl_->wsi);
    return true;
}

bool WsClient::is_connected() const noexcept {
    return pimpl_->established;
}

void WsClient::set_message_callback(WsMessageCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callback_mutex);
    pimpl_->message_callback = std::move(callback);
}

void WsClient::set_error_callback(WsErrorCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callback_mutex);
    pimpl_->error_callback = std::move(callback);
}

void WsClient::set_state_callback(WsStateCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callback_mutex);
    pimpl_->state_callback = std::move(callback);
}

WsConnectionState WsClient::state() const noexcept {
    return pimpl_->state;
}

} // namespace nonkyc
