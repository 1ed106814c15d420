#pragma once

#include "nonkyc/http_client.hpp"
#include "nonkyc/util.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace nonkyc {

struct Credentials {
    std::string api_key;
    std::string api_secret;

    [[nodiscard]] bool empty() const noexcept { return api_key.empty() || api_secret.empty(); }
};

struct SignedRequest {
    std::string method;
    std::string url;
    std::string nonce;
    std::string signature;
    std::string signed_message;
};

enum class SigningMode {
    AbsoluteUrl,
    // Signs only the request path. Some older gateways expect it; the current
    // venue rejects it, so it has to be asked for explicitly.
    PathOnly
};

// floor(now_ms * multiplier), forced strictly increasing across all callers of
// one generator. Every signed call of a client draws from the same instance.
class NonceGenerator {
public:
    using MillisecondClock = std::function<std::int64_t()>;

    explicit NonceGenerator(double multiplier = 1.0, MillisecondClock clock = {});

    NonceGenerator(const NonceGenerator&) = delete;
    NonceGenerator& operator=(const NonceGenerator&) = delete;

    std::uint64_t next_value();
    std::string next();

    // Shifts the clock by the measured difference to the venue's time.
    void set_clock_offset_ms(std::int64_t offset_ms);

    [[nodiscard]] double multiplier() const noexcept { return multiplier_; }

private:
    double multiplier_;
    MillisecondClock clock_;
    std::int64_t offset_ms_ = 0;
    std::uint64_t last_ = 0;
    std::mutex mutex_;
};

std::string hmac_sha256_hex(const std::string& key, const std::string& message);

// Compact, key-sorted JSON. The exact bytes that are signed are the bytes sent.
std::string serialize_body(const nlohmann::json& body);

std::string random_alphanumeric(std::size_t length);

class Signer {
public:
    explicit Signer(SigningMode mode = SigningMode::AbsoluteUrl);

    SignedRequest sign(const std::string& method,
                       const std::string& url,
                       const QueryParams& params,
                       const std::optional<nlohmann::json>& body,
                       const Credentials& credentials,
                       const std::string& nonce) const;

    static HttpHeaders headers(const SignedRequest& signed_request, const Credentials& credentials);

    static nlohmann::json ws_login_payload(const Credentials& credentials,
                                           const std::optional<std::string>& nonce = std::nullopt);

    [[nodiscard]] SigningMode mode() const noexcept { return mode_; }

private:
    SigningMode mode_;
};

} // namespace nonkyc
