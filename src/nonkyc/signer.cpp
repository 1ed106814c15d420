#include "nonkyc/signer.hpp"
#include "nonkyc/errors.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace nonkyc {
namespace {

std::int64_t system_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool is_absolute_url(const std::string& url) {
    return url.rfind("https://", 0) == 0 || url.rfind("http://", 0) == 0;
}

} // namespace

NonceGenerator::NonceGenerator(double multiplier, MillisecondClock clock)
    : multiplier_(multiplier),
      clock_(clock ? std::move(clock) : MillisecondClock(system_clock_ms)) {
    if (!(multiplier_ > 0.0) || !std::isfinite(multiplier_)) {
        throw ConfigurationError("Nonce multiplier must be a positive number");
    }
}

std::uint64_t NonceGenerator::next_value() {
    std::lock_guard<std::mutex> lock(mutex_);
    const long double now_ms = static_cast<long double>(clock_() + offset_ms_);
    const long double scaled = std::floor(now_ms * static_cast<long double>(multiplier_));
    const auto candidate = scaled > 0 ? static_cast<std::uint64_t>(scaled) : std::uint64_t{0};
    last_ = std::max(candidate, last_ + 1);
    return last_;
}

std::string NonceGenerator::next() {
    return std::to_string(next_value());
}

void NonceGenerator::set_clock_offset_ms(std::int64_t offset_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    offset_ms_ = offset_ms;
}

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
    unsigned int len = 0;
    unsigned char buffer[EVP_MAX_MD_SIZE];

    const unsigned char* digest = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        buffer,
        &len);

    if (digest == nullptr) {
        throw std::runtime_error("Failed to create HMAC signature");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(buffer[i]);
    }

    return oss.str();
}

std::string serialize_body(const nlohmann::json& body) {
    // nlohmann::json objects keep keys ordered, and dump() without indent is compact.
    return body.dump();
}

std::string random_alphanumeric(std::size_t length) {
    static constexpr char alphabet[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    constexpr std::size_t alphabet_size = sizeof(alphabet) - 1;
    // Largest multiple of the alphabet size that fits in a byte; bytes above it
    // are discarded so every character is equally likely.
    constexpr unsigned limit = 256 - (256 % alphabet_size);

    std::string result;
    result.reserve(length);
    unsigned char bytes[32];
    while (result.size() < length) {
        if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
            throw std::runtime_error("RAND_bytes failed while generating a nonce");
        }
        for (unsigned char byte : bytes) {
            if (byte >= limit) {
                continue;
            }
            result.push_back(alphabet[byte % alphabet_size]);
            if (result.size() == length) {
                break;
            }
        }
    }
    return result;
}

Signer::Signer(SigningMode mode)
    : mode_(mode) {}

SignedRequest Signer::sign(const std::string& method,
                           const std::string& url,
                           const QueryParams& params,
                           const std::optional<nlohmann::json>& body,
                           const Credentials& credentials,
                           const std::string& nonce) const {
    if (credentials.empty()) {
        throw ConfigurationError("API key and secret are required for signed requests");
    }
    if (mode_ == SigningMode::AbsoluteUrl && !is_absolute_url(url)) {
        throw ConfigurationError("Refusing to sign path-only URL '" + url
                                 + "'; signing requires scheme, host and path");
    }

    const auto method_upper = to_upper_copy(method);
    std::string data_to_sign = url;
    if (method_upper == "GET") {
        const auto query = build_sorted_query_string(params);
        if (!query.empty()) {
            data_to_sign += '?' + query;
        }
    } else if (body && !body->is_null()) {
        data_to_sign += serialize_body(*body);
    }

    SignedRequest signed_request;
    signed_request.method = method_upper;
    signed_request.url = url;
    signed_request.nonce = nonce;
    signed_request.signed_message = credentials.api_key + data_to_sign + nonce;
    signed_request.signature = hmac_sha256_hex(credentials.api_secret, signed_request.signed_message);
    return signed_request;
}

HttpHeaders Signer::headers(const SignedRequest& signed_request, const Credentials& credentials) {
    return {
        {"X-API-KEY", credentials.api_key},
        {"X-API-NONCE", signed_request.nonce},
        {"X-API-SIGN", signed_request.signature}
    };
}

nlohmann::json Signer::ws_login_payload(const Credentials& credentials,
                                        const std::optional<std::string>& nonce) {
    if (credentials.empty()) {
        throw ConfigurationError("API key and secret are required for stream login");
    }
    const auto token = nonce ? *nonce : random_alphanumeric(14);
    return {
        {"method", "login"},
        {"params", {
            {"algo", "HS256"},
            {"pKey", credentials.api_key},
            {"nonce", token},
            {"signature", hmac_sha256_hex(credentials.api_secret, token)}
        }}
    };
}

} // namespace nonkyc
