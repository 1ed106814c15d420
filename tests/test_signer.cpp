#include "nonkyc/errors.hpp"
#include "nonkyc/signer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace {

const nonkyc::Credentials kCredentials{"test-key", "test-secret"};

} // namespace

TEST_CASE("hmac_sha256_hex matches the RFC 4231 vector", "[signer]") {
    CHECK(nonkyc::hmac_sha256_hex("Jefe", "what do ya want for nothing?")
          == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("NonceGenerator scales the clock by the configured multiplier", "[signer][nonce]") {
    nonkyc::NonceGenerator millis{1.0, [] { return std::int64_t{1700000000123}; }};
    CHECK(millis.next_value() == 1700000000123ULL);

    nonkyc::NonceGenerator micros{1000.0, [] { return std::int64_t{1700000000123}; }};
    CHECK(micros.next_value() == 1700000000123000ULL);

    CHECK_THROWS_AS(nonkyc::NonceGenerator(0.0), nonkyc::ConfigurationError);
    CHECK_THROWS_AS(nonkyc::NonceGenerator(-1.0), nonkyc::ConfigurationError);
}

TEST_CASE("NonceGenerator never repeats when the clock stalls or steps back", "[signer][nonce]") {
    std::int64_t now = 5000;
    nonkyc::NonceGenerator generator{1.0, [&now] { return now; }};

    CHECK(generator.next_value() == 5000);
    CHECK(generator.next_value() == 5001);
    now = 4000;
    CHECK(generator.next_value() == 5002);
    now = 9000;
    CHECK(generator.next_value() == 9000);

    generator.set_clock_offset_ms(-10000);
    CHECK(generator.next_value() == 9001);
}

TEST_CASE("NonceGenerator is strictly increasing under concurrent callers", "[signer][nonce]") {
    nonkyc::NonceGenerator generator;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::vector<std::uint64_t> values;
    std::mutex values_mutex;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            std::vector<std::uint64_t> local;
            std::uint64_t previous = 0;
            bool ordered = true;
            for (int i = 0; i < kPerThread; ++i) {
                const auto value = generator.next_value();
                ordered = ordered && value > previous;
                previous = value;
                local.push_back(value);
            }
            std::lock_guard<std::mutex> lock(values_mutex);
            values.insert(values.end(), local.begin(), local.end());
            if (!ordered) {
                values.push_back(0);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::sort(values.begin(), values.end());
    REQUIRE(values.size() == static_cast<std::size_t>(kThreads * kPerThread));
    CHECK(values.front() > 0);
    CHECK(std::adjacent_find(values.begin(), values.end()) == values.end());
}

TEST_CASE("Signer signs GET requests over the absolute URL and sorted query", "[signer]") {
    nonkyc::Signer signer;
    const std::string url = "https://api.nonkyc.io/api/v2/getorders";
    const nonkyc::QueryParams params = {{"symbol", "BTC_USDT"}, {"status", "active"}};

    const auto signed_request = signer.sign("get", url, params, std::nullopt, kCredentials, "1700000000000");

    CHECK(signed_request.method == "GET");
    CHECK(signed_request.url == url);
    CHECK(signed_request.nonce == "1700000000000");
    CHECK(signed_request.signed_message
          == "test-key" + url + "?status=active&symbol=BTC_USDT" + "1700000000000");
    CHECK(signed_request.signature == nonkyc::hmac_sha256_hex("test-secret", signed_request.signed_message));
    CHECK(signed_request.signature.size() == 64);
}

TEST_CASE("Signer signs POST requests over the compact JSON body", "[signer]") {
    nonkyc::Signer signer;
    const std::string url = "https://api.nonkyc.io/api/v2/createorder";
    const nlohmann::json body = {{"symbol", "BTC_USDT"}, {"side", "buy"}, {"quantity", "0.001"}};

    const auto signed_request = signer.sign("POST", url, {}, body, kCredentials, "42");

    CHECK(signed_request.signed_message
          == "test-key" + url + R"({"quantity":"0.001","side":"buy","symbol":"BTC_USDT"})" + "42");
    CHECK(nonkyc::serialize_body(body) == R"({"quantity":"0.001","side":"buy","symbol":"BTC_USDT"})");
}

TEST_CASE("Signer is deterministic for identical inputs", "[signer]") {
    nonkyc::Signer signer;
    const std::string url = "https://api.nonkyc.io/api/v2/balances";
    const auto first = signer.sign("GET", url, {}, std::nullopt, kCredentials, "7");
    const auto second = signer.sign("GET", url, {}, std::nullopt, kCredentials, "7");
    const auto other_nonce = signer.sign("GET", url, {}, std::nullopt, kCredentials, "8");

    CHECK(first.signature == second.signature);
    CHECK(first.signature != other_nonce.signature);
}

TEST_CASE("Signer rejects path-only URLs unless path signing is explicit", "[signer]") {
    nonkyc::Signer absolute;
    CHECK_THROWS_AS(absolute.sign("GET", "/balances", {}, std::nullopt, kCredentials, "1"),
                    nonkyc::ConfigurationError);

    nonkyc::Signer path_only{nonkyc::SigningMode::PathOnly};
    const auto signed_request = path_only.sign("GET", "/balances", {}, std::nullopt, kCredentials, "1");
    CHECK(signed_request.signed_message == "test-key/balances1");

    CHECK_THROWS_AS(absolute.sign("GET", "https://api.nonkyc.io/api/v2/balances", {}, std::nullopt,
                                  nonkyc::Credentials{"", ""}, "1"),
                    nonkyc::ConfigurationError);
}

TEST_CASE("Signer headers carry key, nonce and signature", "[signer]") {
    nonkyc::Signer signer;
    const auto signed_request = signer.sign("GET", "https://api.nonkyc.io/api/v2/balances", {}, std::nullopt,
                                            kCredentials, "99");
    const auto headers = nonkyc::Signer::headers(signed_request, kCredentials);

    REQUIRE(headers.size() == 3);
    CHECK(headers[0] == std::make_pair(std::string("X-API-KEY"), std::string("test-key")));
    CHECK(headers[1] == std::make_pair(std::string("X-API-NONCE"), std::string("99")));
    CHECK(headers[2] == std::make_pair(std::string("X-API-SIGN"), signed_request.signature));
}

TEST_CASE("Stream login payload signs the nonce with the secret", "[signer][stream]") {
    const auto payload = nonkyc::Signer::ws_login_payload(kCredentials, std::string("abcdefghij1234"));
    CHECK(payload["method"] == "login");
    CHECK(payload["params"]["algo"] == "HS256");
    CHECK(payload["params"]["pKey"] == "test-key");
    CHECK(payload["params"]["nonce"] == "abcdefghij1234");
    CHECK(payload["params"]["signature"] == nonkyc::hmac_sha256_hex("test-secret", "abcdefghij1234"));

    const auto generated = nonkyc::Signer::ws_login_payload(kCredentials);
    const auto nonce = generated["params"]["nonce"].get<std::string>();
    CHECK(nonce.size() == 14);
    CHECK(std::all_of(nonce.begin(), nonce.end(), [](unsigned char c) { return std::isalnum(c) != 0; }));
}
