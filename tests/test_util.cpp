#include "nonkyc/errors.hpp"
#include "nonkyc/util.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("url_encode handles safe and unsafe characters", "[util]") {
    using nonkyc::url_encode;
    CHECK(url_encode("simple") == "simple");
    CHECK(url_encode("hello world") == "hello%20world");
    CHECK(url_encode("1+1=2") == "1%2B1%3D2");
    CHECK(url_encode("BTC/USDT") == "BTC%2FUSDT");
    CHECK(url_encode("symbols-_.~") == "symbols-_.~");
}

TEST_CASE("filter_empty drops empty values but keeps falsy strings", "[util]") {
    nonkyc::QueryParams params = {
        {"symbol", "BTC_USDT"},
        {"side", ""},
        {"limit", "0"},
        {"strict", "false"}
    };

    const auto filtered = nonkyc::filter_empty(params);
    REQUIRE(filtered.size() == 3);
    CHECK(filtered[0].first == "symbol");
    CHECK(filtered[1].first == "limit");
    CHECK(filtered[2].first == "strict");
}

TEST_CASE("query strings keep caller order unless sorted for signing", "[util]") {
    nonkyc::QueryParams params = {
        {"symbol", "BTC_USDT"},
        {"status", "active"},
        {"limit", "100"},
        {"note", "space value"}
    };

    CHECK(nonkyc::build_query_string(params) == "symbol=BTC_USDT&status=active&limit=100&note=space%20value");
    CHECK(nonkyc::build_sorted_query_string(params) == "limit=100&note=space%20value&status=active&symbol=BTC_USDT");
}

TEST_CASE("case helpers copy and convert", "[util]") {
    CHECK(nonkyc::to_upper_copy("btcUSDT") == "BTCUSDT");
    CHECK(nonkyc::to_lower_copy("Partly Filled") == "partly filled");
}

TEST_CASE("normalize_symbol converts delimiters to BASE_QUOTE", "[util]") {
    CHECK(nonkyc::normalize_symbol("BTC/USDT") == "BTC_USDT");
    CHECK(nonkyc::normalize_symbol("btc-usdt") == "BTC_USDT");
    CHECK(nonkyc::normalize_symbol("BTC_USDT") == "BTC_USDT");

    CHECK_THROWS_AS(nonkyc::normalize_symbol("BTCUSDT"), nonkyc::ValidationError);
    CHECK_THROWS_AS(nonkyc::normalize_symbol("_USDT"), nonkyc::ValidationError);
    CHECK_THROWS_AS(nonkyc::normalize_symbol("BTC_USDT_X"), nonkyc::ValidationError);

    const auto parts = nonkyc::split_symbol("eth/btc");
    CHECK(parts.base == "ETH");
    CHECK(parts.quote == "BTC");
}

TEST_CASE("rounding floors to the venue increment", "[util]") {
    using Catch::Approx;
    CHECK(nonkyc::round_down_to_tick(89964.009, 0.01) == Approx(89964.0));
    CHECK(nonkyc::round_down_to_tick(89963.99999999999, 0.01) == Approx(89964.0));
    CHECK(nonkyc::round_down_to_tick(101.239, 0.05) == Approx(101.2));
    CHECK(nonkyc::round_down_to_step(0.123456789, 0.0001) == Approx(0.1234));
    CHECK(nonkyc::round_down_to_step(5.0, 0.0) == Approx(5.0));

    CHECK(nonkyc::precision_from_increment(0.01) == 2);
    CHECK(nonkyc::precision_from_increment(0.00000001) == 8);
    CHECK(nonkyc::precision_from_increment(1.0) == 0);
    CHECK(nonkyc::format_decimal(89964.0, 2) == "89964.00");
    CHECK(nonkyc::format_decimal(0.001, 8) == "0.00100000");
}
