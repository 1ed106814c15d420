#include "grid/state_store.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using Catch::Approx;

namespace {

std::filesystem::path fresh_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

grid::TrackedOrder make_order(const std::string& id, nonkyc::Side side, double price) {
    grid::TrackedOrder tracked;
    tracked.order.order_id = id;
    tracked.order.client_reference_id = "ref-" + id;
    tracked.order.symbol = "BTC_USDT";
    tracked.order.side = side;
    tracked.order.price = price;
    tracked.order.quantity = 0.001;
    tracked.order.status = nonkyc::OrderStatus::Open;
    tracked.created_at_ms = 1700000000000;
    return tracked;
}

} // namespace

TEST_CASE("StateStore saves atomically and loads the snapshot back", "[state]") {
    const auto dir = fresh_dir("nonkyc_grid_state_roundtrip");
    const grid::StateStore store{dir / "nested" / "ladder_state.json"};

    CHECK_FALSE(store.load());

    grid::EngineState state;
    state.reference_price = 90000.0;
    state.lowest_buy_price = 84600.0;
    state.open_orders.push_back(make_order("b1", nonkyc::Side::Buy, 88200.0));
    auto sell = make_order("s1", nonkyc::Side::Sell, 89964.0);
    sell.cost_basis = 88200.0;
    state.open_orders.push_back(sell);
    state.unresolved_placements.push_back(make_order("", nonkyc::Side::Buy, 86436.0));
    state.cumulative_sell_revenue = 91.8;
    state.realized_net_profit = 1.25;
    state.is_running = true;
    state.config = {{"symbol", "BTC_USDT"}, {"api_key", "k"}, {"client", {{"api_secret", "s"}}}};

    store.save(state);

    CHECK(std::filesystem::exists(store.path()));
    CHECK_FALSE(std::filesystem::exists(dir / "nested" / "ladder_state.json.tmp"));

    const auto loaded = store.load();
    REQUIRE(loaded);
    REQUIRE(loaded->reference_price);
    CHECK(*loaded->reference_price == Approx(90000.0));
    CHECK_FALSE(loaded->highest_sell_price);
    REQUIRE(loaded->open_orders.size() == 2);
    CHECK(loaded->open_orders[0].order.order_id == "b1");
    CHECK(loaded->open_orders[0].order.side == nonkyc::Side::Buy);
    CHECK_FALSE(loaded->open_orders[0].cost_basis);
    CHECK(loaded->open_orders[1].order.status == nonkyc::OrderStatus::Open);
    REQUIRE(loaded->open_orders[1].cost_basis);
    CHECK(*loaded->open_orders[1].cost_basis == Approx(88200.0));
    REQUIRE(loaded->unresolved_placements.size() == 1);
    CHECK(loaded->unresolved_placements[0].order.client_reference_id == "ref-");
    CHECK(loaded->cumulative_sell_revenue == Approx(91.8));
    CHECK(loaded->realized_net_profit == Approx(1.25));
    CHECK(loaded->is_running);
    CHECK(loaded->updated_at_ms > 0);
    CHECK(loaded->config["symbol"] == "BTC_USDT");

    std::filesystem::remove_all(dir);
}

TEST_CASE("StateStore never writes credentials", "[state]") {
    const auto dir = fresh_dir("nonkyc_grid_state_redaction");
    const grid::StateStore store{dir / "state.json"};

    grid::EngineState state;
    state.config = {{"symbol", "BTC_USDT"}, {"api_key", "AKIA-visible"}, {"api_secret", "shh-secret"}};
    store.save(state);

    const auto text = read_file(store.path());
    CHECK(text.find("api_key") == std::string::npos);
    CHECK(text.find("api_secret") == std::string::npos);
    CHECK(text.find("shh-secret") == std::string::npos);
    CHECK(text.find("\"cumulative_sell_revenue_kind\": \"gross\"") != std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST_CASE("StateStore treats a corrupt snapshot as absent", "[state]") {
    const auto dir = fresh_dir("nonkyc_grid_state_corrupt");
    std::filesystem::create_directories(dir);
    const grid::StateStore store{dir / "state.json"};

    {
        std::ofstream out(store.path());
        out << "{\"open_orders\": [";
    }
    CHECK_FALSE(store.load());

    {
        std::ofstream out(store.path());
        out << R"({"open_orders": {"not": "a list"}})";
    }
    CHECK_FALSE(store.load());

    store.save(grid::EngineState{});
    CHECK(store.load());

    std::filesystem::remove_all(dir);
}

TEST_CASE("StateStore requires a path", "[state]") {
    CHECK_THROWS_AS(grid::StateStore{""}, std::invalid_argument);
}
