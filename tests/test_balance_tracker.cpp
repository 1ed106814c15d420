#include "grid/balance_tracker.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;

namespace {

std::vector<nonkyc::Balance> usdt(double available, double held = 0.0) {
    return {nonkyc::Balance{"USDT", available, held}};
}

} // namespace

TEST_CASE("BalanceTracker adds pending adjustments to the venue view", "[balances]") {
    grid::BalanceTracker tracker;
    CHECK_FALSE(tracker.has_venue_snapshot());

    tracker.reconcile(usdt(1000.0, 5.0));
    REQUIRE(tracker.has_venue_snapshot());

    tracker.apply_pending("USDT", -90.0, "GBB1");
    tracker.apply_pending("USDT", 0.0, "ignored");

    CHECK(tracker.get("USDT") == Approx(910.0));
    CHECK(tracker.venue_available("USDT") == Approx(1000.0));
    CHECK(tracker.pending_adjustment("USDT") == Approx(-90.0));
    CHECK(tracker.pending_entries().size() == 1);
    CHECK(tracker.get("BTC") == 0.0);

    const auto rows = tracker.snapshot();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].asset == "USDT");
    CHECK(rows[0].venue_held == Approx(5.0));
    CHECK(rows[0].available == Approx(910.0));
}

TEST_CASE("BalanceTracker never counts a reflected order twice", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile(usdt(1000.0));
    tracker.apply_pending("USDT", -90.0, "GBB1");

    tracker.reconcile(usdt(910.0));
    CHECK(tracker.pending_adjustment("USDT") == 0.0);
    CHECK(tracker.get("USDT") == Approx(910.0));

    tracker.reconcile(usdt(910.0));
    CHECK(tracker.get("USDT") == Approx(910.0));
    CHECK(tracker.pending_entries().empty());
}

TEST_CASE("BalanceTracker clears only the prefix the venue reflects", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile(usdt(1000.0));
    tracker.apply_pending("USDT", -90.0, "GBB1");
    tracker.apply_pending("USDT", -88.0, "GBB2");

    tracker.reconcile(usdt(910.0));
    auto pending = tracker.pending_entries();
    REQUIRE(pending.size() == 1);
    CHECK(pending[0].reference == "GBB2");
    CHECK(pending[0].missed_cycles == 1);
    CHECK(tracker.get("USDT") == Approx(822.0));

    tracker.reconcile(usdt(822.0));
    CHECK(tracker.pending_entries().empty());
    CHECK(tracker.get("USDT") == Approx(822.0));
}

TEST_CASE("BalanceTracker drops entries the venue never reflects", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile(usdt(1000.0));
    tracker.apply_pending("USDT", -90.0, "GBB1");

    tracker.reconcile(usdt(1000.0));
    CHECK(tracker.pending_entries().size() == 1);
    CHECK(tracker.get("USDT") == Approx(910.0));

    tracker.reconcile(usdt(1000.0));
    CHECK(tracker.pending_entries().empty());
    CHECK(tracker.get("USDT") == Approx(1000.0));
}

TEST_CASE("BalanceTracker releases entries for cancelled orders", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile({nonkyc::Balance{"USDT", 1000.0, 0.0}, nonkyc::Balance{"BTC", 1.0, 0.0}});
    tracker.apply_pending("USDT", -90.0, "GBB1");
    tracker.apply_pending("BTC", -0.001, "GBS1");
    tracker.apply_pending("USDT", 91.0, "fill:GBS1");

    CHECK(tracker.release("GBB1") == 1);
    CHECK(tracker.release("GBB1") == 0);
    CHECK(tracker.get("USDT") == Approx(1091.0));
    CHECK(tracker.get("BTC") == Approx(0.999));
    CHECK(tracker.release("GBS1") == 1);
    CHECK(tracker.get("BTC") == Approx(1.0));
}

TEST_CASE("BalanceTracker takes the first fetch as truth", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.apply_pending("USDT", -90.0, "GBB1");
    CHECK(tracker.get("USDT") == Approx(-90.0));

    tracker.reconcile(usdt(500.0));
    CHECK(tracker.pending_entries().empty());
    CHECK(tracker.get("USDT") == Approx(500.0));
}

TEST_CASE("BalanceTracker treats an asset missing from a fetch as zero", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile({nonkyc::Balance{"BTC", 0.002, 0.0}});
    tracker.apply_pending("BTC", -0.002, "GBS1");

    tracker.reconcile({});
    CHECK(tracker.pending_entries().empty());
    CHECK(tracker.get("BTC") == 0.0);
    CHECK(tracker.venue_available("BTC") == 0.0);
}

TEST_CASE("BalanceTracker recognises a fill the venue booked before it was recorded", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile(usdt(1000.0));

    tracker.reconcile(usdt(1091.0));
    CHECK(tracker.unexplained_movement("USDT") == Approx(91.0));

    tracker.apply_pending("USDT", 91.0, "fill:GBS1");
    CHECK(tracker.pending_entries().empty());
    CHECK(tracker.get("USDT") == Approx(1091.0));
    CHECK(tracker.unexplained_movement("USDT") == 0.0);

    tracker.apply_pending("USDT", -89.0, "GBB2");
    tracker.reconcile(usdt(1002.0));
    CHECK(tracker.pending_entries().empty());
    CHECK(tracker.get("USDT") == Approx(1002.0));
}

TEST_CASE("BalanceTracker matches late entries against the previous fetch", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile(usdt(1000.0));
    tracker.apply_pending("USDT", -90.0, "GBB1");

    // The buy lands together with a sell fill nobody has reported yet.
    tracker.reconcile(usdt(1001.0));
    REQUIRE(tracker.pending_entries().size() == 1);
    CHECK(tracker.unexplained_movement("USDT") == Approx(1.0));

    tracker.apply_pending("USDT", 91.0, "fill:GBS1");
    tracker.apply_pending("USDT", -89.0, "GBB2");
    CHECK(tracker.pending_entries().size() == 3);

    tracker.reconcile(usdt(912.0));
    CHECK(tracker.pending_entries().empty());
    CHECK(tracker.get("USDT") == Approx(912.0));
    CHECK(tracker.unexplained_movement("USDT") == 0.0);
}

TEST_CASE("BalanceTracker only carries unexplained movement for one fetch", "[balances]") {
    grid::BalanceTracker tracker;
    tracker.reconcile(usdt(1000.0));
    tracker.reconcile(usdt(1091.0));
    tracker.reconcile(usdt(1091.0));
    CHECK(tracker.unexplained_movement("USDT") == 0.0);

    tracker.apply_pending("USDT", 91.0, "fill:GBS1");
    CHECK(tracker.pending_entries().size() == 1);
    CHECK(tracker.get("USDT") == Approx(1182.0));
}
