#pragma once

#include "grid/balance_tracker.hpp"
#include "grid/config.hpp"
#include "grid/exchange.hpp"
#include "grid/pricing.hpp"
#include "grid/state_store.hpp"
#include "nonkyc/errors.hpp"
#include "nonkyc/models.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace grid {

// Startup rebalance could not reach the target split. The message names the
// trade the operator has to make by hand.
class RebalanceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Venue-confirmed status change for one order, from the poller or the
// streaming "report" channel.
struct OrderUpdate {
    std::string order_id;
    std::string client_reference_id;
    nonkyc::OrderStatus status = nonkyc::OrderStatus::Unknown;
    double executed_quantity = 0.0;
    std::optional<double> average_price;
};

OrderUpdate order_update_from_order(const nonkyc::Order& order);

// Accepts a full {"method":"report","params":{...}} frame or its params.
// Throws nonkyc::ValidationError when no order id can be found.
OrderUpdate order_update_from_report(const nlohmann::json& message);

class PlacementResult {
public:
    enum class Kind { Placed, Skipped, Failed };

    static PlacementResult placed(nonkyc::Order order);
    static PlacementResult skipped(std::string reason);
    static PlacementResult failed(nonkyc::ErrorKind kind, std::string reason);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_placed() const noexcept { return kind_ == Kind::Placed; }
    [[nodiscard]] nonkyc::ErrorKind failure() const noexcept { return failure_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }
    [[nodiscard]] const std::optional<nonkyc::Order>& order() const noexcept { return order_; }

private:
    PlacementResult(Kind kind, nonkyc::ErrorKind failure, std::string reason, std::optional<nonkyc::Order> order);

    Kind kind_;
    nonkyc::ErrorKind failure_;
    std::string reason_;
    std::optional<nonkyc::Order> order_;
};

// Ladder state machine. Every public entry point takes the same mutex, so
// the poll loop and streaming callbacks never interleave mutations.
class LadderEngine {
public:
    LadderEngine(BotConfig config,
                 std::shared_ptr<ExchangeClient> exchange,
                 std::shared_ptr<BalanceTracker> balances,
                 std::shared_ptr<StateStore> store);

    LadderEngine(const LadderEngine&) = delete;
    LadderEngine& operator=(const LadderEngine&) = delete;

    // Validates spacing (throws nonkyc::ConfigurationError), then resumes
    // from the snapshot or seeds a fresh ladder around the venue mid. A fresh
    // live start may rebalance first and throws RebalanceError when it cannot.
    void start();

    std::vector<PlacementResult> seed(double reference_price);

    void on_order_update(const OrderUpdate& update);
    void on_stream_report(const nlohmann::json& message);

    // One reconciliation cycle. Returns false when a fetch failed.
    bool poll_once();

    // Polls until request_stop() or a fatal error, then saves once more.
    void run();
    void request_stop();

    // Stops the engine for good and persists the reason.
    void report_fatal(const std::string& reason);

    [[nodiscard]] EngineState state() const;
    [[nodiscard]] std::vector<TrackedOrder> open_orders() const;
    [[nodiscard]] std::vector<TrackedOrder> unresolved_placements() const;
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] bool is_fatal() const noexcept { return fatal_; }
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] double cumulative_sell_revenue() const;
    [[nodiscard]] double realized_net_profit() const;
    [[nodiscard]] std::optional<double> highest_sell_price() const;
    [[nodiscard]] std::optional<double> lowest_buy_price() const;
    [[nodiscard]] std::chrono::milliseconds current_fetch_backoff() const;

private:
    struct PlacementIntent {
        nonkyc::Side side = nonkyc::Side::Buy;
        double price = 0.0;
        std::optional<double> opposing_price;
        std::optional<double> cost_basis;
        const char* reason = "";
        // Base quantity carried over from a fill; otherwise sized from config.
        std::optional<double> quantity;
    };

    void validate_spacing(double reference_price) const;
    double level_price(double reference, nonkyc::Side side, int level) const;
    double step_up(double price) const;
    double step_down(double price) const;
    double order_quantity(double price) const;

    void resume_locked(const EngineState& snapshot);
    void restore_counters_locked(const EngineState& snapshot);
    std::vector<PlacementResult> seed_locked(double reference_price);
    void extend_buy_levels_locked();
    void refill_locked();
    void adopt_venue_orders_locked();
    void rebalance_startup_locked();
    std::optional<RebalanceNeed> measure_rebalance_locked(double& base_available, double& quote_available);
    void submit_rebalance_locked(const RebalanceNeed& need);

    PlacementResult place_locked(const PlacementIntent& intent);
    bool rung_occupied_locked(nonkyc::Side side, double price) const;
    int count_side_locked(nonkyc::Side side) const;

    void apply_update_locked(const OrderUpdate& update);
    void handle_fill_locked(const TrackedOrder& tracked, double quantity, double fill_price);
    bool resolve_unresolved_locked();
    void refresh_balances_locked();
    bool sync_order_statuses_locked();

    void fatal_locked(const std::string& reason);
    EngineState state_locked() const;
    void save_locked();
    std::string make_client_id(nonkyc::Side side) const;

    BotConfig bot_config_;
    const LadderConfig& config_;
    std::shared_ptr<ExchangeClient> exchange_;
    std::shared_ptr<BalanceTracker> balances_;
    std::shared_ptr<StateStore> store_;
    std::string base_asset_;
    std::string quote_asset_;
    int price_precision_;
    int quantity_precision_;

    mutable std::mutex mutex_;
    std::vector<TrackedOrder> orders_;
    std::vector<TrackedOrder> unresolved_;
    std::optional<double> reference_price_;
    std::optional<double> lowest_buy_price_;
    std::optional<double> highest_sell_price_;
    double cumulative_sell_revenue_ = 0.0;
    double realized_net_profit_ = 0.0;
    bool is_running_ = false;
    std::string last_error_;
    bool halted_buy_ = false;
    bool halted_sell_ = false;
    int fetch_failures_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_refill_;

    std::atomic<bool> fatal_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

} // namespace grid
