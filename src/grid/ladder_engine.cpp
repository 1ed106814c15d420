#include "grid/ladder_engine.hpp"
#include "grid/pricing.hpp"
#include "nonkyc/util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <thread>
#include <utility>

namespace grid {
namespace {

constexpr double kBalanceEpsilon = 1e-12;
constexpr const char* kDryRunPrefix = "dryrun-";

std::atomic<std::uint64_t> g_order_counter{0};

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool same_price(double lhs, double rhs, double tick) {
    const double tolerance = std::max(tick / 2.0, std::fabs(lhs) * 1e-9);
    return std::fabs(lhs - rhs) <= tolerance;
}

bool matches(const TrackedOrder& tracked, const OrderUpdate& update) {
    const auto& order = tracked.order;
    if (!update.order_id.empty() && order.order_id == update.order_id) {
        return true;
    }
    return !update.client_reference_id.empty() && order.client_reference_id == update.client_reference_id;
}

bool is_dry_run_order(const nonkyc::Order& order) {
    return order.order_id.rfind(kDryRunPrefix, 0) == 0;
}

std::string side_label(nonkyc::Side side) {
    return nonkyc::to_upper_copy(nonkyc::to_string(side));
}

} // namespace

OrderUpdate order_update_from_order(const nonkyc::Order& order) {
    return OrderUpdate{order.order_id, order.client_reference_id, order.status, order.executed_quantity,
                       order.average_price};
}

OrderUpdate order_update_from_report(const nlohmann::json& message) {
    const nlohmann::json* payload = &message;
    if (message.is_object() && message.contains("params")) {
        payload = &message["params"];
    }
    if (payload->is_array() && !payload->empty()) {
        payload = &payload->front();
    }
    if (!payload->is_object()) {
        throw nonkyc::ValidationError("Report frame has no order object: " + message.dump());
    }
    auto update = order_update_from_order(nonkyc::parse_order(*payload));
    if (update.order_id.empty() && update.client_reference_id.empty()) {
        throw nonkyc::ValidationError("Report frame carries no order id: " + payload->dump());
    }
    return update;
}

PlacementResult::PlacementResult(Kind kind, nonkyc::ErrorKind failure, std::string reason,
                                 std::optional<nonkyc::Order> order)
    : kind_(kind), failure_(failure), reason_(std::move(reason)), order_(std::move(order)) {}

PlacementResult PlacementResult::placed(nonkyc::Order order) {
    return PlacementResult(Kind::Placed, nonkyc::ErrorKind::Validation, {}, std::move(order));
}

PlacementResult PlacementResult::skipped(std::string reason) {
    return PlacementResult(Kind::Skipped, nonkyc::ErrorKind::Validation, std::move(reason), std::nullopt);
}

PlacementResult PlacementResult::failed(nonkyc::ErrorKind kind, std::string reason) {
    return PlacementResult(Kind::Failed, kind, std::move(reason), std::nullopt);
}

LadderEngine::LadderEngine(BotConfig config,
                           std::shared_ptr<ExchangeClient> exchange,
                           std::shared_ptr<BalanceTracker> balances,
                           std::shared_ptr<StateStore> store)
    : bot_config_(std::move(config)),
      config_(bot_config_.ladder),
      exchange_(std::move(exchange)),
      balances_(std::move(balances)),
      store_(std::move(store)),
      price_precision_(nonkyc::precision_from_increment(config_.tick_size)),
      quantity_precision_(nonkyc::precision_from_increment(config_.step_size)) {
    if (!exchange_ || !balances_ || !store_) {
        throw nonkyc::ConfigurationError("LadderEngine requires an exchange, a balance tracker and a state store");
    }
    const auto parts = nonkyc::split_symbol(config_.symbol);
    base_asset_ = parts.base;
    quote_asset_ = parts.quote;
}

void LadderEngine::validate_spacing(double reference_price) const {
    const double min_step = min_profitable_step(config_.fee_rate, config_.safety_buffer);
    double step = config_.step_pct;
    if (config_.step_mode == StepMode::Abs) {
        if (reference_price <= 0.0) {
            return;
        }
        step = config_.step_abs / reference_price;
    }
    if (step < min_step) {
        std::ostringstream oss;
        oss << "Configured step " << std::setprecision(6) << step * 100.0
            << "% is below the minimum profitable step " << min_step * 100.0
            << "% for fee_rate=" << config_.fee_rate << " safety_buffer=" << config_.safety_buffer;
        throw nonkyc::ConfigurationError(oss.str());
    }
    std::cout << "[Ladder] Step " << step * 100.0 << "% clears minimum profitable step "
              << min_step * 100.0 << "%" << std::endl;
}

double LadderEngine::level_price(double reference, nonkyc::Side side, int level) const {
    const double sign = side == nonkyc::Side::Buy ? -1.0 : 1.0;
    if (config_.step_mode == StepMode::Abs) {
        return reference + sign * config_.step_abs * level;
    }
    return reference * (1.0 + sign * config_.step_pct * level);
}

double LadderEngine::step_up(double price) const {
    return config_.step_mode == StepMode::Abs ? price + config_.step_abs : price * (1.0 + config_.step_pct);
}

double LadderEngine::step_down(double price) const {
    return config_.step_mode == StepMode::Abs ? price - config_.step_abs : price * (1.0 - config_.step_pct);
}

double LadderEngine::order_quantity(double price) const {
    if (config_.sizing_mode == SizingMode::Quote) {
        return price > 0.0 ? config_.quote_per_order / price : 0.0;
    }
    return config_.base_order_size;
}

std::string LadderEngine::make_client_id(nonkyc::Side side) const {
    std::ostringstream oss;
    oss << 'G';
    if (!base_asset_.empty()) {
        oss << base_asset_.front();
    }
    const char tag = side == nonkyc::Side::Buy ? 'B' : 'S';
    const auto seq = g_order_counter.fetch_add(1, std::memory_order_relaxed) % 10000;
    oss << tag << now_ms() << std::setw(4) << std::setfill('0') << seq;
    std::string id = oss.str();
    if (id.size() > 32) {
        id.resize(32);
    }
    return id;
}

void LadderEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.step_mode == StepMode::Pct) {
        validate_spacing(0.0);
    }

    std::cout << "[Ladder] Starting " << to_string(config_.variant) << " ladder on " << config_.symbol
              << " in " << to_string(config_.mode) << " mode" << std::endl;

    try {
        const auto snapshot = store_->load();
        if (snapshot && (!snapshot->open_orders.empty() || !snapshot->unresolved_placements.empty())) {
            if (config_.step_mode == StepMode::Abs && snapshot->reference_price) {
                validate_spacing(*snapshot->reference_price);
            }
            resume_locked(*snapshot);
        } else {
            if (snapshot) {
                restore_counters_locked(*snapshot);
            }
            if (config_.startup_cancel_all && config_.mode == RunMode::Live) {
                const bool ok = exchange_->cancel_all(config_.symbol);
                std::cout << "[Ladder] Startup cancel-all " << (ok ? "accepted" : "reported failure") << std::endl;
            }
            if (config_.startup_rebalance) {
                if (config_.mode == RunMode::Live) {
                    rebalance_startup_locked();
                } else {
                    std::cout << "[Ladder] Startup rebalance skipped in " << to_string(config_.mode) << " mode"
                              << std::endl;
                }
            }
            if (config_.mode == RunMode::Live) {
                adopt_venue_orders_locked();
            }
            refresh_balances_locked();
            const double mid = exchange_->get_mid_price(config_.symbol);
            if (config_.step_mode == StepMode::Abs) {
                validate_spacing(mid);
            }
            seed_locked(mid);
        }
        is_running_ = true;
        last_error_.clear();
        save_locked();
    } catch (const nonkyc::AuthenticationError& ex) {
        fatal_locked(std::string("Authentication failed: ") + ex.what());
        throw;
    } catch (const RebalanceError& ex) {
        fatal_locked(ex.what());
        throw;
    }
}

std::optional<RebalanceNeed> LadderEngine::measure_rebalance_locked(double& base_available,
                                                                   double& quote_available) {
    base_available = 0.0;
    quote_available = 0.0;
    for (const auto& balance : exchange_->get_balances()) {
        if (balance.asset == base_asset_) {
            base_available = balance.available;
        } else if (balance.asset == quote_asset_) {
            quote_available = balance.available;
        }
    }
    const double mid = exchange_->get_mid_price(config_.symbol);
    auto need = rebalance_need(base_available, quote_available, mid, config_.rebalance_target_base_pct);
    if (!need) {
        return std::nullopt;
    }
    need->quantity = nonkyc::round_down_to_step(need->quantity, config_.step_size);
    if (need->quantity <= 0.0 || need->quantity * mid < config_.min_notional_quote) {
        std::cout << "[Ladder] Rebalance residual " << need->quantity << ' ' << base_asset_
                  << " is below the minimum order; treating as balanced" << std::endl;
        return std::nullopt;
    }
    return need;
}

void LadderEngine::rebalance_startup_locked() {
    const int attempts = std::max(1, config_.rebalance_max_attempts);
    double base_available = 0.0;
    double quote_available = 0.0;
    auto need = measure_rebalance_locked(base_available, quote_available);
    if (!need) {
        std::cout << "[Ladder] Balances already near " << config_.rebalance_target_base_pct * 100.0
                  << "% " << base_asset_ << "; no startup rebalance" << std::endl;
        return;
    }

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::cout << "[Ladder] Startup rebalance " << attempt << '/' << attempts << ": "
                  << side_label(need->side) << ' ' << nonkyc::format_decimal(need->quantity, quantity_precision_)
                  << ' ' << base_asset_ << std::endl;
        submit_rebalance_locked(*need);
        need = measure_rebalance_locked(base_available, quote_available);
        if (!need) {
            std::cout << "[Ladder] Startup rebalance complete" << std::endl;
            return;
        }
    }

    std::ostringstream oss;
    oss << "Startup rebalance failed after " << attempts << " attempts; balances: " << base_asset_
        << " available=" << base_available << ", " << quote_asset_ << " available=" << quote_available
        << ". Manual action: " << nonkyc::to_string(need->side) << ' '
        << nonkyc::format_decimal(need->quantity, quantity_precision_) << ' ' << base_asset_ << " for "
        << quote_asset_;
    throw RebalanceError(oss.str());
}

void LadderEngine::submit_rebalance_locked(const RebalanceNeed& need) {
    nonkyc::OrderRequest request;
    request.symbol = config_.symbol;
    request.side = need.side;
    request.type = nonkyc::OrderType::Market;
    request.quantity = nonkyc::format_decimal(need.quantity, quantity_precision_);
    request.client_reference_id = make_client_id(need.side);

    try {
        const auto placed = exchange_->place_market(request);
        std::cout << "[Ladder] Market rebalance " << side_label(need.side) << ' ' << request.quantity
                  << " accepted id=" << placed.order_id << std::endl;
        return;
    } catch (const nonkyc::AuthenticationError&) {
        throw;
    } catch (const nonkyc::ApiError& ex) {
        std::cerr << "[Ladder] Market rebalance failed; falling back to limit order: " << ex.what() << std::endl;
    }

    try {
        const auto ticker = exchange_->get_ticker(config_.symbol);
        const auto touch = need.side == nonkyc::Side::Buy ? ticker.ask : ticker.bid;
        const auto reference = touch ? touch : ticker.last_price;
        if (!reference || *reference <= 0.0) {
            std::cerr << "[Ladder] No usable top of book for the limit rebalance" << std::endl;
            return;
        }
        const double slippage = need.side == nonkyc::Side::Buy ? 1.0 + config_.rebalance_slippage_pct
                                                               : 1.0 - config_.rebalance_slippage_pct;
        request.type = nonkyc::OrderType::Limit;
        request.price = nonkyc::format_decimal(nonkyc::round_down_to_tick(*reference * slippage, config_.tick_size),
                                               price_precision_);
        request.client_reference_id = make_client_id(need.side);

        const auto placed = exchange_->place_limit(request);
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
        if (exchange_->get_order(placed.order_id).status != nonkyc::OrderStatus::Filled) {
            exchange_->cancel_order(placed.order_id);
            std::cerr << "[Ladder] Limit rebalance @ " << request.price << " did not fill; cancelled" << std::endl;
            return;
        }
        std::cout << "[Ladder] Limit rebalance " << side_label(need.side) << ' ' << request.quantity << " @ "
                  << request.price << " filled" << std::endl;
    } catch (const nonkyc::AuthenticationError&) {
        throw;
    } catch (const nonkyc::ApiError& ex) {
        std::cerr << "[Ladder] Limit rebalance attempt failed: " << ex.what() << std::endl;
    }
}

void LadderEngine::restore_counters_locked(const EngineState& snapshot) {
    cumulative_sell_revenue_ = snapshot.cumulative_sell_revenue;
    realized_net_profit_ = snapshot.realized_net_profit;
}

void LadderEngine::resume_locked(const EngineState& snapshot) {
    restore_counters_locked(snapshot);
    orders_ = snapshot.open_orders;
    unresolved_ = snapshot.unresolved_placements;
    reference_price_ = snapshot.reference_price;
    lowest_buy_price_ = config_.lowest_buy_price ? config_.lowest_buy_price : snapshot.lowest_buy_price;
    highest_sell_price_ = snapshot.highest_sell_price;

    std::cout << "[Ladder] Resuming with " << orders_.size() << " open orders";
    if (!unresolved_.empty()) {
        std::cout << " and " << unresolved_.size() << " unresolved placements";
    }
    std::cout << "; gross sell revenue " << cumulative_sell_revenue_ << ' ' << quote_asset_ << std::endl;

    try {
        refresh_balances_locked();
    } catch (const nonkyc::AuthenticationError&) {
        throw;
    } catch (const nonkyc::ApiError& ex) {
        std::cerr << "[Ladder] Balance refresh on resume failed: " << ex.what() << std::endl;
    }

    if (config_.extend_buy_levels_on_restart) {
        extend_buy_levels_locked();
    }
}

void LadderEngine::adopt_venue_orders_locked() {
    const auto open = exchange_->list_open_orders(config_.symbol);
    std::size_t adopted = 0;
    for (const auto& order : open) {
        const OrderUpdate candidate{order.order_id, order.client_reference_id, order.status, 0.0};
        const bool known = std::any_of(orders_.begin(), orders_.end(),
                                       [&](const TrackedOrder& tracked) { return matches(tracked, candidate); });
        if (known) {
            continue;
        }
        TrackedOrder tracked;
        tracked.order = order;
        if (tracked.order.symbol.empty()) {
            tracked.order.symbol = config_.symbol;
        }
        tracked.created_at_ms = now_ms();
        orders_.push_back(std::move(tracked));
        ++adopted;
    }
    if (adopted > 0) {
        std::cout << "[Ladder] Adopted " << adopted << " open orders already on the venue" << std::endl;
    }
}

std::vector<PlacementResult> LadderEngine::seed(double reference_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return seed_locked(reference_price);
    } catch (const nonkyc::AuthenticationError& ex) {
        fatal_locked(std::string("Authentication failed: ") + ex.what());
        return {};
    }
}

std::vector<PlacementResult> LadderEngine::seed_locked(double reference_price) {
    reference_price_ = reference_price;
    last_refill_ = std::chrono::steady_clock::now();
    std::vector<PlacementResult> results;

    for (int level = 1; level <= config_.buy_levels; ++level) {
        const double price = level_price(reference_price, nonkyc::Side::Buy, level);
        if (price <= 0.0) {
            break;
        }
        if (config_.variant == LadderVariant::Unbounded && config_.lowest_buy_price
            && price < *config_.lowest_buy_price) {
            std::cout << "[Ladder] Buy level " << level << " at " << price << " is below the floor "
                      << *config_.lowest_buy_price << "; stopping" << std::endl;
            break;
        }
        results.push_back(place_locked({nonkyc::Side::Buy, price, step_up(price), std::nullopt, "seed"}));
    }

    for (int level = 1; level <= config_.sell_levels; ++level) {
        const double price = level_price(reference_price, nonkyc::Side::Sell, level);
        results.push_back(place_locked({nonkyc::Side::Sell, price, step_down(price), std::nullopt, "seed"}));
    }

    if (config_.lowest_buy_price) {
        lowest_buy_price_ = config_.lowest_buy_price;
    } else {
        for (const auto& tracked : orders_) {
            if (tracked.order.side == nonkyc::Side::Buy
                && (!lowest_buy_price_ || tracked.order.price < *lowest_buy_price_)) {
                lowest_buy_price_ = tracked.order.price;
            }
        }
    }

    const auto placed = std::count_if(results.begin(), results.end(),
                                      [](const PlacementResult& result) { return result.is_placed(); });
    std::cout << "[Ladder] Seeded around " << nonkyc::format_decimal(reference_price, price_precision_)
              << ": " << placed << '/' << results.size() << " orders placed" << std::endl;
    return results;
}

void LadderEngine::extend_buy_levels_locked() {
    double lowest = 0.0;
    for (const auto& tracked : orders_) {
        if (tracked.order.side == nonkyc::Side::Buy && (lowest == 0.0 || tracked.order.price < lowest)) {
            lowest = tracked.order.price;
        }
    }
    if (lowest == 0.0) {
        if (!reference_price_) {
            std::cout << "[Ladder] No buy rung or reference price to extend from" << std::endl;
            return;
        }
        lowest = *reference_price_;
    }

    int added = 0;
    double price = step_down(lowest);
    while (count_side_locked(nonkyc::Side::Buy) < config_.buy_levels && price > 0.0) {
        if (config_.lowest_buy_price && price < *config_.lowest_buy_price) {
            break;
        }
        const auto result = place_locked({nonkyc::Side::Buy, price, step_up(price), std::nullopt, "extend buys"});
        if (result.is_placed()) {
            ++added;
            if (!config_.lowest_buy_price && (!lowest_buy_price_ || result.order()->price < *lowest_buy_price_)) {
                lowest_buy_price_ = result.order()->price;
            }
        } else if (result.kind() == PlacementResult::Kind::Failed) {
            break;
        }
        if ((halted_buy_ && !result.is_placed()) || config_.mode == RunMode::Monitor) {
            break;
        }
        price = step_down(price);
    }
    std::cout << "[Ladder] Extended buy side by " << added << " rungs below "
              << nonkyc::format_decimal(lowest, price_precision_) << std::endl;
}

int LadderEngine::count_side_locked(nonkyc::Side side) const {
    const auto on_side = [side](const TrackedOrder& tracked) { return tracked.order.side == side; };
    return static_cast<int>(std::count_if(orders_.begin(), orders_.end(), on_side)
                            + std::count_if(unresolved_.begin(), unresolved_.end(), on_side));
}

bool LadderEngine::rung_occupied_locked(nonkyc::Side side, double price) const {
    const auto at_rung = [&](const TrackedOrder& tracked) {
        return tracked.order.side == side && same_price(tracked.order.price, price, config_.tick_size);
    };
    return std::any_of(orders_.begin(), orders_.end(), at_rung)
           || std::any_of(unresolved_.begin(), unresolved_.end(), at_rung);
}

PlacementResult LadderEngine::place_locked(const PlacementIntent& intent) {
    const auto side = intent.side;
    const auto label = side_label(side);

    if (config_.mode == RunMode::Monitor) {
        std::cout << "[Ladder] MONITOR would place " << label << " @ "
                  << nonkyc::format_decimal(intent.price, price_precision_) << " (" << intent.reason << ")"
                  << std::endl;
        return PlacementResult::skipped("monitor mode");
    }
    if ((side == nonkyc::Side::Buy && halted_buy_) || (side == nonkyc::Side::Sell && halted_sell_)) {
        return PlacementResult::skipped(label + " placements halted for this cycle");
    }

    const double price = nonkyc::round_down_to_tick(intent.price, config_.tick_size);
    const double sized = intent.quantity ? *intent.quantity : order_quantity(price);
    const double quantity = nonkyc::round_down_to_step(sized, config_.step_size);

    if (rung_occupied_locked(side, price)) {
        std::cout << "[Ladder] Skip " << label << " @ " << nonkyc::format_decimal(price, price_precision_)
                  << ": rung already occupied" << std::endl;
        return PlacementResult::skipped("rung occupied");
    }

    OrderCheck check;
    check.side = side;
    check.price = price;
    check.quantity = quantity;
    check.opposing_price = intent.opposing_price;
    check.fee_rate = config_.fee_rate;
    check.safety_buffer = config_.safety_buffer;
    check.min_notional = config_.min_notional_quote;
    if (const auto reason = check_order(check)) {
        std::cout << "[Ladder] Skip " << label << " @ " << nonkyc::format_decimal(price, price_precision_)
                  << ": " << *reason << std::endl;
        return PlacementResult::skipped(*reason);
    }

    const auto& asset = side == nonkyc::Side::Buy ? quote_asset_ : base_asset_;
    const double required = side == nonkyc::Side::Buy ? price * quantity : quantity;
    if (balances_->has_venue_snapshot()) {
        const double available = balances_->get(asset);
        if (available + kBalanceEpsilon < required) {
            (side == nonkyc::Side::Buy ? halted_buy_ : halted_sell_) = true;
            std::ostringstream oss;
            oss << "insufficient " << asset << ": have " << available << ", need " << required;
            std::cerr << "[Ladder] " << label << " @ " << nonkyc::format_decimal(price, price_precision_)
                      << " " << oss.str() << "; halting " << label
                      << " placements this cycle, rebalance needed" << std::endl;
            return PlacementResult::skipped(oss.str());
        }
    }

    nonkyc::OrderRequest request;
    request.symbol = config_.symbol;
    request.side = side;
    request.price = nonkyc::format_decimal(price, price_precision_);
    request.quantity = nonkyc::format_decimal(quantity, quantity_precision_);
    request.client_reference_id = make_client_id(side);

    TrackedOrder tracked;
    tracked.cost_basis = intent.cost_basis;
    tracked.created_at_ms = now_ms();
    tracked.order.client_reference_id = request.client_reference_id;
    tracked.order.symbol = config_.symbol;
    tracked.order.side = side;
    tracked.order.price = price;
    tracked.order.quantity = quantity;
    tracked.order.status = nonkyc::OrderStatus::Open;

    if (config_.mode == RunMode::DryRun) {
        tracked.order.order_id = kDryRunPrefix + request.client_reference_id;
    } else {
        try {
            const auto placed = exchange_->place_limit(request);
            tracked.order.order_id = placed.order_id;
            if (placed.status != nonkyc::OrderStatus::Unknown) {
                tracked.order.status = placed.status;
            }
            tracked.order.executed_quantity = placed.executed_quantity;
        } catch (const nonkyc::TransientApiError& ex) {
            tracked.order.status = nonkyc::OrderStatus::Unknown;
            unresolved_.push_back(tracked);
            balances_->apply_pending(asset, -required, request.client_reference_id);
            std::cerr << "[Ladder] " << label << " " << request.quantity << " @ " << request.price
                      << " outcome unknown (" << request.client_reference_id << "): " << ex.what()
                      << "; resolving next cycle" << std::endl;
            return PlacementResult::failed(nonkyc::ErrorKind::Transient, ex.what());
        } catch (const nonkyc::RateLimitError& ex) {
            std::cerr << "[Ladder] " << label << " @ " << request.price << " rate limited: " << ex.what() << std::endl;
            return PlacementResult::failed(nonkyc::ErrorKind::RateLimit, ex.what());
        } catch (const nonkyc::ValidationError& ex) {
            std::cerr << "[Ladder] " << label << " @ " << request.price << " rejected: " << ex.what() << std::endl;
            return PlacementResult::failed(nonkyc::ErrorKind::Validation, ex.what());
        }
    }

    balances_->apply_pending(asset, -required, request.client_reference_id);
    if (side == nonkyc::Side::Sell && (!highest_sell_price_ || price > *highest_sell_price_)) {
        highest_sell_price_ = price;
    }
    orders_.push_back(tracked);
    std::cout << "[Ladder] " << (config_.mode == RunMode::DryRun ? "DRY-RUN " : "") << "Placed " << label
              << ' ' << request.quantity << " @ " << request.price << " (" << intent.reason << ") id="
              << tracked.order.order_id << std::endl;
    return PlacementResult::placed(tracked.order);
}

void LadderEngine::on_order_update(const OrderUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fatal_) {
        return;
    }
    try {
        apply_update_locked(update);
    } catch (const nonkyc::AuthenticationError& ex) {
        fatal_locked(std::string("Authentication failed: ") + ex.what());
        return;
    }
    save_locked();
}

void LadderEngine::on_stream_report(const nlohmann::json& message) {
    OrderUpdate update;
    try {
        update = order_update_from_report(message);
    } catch (const nonkyc::ApiError& ex) {
        std::cerr << "[Ladder] Ignoring report: " << ex.what() << std::endl;
        return;
    }
    on_order_update(update);
}

void LadderEngine::apply_update_locked(const OrderUpdate& update) {
    auto it = std::find_if(orders_.begin(), orders_.end(),
                           [&](const TrackedOrder& tracked) { return matches(tracked, update); });
    if (it == orders_.end()) {
        const auto pending = std::find_if(unresolved_.begin(), unresolved_.end(),
                                          [&](const TrackedOrder& tracked) { return matches(tracked, update); });
        if (pending == unresolved_.end()) {
            std::cout << "[Ladder] Update for untracked order " << update.order_id << " ignored" << std::endl;
            return;
        }
        auto promoted = *pending;
        unresolved_.erase(pending);
        if (promoted.order.order_id.empty()) {
            promoted.order.order_id = update.order_id;
        }
        std::cout << "[Ladder] Unresolved placement " << promoted.order.client_reference_id
                  << " confirmed by venue update" << std::endl;
        orders_.push_back(std::move(promoted));
        it = std::prev(orders_.end());
    }

    switch (update.status) {
        case nonkyc::OrderStatus::Filled: {
            TrackedOrder tracked = *it;
            orders_.erase(it);
            tracked.order.status = nonkyc::OrderStatus::Filled;
            const double quantity = update.executed_quantity > 0.0 ? update.executed_quantity : tracked.order.quantity;
            const double fill_price = update.average_price && *update.average_price > 0.0 ? *update.average_price
                                                                                          : tracked.order.price;
            tracked.order.executed_quantity = quantity;
            handle_fill_locked(tracked, quantity, fill_price);
            break;
        }
        case nonkyc::OrderStatus::Cancelled:
        case nonkyc::OrderStatus::Rejected:
        case nonkyc::OrderStatus::Expired: {
            const TrackedOrder tracked = *it;
            orders_.erase(it);
            const auto released = balances_->release(tracked.order.client_reference_id);
            std::cout << "[Ladder] " << side_label(tracked.order.side) << ' ' << tracked.order.order_id << " @ "
                      << nonkyc::format_decimal(tracked.order.price, price_precision_) << ' '
                      << nonkyc::to_string(update.status) << "; level emptied, " << released
                      << " pending entries released" << std::endl;
            break;
        }
        case nonkyc::OrderStatus::PartiallyFilled:
            it->order.status = nonkyc::OrderStatus::PartiallyFilled;
            it->order.executed_quantity = std::max(it->order.executed_quantity, update.executed_quantity);
            break;
        case nonkyc::OrderStatus::Open:
            it->order.status = nonkyc::OrderStatus::Open;
            break;
        case nonkyc::OrderStatus::Unknown:
            std::cerr << "[Ladder] Unrecognized status for " << update.order_id << "; keeping order" << std::endl;
            break;
    }
}

void LadderEngine::handle_fill_locked(const TrackedOrder& tracked, double quantity, double fill_price) {
    // Counter-orders stay on the rung grid; revenue uses the executed price.
    const double price = tracked.order.price;
    const auto& ref = tracked.order.client_reference_id;
    std::cout << "[Ladder] FILL " << side_label(tracked.order.side) << ' '
              << nonkyc::format_decimal(quantity, quantity_precision_) << " @ "
              << nonkyc::format_decimal(fill_price, price_precision_) << " id=" << tracked.order.order_id << std::endl;

    if (tracked.order.side == nonkyc::Side::Buy) {
        balances_->apply_pending(base_asset_, quantity, "fill:" + ref);
        place_locked({nonkyc::Side::Sell, step_up(price), price, fill_price, "buy filled", quantity});
        return;
    }

    const double proceeds = fill_price * quantity;
    cumulative_sell_revenue_ += proceeds;
    if (tracked.cost_basis) {
        realized_net_profit_ += round_trip_net(*tracked.cost_basis, fill_price, quantity, config_.fee_rate);
    }
    balances_->apply_pending(quote_asset_, proceeds * (1.0 - config_.fee_rate), "fill:" + ref);
    std::cout << "[Ladder] Gross sell revenue " << nonkyc::format_decimal(cumulative_sell_revenue_, 8)
              << ' ' << quote_asset_ << ", realized net " << nonkyc::format_decimal(realized_net_profit_, 8)
              << std::endl;

    if (config_.variant == LadderVariant::Bounded) {
        place_locked({nonkyc::Side::Buy, step_down(price), price, std::nullopt, "sell filled", quantity});
        place_locked({nonkyc::Side::Sell, step_up(price), std::nullopt, std::nullopt, "sell filled"});
        return;
    }

    const double anchor = std::max(highest_sell_price_.value_or(price), price);
    const auto extension = place_locked({nonkyc::Side::Sell, step_up(anchor), std::nullopt, std::nullopt,
                                         "extend sells"});
    if (extension.is_placed()) {
        highest_sell_price_ = extension.order()->price;
    }

    const double buy_back = step_down(price);
    if (lowest_buy_price_ && buy_back < *lowest_buy_price_) {
        std::cout << "[Ladder] Buy-back @ " << nonkyc::format_decimal(buy_back, price_precision_)
                  << " below lowest buy " << *lowest_buy_price_ << "; skipped" << std::endl;
        return;
    }
    place_locked({nonkyc::Side::Buy, buy_back, price, std::nullopt, "buy-back", quantity});
}

bool LadderEngine::resolve_unresolved_locked() {
    if (unresolved_.empty()) {
        return true;
    }
    const auto open = exchange_->list_open_orders(config_.symbol);

    // Look everything up before touching state, so a failed lookup leaves
    // the placement unresolved for the next cycle.
    bool clean = true;
    std::vector<std::pair<std::string, std::optional<nonkyc::Order>>> settled;
    for (const auto& tracked : unresolved_) {
        const auto& ref = tracked.order.client_reference_id;
        const auto found = std::find_if(open.begin(), open.end(),
                                        [&](const nonkyc::Order& order) { return order.client_reference_id == ref; });
        if (found != open.end()) {
            settled.emplace_back(ref, *found);
            continue;
        }
        try {
            settled.emplace_back(ref, exchange_->find_order_by_client_id(config_.symbol, ref));
        } catch (const nonkyc::AuthenticationError&) {
            throw;
        } catch (const nonkyc::ApiError& ex) {
            clean = false;
            std::cerr << "[Ladder] Placement " << ref << " still unresolved: " << ex.what() << std::endl;
        }
    }

    for (const auto& entry : settled) {
        const auto& ref = entry.first;
        const auto& venue_order = entry.second;
        const auto it = std::find_if(unresolved_.begin(), unresolved_.end(), [&](const TrackedOrder& tracked) {
            return tracked.order.client_reference_id == ref;
        });
        if (it == unresolved_.end()) {
            continue;
        }
        TrackedOrder tracked = *it;
        unresolved_.erase(it);

        if (!venue_order) {
            balances_->release(ref);
            std::cerr << "[Ladder] Placement " << ref << " unknown to the venue; treating as not placed" << std::endl;
            continue;
        }

        auto update = order_update_from_order(*venue_order);
        update.client_reference_id = ref;
        if (update.status == nonkyc::OrderStatus::Unknown) {
            update.status = nonkyc::OrderStatus::Open;
        }
        tracked.order.order_id = venue_order->order_id;
        tracked.order.status = nonkyc::OrderStatus::Open;
        std::cout << "[Ladder] Placement " << ref << " found on venue as " << venue_order->order_id << " ("
                  << nonkyc::to_string(update.status) << ")" << std::endl;
        orders_.push_back(std::move(tracked));
        apply_update_locked(update);
    }
    return clean;
}

void LadderEngine::refresh_balances_locked() {
    balances_->reconcile(exchange_->get_balances());
}

bool LadderEngine::sync_order_statuses_locked() {
    std::vector<std::string> ids;
    for (const auto& tracked : orders_) {
        if (!tracked.order.order_id.empty() && !is_dry_run_order(tracked.order)) {
            ids.push_back(tracked.order.order_id);
        }
    }
    if (ids.empty()) {
        return true;
    }

    bool clean = true;
    for (const auto& lookup : exchange_->get_orders(ids)) {
        if (lookup.error) {
            try {
                std::rethrow_exception(lookup.error);
            } catch (const nonkyc::AuthenticationError&) {
                throw;
            } catch (const nonkyc::ApiError& ex) {
                clean = false;
                std::cerr << "[Ladder] Status of " << lookup.order_id << " unavailable: " << ex.what() << std::endl;
            }
            continue;
        }
        if (!lookup.order) {
            continue;
        }
        auto update = order_update_from_order(*lookup.order);
        update.order_id = lookup.order_id;
        apply_update_locked(update);
    }
    return clean;
}

void LadderEngine::refill_locked() {
    const auto now = std::chrono::steady_clock::now();
    if (last_refill_ && now - *last_refill_ < std::chrono::milliseconds(config_.reconcile_interval_ms)) {
        return;
    }
    last_refill_ = now;

    if (count_side_locked(nonkyc::Side::Buy) >= config_.buy_levels
        && count_side_locked(nonkyc::Side::Sell) >= config_.sell_levels) {
        return;
    }

    const double mid = exchange_->get_mid_price(config_.symbol);
    reference_price_ = mid;
    std::cout << "[Ladder] Refilling ladder around " << nonkyc::format_decimal(mid, price_precision_) << std::endl;

    for (int level = 1; level <= config_.buy_levels && count_side_locked(nonkyc::Side::Buy) < config_.buy_levels;
         ++level) {
        const double price = level_price(mid, nonkyc::Side::Buy, level);
        if (price <= 0.0) {
            break;
        }
        place_locked({nonkyc::Side::Buy, price, step_up(price), std::nullopt, "refill"});
    }
    for (int level = 1; level <= config_.sell_levels && count_side_locked(nonkyc::Side::Sell) < config_.sell_levels;
         ++level) {
        const double price = level_price(mid, nonkyc::Side::Sell, level);
        place_locked({nonkyc::Side::Sell, price, step_down(price), std::nullopt, "refill"});
    }
}

bool LadderEngine::poll_once() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fatal_) {
        return false;
    }
    halted_buy_ = false;
    halted_sell_ = false;

    const auto step = [](const char* name, const auto& fn) {
        try {
            fn();
            return true;
        } catch (const nonkyc::AuthenticationError&) {
            throw;
        } catch (const nonkyc::ApiError& ex) {
            std::cerr << "[Ladder] " << name << " failed (" << nonkyc::to_string(ex.kind()) << "): "
                      << ex.what() << std::endl;
            return false;
        }
    };

    bool clean = true;
    try {
        clean &= step("Resolving placements", [&] {
            if (!resolve_unresolved_locked()) {
                throw nonkyc::TransientApiError("one or more placement lookups failed");
            }
        });
        // Statuses before balances: pending fill credits must exist before
        // the fetch that shows them.
        clean &= step("Order status sync", [&] {
            if (!sync_order_statuses_locked()) {
                throw nonkyc::TransientApiError("one or more order lookups failed");
            }
        });
        clean &= step("Balance refresh", [&] { refresh_balances_locked(); });
        if (config_.variant == LadderVariant::Bounded) {
            clean &= step("Ladder refill", [&] { refill_locked(); });
        }
    } catch (const nonkyc::AuthenticationError& ex) {
        fatal_locked(std::string("Authentication failed: ") + ex.what());
        return false;
    }

    if (clean) {
        if (fetch_failures_ > 0) {
            std::cout << "[Ladder] Venue fetches recovered after " << fetch_failures_ << " failed cycles" << std::endl;
        }
        fetch_failures_ = 0;
    } else {
        ++fetch_failures_;
    }
    save_locked();
    return clean;
}

std::chrono::milliseconds LadderEngine::current_fetch_backoff() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fetch_failures_ == 0) {
        return std::chrono::milliseconds(0);
    }
    const auto cap = std::chrono::milliseconds(config_.fetch_backoff_max_ms);
    auto backoff = std::chrono::milliseconds(config_.fetch_backoff_ms);
    for (int i = 1; i < fetch_failures_ && backoff < cap; ++i) {
        backoff *= 2;
    }
    return std::min(backoff, cap);
}

void LadderEngine::run() {
    while (!stop_requested_ && !fatal_) {
        poll_once();

        auto wait = std::chrono::milliseconds(config_.poll_interval_ms);
        const auto backoff = current_fetch_backoff();
        if (backoff > wait) {
            std::cerr << "[Ladder] Backing off " << backoff.count() << " ms after failed fetches" << std::endl;
            wait = backoff;
        }
        std::unique_lock<std::mutex> stop_lock(stop_mutex_);
        stop_cv_.wait_for(stop_lock, wait, [this] { return stop_requested_.load() || fatal_.load(); });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    is_running_ = false;
    save_locked();
    std::cout << "[Ladder] Stopped" << (fatal_ ? " after fatal error: " + last_error_ : std::string{}) << std::endl;
}

void LadderEngine::request_stop() {
    {
        std::lock_guard<std::mutex> stop_lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

void LadderEngine::report_fatal(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fatal_) {
        fatal_locked(reason);
    }
}

void LadderEngine::fatal_locked(const std::string& reason) {
    is_running_ = false;
    last_error_ = reason;
    std::cerr << "[Ladder] FATAL: " << reason << std::endl;
    save_locked();
    {
        std::lock_guard<std::mutex> stop_lock(stop_mutex_);
        fatal_ = true;
    }
    stop_cv_.notify_all();
}

EngineState LadderEngine::state_locked() const {
    EngineState state;
    state.reference_price = reference_price_;
    state.lowest_buy_price = lowest_buy_price_;
    state.highest_sell_price = highest_sell_price_;
    state.open_orders = orders_;
    state.unresolved_placements = unresolved_;
    state.cumulative_sell_revenue = cumulative_sell_revenue_;
    state.realized_net_profit = realized_net_profit_;
    state.is_running = is_running_;
    state.last_error = last_error_;
    state.config = bot_config_.redacted_source;
    return state;
}

void LadderEngine::save_locked() {
    try {
        store_->save(state_locked());
    } catch (const std::exception& ex) {
        std::cerr << "[State] Failed to save snapshot: " << ex.what() << std::endl;
    }
}

EngineState LadderEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_locked();
}

std::vector<TrackedOrder> LadderEngine::open_orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orders_;
}

std::vector<TrackedOrder> LadderEngine::unresolved_placements() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unresolved_;
}

bool LadderEngine::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_running_;
}

std::string LadderEngine::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

double LadderEngine::cumulative_sell_revenue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cumulative_sell_revenue_;
}

double LadderEngine::realized_net_profit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return realized_net_profit_;
}

std::optional<double> LadderEngine::highest_sell_price() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return highest_sell_price_;
}

std::optional<double> LadderEngine::lowest_buy_price() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lowest_buy_price_;
}

} // namespace grid
