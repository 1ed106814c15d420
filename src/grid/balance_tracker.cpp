#include "grid/balance_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace grid {
namespace {

constexpr int kMaxMissedCycles = 1;

} // namespace

BalanceTracker::BalanceTracker(double tolerance) : tolerance_(tolerance) {}

bool BalanceTracker::matches(double lhs, double rhs) const {
    const double tolerance = std::max(tolerance_, std::max(std::fabs(lhs), std::fabs(rhs)) * 1e-9);
    return std::fabs(lhs - rhs) <= tolerance;
}

void BalanceTracker::reconcile(const std::vector<nonkyc::Balance>& fresh) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, nonkyc::Balance> next;
    for (const auto& balance : fresh) {
        next[balance.asset] = balance;
    }

    if (!has_snapshot_) {
        // No baseline to diff against: the fresh fetch is taken as truth.
        if (!pending_.empty()) {
            std::cout << "[Balances] First snapshot; cleared " << pending_.size() << " pending entries" << std::endl;
        }
        pending_.clear();
        unexplained_.clear();
        venue_ = std::move(next);
        has_snapshot_ = true;
        return;
    }

    std::set<std::string> assets;
    for (const auto& entry : pending_) {
        assets.insert(entry.asset);
    }
    for (const auto& [asset, balance] : venue_) {
        assets.insert(asset);
    }
    for (const auto& [asset, balance] : next) {
        assets.insert(asset);
    }

    std::map<std::string, double> unexplained;
    for (const auto& asset : assets) {
        const auto prev_it = venue_.find(asset);
        const auto next_it = next.find(asset);
        const double previous = prev_it != venue_.end() ? prev_it->second.available : 0.0;
        const double current = next_it != next.end() ? next_it->second.available : 0.0;
        const auto carried_it = unexplained_.find(asset);
        const double carried = carried_it != unexplained_.end() ? carried_it->second : 0.0;

        const double left = reconcile_asset(asset, current - previous, carried);
        if (!matches(left, 0.0)) {
            unexplained[asset] = left;
        }
    }

    venue_ = std::move(next);
    unexplained_ = std::move(unexplained);
}

double BalanceTracker::reconcile_asset(const std::string& asset, double observed_delta, double carried) {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < pending_.size(); ++i) {
        if (pending_[i].asset == asset) {
            indices.push_back(i);
        }
    }

    // Longest insertion-ordered prefix whose sum the venue already shows,
    // either in this fetch alone or together with the previous fetch's
    // unexplained movement.
    std::size_t reflected = 0;
    double cumulative = 0.0;
    for (std::size_t k = 0; k < indices.size(); ++k) {
        cumulative += pending_[indices[k]].delta;
        if (matches(cumulative, observed_delta)
            || (carried != 0.0 && matches(cumulative, observed_delta + carried))) {
            reflected = k + 1;
        }
    }

    std::vector<bool> remove(pending_.size(), false);
    for (std::size_t k = 0; k < indices.size(); ++k) {
        auto& entry = pending_[indices[k]];
        if (k < reflected) {
            remove[indices[k]] = true;
            continue;
        }
        if (++entry.missed_cycles > kMaxMissedCycles) {
            std::cerr << "[Balances] Dropping stale pending " << entry.delta << ' ' << asset
                      << " (" << entry.reference << ") not reflected after "
                      << entry.missed_cycles << " refreshes" << std::endl;
            remove[indices[k]] = true;
        }
    }

    std::vector<PendingAdjustment> kept;
    kept.reserve(pending_.size());
    for (std::size_t i = 0; i < pending_.size(); ++i) {
        if (!remove[i]) {
            kept.push_back(std::move(pending_[i]));
        }
    }
    pending_ = std::move(kept);
    return reflected > 0 ? 0.0 : observed_delta;
}

double BalanceTracker::get(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    const auto it = venue_.find(asset);
    if (it != venue_.end()) {
        total = it->second.available;
    }
    for (const auto& entry : pending_) {
        if (entry.asset == asset) {
            total += entry.delta;
        }
    }
    return total;
}

double BalanceTracker::venue_available(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = venue_.find(asset);
    return it != venue_.end() ? it->second.available : 0.0;
}

double BalanceTracker::pending_adjustment(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& entry : pending_) {
        if (entry.asset == asset) {
            total += entry.delta;
        }
    }
    return total;
}

bool BalanceTracker::has_venue_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_snapshot_;
}

double BalanceTracker::unexplained_movement(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = unexplained_.find(asset);
    return it != unexplained_.end() ? it->second : 0.0;
}

void BalanceTracker::apply_pending(const std::string& asset, double delta, const std::string& reference) {
    if (delta == 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // Only credits arrive late; a debit is recorded as soon as it is placed.
    const auto it = unexplained_.find(asset);
    if (delta > 0.0 && it != unexplained_.end() && matches(it->second, delta)) {
        std::cout << "[Balances] Latest fetch already shows +" << delta << ' ' << asset << " (" << reference
                  << "); not counted again" << std::endl;
        unexplained_.erase(it);
        return;
    }
    pending_.push_back(PendingAdjustment{asset, delta, reference, 0});
}

std::size_t BalanceTracker::release(const std::string& reference) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = pending_.size();
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const PendingAdjustment& entry) { return entry.reference == reference; }),
                   pending_.end());
    return before - pending_.size();
}

std::vector<TrackedBalance> BalanceTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, TrackedBalance> merged;
    for (const auto& [asset, balance] : venue_) {
        auto& row = merged[asset];
        row.asset = asset;
        row.venue_available = balance.available;
        row.venue_held = balance.held;
    }
    for (const auto& entry : pending_) {
        auto& row = merged[entry.asset];
        row.asset = entry.asset;
        row.pending += entry.delta;
    }

    std::vector<TrackedBalance> rows;
    rows.reserve(merged.size());
    for (auto& [asset, row] : merged) {
        row.available = row.venue_available + row.pending;
        rows.push_back(row);
    }
    return rows;
}

std::vector<PendingAdjustment> BalanceTracker::pending_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

} // namespace grid
