#pragma once

#include "nonkyc/models.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace grid {

struct PendingAdjustment {
    std::string asset;
    double delta = 0.0;
    std::string reference;
    // Reconcile passes this entry has survived without being reflected.
    int missed_cycles = 0;
};

struct TrackedBalance {
    std::string asset;
    double venue_available = 0.0;
    double venue_held = 0.0;
    double pending = 0.0;
    double available = 0.0;   // venue_available + pending
};

// Venue balances merged with locally predicted effects of orders the venue
// has not reflected yet. Every pending entry is cleared exactly once: by the
// reconcile pass that sees it in a fresh fetch, or by release() when the
// order is confirmed cancelled or rejected.
//
// A fill can reach the venue balance before the engine learns about it. The
// movement of the latest fetch that no entry explained is kept per asset; an
// entry recorded afterwards that matches it is treated as already reflected.
class BalanceTracker {
public:
    explicit BalanceTracker(double tolerance = 1e-8);

    // Replaces the venue view and clears pending entries it already reflects.
    void reconcile(const std::vector<nonkyc::Balance>& fresh);

    [[nodiscard]] double get(const std::string& asset) const;
    [[nodiscard]] double venue_available(const std::string& asset) const;
    [[nodiscard]] double pending_adjustment(const std::string& asset) const;
    [[nodiscard]] bool has_venue_snapshot() const;
    [[nodiscard]] double unexplained_movement(const std::string& asset) const;

    // Records a predicted effect, unless the latest fetch already moved the
    // asset by exactly delta with nothing to explain it.
    void apply_pending(const std::string& asset, double delta, const std::string& reference);

    // Drops every pending entry recorded under reference. Returns how many.
    std::size_t release(const std::string& reference);

    [[nodiscard]] std::vector<TrackedBalance> snapshot() const;
    [[nodiscard]] std::vector<PendingAdjustment> pending_entries() const;

private:
    // Clears reflected entries and returns the movement left unexplained.
    double reconcile_asset(const std::string& asset, double observed_delta, double carried);
    bool matches(double lhs, double rhs) const;

    double tolerance_;
    mutable std::mutex mutex_;
    bool has_snapshot_ = false;
    std::map<std::string, nonkyc::Balance> venue_;
    std::vector<PendingAdjustment> pending_;
    std::map<std::string, double> unexplained_;
};

} // namespace grid
