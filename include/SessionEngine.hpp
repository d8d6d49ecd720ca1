#pragma once
#include "ConfigManager.hpp"
#include "UsageTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Half-open index range [first, last) into a sorted entry stream.
struct WindowRange {
    std::size_t first{0};
    std::size_t last{0};
};

// Number of leading entries (ascending stream) not beyond now + skew.
std::size_t eligible_prefix(const std::vector<UsageEntry>& sorted, int64_t now_ns, int64_t skew_ns);

// Entries within five hours of sorted[last_excl - 1], scanning backward.
WindowRange window_ending_at(const std::vector<UsageEntry>& sorted, std::size_t last_excl);

// Backward partition of sorted[0, last_excl) into windows, chronological order.
std::vector<WindowRange> partition_windows(const std::vector<UsageEntry>& sorted, std::size_t last_excl);

// Auto-detection: > 20000 tokens -> max20; > 10000 tokens or > 20 entries -> pro; else max5.
PlanType detect_plan(uint64_t tokens, uint64_t entry_count);

std::string session_id_for(int64_t start_time_ns);

// Build the session of one window. start_time is the earliest entry floored to
// whole seconds; is_active is evaluated against now_ns.
ObservedSession build_session(const std::vector<UsageEntry>& sorted,
                              const WindowRange& w,
                              int64_t now_ns,
                              const MonitorConfig& cfg);

// Two-state machine (Inactive / Active) over successive derivation passes.
// Owns the current session and the append-only history.
class SessionEngine {
public:
    SessionEngine(const MonitorConfig& cfg, int log_fd);

    // Persisted state from a previous run. open_session may be null.
    void seed(const std::vector<ObservedSession>& history, const ObservedSession* open_session);

    // One pass over a sorted, deduplicated stream. Returns false (Inactive, state
    // untouched) when no entry is eligible.
    bool derive(const std::vector<UsageEntry>& sorted, int64_t now_ns, DerivationReport& report);

    // Time-dependent fields only (is_active).
    void refresh(int64_t now_ns);

    bool hasCurrent() const { return has_current_; }
    const ObservedSession& current() const { return current_; }
    const std::vector<ObservedSession>& history() const { return history_; }
    const std::vector<UsagePoint>& series() const { return series_; }

private:
    void closeInto(ObservedSession s);
    void trimHistory();

    MonitorConfig cfg_;
    int log_fd_;
    bool has_current_{false};
    ObservedSession current_;
    std::vector<ObservedSession> history_;
    std::vector<UsagePoint> series_;
};
