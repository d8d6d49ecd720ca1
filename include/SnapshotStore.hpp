#pragma once
#include "UsageTypes.hpp"
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <vector>

// Everything a reader needs from one derivation pass. Never mutated once published.
struct MonitorSnapshot {
    bool            has_session{false};
    ObservedSession session;
    UsageMetrics    metrics;
    std::vector<UsagePoint>      series;
    std::vector<ObservedSession> history;
    DerivationReport report;
    int64_t  generated_at_ns{0};
    uint64_t sequence{0};
};

// Latest-snapshot holder shared by the monitor loop (writer) and readers.
class SnapshotStore {
public:
    SnapshotStore() = default;

    void publish(std::shared_ptr<const MonitorSnapshot> snap);

    // nullptr until the first pass completes
    std::shared_ptr<const MonitorSnapshot> latest() const;

private:
    mutable std::shared_mutex mu_;
    std::shared_ptr<const MonitorSnapshot> snap_;
};
