#pragma once
#include "ConfigManager.hpp"
#include "UsageTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

// usage_rate at or below this projects no depletion
constexpr double kRateEpsilon = 1e-9;
constexpr std::size_t kMaxSeriesPoints = 50;

// Recomputed from scratch on every call; no state is carried between calls.
UsageMetrics compute_metrics(const ObservedSession& session,
                             int64_t now_ns,
                             const MonitorConfig& cfg);

// Cumulative token curve over window entries (ascending timestamps). Starts
// with (start_ns, 0), then at most max_points sampled points plus the final point.
std::vector<UsagePoint> build_usage_series(const std::vector<UsageEntry>& window,
                                           int64_t start_ns,
                                           std::size_t max_points = kMaxSeriesPoints);

const char* depletion_kind_name(DepletionKind k);
