#include "MetricsCalculator.hpp"
#include <algorithm>
#include <limits>


const char* depletion_kind_name(DepletionKind k) {
    switch (k) {
        case DepletionKind::At:        return "at";
        case DepletionKind::Now:       return "now";
        case DepletionKind::Unbounded: return "unbounded";
    }
    return "unbounded";
}

static inline double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

// Desc: derive rate, progress, efficiency, depletion and cache figures
// In: const ObservedSession& session, int64_t now_ns, const MonitorConfig& cfg
// Out: UsageMetrics
UsageMetrics compute_metrics(const ObservedSession& session,
                             int64_t now_ns,
                             const MonitorConfig& cfg) {
    UsageMetrics m;
    const TokenBreakdown& b = session.breakdown;

    const double elapsed_ns = static_cast<double>(now_ns - session.start_time_ns);
    const double minutes_elapsed = std::max(1.0, elapsed_ns / static_cast<double>(kNsPerMinute));

    m.usage_rate       = static_cast<double>(session.tokens_used) / minutes_elapsed;
    m.session_progress = clamp01(elapsed_ns / static_cast<double>(kSessionWindowNs));

    if (m.usage_rate == 0.0) {
        m.efficiency_score = 1.0;
    } else {
        const double expected_rate = static_cast<double>(session.tokens_limit) / kSessionWindowMinutes;
        m.efficiency_score = clamp01(expected_rate / m.usage_rate);
    }

    m.tokens_remaining = session.tokens_limit > session.tokens_used
                       ? session.tokens_limit - session.tokens_used : 0;

    if (session.tokens_used >= session.tokens_limit) {
        m.depletion_kind = DepletionKind::Now;
        m.projected_depletion_ns = now_ns;
    } else if (m.usage_rate <= kRateEpsilon) {
        m.depletion_kind = DepletionKind::Unbounded;
        m.projected_depletion_ns = 0;
    } else {
        const double minutes_left = static_cast<double>(m.tokens_remaining) / m.usage_rate;
        const double offset_ns = minutes_left * static_cast<double>(kNsPerMinute);
        // projection must stay representable as ns since epoch; the margin
        // covers double rounding near 2^63
        const int64_t headroom = (now_ns >= 0 ? std::numeric_limits<int64_t>::max() - now_ns
                                              : std::numeric_limits<int64_t>::max()) - 1024;
        if (!(offset_ns < static_cast<double>(headroom))) {
            m.depletion_kind = DepletionKind::Unbounded;
            m.projected_depletion_ns = 0;
        } else {
            m.depletion_kind = DepletionKind::At;
            m.projected_depletion_ns = now_ns + static_cast<int64_t>(offset_ns);
        }
    }

    m.cache_hit_rate = static_cast<double>(b.cache_read_tokens)
                     / static_cast<double>(std::max<uint64_t>(1, b.input_tokens + b.cache_read_tokens));
    m.cache_creation_rate = static_cast<double>(b.cache_creation_tokens) / minutes_elapsed;

    m.input_output_ratio = b.output_tokens == 0 ? 0.0
        : static_cast<double>(b.input_tokens + b.cache_creation_tokens) / static_cast<double>(b.output_tokens);

    if (session.tokens_limit == 0) {
        m.approaching_limit = true;
    } else {
        const double ratio = static_cast<double>(session.tokens_used) / static_cast<double>(session.tokens_limit);
        m.approaching_limit = ratio >= cfg.warning_threshold;
    }
    return m;
}

// Desc: cumulative token curve from a zero point at the session start
// In: window entries (ascending), start_ns, max_points
// Out: std::vector<UsagePoint> (empty for an empty window)
std::vector<UsagePoint> build_usage_series(const std::vector<UsageEntry>& window,
                                           int64_t start_ns,
                                           std::size_t max_points) {
    std::vector<UsagePoint> out;
    if (window.empty()) return out;
    if (max_points == 0) max_points = 1;

    std::vector<UsagePoint> full;
    full.reserve(window.size());
    uint64_t cum = 0;
    for (const auto& e : window) {
        cum += e.total_tokens();
        full.push_back(UsagePoint{e.timestamp_ns, cum});
    }

    out.reserve(std::min(full.size(), max_points) + 2);
    out.push_back(UsagePoint{start_ns, 0});
    if (full.size() <= max_points) {
        out.insert(out.end(), full.begin(), full.end());
        return out;
    }

    const std::size_t step = (full.size() + max_points - 1) / max_points;
    for (std::size_t i = 0; i < full.size(); i += step) out.push_back(full[i]);
    if (out.back().timestamp_ns != full.back().timestamp_ns ||
        out.back().cumulative_tokens != full.back().cumulative_tokens) {
        out.push_back(full.back());
    }
    return out;
}
