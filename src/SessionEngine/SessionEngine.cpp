#include "SessionEngine.hpp"
#include "Logger.hpp"
#include "MetricsCalculator.hpp"
#include "TimeUtil.hpp"

#include <algorithm>
#include <map>


std::size_t eligible_prefix(const std::vector<UsageEntry>& sorted, int64_t now_ns, int64_t skew_ns) {
    const int64_t cutoff = now_ns + skew_ns;
    auto it = std::upper_bound(sorted.begin(), sorted.end(), cutoff,
                               [](int64_t t, const UsageEntry& e) { return t < e.timestamp_ns; });
    return static_cast<std::size_t>(it - sorted.begin());
}

// Desc: scan backward from the anchor entry while entries stay within 5h of it
// In: const std::vector<UsageEntry>& sorted, size_t last_excl (> 0)
// Out: WindowRange
WindowRange window_ending_at(const std::vector<UsageEntry>& sorted, std::size_t last_excl) {
    WindowRange w{last_excl, last_excl};
    if (last_excl == 0) return w;
    const int64_t anchor = sorted[last_excl - 1].timestamp_ns;
    std::size_t i = last_excl;
    while (i > 0 && anchor - sorted[i - 1].timestamp_ns < kSessionWindowNs) --i;
    w.first = i;
    return w;
}

std::vector<WindowRange> partition_windows(const std::vector<UsageEntry>& sorted, std::size_t last_excl) {
    std::vector<WindowRange> out;
    std::size_t end = last_excl;
    while (end > 0) {
        WindowRange w = window_ending_at(sorted, end);
        out.push_back(w);
        end = w.first;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

PlanType detect_plan(uint64_t tokens, uint64_t entry_count) {
    if (tokens > 20000) return PlanType::Max20;
    if (tokens > 10000 || entry_count > 20) return PlanType::Pro;
    return PlanType::Max5;
}

std::string session_id_for(int64_t start_time_ns) {
    return "observed-" + std::to_string(start_time_ns / kNsPerSecond);
}

static inline int64_t floor_to_second(int64_t ns) {
    int64_t s = ns / kNsPerSecond;
    if (ns % kNsPerSecond < 0) --s;
    return s * kNsPerSecond;
}

// Desc: aggregate one window into an ObservedSession
// In: sorted, w (non-empty), now_ns, cfg
// Out: ObservedSession
ObservedSession build_session(const std::vector<UsageEntry>& sorted,
                              const WindowRange& w,
                              int64_t now_ns,
                              const MonitorConfig& cfg) {
    ObservedSession s;
    TokenBreakdown& b = s.breakdown;
    std::map<std::string, uint64_t> per_model;

    for (std::size_t i = w.first; i < w.last; ++i) {
        const UsageEntry& e = sorted[i];
        b.input_tokens          += e.input_tokens;
        b.output_tokens         += e.output_tokens;
        b.cache_creation_tokens += e.cache_creation_tokens;
        b.cache_read_tokens     += e.cache_read_tokens;
        b.entry_count++;
        per_model[e.model.empty() ? std::string("unknown") : e.model] += e.total_tokens();
    }
    b.model_tokens.assign(per_model.begin(), per_model.end());
    std::stable_sort(b.model_tokens.begin(), b.model_tokens.end(),
                     [](const std::pair<std::string, uint64_t>& x, const std::pair<std::string, uint64_t>& y) {
                         return x.second > y.second;
                     });

    s.tokens_used   = b.input_tokens + b.output_tokens + b.cache_creation_tokens + b.cache_read_tokens;
    s.start_time_ns = w.last > w.first ? floor_to_second(sorted[w.first].timestamp_ns) : 0;
    s.reset_time_ns = s.start_time_ns + kSessionWindowNs;
    s.id            = session_id_for(s.start_time_ns);
    s.plan_type     = cfg.auto_plan ? detect_plan(s.tokens_used, b.entry_count) : cfg.plan_type;
    s.tokens_limit  = plan_default_limit(s.plan_type, cfg.custom_limit);
    s.is_active     = now_ns < s.reset_time_ns;
    return s;
}


SessionEngine::SessionEngine(const MonitorConfig& cfg, int log_fd)
    : cfg_(cfg), log_fd_(log_fd) {}

void SessionEngine::seed(const std::vector<ObservedSession>& history, const ObservedSession* open_session) {
    history_ = history;
    std::stable_sort(history_.begin(), history_.end(),
                     [](const ObservedSession& a, const ObservedSession& b) {
                         return a.start_time_ns < b.start_time_ns;
                     });
    trimHistory();
    has_current_ = open_session != nullptr;
    if (open_session) current_ = *open_session;
    series_.clear();
}

void SessionEngine::closeInto(ObservedSession s) {
    s.is_active    = false;
    s.end_time_ns  = s.reset_time_ns;
    s.has_end_time = true;
    log_line(log_fd_, LogLevel::Info, "SessionEngine",
             "session closed: " + s.id + " tokens=" + std::to_string(s.tokens_used));
    history_.push_back(std::move(s));
}

void SessionEngine::trimHistory() {
    if (cfg_.history_limit == 0 || history_.size() <= cfg_.history_limit) return;
    history_.erase(history_.begin(), history_.begin() + (history_.size() - cfg_.history_limit));
}

// Desc: run one transition of the Inactive/Active state machine
// In: sorted entries, now_ns, DerivationReport& report
// Out: bool (true if a current session exists after the pass)
bool SessionEngine::derive(const std::vector<UsageEntry>& sorted, int64_t now_ns, DerivationReport& report) {
    const int64_t skew_ns = static_cast<int64_t>(cfg_.clock_skew_sec) * kNsPerSecond;
    const std::size_t eligible = eligible_prefix(sorted, now_ns, skew_ns);
    report.skewed_entries = sorted.size() - eligible;
    report.skewed.clear();
    for (std::size_t i = eligible; i < sorted.size() && report.skewed.size() < kMaxSkewedRecords; ++i) {
        const UsageEntry& e = sorted[i];
        report.skewed.push_back(SkewedEntry{e.source_file, e.line_no, e.timestamp_ns});
        log_line(log_fd_, LogLevel::Warn, "SessionEngine",
                 "SkewedEntry: " + e.source_file + ":" + std::to_string(e.line_no)
                 + " timestamp " + format_rfc3339(e.timestamp_ns) + " is beyond now + "
                 + std::to_string(cfg_.clock_skew_sec) + "s");
    }
    if (report.skewed_entries > 0) {
        log_line(log_fd_, LogLevel::Warn, "SessionEngine",
                 std::to_string(report.skewed_entries) + " entries beyond clock-skew tolerance excluded from window");
    }
    if (eligible == 0) {
        series_.clear();
        return false;
    }

    const std::vector<WindowRange> windows = partition_windows(sorted, eligible);
    const WindowRange& latest = windows.back();
    ObservedSession next = build_session(sorted, latest, now_ns, cfg_);

    if (has_current_ && current_.id == next.id) {
        // same identity: plan never downgrades, tokens never shrink
        if (cfg_.auto_plan &&
            plan_default_limit(current_.plan_type, cfg_.custom_limit) > plan_default_limit(next.plan_type, cfg_.custom_limit)) {
            next.plan_type    = current_.plan_type;
            next.tokens_limit = current_.tokens_limit;
        }
        if (current_.tokens_used > next.tokens_used) {
            next.tokens_used = current_.tokens_used;
            next.breakdown   = current_.breakdown;
        }
    } else if (has_current_ && current_.start_time_ns < next.start_time_ns) {
        closeInto(current_);
    } else if (has_current_) {
        // data rewritten behind us: the stored window no longer exists
        #ifdef DEBUG
        log_line(log_fd_, LogLevel::Debug, "SessionEngine", "dropping stale current session " + current_.id);
        #endif
    }

    // backfill windows between the newest history entry and the new anchor
    for (std::size_t i = 0; i + 1 < windows.size(); ++i) {
        ObservedSession past = build_session(sorted, windows[i], now_ns, cfg_);
        if (!history_.empty() && past.start_time_ns <= history_.back().start_time_ns) continue;
        if (past.start_time_ns >= next.start_time_ns) continue;
        closeInto(std::move(past));
    }
    trimHistory();

    if (!has_current_ || current_.id != next.id) {
        log_line(log_fd_, LogLevel::Info, "SessionEngine",
                 "session opened: " + next.id + " plan=" + plan_type_name(next.plan_type));
    }
    current_ = std::move(next);
    has_current_ = true;

    std::vector<UsageEntry> window(sorted.begin() + static_cast<std::ptrdiff_t>(latest.first),
                                   sorted.begin() + static_cast<std::ptrdiff_t>(latest.last));
    series_ = build_usage_series(window, current_.start_time_ns);
    return true;
}

void SessionEngine::refresh(int64_t now_ns) {
    if (has_current_) current_.is_active = now_ns < current_.reset_time_ns;
}
