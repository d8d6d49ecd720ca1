#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <utility>

constexpr int64_t kNsPerSecond = 1000000000LL;
constexpr int64_t kNsPerMinute = 60LL * kNsPerSecond;
constexpr int64_t kNsPerHour   = 60LL * kNsPerMinute;

// Observed sessions always span a fixed five hours.
constexpr int64_t kSessionWindowNs      = 5LL * kNsPerHour;
constexpr double  kSessionWindowMinutes = 300.0;

// One usage record read from a JSONL line.
struct UsageEntry {
    int64_t     timestamp_ns{0};       // UTC, ns since epoch
    std::string model;
    uint64_t    input_tokens{0};
    uint64_t    output_tokens{0};
    uint64_t    cache_creation_tokens{0};
    uint64_t    cache_read_tokens{0};
    std::string message_id;            // empty when absent
    std::string request_id;            // empty when absent
    std::string source_file;
    uint64_t    line_no{0};

    uint64_t total_tokens() const {
        return input_tokens + output_tokens + cache_creation_tokens + cache_read_tokens;
    }
};

enum class PlanType : uint8_t { Pro = 0, Max5, Max20, Custom };

struct TokenBreakdown {
    uint64_t input_tokens{0};
    uint64_t output_tokens{0};
    uint64_t cache_creation_tokens{0};
    uint64_t cache_read_tokens{0};
    uint64_t entry_count{0};
    // (model, tokens), tokens descending
    std::vector<std::pair<std::string, uint64_t>> model_tokens;
};

// Derived approximation of a 5h usage period.
struct ObservedSession {
    std::string id;
    PlanType    plan_type{PlanType::Pro};
    int64_t     start_time_ns{0};
    int64_t     reset_time_ns{0};
    int64_t     end_time_ns{0};        // valid only when has_end_time
    bool        has_end_time{false};
    uint64_t    tokens_used{0};
    uint64_t    tokens_limit{0};
    bool        is_active{false};
    TokenBreakdown breakdown;
};

enum class DepletionKind : uint8_t { At = 0, Now, Unbounded };

struct UsagePoint {
    int64_t  timestamp_ns{0};
    uint64_t cumulative_tokens{0};
};

struct UsageMetrics {
    double   usage_rate{0.0};          // tokens / minute
    double   session_progress{0.0};    // 0..1
    double   efficiency_score{1.0};    // 0..1
    DepletionKind depletion_kind{DepletionKind::Unbounded};
    int64_t  projected_depletion_ns{0}; // valid for At / Now
    double   cache_hit_rate{0.0};
    double   cache_creation_rate{0.0}; // tokens / minute
    double   input_output_ratio{0.0};
    uint64_t tokens_remaining{0};
    bool     approaching_limit{false};
};

// Entry left out of window math for lying beyond the clock-skew tolerance.
struct SkewedEntry {
    std::string source_file;
    uint64_t    line_no{0};
    int64_t     timestamp_ns{0};
};

// At most this many SkewedEntry records are kept per pass.
constexpr std::size_t kMaxSkewedRecords = 100;

// Per-pass ingestion counters.
struct DerivationReport {
    uint64_t roots_scanned{0};
    uint64_t roots_rejected{0};
    uint64_t files_scanned{0};
    uint64_t files_too_large{0};
    uint64_t files_rejected{0};
    uint64_t files_unreadable{0};
    uint64_t lines_read{0};
    uint64_t usage_entries{0};
    uint64_t non_usage_lines{0};
    uint64_t malformed_lines{0};
    uint64_t duplicates_dropped{0};
    uint64_t skewed_entries{0};
    std::vector<SkewedEntry> skewed;   // earliest kMaxSkewedRecords of skewed_entries
    bool     reused_previous{false};
};

const char* plan_type_name(PlanType p);
bool parse_plan_type(const std::string& s, PlanType& out);
uint64_t plan_default_limit(PlanType p, uint64_t custom_limit);
