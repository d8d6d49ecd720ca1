// include/ConfigManager.hpp
#pragma once
#include "UsageTypes.hpp"
#include <vector>
#include <string>
#include <cstdint>

// Ceiling for every duration key (one day), keeps ns arithmetic in range.
constexpr std::uint64_t kMaxDurationSec = 86400;

// Immutable settings handed explicitly to every pipeline stage.
struct MonitorConfig {
    bool          auto_plan{true};
    PlanType      plan_type{PlanType::Pro};
    std::uint64_t custom_limit{0};
    std::uint64_t update_interval_sec{3};
    std::uint64_t debounce_ms{500};
    std::uint64_t clock_skew_sec{60};
    std::uint64_t max_line_bytes{1024ULL * 1024ULL};
    std::uint64_t max_file_bytes{50ULL * 1024ULL * 1024ULL};
    std::uint32_t max_json_depth{32};
    double        warning_threshold{0.85};
    std::vector<std::string> allowed_roots;
    std::size_t   history_limit{200};
    bool          use_mock{false};
    std::string   log_path;
    std::string   history_path;
};

class ConfigManager {
public:
    explicit ConfigManager() = default;

    // Missing file -> defaults (true). Bad JSON or bad values -> false.
    bool loadFromFile(const std::string& config_path);
    bool loadFromJsonText(const std::string& text);

    const MonitorConfig& config() const { return cfg_; }
    MonitorConfig& mutableConfig() { return cfg_; }
    bool loadedFromFile() const { return loaded_from_file_; }

    std::string canonicalConfigJson() const;
    std::string fingerprint() const;

    static std::uint64_t parse_size_kb_mb(const std::string& s);

private:
    MonitorConfig cfg_;
    bool loaded_from_file_{false};
};
