// === ConfigManager.cpp ===
#include "ConfigManager.hpp"
#include "Hash.hpp"

#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>
using nlohmann::json;


// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}


// Desc: parse size string (KB/MB) into bytes
// In: const std::string& raw
// Out: std::uint64_t (bytes); throws on invalid input
std::uint64_t ConfigManager::parse_size_kb_mb(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([kKmM][bB]?)$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw std::runtime_error("invalid format (only KB/MB allowed): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number : '" + raw + "'");
    }

    std::string unit = m[2].str();
    for (auto& c : unit) c = (char)std::toupper((unsigned char)c);

    if (unit == "K" || unit == "KB") return n * 1024ULL;
    if (unit == "M" || unit == "MB") return n * 1024ULL * 1024ULL;
    throw std::runtime_error("unreachable unit");
}


// Desc: read an optional unsigned integer key
// In: const json& j, const char* key, std::uint64_t& out
// Out: bool (false if present but not a non-negative integer)
static bool read_uint(const json& j, const char* key, std::uint64_t& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<std::int64_t>() >= 0)) {
        std::cerr << "[ConfigManager] '" << key << "' must be a non-negative integer\n";
        return false;
    }
    out = v.get<std::uint64_t>();
    return true;
}

// Desc: read an optional size key ("512KB", "50MB")
// In: const json& j, const char* key, std::uint64_t& out
// Out: bool
static bool read_size(const json& j, const char* key, std::uint64_t& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        std::cerr << "[ConfigManager] '" << key << "' must be like '512KB' or '10MB'\n";
        return false;
    }
    try {
        out = ConfigManager::parse_size_kb_mb(j[key].get<std::string>());
    } catch (const std::exception& e) {
        std::cerr << "[ConfigManager] '" << key << "': " << e.what() << "\n";
        return false;
    }
    if (out == 0) {
        std::cerr << "[ConfigManager] '" << key << "' must be > 0\n";
        return false;
    }
    return true;
}

// Desc: read an optional string key
// In: const json& j, const char* key, std::string& out
// Out: bool
static bool read_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        std::cerr << "[ConfigManager] '" << key << "' must be a string\n";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}


bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        // no config file: defaults
        loaded_from_file_ = false;
        return true;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (!loadFromJsonText(ss.str())) return false;
    loaded_from_file_ = true;
    return true;
}

bool ConfigManager::loadFromJsonText(const std::string& text) {
    json j;
    try { j = json::parse(text); }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }

    if (!j.is_object()) {
        std::cerr << "[ConfigManager] config root must be an object\n";
        return false;
    }

    MonitorConfig c;  // start from defaults

    // plan
    if (j.contains("plan")) {
        if (!j["plan"].is_string()) { std::cerr << "[ConfigManager] 'plan' must be a string\n"; return false; }
        std::string plan = j["plan"].get<std::string>();
        for (char& ch : plan) ch = (char)std::tolower((unsigned char)ch);
        if (plan == "auto") {
            c.auto_plan = true;
        } else if (parse_plan_type(plan, c.plan_type)) {
            c.auto_plan = false;
        } else {
            std::cerr << "[ConfigManager] plan must be auto|pro|max5|max20|custom, got: " << plan << "\n";
            return false;
        }
    }
    if (!read_uint(j, "custom_limit", c.custom_limit)) return false;
    if (!c.auto_plan && c.plan_type == PlanType::Custom && c.custom_limit == 0) {
        std::cerr << "[ConfigManager] plan 'custom' requires 'custom_limit' > 0\n";
        return false;
    }

    // timing
    if (!read_uint(j, "update_interval_sec", c.update_interval_sec)) return false;
    if (c.update_interval_sec == 0 || c.update_interval_sec > kMaxDurationSec) {
        std::cerr << "[ConfigManager] 'update_interval_sec' must be in 1.." << kMaxDurationSec << "\n";
        return false;
    }
    if (!read_uint(j, "debounce_ms", c.debounce_ms)) return false;
    if (c.debounce_ms > kMaxDurationSec * 1000ULL) {
        std::cerr << "[ConfigManager] 'debounce_ms' must be <= " << kMaxDurationSec * 1000ULL << "\n";
        return false;
    }
    if (!read_uint(j, "clock_skew_sec", c.clock_skew_sec)) return false;
    if (c.clock_skew_sec > kMaxDurationSec) {
        std::cerr << "[ConfigManager] 'clock_skew_sec' must be <= " << kMaxDurationSec << "\n";
        return false;
    }

    // parser limits
    if (!read_size(j, "max_line_size", c.max_line_bytes)) return false;
    if (!read_size(j, "max_file_size", c.max_file_bytes)) return false;
    std::uint64_t depth = c.max_json_depth;
    if (!read_uint(j, "max_json_depth", depth)) return false;
    if (depth == 0 || depth > 1024) { std::cerr << "[ConfigManager] 'max_json_depth' must be in 1..1024\n"; return false; }
    c.max_json_depth = static_cast<std::uint32_t>(depth);

    if (j.contains("warning_threshold")) {
        if (!j["warning_threshold"].is_number()) { std::cerr << "[ConfigManager] 'warning_threshold' must be a number\n"; return false; }
        c.warning_threshold = j["warning_threshold"].get<double>();
        if (c.warning_threshold <= 0.0 || c.warning_threshold > 1.0) {
            std::cerr << "[ConfigManager] 'warning_threshold' must be in (0, 1]\n";
            return false;
        }
    }

    // allowed_roots (absolute paths only)
    if (j.contains("allowed_roots")) {
        if (!j["allowed_roots"].is_array()) {
            std::cerr << "[ConfigManager] 'allowed_roots' must be an array of strings\n";
            return false;
        }
        for (const auto& r : j["allowed_roots"]) {
            if (!r.is_string() || r.get<std::string>().empty() || r.get<std::string>()[0] != '/') {
                std::cerr << "[ConfigManager] 'allowed_roots' entries must be absolute paths\n";
                return false;
            }
            c.allowed_roots.push_back(r.get<std::string>());
        }
    }

    std::uint64_t hist = c.history_limit;
    if (!read_uint(j, "history_limit", hist)) return false;
    c.history_limit = static_cast<std::size_t>(hist);

    if (j.contains("use_mock")) {
        if (!j["use_mock"].is_boolean()) { std::cerr << "[ConfigManager] 'use_mock' must be a boolean\n"; return false; }
        c.use_mock = j["use_mock"].get<bool>();
    }
    if (!read_string(j, "log_path", c.log_path)) return false;
    if (!read_string(j, "history_path", c.history_path)) return false;

    cfg_ = std::move(c);
    return true;
}


// Desc: build canonical JSON of the effective settings (sorted roots)
// In: (none)
// Out: std::string (JSON)
std::string ConfigManager::canonicalConfigJson() const {
    std::vector<std::string> roots = cfg_.allowed_roots;
    std::sort(roots.begin(), roots.end());
    json c;
    c["plan"]                = cfg_.auto_plan ? std::string("auto") : std::string(plan_type_name(cfg_.plan_type));
    c["custom_limit"]        = cfg_.custom_limit;
    c["update_interval_sec"] = cfg_.update_interval_sec;
    c["debounce_ms"]         = cfg_.debounce_ms;
    c["clock_skew_sec"]      = cfg_.clock_skew_sec;
    c["max_line_bytes"]      = cfg_.max_line_bytes;
    c["max_file_bytes"]      = cfg_.max_file_bytes;
    c["max_json_depth"]      = cfg_.max_json_depth;
    c["warning_threshold"]   = cfg_.warning_threshold;
    c["allowed_roots"]       = roots;
    c["history_limit"]       = cfg_.history_limit;
    c["use_mock"]            = cfg_.use_mock;
    return c.dump();
}

std::string ConfigManager::fingerprint() const {
    return sha256_hex(canonicalConfigJson());
}
