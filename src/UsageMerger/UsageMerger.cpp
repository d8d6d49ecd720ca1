#include "UsageMerger.hpp"
#include <algorithm>
#include <unordered_set>
#include <utility>


std::string dedup_key(const UsageEntry& e) {
    if (e.message_id.empty() && e.request_id.empty()) return {};
    std::string k;
    k.reserve(e.message_id.size() + e.request_id.size() + 1);
    k.append(e.message_id);
    k.push_back('\x1f');
    k.append(e.request_id);
    return k;
}

// Desc: concatenate, stable-sort by timestamp, drop later duplicates
// In: std::vector<std::vector<UsageEntry>>&& per_file, uint64_t& duplicates_dropped
// Out: std::vector<UsageEntry> (ascending timestamp, unique keys)
std::vector<UsageEntry> merge_usage_entries(std::vector<std::vector<UsageEntry>>&& per_file,
                                            std::uint64_t& duplicates_dropped) {
    duplicates_dropped = 0;

    size_t total = 0;
    for (const auto& f : per_file) total += f.size();

    std::vector<UsageEntry> all;
    all.reserve(total);
    for (auto& f : per_file) {
        for (auto& e : f) all.push_back(std::move(e));
    }
    per_file.clear();

    std::stable_sort(all.begin(), all.end(), [](const UsageEntry& a, const UsageEntry& b) {
        return a.timestamp_ns < b.timestamp_ns;
    });

    std::unordered_set<std::string> seen;
    seen.reserve(all.size());
    std::vector<UsageEntry> out;
    out.reserve(all.size());
    for (auto& e : all) {
        std::string key = dedup_key(e);
        if (!key.empty() && !seen.insert(std::move(key)).second) {
            duplicates_dropped++;
            continue;
        }
        out.push_back(std::move(e));
    }
    return out;
}
