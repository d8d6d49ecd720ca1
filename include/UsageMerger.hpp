#pragma once
#include "UsageTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Dedup key of an entry; empty when both identifiers are empty.
std::string dedup_key(const UsageEntry& e);

// Merge per-file entry lists (discovery order, each in line order) into one
// stream sorted by timestamp. Ties keep discovery then line order. The first
// entry of each non-empty (message_id, request_id) key wins.
std::vector<UsageEntry> merge_usage_entries(std::vector<std::vector<UsageEntry>>&& per_file,
                                            std::uint64_t& duplicates_dropped);
