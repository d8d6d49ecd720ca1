#pragma once
#include <cstdint>
#include <string>

// Desc: parse an RFC3339 timestamp ("2025-01-02T03:04:05.123Z", "+02:00" offsets)
// Out: true and ns since epoch (UTC) on success
bool parse_rfc3339(const std::string& ts, int64_t& out_ns);

// Desc: format ns since epoch as RFC3339 UTC with millisecond precision
std::string format_rfc3339(int64_t ns);

// Desc: wall clock in ns since epoch
int64_t now_ns_realtime();
