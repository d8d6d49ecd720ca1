#pragma once
#include "ConfigManager.hpp"
#include "IngestError.hpp"
#include "UsageTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class ParseStatus {
    Usage,      // out filled
    NotUsage,   // valid record without usage data, skipped silently
    Malformed   // MalformedRecord, reason filled
};

// Turns JSONL lines into UsageEntry values under size and nesting ceilings.
class RecordParser {
public:
    RecordParser(const MonitorConfig& cfg, int log_fd);

    ParseStatus parse_line(const std::string& line,
                           const std::string& source_file,
                           std::uint64_t line_no,
                           UsageEntry& out,
                           std::string& reason) const;

    // Whole-file ceiling is checked with stat() before the file is opened.
    // Appends entries in line order. Returns FileTooLarge / ReadFailed for a
    // skipped file, None otherwise (individual bad lines only bump counters).
    IngestError parse_file(const std::string& path,
                           std::vector<UsageEntry>& out,
                           DerivationReport& report) const;

private:
    std::uint64_t max_line_bytes_;
    std::uint64_t max_file_bytes_;
    std::uint32_t max_depth_;
    int log_fd_;
};
