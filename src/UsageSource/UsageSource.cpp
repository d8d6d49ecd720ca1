#include "UsageSource.hpp"
#include "Hash.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <sys/stat.h>
#include <utility>

namespace fs = std::filesystem;


std::string listing_fingerprint(std::vector<SourceFile> files) {
    std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
        return a.path < b.path;
    });
    std::string canon;
    for (const auto& f : files) {
        canon += f.path;
        canon += '\t';
        canon += std::to_string(f.size);
        canon += '\t';
        canon += std::to_string(f.mtime_ns);
        canon += '\n';
    }
    return sha256_hex(canon);
}

// Desc: walk a root and collect *.jsonl regular files
// In: const std::string& root, int log_fd
// Out: std::vector<std::string> (sorted)
std::vector<std::string> find_jsonl_files(const std::string& root, int log_fd) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_line(log_fd, LogLevel::Warn, "UsageSource", "ReadFailed: cannot walk " + root + ": " + ec.message());
        return out;
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::directory_entry& de = *it;
        std::error_code fec;
        if (de.path().extension() == ".jsonl" && de.is_regular_file(fec)) {
            out.push_back(de.path().string());
        }
        it.increment(ec);
        if (ec) {
            #ifdef DEBUG
            log_line(log_fd, LogLevel::Debug, "UsageSource", "walk error under " + root + ": " + ec.message());
            #endif
            ec.clear();
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}


FileUsageSource::FileUsageSource(const MonitorConfig& cfg,
                                 PathValidator validator,
                                 std::vector<std::string> candidate_roots,
                                 int log_fd)
    : cfg_(cfg),
      validator_(std::move(validator)),
      candidates_(std::move(candidate_roots)),
      parser_(cfg, log_fd),
      log_fd_(log_fd) {}

std::vector<std::string> FileUsageSource::watchRoots() const {
    return discover_data_roots(validator_, candidates_, log_fd_, nullptr);
}

// Desc: discover roots, walk them, validate and stat every data file
// In: int64_t now_ns, DerivationReport& report
// Out: SourceListing
SourceListing FileUsageSource::list(int64_t now_ns, DerivationReport& report) {
    (void)now_ns;
    SourceListing listing;
    const std::vector<std::string> roots =
        discover_data_roots(validator_, candidates_, log_fd_, &report.roots_rejected);
    report.roots_scanned = roots.size();

    std::vector<std::string> seen;
    for (const auto& root : roots) {
        for (const auto& file : find_jsonl_files(root, log_fd_)) {
            std::string canon, reason;
            if (validator_.validate(file, canon, reason) != IngestError::None) {
                log_line(log_fd_, LogLevel::Warn, "UsageSource",
                         "InvalidPath: skipping " + file + " (" + reason + ")");
                report.files_rejected++;
                continue;
            }
            // overlapping roots or symlinked files resolve to the same file
            if (std::find(seen.begin(), seen.end(), canon) != seen.end()) continue;
            seen.push_back(canon);

            struct stat st{};
            if (::stat(canon.c_str(), &st) != 0) continue;  // removed since the walk
            SourceFile f;
            f.path     = canon;
            f.size     = static_cast<uint64_t>(st.st_size);
            f.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * kNsPerSecond + st.st_mtim.tv_nsec;
            listing.files.push_back(std::move(f));
        }
    }
    listing.fingerprint = listing_fingerprint(listing.files);
    return listing;
}

IngestError FileUsageSource::read(const SourceListing& listing,
                                  int64_t now_ns,
                                  std::vector<std::vector<UsageEntry>>& per_file,
                                  DerivationReport& report) {
    (void)now_ns;
    per_file.clear();
    per_file.reserve(listing.files.size());
    uint64_t produced = 0;
    for (const auto& f : listing.files) {
        // re-validate right before open: the tree may have changed since list()
        std::string canon, reason;
        if (validator_.validate(f.path, canon, reason) != IngestError::None) {
            log_line(log_fd_, LogLevel::Warn, "UsageSource",
                     "InvalidPath: skipping " + f.path + " (" + reason + ")");
            report.files_rejected++;
            continue;
        }
        std::vector<UsageEntry> entries;
        if (parser_.parse_file(canon, entries, report) != IngestError::None) continue;
        produced += entries.size();
        per_file.push_back(std::move(entries));
    }
    return produced == 0 ? IngestError::NoDataFound : IngestError::None;
}


MockUsageSource::MockUsageSource(uint32_t seed, int log_fd)
    : seed_(seed), log_fd_(log_fd) {}

SourceListing MockUsageSource::list(int64_t now_ns, DerivationReport& report) {
    (void)now_ns;
    (void)report;
    return SourceListing{};
}

// Desc: synthesize one entry every ~7 minutes over the last 3 hours
// In: listing (unused), now_ns, per_file, report
// Out: IngestError (always None)
IngestError MockUsageSource::read(const SourceListing& listing,
                                  int64_t now_ns,
                                  std::vector<std::vector<UsageEntry>>& per_file,
                                  DerivationReport& report) {
    (void)listing;
    static const char* kModels[] = {
        "claude-sonnet-4-20250514",
        "claude-opus-4-20250514",
        "claude-3-5-haiku-20241022",
    };

    std::vector<UsageEntry> entries;
    const int64_t span  = 3 * kNsPerHour;
    const int64_t step  = 7 * kNsPerMinute;
    // align to the step so consecutive passes see the same history
    const int64_t begin = ((now_ns - span) / step) * step;
    uint64_t n = 0;
    for (int64_t t = begin; t <= now_ns; t += step, ++n) {
        // per-slot seed: a slot always yields the same entry
        std::mt19937 rng(seed_ + static_cast<uint32_t>(t / step));
        UsageEntry e;
        e.timestamp_ns          = t;
        e.model                 = kModels[rng() % 3];
        e.input_tokens          = 1500 + rng() % 100;
        e.output_tokens         = 200 + rng() % 400;
        e.cache_creation_tokens = rng() % 4 == 0 ? 500 + rng() % 500 : 0;
        e.cache_read_tokens     = rng() % 2 == 0 ? rng() % 3000 : 0;
        e.message_id            = "mock-msg-" + std::to_string(t / kNsPerSecond);
        e.request_id            = "mock-req-" + std::to_string(t / step);
        e.source_file           = "mock";
        e.line_no               = n + 1;
        entries.push_back(std::move(e));
    }
    report.lines_read    += entries.size();
    report.usage_entries += entries.size();
    #ifdef DEBUG
    log_line(log_fd_, LogLevel::Debug, "UsageSource", "mock produced " + std::to_string(entries.size()) + " entries");
    #endif
    per_file.clear();
    per_file.push_back(std::move(entries));
    return IngestError::None;
}
