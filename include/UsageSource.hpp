#pragma once
#include "ConfigManager.hpp"
#include "IngestError.hpp"
#include "PathValidator.hpp"
#include "RecordParser.hpp"
#include "UsageTypes.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

struct SourceFile {
    std::string path;       // canonical
    uint64_t    size{0};
    int64_t     mtime_ns{0};
};

// What a pass would read. An empty fingerprint means "always re-read".
struct SourceListing {
    std::vector<SourceFile> files;   // discovery order
    std::string fingerprint;
};

// Capability selected once at startup: produces UsageEntry lists.
class UsageSource {
public:
    virtual ~UsageSource() = default;

    virtual const char* name() const = 0;

    // Directories to watch for changes; empty disables the watcher.
    virtual std::vector<std::string> watchRoots() const = 0;

    virtual SourceListing list(int64_t now_ns, DerivationReport& report) = 0;

    // One entry list per source file, in discovery order, each in line order.
    // NoDataFound when nothing usable was produced.
    virtual IngestError read(const SourceListing& listing,
                             int64_t now_ns,
                             std::vector<std::vector<UsageEntry>>& per_file,
                             DerivationReport& report) = 0;
};

// JSONL files under validated data roots.
class FileUsageSource : public UsageSource {
public:
    FileUsageSource(const MonitorConfig& cfg,
                    PathValidator validator,
                    std::vector<std::string> candidate_roots,
                    int log_fd);

    const char* name() const override { return "files"; }
    std::vector<std::string> watchRoots() const override;
    SourceListing list(int64_t now_ns, DerivationReport& report) override;
    IngestError read(const SourceListing& listing,
                     int64_t now_ns,
                     std::vector<std::vector<UsageEntry>>& per_file,
                     DerivationReport& report) override;

    const PathValidator& validator() const { return validator_; }

private:
    MonitorConfig cfg_;
    PathValidator validator_;
    std::vector<std::string> candidates_;
    RecordParser parser_;
    int log_fd_;
};

// Deterministic synthetic entries over the trailing hours, for demos and tests.
class MockUsageSource : public UsageSource {
public:
    explicit MockUsageSource(uint32_t seed, int log_fd = -1);

    const char* name() const override { return "mock"; }
    std::vector<std::string> watchRoots() const override { return {}; }
    SourceListing list(int64_t now_ns, DerivationReport& report) override;
    IngestError read(const SourceListing& listing,
                     int64_t now_ns,
                     std::vector<std::vector<UsageEntry>>& per_file,
                     DerivationReport& report) override;

private:
    uint32_t seed_;
    int log_fd_;
};

// Fingerprint of the sorted (path, size, mtime) list.
std::string listing_fingerprint(std::vector<SourceFile> files);

// Regular *.jsonl files under root, sorted by path. Permission-denied
// directories are skipped; directory symlinks are not followed.
std::vector<std::string> find_jsonl_files(const std::string& root, int log_fd);
