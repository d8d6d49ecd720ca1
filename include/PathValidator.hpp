#pragma once
#include "IngestError.hpp"
#include "ConfigManager.hpp"
#include <cstddef>
#include <string>
#include <vector>

constexpr std::size_t kMaxPathLength = 4096;

// Canonicalizes candidate paths and bounds them to an allow-list of roots.
class PathValidator {
public:
    explicit PathValidator(const std::vector<std::string>& allowed_roots);

    // home subtree + system claude dirs + cfg.allowed_roots
    static PathValidator fromConfig(const MonitorConfig& cfg);

    // Out: IngestError::None and the canonical path, or InvalidPath with reason
    IngestError validate(const std::string& candidate,
                         std::string& out_canonical,
                         std::string& reason) const;

    bool isWithinAllowedRoots(const std::string& canonical) const;
    const std::vector<std::string>& allowedRoots() const { return roots_; }

private:
    std::vector<std::string> roots_;
};

std::string home_directory();

// CLAUDE_DATA_PATHS entries, then CLAUDE_DATA_PATH, then the default locations.
std::vector<std::string> candidate_data_roots();

// Validate candidates, drop missing/duplicate/non-directory roots. Rejections are
// logged and counted, never fatal.
std::vector<std::string> discover_data_roots(const PathValidator& validator,
                                             const std::vector<std::string>& candidates,
                                             int log_fd,
                                             std::uint64_t* rejected_count);
