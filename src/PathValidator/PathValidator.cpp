#include "PathValidator.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

static const char* kSystemRoots[] = {
    "/opt/claude",
    "/usr/local/share/claude",
    "/var/lib/claude",
};


// Desc: normalize a root to canonical form without requiring it to exist
// In: const std::string& path
// Out: std::string (normalized, no trailing '/')
static std::string normalizeRoot(const std::string& path) {
    std::error_code ec;
    fs::path norm = fs::weakly_canonical(fs::path(path), ec);
    std::string result = ec ? fs::path(path).lexically_normal().string() : norm.string();
    while (result.size() > 1 && result.back() == '/')
        result.pop_back();
    return result;
}

// Desc: true if any '/'-separated segment equals ".."
// In: const std::string& p
// Out: bool
static bool hasTraversalSegment(const std::string& p) {
    size_t start = 0;
    while (start <= p.size()) {
        size_t end = p.find('/', start);
        if (end == std::string::npos) end = p.size();
        if (p.compare(start, end - start, "..") == 0 && end - start == 2) return true;
        start = end + 1;
    }
    return false;
}


PathValidator::PathValidator(const std::vector<std::string>& allowed_roots) {
    for (const auto& r : allowed_roots) {
        if (r.empty()) continue;
        std::string n = normalizeRoot(r);
        if (std::find(roots_.begin(), roots_.end(), n) == roots_.end())
            roots_.push_back(n);
    }
}

PathValidator PathValidator::fromConfig(const MonitorConfig& cfg) {
    std::vector<std::string> roots;
    const std::string home = home_directory();
    if (!home.empty()) roots.push_back(home);
    for (const char* s : kSystemRoots) roots.emplace_back(s);
    for (const auto& r : cfg.allowed_roots) roots.push_back(r);
    return PathValidator(roots);
}

bool PathValidator::isWithinAllowedRoots(const std::string& canonical) const {
    for (const auto& root : roots_) {
        if (root == "/") return true;
        if (canonical == root) return true;
        if (canonical.size() > root.size() &&
            canonical.compare(0, root.size(), root) == 0 &&
            canonical[root.size()] == '/') return true;
    }
    return false;
}

// Desc: validate and canonicalize a candidate path
// In: const std::string& candidate, std::string& out_canonical, std::string& reason
// Out: IngestError (None on success, InvalidPath otherwise)
IngestError PathValidator::validate(const std::string& candidate,
                                    std::string& out_canonical,
                                    std::string& reason) const {
    out_canonical.clear();

    if (std::all_of(candidate.begin(), candidate.end(), [](unsigned char c){ return std::isspace(c); })) {
        reason = "empty path";
        return IngestError::InvalidPath;
    }
    if (candidate.find('\0') != std::string::npos) {
        reason = "path contains null byte";
        return IngestError::InvalidPath;
    }
    if (candidate.size() > kMaxPathLength) {
        reason = "path too long (max " + std::to_string(kMaxPathLength) + ")";
        return IngestError::InvalidPath;
    }
    if (hasTraversalSegment(candidate)) {
        reason = "path traversal segment '..'";
        return IngestError::InvalidPath;
    }

    std::error_code ec;
    fs::path canon = fs::canonical(fs::path(candidate), ec);
    if (ec) {
        reason = "cannot canonicalize: " + ec.message();
        return IngestError::InvalidPath;
    }
    const std::string c = canon.string();
    if (c.size() > kMaxPathLength) {
        reason = "canonical path too long";
        return IngestError::InvalidPath;
    }
    if (!isWithinAllowedRoots(c)) {
        reason = "outside allowed roots: " + c;
        return IngestError::InvalidPath;
    }

    out_canonical = c;
    return IngestError::None;
}


// Desc: resolve the user's home directory ($HOME, then passwd entry)
// In: (none)
// Out: std::string (empty if unknown)
std::string home_directory() {
    const char* h = std::getenv("HOME");
    if (h && *h) return h;
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return pw->pw_dir;
    return {};
}

std::vector<std::string> candidate_data_roots() {
    std::vector<std::string> out;

    if (const char* multi = std::getenv("CLAUDE_DATA_PATHS")) {
        std::string s(multi);
        size_t start = 0;
        while (start <= s.size()) {
            size_t end = s.find(':', start);
            if (end == std::string::npos) end = s.size();
            std::string part = s.substr(start, end - start);
            if (!part.empty()) out.push_back(part);
            start = end + 1;
        }
    }
    if (const char* single = std::getenv("CLAUDE_DATA_PATH")) {
        if (*single) out.emplace_back(single);
    }

    const std::string home = home_directory();
    if (!home.empty()) {
        out.push_back(home + "/.claude/projects");
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && *xdg) out.push_back(std::string(xdg) + "/claude/projects");
        else             out.push_back(home + "/.config/claude/projects");
    }
    return out;
}

std::vector<std::string> discover_data_roots(const PathValidator& validator,
                                             const std::vector<std::string>& candidates,
                                             int log_fd,
                                             std::uint64_t* rejected_count) {
    std::vector<std::string> roots;
    for (const auto& cand : candidates) {
        std::error_code ec;
        // missing default locations are normal; skip quietly
        if (!hasTraversalSegment(cand) && cand.find('\0') == std::string::npos &&
            !fs::exists(fs::path(cand), ec)) {
            #ifdef DEBUG
            log_line(log_fd, LogLevel::Debug, "PathValidator", "root does not exist: " + cand);
            #endif
            continue;
        }

        std::string canon, reason;
        if (validator.validate(cand, canon, reason) != IngestError::None) {
            log_line(log_fd, LogLevel::Warn, "PathValidator",
                     "InvalidPath: rejected data root (" + reason + ")");
            if (rejected_count) ++*rejected_count;
            continue;
        }
        if (!fs::is_directory(fs::path(canon), ec)) {
            #ifdef DEBUG
            log_line(log_fd, LogLevel::Debug, "PathValidator", "root is not a directory: " + canon);
            #endif
            continue;
        }
        if (std::find(roots.begin(), roots.end(), canon) != roots.end()) continue;
        roots.push_back(canon);
    }
    return roots;
}
