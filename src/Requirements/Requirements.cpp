// requirements.cpp
#include "requirements.hpp"
#include "PathValidator.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>


std::string Requirements::defaultConfigPath() {
    const char* env = std::getenv("TOKENWATCH_CONFIG");
    if (env && *env) return env;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/tokenwatch/config.json";
    return home_directory() + "/.config/tokenwatch/config.json";
}

std::string Requirements::defaultStateDir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/tokenwatch";
    return home_directory() + "/.local/share/tokenwatch";
}


// Desc: append a timestamped line to config log file
// In: const std::string& log_file, const std::string& msg
// Out: void
void Requirements::fileLog(const std::string& log_file, const std::string& msg) {
    int fd = ::open(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string line = "[" + std::string(buf) + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

// Desc: create directory (and parents) if missing and record status
// In: const std::string& path, StartupResult& out
// Out: bool (false if it could not be created)
bool Requirements::ensureDir(const std::string& path, StartupResult& out) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec || !std::filesystem::is_directory(path, ec)) {
        out.error = "[ensureDir] cannot create " + path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
    return true;
}

// Desc: load JSON config into StartupResult::config
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    if (out.config.loadedFromFile())
        out.logs.push_back("[config] loaded: " + config_path);
    else
        out.logs.push_back("[config] not found, using defaults: " + config_path);
    return true;
}

// Desc: cross-field checks and summary of effective settings
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    const MonitorConfig& c = cfg.config();

    if (c.max_line_bytes > c.max_file_bytes) {
        out.error = "[config] max_line_size larger than max_file_size";
        out.logs.push_back(out.error);
        return false;
    }
    for (const auto& p : {c.log_path, c.history_path}) {
        if (!p.empty() && p[0] != '/') {
            out.error = "[config] log_path/history_path must be absolute: " + p;
            out.logs.push_back(out.error);
            return false;
        }
    }
    for (const auto& r : c.allowed_roots) {
        struct stat st{};
        if (::stat(r.c_str(), &st) == -1 || !S_ISDIR(st.st_mode)) {
            // not fatal: the root may be created later
            out.logs.push_back("[config] allowed root not a directory (yet): " + r);
        }
    }

    out.logs.push_back(std::string("[config] plan: ")
                       + (c.auto_plan ? std::string("auto") : std::string(plan_type_name(c.plan_type))));
    out.logs.push_back("[config] update_interval_sec: " + std::to_string(c.update_interval_sec));
    out.logs.push_back("[config] max_line_bytes: " + std::to_string(c.max_line_bytes)
                       + " max_file_bytes: " + std::to_string(c.max_file_bytes)
                       + " max_json_depth: " + std::to_string(c.max_json_depth));
    out.logs.push_back("[config] fingerprint: " + cfg.fingerprint());
    out.logs.push_back("[config] validation ok");
    return true;
}

void Requirements::resolvePaths(StartupResult& out) {
    const MonitorConfig& c = out.config.config();
    out.log_path     = c.log_path.empty() ? out.state_dir + "/logs/tokenwatch.log" : c.log_path;
    out.history_path = c.history_path.empty() ? out.state_dir + "/sessions.json" : c.history_path;
    out.logs.push_back("[paths] log: " + out.log_path);
    out.logs.push_back("[paths] history: " + out.history_path);
}


// Desc: orchestrate startup: dirs, config load + validate, paths; log results
// In: const std::string& config_path, const std::string& state_dir
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path,
                                const std::string& state_dir) {
    StartupResult res;
    res.state_dir = state_dir;
    const std::string config_log = state_dir + "/logs/config.log";

    // 1) dirs
    if (!ensureDir(state_dir, res) || !ensureDir(state_dir + "/logs", res)) {
        return res;
    }

    // 2) config load + validate
    if (!loadConfig(config_path, res)) {
        for (auto& l : res.logs) fileLog(config_log, l);
        return res;
    }
    if (!validateConfig(res.config, res)) {
        for (auto& l : res.logs) fileLog(config_log, l);
        return res;
    }

    // 3) output locations
    resolvePaths(res);

    // Ok
    res.ok = true;
    for (auto& l : res.logs) fileLog(config_log, l);
    return res;
}
