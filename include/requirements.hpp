// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include <string>
#include <vector>

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
    std::string state_dir;
    std::string log_path;       // effective monitor log file
    std::string history_path;   // effective persisted-sessions file
};

class Requirements {
public:
    static StartupResult run(const std::string& config_path,
                             const std::string& state_dir);

    // $TOKENWATCH_CONFIG, else ~/.config/tokenwatch/config.json
    static std::string defaultConfigPath();
    // $XDG_DATA_HOME/tokenwatch, else ~/.local/share/tokenwatch
    static std::string defaultStateDir();

private:
    static bool ensureDir(const std::string& path, StartupResult& out);
    static void fileLog(const std::string& log_file, const std::string& msg);
    static bool loadConfig(const std::string& config_path,
                           StartupResult& out);
    static bool validateConfig(const ConfigManager& cfg,
                               StartupResult& out);
    static void resolvePaths(StartupResult& out);
};
