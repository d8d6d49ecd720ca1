// === include/SessionStore.hpp ===
#pragma once
#include "UsageTypes.hpp"
#include <string>
#include <vector>

// JSON array of sessions: history (closed) followed by the open session, if any.
// Times are RFC3339 UTC; end_time is null while a session is open.
std::string sessions_to_json(const std::vector<ObservedSession>& history,
                             const ObservedSession* current);

bool sessions_from_json(const std::string& text,
                        std::vector<ObservedSession>& history,
                        ObservedSession& current,
                        bool& has_current,
                        std::string& error);

// Written to path + ".tmp" then renamed over path.
bool save_sessions(const std::string& path,
                   const std::vector<ObservedSession>& history,
                   const ObservedSession* current);

// Missing file -> true with nothing loaded.
bool load_sessions(const std::string& path,
                   std::vector<ObservedSession>& history,
                   ObservedSession& current,
                   bool& has_current,
                   std::string& error);
