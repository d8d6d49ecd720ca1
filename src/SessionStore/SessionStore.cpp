// === src/SessionStore/SessionStore.cpp ===
#include "SessionStore.hpp"
#include "TimeUtil.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
using nlohmann::json;


static json session_to_json(const ObservedSession& s) {
    json j;
    j["id"]           = s.id;
    j["plan_type"]    = plan_type_name(s.plan_type);
    j["tokens_used"]  = s.tokens_used;
    j["tokens_limit"] = s.tokens_limit;
    j["start_time"]   = format_rfc3339(s.start_time_ns);
    j["reset_time"]   = format_rfc3339(s.reset_time_ns);
    j["is_active"]    = s.is_active;
    if (s.has_end_time) j["end_time"] = format_rfc3339(s.end_time_ns);
    else                j["end_time"] = nullptr;
    return j;
}

// Desc: read one time field (RFC3339 string)
// In: const json& j, const char* key, int64_t& out, std::string& error
// Out: bool
static bool read_time(const json& j, const char* key, int64_t& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || !parse_rfc3339(it->get<std::string>(), out)) {
        error = std::string("'") + key + "' missing or not an RFC3339 time";
        return false;
    }
    return true;
}

static bool read_count(const json& j, const char* key, uint64_t& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) {
        if (it != j.end() && it->is_number_integer() && it->get<int64_t>() >= 0) {
            out = it->get<uint64_t>();
            return true;
        }
        error = std::string("'") + key + "' missing or not a non-negative integer";
        return false;
    }
    out = it->get<uint64_t>();
    return true;
}

// Desc: decode one persisted session record
// In: const json& j, ObservedSession& s, std::string& error
// Out: bool
static bool session_from_json(const json& j, ObservedSession& s, std::string& error) {
    if (!j.is_object()) { error = "session record is not an object"; return false; }

    auto id = j.find("id");
    if (id == j.end() || !id->is_string() || id->get<std::string>().empty()) {
        error = "'id' missing or not a string";
        return false;
    }
    s.id = id->get<std::string>();

    auto plan = j.find("plan_type");
    if (plan == j.end() || !plan->is_string() || !parse_plan_type(plan->get<std::string>(), s.plan_type)) {
        error = "'plan_type' missing or unknown";
        return false;
    }
    if (!read_count(j, "tokens_used", s.tokens_used, error)) return false;
    if (!read_count(j, "tokens_limit", s.tokens_limit, error)) return false;
    if (!read_time(j, "start_time", s.start_time_ns, error)) return false;
    if (!read_time(j, "reset_time", s.reset_time_ns, error)) return false;

    auto active = j.find("is_active");
    s.is_active = active != j.end() && active->is_boolean() && active->get<bool>();

    auto end = j.find("end_time");
    if (end == j.end() || end->is_null()) {
        s.has_end_time = false;
        s.end_time_ns  = 0;
    } else {
        if (!read_time(j, "end_time", s.end_time_ns, error)) return false;
        s.has_end_time = true;
    }
    return true;
}


std::string sessions_to_json(const std::vector<ObservedSession>& history,
                             const ObservedSession* current) {
    json arr = json::array();
    for (const auto& s : history) arr.push_back(session_to_json(s));
    if (current) arr.push_back(session_to_json(*current));
    return arr.dump(2);
}

bool sessions_from_json(const std::string& text,
                        std::vector<ObservedSession>& history,
                        ObservedSession& current,
                        bool& has_current,
                        std::string& error) {
    json arr;
    try {
        arr = json::parse(text);
    } catch (const json::parse_error& e) {
        error = "invalid JSON at byte " + std::to_string(e.byte);
        return false;
    }
    if (!arr.is_array()) {
        error = "root must be an array";
        return false;
    }

    std::vector<ObservedSession> closed;
    ObservedSession open;
    bool has_open = false;
    size_t idx = 0;
    for (const auto& item : arr) {
        ObservedSession s;
        if (!session_from_json(item, s, error)) {
            error = "record " + std::to_string(idx) + ": " + error;
            return false;
        }
        if (s.has_end_time) {
            closed.push_back(std::move(s));
        } else {
            // latest open record wins
            open = std::move(s);
            has_open = true;
        }
        ++idx;
    }

    history = std::move(closed);
    has_current = has_open;
    if (has_open) current = std::move(open);
    return true;
}


// Desc: persist sessions atomically (tmp + rename)
// In: path, history, current (may be null)
// Out: bool
bool save_sessions(const std::string& path,
                   const std::vector<ObservedSession>& history,
                   const ObservedSession* current) {
    std::error_code ec;
    const std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    const std::string tmp = path + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) return false;
        ofs << sessions_to_json(history, current) << "\n";
        if (!ofs.good()) return false;
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

bool load_sessions(const std::string& path,
                   std::vector<ObservedSession>& history,
                   ObservedSession& current,
                   bool& has_current,
                   std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        history.clear();
        has_current = false;
        return true;
    }
    std::ifstream ifs(path);
    if (!ifs) {
        error = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return sessions_from_json(ss.str(), history, current, has_current, error);
}
