#include "RecordParser.hpp"
#include "Logger.hpp"
#include "TimeUtil.hpp"

#include <cerrno>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
using nlohmann::json;

#define READ_CHUNK 65536

namespace {

struct DepthLimitExceeded : std::runtime_error {
    DepthLimitExceeded() : std::runtime_error("nesting too deep") {}
};

// Desc: find a member of an object by key
// In: const json& j, const char* key
// Out: const json* (nullptr if j is not an object or key missing)
const json* member(const json& j, const char* key) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    if (it == j.end()) return nullptr;
    return &*it;
}

// Desc: first string found among (object, key) candidates
// In: const json* a, const char* ka, const json* b, const char* kb
// Out: std::string (empty if none)
std::string first_string(const json* a, const char* ka, const json* b, const char* kb) {
    if (a) {
        const json* v = member(*a, ka);
        if (v && v->is_string()) return v->get<std::string>();
    }
    if (b) {
        const json* v = member(*b, kb);
        if (v && v->is_string()) return v->get<std::string>();
    }
    return {};
}

// Desc: read one optional token counter
// In: const json& usage, const char* key, uint64_t& out
// Out: bool (false if present and not an integer in [0, 2^32-1])
bool read_tokens(const json& usage, const char* key, uint64_t& out) {
    out = 0;
    const json* v = member(usage, key);
    if (!v || v->is_null()) return true;
    if (v->is_number_unsigned()) {
        out = v->get<uint64_t>();
    } else if (v->is_number_integer()) {
        int64_t s = v->get<int64_t>();
        if (s < 0) return false;
        out = static_cast<uint64_t>(s);
    } else {
        return false;
    }
    return out <= std::numeric_limits<uint32_t>::max();
}

} // namespace


RecordParser::RecordParser(const MonitorConfig& cfg, int log_fd)
    : max_line_bytes_(cfg.max_line_bytes),
      max_file_bytes_(cfg.max_file_bytes),
      max_depth_(cfg.max_json_depth),
      log_fd_(log_fd) {}


// Desc: parse one JSONL line into a UsageEntry
// In: line, source_file, line_no, UsageEntry& out, std::string& reason
// Out: ParseStatus
ParseStatus RecordParser::parse_line(const std::string& line,
                                     const std::string& source_file,
                                     std::uint64_t line_no,
                                     UsageEntry& out,
                                     std::string& reason) const {
    if (line.size() > max_line_bytes_) {
        reason = "line too large (" + std::to_string(line.size()) + " bytes, max "
               + std::to_string(max_line_bytes_) + ")";
        return ParseStatus::Malformed;
    }

    // nesting is checked as containers open, before any deeper level is built
    const int max_depth = static_cast<int>(max_depth_);
    json::parser_callback_t cb = [max_depth](int depth, json::parse_event_t event, json&) -> bool {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start)
            && depth >= max_depth) {
            throw DepthLimitExceeded();
        }
        return true;
    };

    json j;
    try {
        j = json::parse(line, cb);
    } catch (const DepthLimitExceeded&) {
        reason = "nesting deeper than " + std::to_string(max_depth_) + " levels";
        return ParseStatus::Malformed;
    } catch (const json::parse_error& e) {
        // e.what() quotes the offending text; report the position only
        reason = "invalid JSON at byte " + std::to_string(e.byte);
        return ParseStatus::Malformed;
    } catch (const json::exception& e) {
        reason = "invalid JSON (error " + std::to_string(e.id) + ")";
        return ParseStatus::Malformed;
    }

    if (!j.is_object()) {
        reason = "record is not a JSON object";
        return ParseStatus::Malformed;
    }

    const json* type = member(j, "type");
    if (type && type->is_string() && type->get<std::string>() == "summary") {
        return ParseStatus::NotUsage;
    }

    const json* message = member(j, "message");
    if (message && !message->is_object()) message = nullptr;

    const json* usage = message ? member(*message, "usage") : nullptr;
    if (!usage) usage = member(j, "usage");
    if (!usage || !usage->is_object()) {
        return ParseStatus::NotUsage;
    }

    const json* ts = member(j, "timestamp");
    int64_t ts_ns = 0;
    if (!ts || !ts->is_string() || !parse_rfc3339(ts->get<std::string>(), ts_ns)) {
        reason = "missing or invalid timestamp";
        return ParseStatus::Malformed;
    }

    UsageEntry e;
    e.timestamp_ns = ts_ns;
    if (!read_tokens(*usage, "input_tokens", e.input_tokens) ||
        !read_tokens(*usage, "output_tokens", e.output_tokens) ||
        !read_tokens(*usage, "cache_creation_input_tokens", e.cache_creation_tokens) ||
        !read_tokens(*usage, "cache_read_input_tokens", e.cache_read_tokens)) {
        reason = "invalid token count";
        return ParseStatus::Malformed;
    }
    e.model       = first_string(message, "model", &j, "model");
    e.message_id  = first_string(message, "id", &j, "message_id");
    e.request_id  = first_string(&j, "requestId", &j, "request_id");
    e.source_file = source_file;
    e.line_no     = line_no;

    out = std::move(e);
    return ParseStatus::Usage;
}


// Desc: handle one complete line of a file (counters + logging)
// In: parser, line, oversize, path, line_no, terminated, out, report, log_fd
// Out: void
static void consume_line(const RecordParser& parser,
                         std::string& line,
                         bool oversize,
                         const std::string& path,
                         uint64_t line_no,
                         bool terminated,
                         std::vector<UsageEntry>& out,
                         DerivationReport& report,
                         int log_fd) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!oversize && line.find_first_not_of(" \t") == std::string::npos) return;

    if (oversize) {
        report.lines_read++;
        report.malformed_lines++;
        log_line(log_fd, LogLevel::Info, "RecordParser",
                 "MalformedRecord: " + path + ":" + std::to_string(line_no) + " line too large");
        return;
    }

    UsageEntry e;
    std::string reason;
    const ParseStatus status = parser.parse_line(line, path, line_no, e, reason);
    if (status == ParseStatus::Malformed && !terminated) {
        // writer has not finished this line yet
        #ifdef DEBUG
        log_line(log_fd, LogLevel::Debug, "RecordParser", "incomplete trailing line " + path + ":" + std::to_string(line_no));
        #endif
        return;
    }

    report.lines_read++;
    switch (status) {
        case ParseStatus::Usage:
            report.usage_entries++;
            out.push_back(std::move(e));
            break;
        case ParseStatus::NotUsage:
            report.non_usage_lines++;
            break;
        case ParseStatus::Malformed:
            report.malformed_lines++;
            log_line(log_fd, LogLevel::Info, "RecordParser",
                     "MalformedRecord: " + path + ":" + std::to_string(line_no) + " " + reason);
            break;
    }
}

IngestError RecordParser::parse_file(const std::string& path,
                                     std::vector<UsageEntry>& out,
                                     DerivationReport& report) const {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        log_line(log_fd_, LogLevel::Warn, "RecordParser",
                 "ReadFailed: stat " + path + ": " + std::strerror(errno));
        report.files_unreadable++;
        return IngestError::ReadFailed;
    }
    if (static_cast<uint64_t>(st.st_size) > max_file_bytes_) {
        log_line(log_fd_, LogLevel::Warn, "RecordParser",
                 "FileTooLarge: skipping " + path + " (" + std::to_string(st.st_size)
                 + " bytes, max " + std::to_string(max_file_bytes_) + ")");
        report.files_too_large++;
        return IngestError::FileTooLarge;
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        log_line(log_fd_, LogLevel::Warn, "RecordParser",
                 "ReadFailed: open " + path + ": " + std::strerror(errno));
        report.files_unreadable++;
        return IngestError::ReadFailed;
    }
    report.files_scanned++;

    std::vector<char> buf(READ_CHUNK);
    std::string line;
    bool oversize = false;
    uint64_t line_no = 0;
    uint64_t total = 0;

    // [Read loop] never holds more than one line (capped) in memory
    while (true) {
        ssize_t r = ::read(fd, buf.data(), buf.size());
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) {
            log_line(log_fd_, LogLevel::Warn, "RecordParser",
                     "ReadFailed: read " + path + ": " + std::strerror(errno));
            break;
        }
        if (r == 0) break;

        size_t n = static_cast<size_t>(r);
        // file grew past the ceiling after stat(): stop at the ceiling
        if (total + n > max_file_bytes_) n = static_cast<size_t>(max_file_bytes_ - total);
        total += n;

        size_t pos = 0;
        while (pos < n) {
            const char* nl = static_cast<const char*>(std::memchr(buf.data() + pos, '\n', n - pos));
            size_t seg_end = nl ? static_cast<size_t>(nl - buf.data()) : n;
            if (!oversize) {
                size_t seg_len = seg_end - pos;
                if (line.size() + seg_len > max_line_bytes_ + 1) {
                    oversize = true;
                    line.clear();
                } else {
                    line.append(buf.data() + pos, seg_len);
                }
            }
            if (!nl) break;
            ++line_no;
            consume_line(*this, line, oversize, path, line_no, true, out, report, log_fd_);
            line.clear();
            oversize = false;
            pos = seg_end + 1;
        }
        if (total >= max_file_bytes_) break;
    }
    if (!line.empty() || oversize) {
        ++line_no;
        consume_line(*this, line, oversize, path, line_no, false, out, report, log_fd_);
    }

    ::close(fd);
    return IngestError::None;
}
