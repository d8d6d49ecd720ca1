// main.cpp
#include "Logger.hpp"
#include "MetricsCalculator.hpp"
#include "MonitorEngine.hpp"
#include "PathValidator.hpp"
#include "SessionStore.hpp"
#include "TimeUtil.hpp"
#include "UsageSource.hpp"
#include "requirements.hpp"

#include <csignal>
#include <signal.h>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <chrono>

#define MOCK_SEED 42u

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

void print_help() {
    std::cout << "Usage:\n"
              << "  ./tokenwatch                 Monitor usage until SIGINT/SIGTERM (default)\n"
              << "  ./tokenwatch status          One pass, print the current session, exit\n"
              << "  ./tokenwatch history [N]     Print up to N past sessions (default 10), newest first\n"
              << "  ./tokenwatch --mock          Use the synthetic usage source\n"
              << "  ./tokenwatch -h, --help      Show this help message\n";
}

// Desc: one-line summary of a snapshot
// In: const MonitorSnapshot& s
// Out: std::string
static std::string status_line(const MonitorSnapshot& s) {
    if (!s.has_session) return "[tokenwatch] no active session (no usage data found)";
    const ObservedSession& o = s.session;
    const UsageMetrics& m = s.metrics;
    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "[tokenwatch] %s %s plan=%s tokens=%llu/%llu (%.1f%%) rate=%.1f/min "
                  "progress=%.0f%% efficiency=%.2f cache_hit=%.2f depletion=%s%s",
                  o.id.c_str(), o.is_active ? "active" : "ended",
                  plan_type_name(o.plan_type),
                  (unsigned long long)o.tokens_used, (unsigned long long)o.tokens_limit,
                  o.tokens_limit ? 100.0 * (double)o.tokens_used / (double)o.tokens_limit : 100.0,
                  m.usage_rate, m.session_progress * 100.0, m.efficiency_score, m.cache_hit_rate,
                  depletion_kind_name(m.depletion_kind),
                  m.approaching_limit ? " [WARNING: approaching limit]" : "");
    std::string line = buf;
    if (m.depletion_kind == DepletionKind::At) line += " at " + format_rfc3339(m.projected_depletion_ns);
    return line;
}

static void print_status(const MonitorSnapshot& s) {
    std::cout << status_line(s) << "\n";
    if (!s.has_session) return;
    const ObservedSession& o = s.session;
    const TokenBreakdown& b = o.breakdown;
    std::cout << "  window:    " << format_rfc3339(o.start_time_ns) << " .. " << format_rfc3339(o.reset_time_ns) << "\n"
              << "  tokens:    input=" << b.input_tokens << " output=" << b.output_tokens
              << " cache_creation=" << b.cache_creation_tokens << " cache_read=" << b.cache_read_tokens
              << " entries=" << b.entry_count << "\n"
              << "  remaining: " << s.metrics.tokens_remaining
              << "  in/out ratio: " << s.metrics.input_output_ratio << "\n";
    for (const auto& mt : b.model_tokens) {
        std::cout << "  model:     " << mt.first << " " << mt.second << "\n";
    }
    const DerivationReport& r = s.report;
    std::cout << "  scan:      roots=" << r.roots_scanned << " files=" << r.files_scanned
              << " lines=" << r.lines_read << " malformed=" << r.malformed_lines
              << " duplicates=" << r.duplicates_dropped << " skewed=" << r.skewed_entries << "\n";
    for (const auto& k : r.skewed) {
        std::cout << "  skewed:    " << k.source_file << ":" << k.line_no
                  << " " << format_rfc3339(k.timestamp_ns) << "\n";
    }
}

static void print_history(const std::vector<ObservedSession>& hist, size_t n) {
    if (hist.empty()) {
        std::cout << "[tokenwatch] no past sessions\n";
        return;
    }
    size_t shown = 0;
    for (auto it = hist.rbegin(); it != hist.rend() && shown < n; ++it, ++shown) {
        std::cout << it->id << "  " << format_rfc3339(it->start_time_ns)
                  << "  plan=" << plan_type_name(it->plan_type)
                  << "  tokens=" << it->tokens_used << "/" << it->tokens_limit << "\n";
    }
}

int main(int argc, char** argv) {
    std::string mode = "monitor";
    bool mock = false;
    size_t history_n = 10;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help") { print_help(); return 0; }
        if (a == "--mock") { mock = true; continue; }
        if (a == "status" || a == "history" || a == "monitor") { mode = a; continue; }
        if (mode == "history") {
            char* end = nullptr;
            unsigned long v = std::strtoul(a.c_str(), &end, 10);
            if (end && *end == '\0' && v > 0) { history_n = v; continue; }
        }
        std::cerr << "[Main] unknown argument: " << a << "\n";
        print_help();
        return 1;
    }

    auto boot = Requirements::run(Requirements::defaultConfigPath(), Requirements::defaultStateDir());
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }
    const MonitorConfig& cfg = boot.config.config();
    mock = mock || cfg.use_mock;

    // [Persisted sessions]
    std::vector<ObservedSession> hist;
    ObservedSession open;
    bool has_open = false;
    std::string err;
    if (!load_sessions(boot.history_path, hist, open, has_open, err)) {
        std::cerr << "[Main] ignoring unreadable history " << boot.history_path << ": " << err << "\n";
        hist.clear();
        has_open = false;
    }
    if (mode == "history") {
        print_history(hist, history_n);
        return 0;
    }

    // [Logger thread] monitor mode logs to file, one-shot modes to stderr
    LoggerPipe logger;
    int log_fd = -1;
    if (mode == "monitor") {
        if (logger.start(boot.log_path)) log_fd = logger.write_fd();
    }

    std::unique_ptr<UsageSource> source;
    if (mock) {
        source = std::make_unique<MockUsageSource>(MOCK_SEED, log_fd);
    } else {
        source = std::make_unique<FileUsageSource>(cfg, PathValidator::fromConfig(cfg),
                                                   candidate_data_roots(), log_fd);
    }

    MonitorEngine monitor(cfg, std::move(source), log_fd);
    monitor.seed(hist, has_open ? &open : nullptr);

    if (mode == "status") {
        auto snap = monitor.rescan_now();
        print_status(*snap);
        if (!mock) {
            monitor.persistentState(hist, open, has_open);
            if (!save_sessions(boot.history_path, hist, has_open ? &open : nullptr))
                std::cerr << "[Main] failed to write " << boot.history_path << "\n";
        }
        return 0;
    }

    // default: monitor mode
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    monitor.start();
    std::cout << "[Main] monitoring (" << (mock ? "mock data" : "local usage logs")
              << "), Ctrl-C to stop\n";

    uint64_t last_seq = 0;
    auto last_print = std::chrono::steady_clock::now() - std::chrono::hours(1);
    const auto interval = std::chrono::seconds(cfg.update_interval_sec);
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto snap = monitor.snapshot();
        const auto now = std::chrono::steady_clock::now();
        if (snap && snap->sequence != last_seq && now - last_print >= interval) {
            std::cout << status_line(*snap) << std::endl;
            last_seq = snap->sequence;
            last_print = now;
        }
    }

    std::cout << "\n[Main] shutting down\n";
    monitor.stop();
    if (!mock) {
        monitor.persistentState(hist, open, has_open);
        if (!save_sessions(boot.history_path, hist, has_open ? &open : nullptr))
            log_line(log_fd, LogLevel::Error, "Main", "failed to write " + boot.history_path);
    }
    logger.stop();
    return 0;
}
