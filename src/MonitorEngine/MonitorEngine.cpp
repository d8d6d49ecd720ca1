// === src/MonitorEngine/MonitorEngine.cpp ===
#include "MonitorEngine.hpp"
#include "Logger.hpp"
#include "MetricsCalculator.hpp"
#include "TimeUtil.hpp"
#include "UsageMerger.hpp"

#include <chrono>
#include <utility>


WallClock MonitorEngine::now_ns_realtime_clock() {
    return []() { return now_ns_realtime(); };
}

MonitorEngine::MonitorEngine(const MonitorConfig& cfg,
                             std::unique_ptr<UsageSource> source,
                             int log_fd,
                             WallClock clock)
    : cfg_(cfg),
      source_(std::move(source)),
      log_fd_(log_fd),
      clock_(std::move(clock)),
      engine_(cfg, log_fd) {}

MonitorEngine::~MonitorEngine() {
    stop();
}

void MonitorEngine::seed(const std::vector<ObservedSession>& history, const ObservedSession* open_session) {
    std::lock_guard<std::mutex> lk(pass_mu_);
    engine_.seed(history, open_session);
    have_previous_ = false;
}

// Desc: one derivation pass: list -> (read -> merge -> derive | reuse) -> metrics -> publish
// In: int64_t now_ns
// Out: std::shared_ptr<const MonitorSnapshot>
std::shared_ptr<const MonitorSnapshot> MonitorEngine::runPass(int64_t now_ns) {
    std::lock_guard<std::mutex> lk(pass_mu_);

    DerivationReport report;
    SourceListing listing = source_->list(now_ns, report);

    const bool reuse = have_previous_ &&
                       !listing.fingerprint.empty() &&
                       listing.fingerprint == last_fingerprint_ &&
                       last_report_.skewed_entries == 0;
    bool has_session = false;
    if (reuse) {
        report = last_report_;
        report.reused_previous = true;
        engine_.refresh(now_ns);
        has_session = last_has_session_;
    } else {
        std::vector<std::vector<UsageEntry>> per_file;
        const IngestError err = source_->read(listing, now_ns, per_file, report);
        if (err == IngestError::NoDataFound) {
            #ifdef DEBUG
            log_line(log_fd_, LogLevel::Debug, "MonitorEngine", "NoDataFound: no usage entries under any root");
            #endif
        }
        std::vector<UsageEntry> entries = merge_usage_entries(std::move(per_file), report.duplicates_dropped);
        has_session = engine_.derive(entries, now_ns, report);

        last_fingerprint_ = listing.fingerprint;
        last_report_      = report;
        last_has_session_ = has_session;
        have_previous_    = true;

        #ifdef DEBUG
        log_line(log_fd_, LogLevel::Debug, "MonitorEngine",
                 "pass: files=" + std::to_string(report.files_scanned)
                 + " entries=" + std::to_string(entries.size())
                 + " malformed=" + std::to_string(report.malformed_lines)
                 + " dup=" + std::to_string(report.duplicates_dropped));
        #endif
    }

    auto snap = std::make_shared<MonitorSnapshot>();
    snap->has_session     = has_session;
    snap->report          = report;
    snap->generated_at_ns = now_ns;
    snap->sequence        = ++sequence_;
    snap->history         = engine_.history();
    if (has_session) {
        snap->session = engine_.current();
        snap->metrics = compute_metrics(snap->session, now_ns, cfg_);
        snap->series  = engine_.series();
    }

    std::shared_ptr<const MonitorSnapshot> out = std::move(snap);
    store_.publish(out);
    return out;
}

std::shared_ptr<const MonitorSnapshot> MonitorEngine::rescan_now() {
    return runPass(clock_());
}

void MonitorEngine::request_rescan() {
    channel_.request();
}

std::shared_ptr<const MonitorSnapshot> MonitorEngine::snapshot() const {
    return store_.latest();
}

std::vector<ObservedSession> MonitorEngine::history() const {
    std::lock_guard<std::mutex> lk(pass_mu_);
    return engine_.history();
}

void MonitorEngine::persistentState(std::vector<ObservedSession>& history,
                                    ObservedSession& current,
                                    bool& has_current) const {
    std::lock_guard<std::mutex> lk(pass_mu_);
    history     = engine_.history();
    has_current = engine_.hasCurrent();
    if (has_current) current = engine_.current();
}

bool MonitorEngine::watcherActive() const {
    std::lock_guard<std::mutex> lk(watcher_mu_);
    return watcher_ != nullptr;
}

// Desc: pass on start, then on every tick or rescan request until shutdown
// In: (none)
// Out: void
void MonitorEngine::monitorLoop() {
    const std::chrono::milliseconds interval(cfg_.update_interval_sec * 1000);
    while (true) {
        runPass(clock_());
        if (channel_.wait_for(interval) == WakeReason::Shutdown) break;
    }
    #ifdef DEBUG
    log_line(log_fd_, LogLevel::Debug, "MonitorEngine", "monitor loop stopped");
    #endif
}

// Desc: start watch task (or polling fallback) and the monitor loop
// In: (none)
// Out: void
void MonitorEngine::start() {
    if (running_) return;
    running_ = true;

    const std::vector<std::string> roots = source_->watchRoots();
    if (roots.empty()) {
        log_line(log_fd_, LogLevel::Info, "MonitorEngine",
                 std::string("no watchable roots for source '") + source_->name()
                 + "', polling every " + std::to_string(cfg_.update_interval_sec) + "s");
    } else {
        auto w = std::make_shared<FileWatcher>(cfg_, log_fd_);
        std::string reason;
        if (w->init(roots, reason) != IngestError::None) {
            log_line(log_fd_, LogLevel::Warn, "MonitorEngine",
                     "WatchInitFailed: " + reason + ", polling every "
                     + std::to_string(cfg_.update_interval_sec) + "s");
        } else {
            std::lock_guard<std::mutex> lk(watcher_mu_);
            watcher_ = w;
            watch_thread_ = std::thread([w, this]() { w->run(channel_); });
        }
    }

    monitor_thread_ = std::thread(&MonitorEngine::monitorLoop, this);
    log_line(log_fd_, LogLevel::Info, "MonitorEngine",
             std::string("started (source=") + source_->name() + ")");
}

// Desc: signal shutdown, join both tasks, release the watcher
// In: (none)
// Out: void
void MonitorEngine::stop() {
    if (!running_) return;
    channel_.shutdown();

    std::shared_ptr<FileWatcher> w;
    {
        std::lock_guard<std::mutex> lk(watcher_mu_);
        w = watcher_;
    }
    if (w) w->stop();
    if (watch_thread_.joinable()) watch_thread_.join();
    if (monitor_thread_.joinable()) monitor_thread_.join();

    {
        std::lock_guard<std::mutex> lk(watcher_mu_);
        if (watcher_) watcher_->close();
        watcher_.reset();
    }
    running_ = false;
    log_line(log_fd_, LogLevel::Info, "MonitorEngine", "stopped");
}
