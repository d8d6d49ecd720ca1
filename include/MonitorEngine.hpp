#pragma once
#include "ConfigManager.hpp"
#include "RescanChannel.hpp"
#include "SessionEngine.hpp"
#include "SnapshotStore.hpp"
#include "UsageSource.hpp"
#include "WatchPipeline.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using WallClock = std::function<int64_t()>;

// Long-lived monitoring loop plus the background watch task. Collaborators read
// snapshot() / history() and may trigger rescans; nothing here is fatal.
// Started at most once per instance.
class MonitorEngine {
public:
    MonitorEngine(const MonitorConfig& cfg,
                  std::unique_ptr<UsageSource> source,
                  int log_fd,
                  WallClock clock = now_ns_realtime_clock());
    ~MonitorEngine();
    MonitorEngine(const MonitorEngine&) = delete;
    MonitorEngine& operator=(const MonitorEngine&) = delete;

    // Persisted state from a previous run; call before start() / rescan_now().
    void seed(const std::vector<ObservedSession>& history, const ObservedSession* open_session);

    // Starts the watcher (or polling fallback) and the monitor thread.
    void start();
    // Idempotent. Returns after both threads exited and the watcher was released.
    void stop();

    // Asynchronous: wakes the monitor loop.
    void request_rescan();
    // Synchronous pass on the calling thread; publishes and returns the snapshot.
    std::shared_ptr<const MonitorSnapshot> rescan_now();

    // nullptr until the first pass completed
    std::shared_ptr<const MonitorSnapshot> snapshot() const;
    std::vector<ObservedSession> history() const;

    // State to persist: closed history plus the current session, if any.
    void persistentState(std::vector<ObservedSession>& history,
                         ObservedSession& current,
                         bool& has_current) const;

    bool watcherActive() const;
    bool running() const { return running_; }

    static WallClock now_ns_realtime_clock();

private:
    std::shared_ptr<const MonitorSnapshot> runPass(int64_t now_ns);
    void monitorLoop();

    MonitorConfig cfg_;
    std::unique_ptr<UsageSource> source_;
    int log_fd_;
    WallClock clock_;

    // guards the derivation pipeline (source, engine, previous-pass state)
    mutable std::mutex pass_mu_;
    SessionEngine engine_;
    std::string last_fingerprint_;
    bool have_previous_{false};
    bool last_has_session_{false};
    DerivationReport last_report_;
    uint64_t sequence_{0};

    SnapshotStore store_;
    RescanChannel channel_;

    mutable std::mutex watcher_mu_;
    std::shared_ptr<FileWatcher> watcher_;
    std::thread watch_thread_;
    std::thread monitor_thread_;
    bool running_{false};
};
