#pragma once
#include "ConfigManager.hpp"
#include "IngestError.hpp"
#include "RescanChannel.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Coalesces bursts of events per path. A path is due once no event for it
// arrived during the debounce window.
class Debouncer {
public:
    explicit Debouncer(int64_t window_ns) : window_ns_(window_ns) {}

    void note(const std::string& path, int64_t now_ns);

    // Removes and returns every due path (sorted).
    std::vector<std::string> take_due(int64_t now_ns);

    bool empty() const { return last_seen_.empty(); }
    std::size_t pending() const { return last_seen_.size(); }

    // Earliest instant a pending path becomes due; -1 when nothing is pending.
    int64_t next_deadline_ns() const;

private:
    int64_t window_ns_;
    std::unordered_map<std::string, int64_t> last_seen_;
};

// inotify watcher over data roots (recursive). Owns the inotify fd, every
// watch descriptor and a wake-up pipe; all are released by close()/destructor.
class FileWatcher {
public:
    FileWatcher(const MonitorConfig& cfg, int log_fd);
    ~FileWatcher();
    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    // WatchInitFailed when inotify is unavailable or no root could be watched.
    IngestError init(const std::vector<std::string>& roots, std::string& reason);

    // Blocks until stop(). Each debounce flush posts one request to channel.
    void run(RescanChannel& channel);

    // Safe from any thread; run() returns promptly.
    void stop();

    // Remove watches and close descriptors. Call after run() has returned.
    void close();

    std::size_t watchCount() const { return wd_paths_.size(); }
    uint64_t flushes() const { return flushes_.load(); }

private:
    bool addWatch(const std::string& dir);
    void addWatchRecursive(const std::string& dir);
    void drainEvents(Debouncer& debouncer);

    uint32_t mask_;
    int64_t debounce_ns_;
    int log_fd_;
    int inotify_fd_{-1};
    int wake_fds_[2]{-1, -1};
    std::unordered_map<int, std::string> wd_paths_;
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> flushes_{0};
};

// Monotonic clock in ns (debounce timing).
int64_t now_ns_monotonic();
