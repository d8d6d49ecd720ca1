#include "WatchPipeline.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

#define EVENT_BUF_SIZE 8192
// upper bound on a single poll() so a stuck clock never parks the thread
#define MAX_POLL_MS 1000


int64_t now_ns_monotonic() {
    struct timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (int64_t)ts.tv_sec * 1000000000LL + (int64_t)ts.tv_nsec;
}


void Debouncer::note(const std::string& path, int64_t now_ns) {
    last_seen_[path] = now_ns;
}

std::vector<std::string> Debouncer::take_due(int64_t now_ns) {
    std::vector<std::string> due;
    for (auto it = last_seen_.begin(); it != last_seen_.end();) {
        if (now_ns - it->second >= window_ns_) {
            due.push_back(it->first);
            it = last_seen_.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(due.begin(), due.end());
    return due;
}

int64_t Debouncer::next_deadline_ns() const {
    int64_t best = -1;
    for (const auto& kv : last_seen_) {
        const int64_t d = kv.second + window_ns_;
        if (best < 0 || d < best) best = d;
    }
    return best;
}


FileWatcher::FileWatcher(const MonitorConfig& cfg, int log_fd)
    : mask_(IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO),
      debounce_ns_(static_cast<int64_t>(cfg.debounce_ms) * 1000000LL),
      log_fd_(log_fd) {}

FileWatcher::~FileWatcher() {
    close();
}

bool FileWatcher::addWatch(const std::string& dir) {
    int wd = inotify_add_watch(inotify_fd_, dir.c_str(), mask_ | IN_ONLYDIR);
    if (wd == -1) {
        log_line(log_fd_, LogLevel::Warn, "FileWatcher",
                 "inotify_add_watch " + dir + ": " + std::strerror(errno));
        return false;
    }
    wd_paths_[wd] = dir;
    return true;
}

void FileWatcher::addWatchRecursive(const std::string& dir) {
    if (!addWatch(dir)) return;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return;
    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code dec;
        if (it->is_directory(dec) && !it->is_symlink(dec)) addWatch(it->path().string());
        it.increment(ec);
        if (ec) ec.clear();
    }
}

// Desc: create inotify instance + wake pipe and register every root
// In: const std::vector<std::string>& roots, std::string& reason
// Out: IngestError (None or WatchInitFailed)
IngestError FileWatcher::init(const std::vector<std::string>& roots, std::string& reason) {
    if (inotify_fd_ != -1) return IngestError::None;

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ == -1) {
        reason = std::string("inotify_init1: ") + std::strerror(errno);
        return IngestError::WatchInitFailed;
    }
    if (::pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) == -1) {
        reason = std::string("pipe2: ") + std::strerror(errno);
        close();
        return IngestError::WatchInitFailed;
    }

    for (const auto& r : roots) addWatchRecursive(r);
    if (wd_paths_.empty()) {
        reason = "no data root could be watched";
        close();
        return IngestError::WatchInitFailed;
    }
    log_line(log_fd_, LogLevel::Info, "FileWatcher",
             "watching " + std::to_string(roots.size()) + " root(s), "
             + std::to_string(wd_paths_.size()) + " director(ies)");
    return IngestError::None;
}

// Desc: read every queued inotify event and feed the debouncer
// In: Debouncer& debouncer
// Out: void
void FileWatcher::drainEvents(Debouncer& debouncer) {
    alignas(struct inotify_event) char buffer[EVENT_BUF_SIZE];
    while (true) {
        ssize_t len = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (len < 0 && errno == EINTR) continue;
        if (len <= 0) return;  // EAGAIN: queue drained

        const int64_t now = now_ns_monotonic();
        for (char* p = buffer; p < buffer + len;) {
            const struct inotify_event* ev = reinterpret_cast<const struct inotify_event*>(p);
            p += sizeof(struct inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                // events were lost; treat as a change of everything
                debouncer.note("*overflow*", now);
                continue;
            }
            if (ev->mask & IN_IGNORED) {
                wd_paths_.erase(ev->wd);
                continue;
            }
            auto it = wd_paths_.find(ev->wd);
            if (it == wd_paths_.end() || ev->len == 0) continue;

            const std::string name(ev->name);
            const std::string full = it->second + "/" + name;
            if (ev->mask & IN_ISDIR) {
                if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
                    addWatchRecursive(full);
                    debouncer.note(full, now);
                }
                continue;
            }
            if (name.size() > 6 && name.compare(name.size() - 6, 6, ".jsonl") == 0) {
                debouncer.note(full, now);
            }
        }
    }
}

// Desc: poll inotify + wake pipe; flush due paths as one rescan request
// In: RescanChannel& channel
// Out: void (returns after stop())
void FileWatcher::run(RescanChannel& channel) {
    if (inotify_fd_ == -1) return;
    Debouncer debouncer(debounce_ns_);

    // [Main loop of watch thread]
    while (!stopping_.load()) {
        int timeout_ms = -1;
        const int64_t deadline = debouncer.next_deadline_ns();
        if (deadline >= 0) {
            const int64_t wait_ns = std::max<int64_t>(0, deadline - now_ns_monotonic());
            timeout_ms = static_cast<int>(std::min<int64_t>(MAX_POLL_MS, (wait_ns + 999999) / 1000000));
        }

        struct pollfd fds[2];
        fds[0].fd = inotify_fd_;  fds[0].events = POLLIN; fds[0].revents = 0;
        fds[1].fd = wake_fds_[0]; fds[1].events = POLLIN; fds[1].revents = 0;
        int rc = ::poll(fds, 2, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            log_line(log_fd_, LogLevel::Error, "FileWatcher", std::string("poll: ") + std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (fds[0].revents & POLLIN) drainEvents(debouncer);

        const std::vector<std::string> due = debouncer.take_due(now_ns_monotonic());
        if (!due.empty()) {
            #ifdef DEBUG
            log_line(log_fd_, LogLevel::Debug, "FileWatcher", "rescan after changes to " + std::to_string(due.size()) + " path(s)");
            #endif
            flushes_.fetch_add(1);
            channel.request();
        }
    }
    #ifdef DEBUG
    log_line(log_fd_, LogLevel::Debug, "FileWatcher", "watch loop stopped");
    #endif
}

void FileWatcher::stop() {
    stopping_.store(true);
    if (wake_fds_[1] != -1) {
        const char b = 1;
        ssize_t _wr = ::write(wake_fds_[1], &b, 1);
        (void)_wr;
    }
}

// Desc: remove every watch and close all descriptors (idempotent)
// In: (none)
// Out: void
void FileWatcher::close() {
    if (inotify_fd_ != -1) {
        for (const auto& kv : wd_paths_) inotify_rm_watch(inotify_fd_, kv.first);
        wd_paths_.clear();
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    for (int& fd : wake_fds_) {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
}
