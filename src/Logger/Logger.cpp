// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>


const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

// Desc: format and write one log line in a single write()
// In: int log_fd, LogLevel lvl, const char* tag, const std::string& msg
// Out: void
void log_line(int log_fd, LogLevel lvl, const char* tag, const std::string& msg) {
    time_t now = ::time(nullptr);
    char tbuf[64];
    ctime_r(&now, tbuf);
    tbuf[std::strlen(tbuf) - 1] = '\0';

    std::string line = "[" + std::string(tbuf) + "] [" + log_level_name(lvl) + "] ["
                     + (tag ? tag : "-") + "] " + msg + "\n";
    const int fd = (log_fd >= 0) ? log_fd : STDERR_FILENO;
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
}

// Desc: logger loop to read from pipe and append to log file
// In: int pipe_read_fd, const std::string& log_path
// Out: void (returns on EOF)
void logger_loop(int pipe_read_fd, const std::string& log_path) {
    char buf[4096];
    FILE* f = std::fopen(log_path.c_str(), "a");
    if (!f) {
        std::fprintf(stderr, "[Logger] cannot open %s: %s (logging to stderr)\n",
                     log_path.c_str(), std::strerror(errno));
    }
    // [Main loop of logger thread]
    while (true) {
        ssize_t len = ::read(pipe_read_fd, buf, sizeof(buf));
        if (len < 0 && errno == EINTR) continue;
        if (len <= 0) break;
        if (f) {
            std::fwrite(buf, 1, static_cast<size_t>(len), f);
            std::fflush(f);
        } else {
            ssize_t _wr = ::write(STDERR_FILENO, buf, static_cast<size_t>(len));
            (void)_wr;
        }
    }
    if (f) std::fclose(f);
}

// Desc: create the log pipe and start the logger thread
// In: const std::string& log_path
// Out: bool (false if pipe creation failed)
bool LoggerPipe::start(const std::string& log_path) {
    if (write_fd_ >= 0) return true;
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        std::fprintf(stderr, "[Logger] pipe failed: %s\n", std::strerror(errno));
        return false;
    }
    read_fd_  = fds[0];
    write_fd_ = fds[1];
    thr_ = std::thread(logger_loop, read_fd_, log_path);
    return true;
}

// Desc: close the write end so the logger drains and exits, then join
// In: (none)
// Out: void
void LoggerPipe::stop() {
    if (write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
    if (thr_.joinable()) thr_.join();
    if (read_fd_ >= 0) {
        ::close(read_fd_);
        read_fd_ = -1;
    }
}
