#pragma once
#include <string>
#include <thread>

enum class LogLevel { Debug = 0, Info, Warn, Error };

const char* log_level_name(LogLevel lvl);

// Write one timestamped line "[time] [LEVEL] [tag] msg" to log_fd.
// log_fd < 0 writes to stderr.
void log_line(int log_fd, LogLevel lvl, const char* tag, const std::string& msg);

// Drain pipe_read_fd into log_path until the write end is closed.
void logger_loop(int pipe_read_fd, const std::string& log_path);

// Pipe + logger thread. write_fd() is handed to every component that logs.
class LoggerPipe {
public:
    LoggerPipe() = default;
    ~LoggerPipe() { stop(); }
    LoggerPipe(const LoggerPipe&) = delete;
    LoggerPipe& operator=(const LoggerPipe&) = delete;

    bool start(const std::string& log_path);
    void stop();
    int  write_fd() const { return write_fd_; }

private:
    int read_fd_{-1};
    int write_fd_{-1};
    std::thread thr_;
};
