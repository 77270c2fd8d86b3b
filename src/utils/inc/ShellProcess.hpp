#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <sys/types.h>

// Output and status of one finished (or killed) shell command.
struct ProcessResult {
    int exit_code = -1;          // exit status, or 128 + signal when killed by a signal
    std::string combined;        // stdout and stderr in arrival order
    std::string stdout_text;     // stdout only
    bool timed_out = false;
    double duration_ms = 0.0;
};

// Runs one command through the shell as a scoped resource: the child gets its
// own process group, and the destructor kills and reaps it and closes every
// pipe no matter how run() was left.
class ShellProcess {
public:
    struct Options {
        std::string command;
        std::filesystem::path working_dir;
        std::chrono::milliseconds timeout{0};   // 0 = no limit
        std::string shell = "/bin/sh";
    };

    explicit ShellProcess(Options options);
    ~ShellProcess();

    ShellProcess(const ShellProcess&) = delete;
    ShellProcess& operator=(const ShellProcess&) = delete;

    // Blocks until the command exits or the timeout fires.
    // Throws std::system_error when the process cannot be started.
    ProcessResult run();

    // Convenience wrapper for one-shot commands
    static ProcessResult execute(const Options& options);

    // Kills the process group of the command currently running, if any.
    // Async-signal-safe; meant for SIGINT/SIGTERM handlers.
    static void kill_active() noexcept;

private:
    void spawn();
    void drain(ProcessResult& result);
    bool read_available(int& fd, ProcessResult& result, bool is_stdout);
    bool try_reap(int& status);
    void kill_group();
    void close_pipes();

    Options options_;
    pid_t pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;

    static std::atomic<pid_t> active_group_;
};
