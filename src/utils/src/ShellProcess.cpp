#include "ShellProcess.hpp"
#include "TimeRecorder.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kPollSliceMs = 50;

void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

std::atomic<pid_t> ShellProcess::active_group_{-1};

void ShellProcess::kill_active() noexcept {
    pid_t group = active_group_.load();
    if (group > 0) {
        ::killpg(group, SIGKILL);
    }
}

ShellProcess::ShellProcess(Options options) : options_(std::move(options)) {}

ShellProcess::~ShellProcess() {
    if (pid_ > 0) {
        kill_group();
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        active_group_.store(-1);
        pid_ = -1;
    }
    close_pipes();
}

ProcessResult ShellProcess::execute(const Options& options) {
    ShellProcess process(options);
    return process.run();
}

void ShellProcess::spawn() {
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe(out_pipe) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe (stdout)");
    }
    if (::pipe(err_pipe) != 0) {
        int saved = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "pipe (stderr)");
    }
    set_cloexec(out_pipe[0]);
    set_cloexec(err_pipe[0]);

    // Everything the child touches is prepared before fork
    const std::string shell = options_.shell;
    const std::string command = options_.command;
    const std::string workdir = options_.working_dir.string();

    pid_t child = ::fork();
    if (child < 0) {
        int saved = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "fork");
    }

    if (child == 0) {
        // New process group so a timeout can take down the whole pipeline
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);

        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            static const char msg[] = "cannot change to working directory\n";
            ssize_t wr = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)wr;
            ::_exit(127);
        }

        ::execl(shell.c_str(), shell.c_str(), "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // parent
    ::setpgid(child, child); // mirror the child's setpgid (race safety)
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    out_fd_ = out_pipe[0];
    err_fd_ = err_pipe[0];
    set_nonblocking(out_fd_);
    set_nonblocking(err_fd_);
    pid_ = child;
    active_group_.store(child);
}

bool ShellProcess::read_available(int& fd, ProcessResult& result, bool is_stdout) {
    char buf[8192];
    while (fd >= 0) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            result.combined.append(buf, static_cast<size_t>(n));
            if (is_stdout) {
                result.stdout_text.append(buf, static_cast<size_t>(n));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;

        // EOF or read error
        ::close(fd);
        fd = -1;
    }
    return false;
}

void ShellProcess::drain(ProcessResult& result) {
    read_available(out_fd_, result, true);
    read_available(err_fd_, result, false);
}

bool ShellProcess::try_reap(int& status) {
    if (pid_ <= 0) return true;
    pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
        active_group_.store(-1);
        pid_ = -1;
        return true;
    }
    return false;
}

void ShellProcess::kill_group() {
    if (pid_ <= 0) return;
    if (::killpg(pid_, SIGKILL) != 0) {
        ::kill(pid_, SIGKILL);
    }
}

void ShellProcess::close_pipes() {
    if (out_fd_ >= 0) { ::close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { ::close(err_fd_); err_fd_ = -1; }
}

ProcessResult ShellProcess::run() {
    ProcessResult result;
    TimeRecorder timer;

    spawn();

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options_.timeout.count() > 0) {
        deadline = std::chrono::steady_clock::now() + options_.timeout;
    }

    int status = 0;
    bool exited = false;

    while (true) {
        int wait_ms = kPollSliceMs;
        if (deadline) {
            auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now()).count();
            wait_ms = static_cast<int>(std::max<long long>(0, std::min<long long>(remain, kPollSliceMs)));
        }

        std::vector<pollfd> fds;
        if (out_fd_ >= 0) fds.push_back(pollfd{out_fd_, POLLIN, 0});
        if (err_fd_ >= 0) fds.push_back(pollfd{err_fd_, POLLIN, 0});

        int rc = ::poll(fds.empty() ? nullptr : fds.data(), fds.size(), wait_ms);
        if (rc < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (rc > 0) {
            drain(result);
        }

        if (!exited) {
            exited = try_reap(status);
        }

        if (exited) {
            // Background children may keep the pipes open; take what is
            // already buffered and stop.
            drain(result);
            break;
        }

        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            result.timed_out = true;
            kill_group();
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            active_group_.store(-1);
            pid_ = -1;
            drain(result);
            break;
        }
    }

    close_pipes();
    result.exit_code = decode_status(status);
    result.duration_ms = timer.elapsed();
    return result;
}
