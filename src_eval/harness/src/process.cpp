#include "fixbench/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace fixbench {

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(20);
constexpr auto kDrainGrace = std::chrono::milliseconds(100);

void ignore_sigpipe_once() {
    // A child that exits before consuming stdin must not take the parent down with it.
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int rd{-1};
    int wr{-1};
    ~Pipe() {
        close_fd(rd);
        close_fd(wr);
    }
};

bool open_pipe(Pipe& p, std::string& err) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    p.rd = fds[0];
    p.wr = fds[1];
    return true;
}

void append_limited(std::string& dst, const char* src, std::size_t n, std::size_t limit, bool& truncated) {
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min(n, avail);
    dst.append(src, take);
    if (take < n) truncated = true;
}

// Reads what is available; returns false on EOF (fd is then closed).
bool pump(int& fd, std::string& dst, std::size_t limit, bool& truncated) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_limited(dst, buf, static_cast<std::size_t>(n), limit, truncated);
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        close_fd(fd);
        return false;
    }
}

// Runs between fork and exec in a multi-threaded parent: async-signal-safe calls only.
[[noreturn]] void exec_child(char* const* argv, const char* cwd, int in_fd, int out_fd, int err_fd) {
    ::setsid();
    ::dup2(in_fd, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    static constexpr char kChdirFailed[] = "chdir failed\n";
    static constexpr char kExecFailed[] = "exec failed\n";

    if (cwd != nullptr && ::chdir(cwd) != 0) {
        (void)!::write(STDERR_FILENO, kChdirFailed, sizeof(kChdirFailed) - 1);
        _exit(127);
    }

    ::execvp(argv[0], argv);

    (void)!::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
    _exit(127);
}

void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

}  // namespace

ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* token) {
    ProcessResult result;
    if (spec.argv.empty() || spec.argv.front().empty()) {
        result.error = "empty command";
        return result;
    }
    ignore_sigpipe_once();

    Pipe in_pipe, out_pipe, err_pipe;
    if (!open_pipe(in_pipe, result.error) || !open_pipe(out_pipe, result.error) ||
        !open_pipe(err_pipe, result.error)) {
        return result;
    }

    // Everything the child needs is built before fork.
    std::vector<char*> child_argv;
    child_argv.reserve(spec.argv.size() + 1);
    for (const auto& a : spec.argv) {
        child_argv.push_back(const_cast<char*>(a.c_str()));
    }
    child_argv.push_back(nullptr);
    const char* child_cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        exec_child(child_argv.data(), child_cwd, in_pipe.rd, out_pipe.wr, err_pipe.wr);
    }
    result.started = true;

    close_fd(in_pipe.rd);
    close_fd(out_pipe.wr);
    close_fd(err_pipe.wr);
    ::fcntl(in_pipe.wr, F_SETFL, O_NONBLOCK);
    ::fcntl(out_pipe.rd, F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe.rd, F_SETFL, O_NONBLOCK);

    std::size_t stdin_off = 0;
    if (spec.stdin_text.empty()) {
        close_fd(in_pipe.wr);
    }

    const auto started_at = Clock::now();
    const bool has_timeout = spec.timeout.count() > 0;
    const auto own_deadline = started_at + spec.timeout;

    bool out_trunc = false, err_trunc = false;
    bool reaped = false;
    int status = 0;
    std::optional<Clock::time_point> drain_until;

    for (;;) {
        const auto now = Clock::now();

        if (!reaped) {
            const bool own_expired = has_timeout && now >= own_deadline;
            const bool token_expired = token != nullptr && token->expired();
            if (own_expired || token_expired) {
                kill_group(pid);
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                }
                reaped = true;
                result.timed_out = own_expired;
                result.cancelled = !own_expired;
                spdlog::debug("process {} killed ({})", spec.argv.front(),
                              own_expired ? "timeout" : "cancelled");
                break;
            }
        }

        if (reaped && out_pipe.rd < 0 && err_pipe.rd < 0) break;
        if (drain_until && now >= *drain_until) {
            // Something in the child's group still holds the pipes open.
            kill_group(pid);
            break;
        }

        std::vector<pollfd> fds;
        if (out_pipe.rd >= 0) fds.push_back({out_pipe.rd, POLLIN, 0});
        if (err_pipe.rd >= 0) fds.push_back({err_pipe.rd, POLLIN, 0});
        if (in_pipe.wr >= 0) fds.push_back({in_pipe.wr, POLLOUT, 0});

        auto slice = kPollSlice;
        if (has_timeout && !reaped) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(own_deadline - now);
            slice = std::clamp(left, std::chrono::milliseconds(0), kPollSlice);
        }
        const int rc = ::poll(fds.data(), fds.size(), static_cast<int>(slice.count()));
        if (rc < 0 && errno != EINTR) {
            result.error = std::string("poll failed: ") + std::strerror(errno);
            kill_group(pid);
            if (!reaped) {
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                }
                reaped = true;
            }
            break;
        }

        if (out_pipe.rd >= 0) pump(out_pipe.rd, result.stdout_text, spec.max_output_bytes, out_trunc);
        if (err_pipe.rd >= 0) pump(err_pipe.rd, result.stderr_text, spec.max_output_bytes, err_trunc);

        if (in_pipe.wr >= 0) {
            const auto remaining = spec.stdin_text.size() - stdin_off;
            const ssize_t n = ::write(in_pipe.wr, spec.stdin_text.data() + stdin_off, remaining);
            if (n > 0) {
                stdin_off += static_cast<std::size_t>(n);
                if (stdin_off == spec.stdin_text.size()) close_fd(in_pipe.wr);
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                close_fd(in_pipe.wr);  // EPIPE: child stopped reading
            }
        }

        if (!reaped) {
            const pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
                drain_until = Clock::now() + kDrainGrace;
            }
        }
    }

    if (out_pipe.rd >= 0) pump(out_pipe.rd, result.stdout_text, spec.max_output_bytes, out_trunc);
    if (err_pipe.rd >= 0) pump(err_pipe.rd, result.stderr_text, spec.max_output_bytes, err_trunc);
    if (out_trunc) result.stdout_text += "(truncated)";
    if (err_trunc) result.stderr_text += "(truncated)";

    if (!result.timed_out && !result.cancelled) {
        if (WIFEXITED(status)) {
            result.exited = true;
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }
    }
    return result;
}

}  // namespace fixbench
