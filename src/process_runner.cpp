// =============================================================================
// AutoLink - Process Runner
// =============================================================================
// fork/execvp with stdout and stderr drained through poll().
// =============================================================================
#include "process_runner.hpp"
#include "autolink_log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace autolink {

namespace {

struct FdCloser {
    int fd = -1;
    explicit FdCloser(int f = -1) : fd(f) {}
    ~FdCloser() { reset(); }
    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;
    void reset() { if (fd >= 0) { ::close(fd); fd = -1; } }
};

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

} // namespace

Result<ProcessOutput> runProcess(const std::vector<std::string>& argv, int timeout_ms) {
    if (argv.empty()) {
        return Err<ProcessOutput>(ErrorCode::BridgeToolUnavailable, "empty command line");
    }

    // All pipe ends are CLOEXEC so a concurrent runProcess never leaks them into
    // its child. dup2 onto stdout/stderr clears the flag on the copies. The
    // exec_pipe write end closing on exec is how the parent sees exec succeed.
    int out_pipe[2], err_pipe[2], exec_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Err<ProcessOutput>(ErrorCode::Io, std::string("pipe: ") + std::strerror(errno));
    }
    FdCloser out_r(out_pipe[0]), out_w(out_pipe[1]);
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        return Err<ProcessOutput>(ErrorCode::Io, std::string("pipe: ") + std::strerror(errno));
    }
    FdCloser err_r(err_pipe[0]), err_w(err_pipe[1]);
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        return Err<ProcessOutput>(ErrorCode::Io, std::string("pipe: ") + std::strerror(errno));
    }
    FdCloser exec_r(exec_pipe[0]), exec_w(exec_pipe[1]);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Err<ProcessOutput>(ErrorCode::BridgeToolUnavailable,
                                  std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::close(exec_pipe[0]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t w = ::write(exec_pipe[1], &e, sizeof(e));
        (void)w;
        ::_exit(127);
    }

    out_w.reset();
    err_w.reset();
    exec_w.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_r.fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ALOG_DEBUG("proc", "spawn failed: %s (%s)", argv[0].c_str(), std::strerror(child_errno));
        return Err<ProcessOutput>(ErrorCode::BridgeToolUnavailable,
                                  "cannot run " + argv[0] + ": " + std::strerror(child_errno));
    }

    ProcessOutput result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool out_open = true, err_open = true;
    char buf[4096];

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { out_idx = nfds; fds[nfds++] = pollfd{out_r.fd, POLLIN, 0}; }
        if (err_open) { err_idx = nfds; fds[nfds++] = pollfd{err_r.fd, POLLIN, 0}; }

        int pr = ::poll(fds, nfds, static_cast<int>(remaining));
        if (pr < 0) {
            if (errno == EINTR) continue;
            ALOG_ERROR("proc", "poll: %s", std::strerror(errno));
            break;
        }
        if (pr == 0) continue;

        auto drain = [&](int idx, int fd, std::string& sink, bool& open) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t r = ::read(fd, buf, sizeof(buf));
            if (r > 0) sink.append(buf, static_cast<size_t>(r));
            else if (r == 0 || errno != EINTR) open = false;
        };
        drain(out_idx, out_r.fd, result.out, out_open);
        drain(err_idx, err_r.fd, result.err, err_open);
    }

    int status = 0;
    if (result.timed_out) {
        ALOG_WARN("proc", "timeout after %d ms, killing: %s", timeout_ms, joinArgs(argv).c_str());
        ::kill(pid, SIGKILL);
    }
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    ALOG_TRACE("proc", "%s -> exit %d (%zu/%zu bytes)", joinArgs(argv).c_str(),
               result.exit_code, result.out.size(), result.err.size());
    return result;
}

} // namespace autolink
