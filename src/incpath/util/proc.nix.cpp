#ifndef _WIN32
#include "./proc.hpp"

#include <incpath/util/log.hpp>

#include <fmt/core.h>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <system_error>
#include <utility>

using namespace incpath;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

/// Owns one end of a pipe. Closed on destruction unless closed earlier.
struct pipe_end {
    int fd = -1;

    pipe_end() = default;
    explicit pipe_end(int fd_) noexcept
        : fd(fd_) {}
    pipe_end(pipe_end&& o) noexcept
        : fd(std::exchange(o.fd, -1)) {}
    pipe_end(const pipe_end&) = delete;
    pipe_end& operator=(const pipe_end&) = delete;
    ~pipe_end() { close(); }

    void close() noexcept {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
};

struct pipe_pair {
    pipe_end read;
    pipe_end write;
};

pipe_pair open_pipe(std::string_view what) {
    int  fds[2] = {};
    auto rc     = ::pipe2(fds, O_CLOEXEC);
    check_rc(rc == 0, what);
    pipe_pair ret;
    ret.read.fd  = fds[0];
    ret.write.fd = fds[1];
    return ret;
}

void kill_group(::pid_t pid) noexcept {
    if (::kill(-pid, SIGKILL) != 0) {
        ::kill(pid, SIGKILL);
    }
}

/**
 * Owns a running child process. If the child has not been reaped when this is destroyed (an error
 * is propagating), its process group is killed and the child is waited on.
 */
struct child_process {
    ::pid_t pid = -1;

    explicit child_process(::pid_t p) noexcept
        : pid(p) {}
    child_process(const child_process&) = delete;
    child_process& operator=(const child_process&) = delete;

    ~child_process() {
        if (pid == -1) {
            return;
        }
        kill_group(pid);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
    }

    int wait() {
        int  status = 0;
        auto rc     = 0;
        do {
            rc = ::waitpid(pid, &status, 0);
        } while (rc < 0 && errno == EINTR);
        check_rc(rc >= 0, "Failed in waitpid()");
        pid = -1;
        return status;
    }
};

/**
 * Blocks SIGPIPE for the calling thread while writing to the stdin of a subprocess, so a child that
 * exits early yields EPIPE instead of a signal. A SIGPIPE raised by our own writes is consumed
 * before the previous mask is restored.
 */
class sigpipe_blocker {
    ::sigset_t _prev_mask;
    bool       _was_pending = false;

public:
    bool raised = false;

    sigpipe_blocker() {
        ::sigset_t pending;
        ::sigemptyset(&pending);
        ::sigpending(&pending);
        _was_pending = ::sigismember(&pending, SIGPIPE) == 1;

        ::sigset_t block;
        ::sigemptyset(&block);
        ::sigaddset(&block, SIGPIPE);
        auto rc = ::pthread_sigmask(SIG_BLOCK, &block, &_prev_mask);
        if (rc != 0) {
            errno = rc;
            check_rc(false, "Failed to block SIGPIPE");
        }
    }

    sigpipe_blocker(const sigpipe_blocker&) = delete;
    sigpipe_blocker& operator=(const sigpipe_blocker&) = delete;

    ~sigpipe_blocker() {
        if (raised && !_was_pending) {
            ::sigset_t only_pipe;
            ::sigemptyset(&only_pipe);
            ::sigaddset(&only_pipe, SIGPIPE);
            const ::timespec no_wait = {};
            while (::sigtimedwait(&only_pipe, nullptr, &no_wait) < 0 && errno == EINTR) {}
        }
        ::pthread_sigmask(SIG_SETMASK, &_prev_mask, nullptr);
    }
};

[[noreturn]] void child_fail(const char* what) noexcept {
    std::fputs("[incpath child executor] ", stderr);
    std::fputs(what, stderr);
    std::fputs(": ", stderr);
    std::fputs(std::strerror(errno), stderr);
    std::fputs("\n", stderr);
    std::_Exit(-1);
}

::pid_t spawn_child(const proc_options& opts, int output_pipe, int stdin_pipe) {
    // We must allocate BEFORE fork(), since the CRT might stumble with malloc()-related locks that
    // are held during the fork().
    std::vector<const char*> strings;
    strings.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        strings.push_back(s.data());
    }
    strings.push_back(nullptr);

    auto not_found_err
        = fmt::format("[incpath child executor] The requested executable [{}] could not be found.\n",
                      strings[0]);

    auto child_pid = ::fork();
    check_rc(child_pid != -1, "Failed to fork() for subprocess");
    if (child_pid != 0) {
        // Also set from the parent, so the group exists before we might need to kill it
        ::setpgid(child_pid, child_pid);
        return child_pid;
    }
    // We are child. Every pipe end is close-on-exec, and dup2() clears that flag on the copies.
    if (::setpgid(0, 0) == -1) {
        child_fail("Failed to create a process group");
    }
    if (::dup2(output_pipe, STDOUT_FILENO) == -1) {
        child_fail("Failed to dup2 stdout");
    }
    if (::dup2(output_pipe, STDERR_FILENO) == -1) {
        child_fail("Failed to dup2 stderr");
    }
    if (::dup2(stdin_pipe, STDIN_FILENO) == -1) {
        child_fail("Failed to dup2 stdin");
    }

    ::execvp(strings[0], (char* const*)strings.data());

    if (errno == ENOENT) {
        std::fputs(not_found_err.c_str(), stderr);
        std::_Exit(-1);
    }

    child_fail("execvp returned! This is a fatal error");
}

void feed_stdin(pipe_end& stdin_write, std::string_view input) {
    sigpipe_blocker blocker;
    const char*     stdin_cur = input.data();
    size_t          remaining = input.size();
    while (remaining > 0) {
        ssize_t num_written = ::write(stdin_write.fd, stdin_cur, remaining);
        if (num_written == -1 && errno == EINTR) {
            continue;
        }
        if (num_written == -1 && errno == EPIPE) {
            blocker.raised = true;
            incpath_log(debug, "Subprocess closed its stdin before reading all input");
            break;
        }
        check_rc(num_written != -1, "Unable to write to stdin for subprocess");
        remaining -= static_cast<size_t>(num_written);
        stdin_cur += num_written;
    }
    stdin_write.close();
}

}  // namespace

proc_result incpath::run_proc(const proc_options& opts) {
    if (opts.stdin_.empty()) {
        incpath_log(debug, "Spawning subprocess: {}", quote_command(opts.command));
    } else {
        incpath_log(debug,
                    "Spawning subprocess: {}\n\tWith stdin: {}",
                    quote_command(opts.command),
                    opts.stdin_);
    }
    auto output_pipe = open_pipe("Create stdio pipe for subprocess");
    auto stdin_pipe  = open_pipe("Create stdin pipe for subprocess");

    child_process child{spawn_child(opts, output_pipe.write.fd, stdin_pipe.read.fd)};

    stdin_pipe.read.close();
    output_pipe.write.close();

    feed_stdin(stdin_pipe.write, opts.stdin_);

    pollfd stdio_fd;
    stdio_fd.fd     = output_pipe.read.fd;
    stdio_fd.events = POLLIN;

    proc_result res;

    using namespace std::chrono_literals;
    using clock = std::chrono::steady_clock;

    std::optional<clock::time_point> deadline;
    if (opts.timeout) {
        deadline = clock::now() + *opts.timeout;
    }
    std::string buffer;
    buffer.resize(1024);
    while (true) {
        auto timeout = -1ms;
        if (deadline) {
            timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline
                                                                            - clock::now());
            if (timeout < 0ms) {
                timeout = 0ms;
            }
        }
        auto rc = ::poll(&stdio_fd, 1, static_cast<int>(timeout.count()));
        if (rc < 0 && errno == EINTR) {
            errno = 0;
            continue;
        }
        check_rc(rc >= 0, "Failed in poll()");
        if (rc == 0) {
            // Timeout! Descendants may still hold the pipe open, so stop reading here.
            kill_group(child.pid);
            res.timed_out = true;
            incpath_log(debug, "Subprocess [{}] timed out", quote_command(opts.command));
            break;
        }
        auto nread = ::read(stdio_fd.fd, buffer.data(), buffer.size());
        if (nread == 0) {
            break;
        }
        if (nread < 0 && errno == EINTR) {
            continue;
        }
        check_rc(nread > 0, "Failed in read()");
        res.output.append(buffer.begin(), buffer.begin() + nread);
    }
    output_pipe.read.close();

    auto status = child.wait();
    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }

    return res;
}

#endif  // _WIN32
