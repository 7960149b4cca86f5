#include "common/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <mutex>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace bubble {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

// reads per stream per poll round, so a program flooding one pipe can not starve the other
const int MAX_READS_PER_ROUND = 16;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// poll granularity when the child may have exited while descendants keep the pipes open
const int POLL_INTERVAL_MS = 50;

// how long to keep draining pipes held by descendants once the child itself is gone
const double DRAIN_TIMEOUT = 1;

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, const Args &... args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), args...));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

/**
 * First try to kill graciously, then hard.
 * Don't report an already exited process group as error.
 */
static void terminate_group(pid_t pgid) {
    LOG(INFO) << "sending SIGTERM to process group " << pgid;
    if (kill(-pgid, SIGTERM) != 0 && errno != ESRCH)
        error(errno, "sending SIGTERM to command");

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pgid;
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
}

static void pump_input(int &fd, const string &payload, size_t &written) {
    while (written < payload.size()) {
        size_t to_write = min(payload.size() - written, (size_t)BUF_SIZE * 16);
        ssize_t nwritten = write(fd, payload.data() + written, to_write);
        if (nwritten > 0) {
            written += nwritten;
            continue;
        }
        if (nwritten == -1 && errno == EINTR) continue;
        if (nwritten == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        if (nwritten == -1 && errno == EPIPE) {
            // the program stopped reading before consuming the whole input
            LOG(INFO) << "child closed stdin after " << written << " of " << payload.size() << " bytes";
            break;
        }
        error(errno, "writing input to child");
    }
    close_fd(fd);
}

static void pump_output(int &fd, int i, size_t limit, string &data, size_t &total, bool &truncated) {
    char buf[BUF_SIZE];
    for (int round = 0; round < MAX_READS_PER_ROUND; ++round) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            total += nread;
            /* Throw away data if we're at the output limit, but
               still count how much data we consumed  */
            if (data.size() < limit)
                data.append(buf, min(limit - data.size(), (size_t)nread));
            if (total > limit && !truncated) {
                truncated = true;
                LOG(INFO) << "child fd " << i << " limit reached";
            }
            continue;
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            close_fd(fd);
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        error(errno, "copying data fd {}", i);
    }
}

process_result run_process(const process_options &opt) {
    if (opt.command.empty())
        throw sandbox_error("empty command");

    // writing stdin of a child that already exited must yield EPIPE instead of killing us
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

    int child_pipefd[3][2];
    int error_pipefd[2];
    for (int i = 0; i < 3; ++i)
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    if (pipe2(error_pipefd, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    vector<string> cmd = opt.command;
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    elapsed_time timer;
    process_result result;

    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // child process, run the command
            // a separate process group, so killing -pid reaches every descendant
            setpgid(0, 0);
            signal(SIGPIPE, SIG_DFL);
            sigset_t emptymask;
            sigemptyset(&emptymask);
            sigprocmask(SIG_SETMASK, &emptymask, nullptr);

            // connect the pipes to stdin/stdout/stderr
            bool redirected = dup2(child_pipefd[0][PIPE_OUT], STDIN_FILENO) >= 0 &&
                              dup2(child_pipefd[1][PIPE_IN], STDOUT_FILENO) >= 0 &&
                              dup2(child_pipefd[2][PIPE_IN], STDERR_FILENO) >= 0;
            if (redirected) execvp(args[0], args.data());

            int err = errno;
            ssize_t ignored = write(error_pipefd[PIPE_IN], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        default:
            break;
    }

    setpgid(child_pid, child_pid);
    close(child_pipefd[0][PIPE_OUT]);
    close(child_pipefd[1][PIPE_IN]);
    close(child_pipefd[2][PIPE_IN]);
    close(error_pipefd[PIPE_IN]);

    int stdin_fd = child_pipefd[0][PIPE_IN];
    int stdout_fd = child_pipefd[1][PIPE_OUT];
    int stderr_fd = child_pipefd[2][PIPE_OUT];

    {
        // the error pipe is closed by a successful exec, otherwise it carries errno
        int err = 0;
        ssize_t nread;
        do {
            nread = read(error_pipefd[PIPE_OUT], &err, sizeof(err));
        } while (nread == -1 && errno == EINTR);
        close(error_pipefd[PIPE_OUT]);
        if (nread == sizeof(err)) {
            close_fd(stdin_fd);
            close_fd(stdout_fd);
            close_fd(stderr_fd);
            int status;
            while (waitpid(child_pid, &status, 0) == -1 && errno == EINTR) {}
            throw sandbox_error(fmt::format("unable to start command {}: {}", cmd[0], strerror(err)));
        }
    }

    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    size_t written = 0;
    if (opt.stdin_payload.empty()) close_fd(stdin_fd);

    int status = 0;
    bool exited = false;
    double exit_time = 0;

    try {
        while (stdout_fd >= 0 || stderr_fd >= 0) {
            int timeout = POLL_INTERVAL_MS;
            if (opt.watchdog >= 0 && !result.watchdog_fired && !exited) {
                double left = opt.watchdog - timer.seconds();
                if (left <= 0) {
                    LOG(WARNING) << fmt::format("watchdog fired after {:.3f} seconds: aborting command", timer.seconds());
                    result.watchdog_fired = true;
                    terminate_group(child_pid);
                    continue;
                }
                timeout = min(timeout, (int)(left * 1000) + 1);
            }

            if (exited && timer.seconds() - exit_time > DRAIN_TIMEOUT) {
                LOG(WARNING) << "descendants of the command still hold its output pipes, giving up reading";
                break;
            }

            struct pollfd fds[3];
            int nfds = 0;
            int stdin_idx = -1, stdout_idx = -1, stderr_idx = -1;
            if (stdin_fd >= 0) fds[stdin_idx = nfds++] = {stdin_fd, POLLOUT, 0};
            if (stdout_fd >= 0) fds[stdout_idx = nfds++] = {stdout_fd, POLLIN, 0};
            if (stderr_fd >= 0) fds[stderr_idx = nfds++] = {stderr_fd, POLLIN, 0};

            int r = poll(fds, nfds, timeout);
            if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

            if (r > 0) {
                if (stdin_idx >= 0 && fds[stdin_idx].revents)
                    pump_input(stdin_fd, opt.stdin_payload, written);
                if (stdout_idx >= 0 && fds[stdout_idx].revents)
                    pump_output(stdout_fd, STDOUT_FILENO, opt.stream_limit, result.stdout_data, result.stdout_bytes, result.stdout_truncated);
                if (stderr_idx >= 0 && fds[stderr_idx].revents)
                    pump_output(stderr_fd, STDERR_FILENO, opt.stream_limit, result.stderr_data, result.stderr_bytes, result.stderr_truncated);
            }

            if (!exited) {
                pid_t pid = waitpid(child_pid, &status, WNOHANG);
                if (pid == -1 && errno != EINTR) error(errno, "waiting on child");
                if (pid == child_pid) {
                    exited = true;
                    exit_time = timer.seconds();
                    result.wall_time = exit_time;
                    // no descendant may outlive the monitored command
                    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                        LOG(WARNING) << "unable to kill remaining processes of group " << child_pid << ": " << strerror(errno);
                }
            }
        }
    } catch (...) {
        close_fd(stdin_fd);
        close_fd(stdout_fd);
        close_fd(stderr_fd);
        kill(-child_pid, SIGKILL);
        if (!exited)
            while (waitpid(child_pid, &status, 0) == -1 && errno == EINTR) {}
        throw;
    }

    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);

    if (!exited) {
        while (waitpid(child_pid, &status, 0) == -1) {
            if (errno != EINTR) error(errno, "waiting on child");
        }
        result.wall_time = timer.seconds();
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }

    LOG(INFO) << fmt::format("command exited with {} after {:.3f} seconds, stdout {} bytes, stderr {} bytes",
                             result.exitcode, result.wall_time, result.stdout_bytes, result.stderr_bytes);
    return result;
}

}  // namespace bubble
