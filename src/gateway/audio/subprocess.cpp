#include "audio/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subprocess {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

std::expected<ProcessResult, std::string>
run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) return std::unexpected("empty command");

    // Built before fork: the child must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe()"));
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(errno_message("pipe()"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t n = 0;
        if (out_fd >= 0) fds[n++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[n++] = {err_fd, POLLIN, 0};

        int rc = ::poll(fds, n, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            auto msg = errno_message("poll()");
            close_fd(out_fd);
            close_fd(err_fd);
            ::kill(pid, SIGKILL);
            wait_child(pid);
            return std::unexpected(msg);
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool is_out = fds[i].fd == out_fd;
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                (is_out ? result.out : result.err).append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close_fd(is_out ? out_fd : err_fd);
            }
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
    }
    result.exit_code = wait_child(pid);
    return result;
}

} // namespace subprocess
