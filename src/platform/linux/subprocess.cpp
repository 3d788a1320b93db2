#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Reap the child if it exits before `deadline`. Returns false if it is still running.
bool wait_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline, int& code) {
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r < 0) {
            if (errno == EINTR) continue;
            code = -1;
            return true;
        }
        if (r == pid) {
            if (WIFEXITED(status)) code = WEXITSTATUS(status);
            else if (WIFSIGNALED(status)) code = 128 + WTERMSIG(status);
            else code = -1;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        ::usleep(2000);
    }
}

} // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) return std::unexpected(std::string("empty command"));

    // Built before fork so the child does not allocate.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(saved));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // The event loop blocks SIGINT/SIGTERM for its signalfd. tmux must not inherit
        // that mask or every pane of a server it starts would ignore Ctrl-C.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    pollfd fds[2] = {
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    std::string io_error;

    while (open_fds > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        int ret = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            io_error = std::string("poll() failed: ") + std::strerror(errno);
            break;
        }
        if (ret == 0) {
            timed_out = true;
            break;
        }

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            char buf[4096];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;

            ::close(fds[i].fd);
            fds[i].fd = -1;
            open_fds--;
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }

    if (!timed_out && io_error.empty() &&
        !wait_child_until(pid, deadline, result.exit_code)) {
        timed_out = true;
    }

    if (timed_out || !io_error.empty()) {
        ::kill(pid, SIGKILL);
        wait_child(pid);
        if (timed_out) {
            return std::unexpected(std::format("{} timed out after {}ms", argv[0], timeout.count()));
        }
        return std::unexpected(io_error);
    }

    if (result.exit_code < 0) {
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }
    return result;
}
