#include "platform/linux/linux_event_loop.hpp"

#include "report/summary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(App& app, std::chrono::milliseconds interval, bool verbose)
    : app_(app), interval_(interval), verbose_(verbose) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Blocked before any worker thread starts so only the signalfd sees them.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

int LinuxEventLoop::watch() {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(interval_);
    auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(interval_ - secs);
    itimerspec spec{};
    spec.it_interval.tv_sec = secs.count();
    spec.it_interval.tv_nsec = nsecs.count();
    spec.it_value = spec.it_interval;
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return 1;
    }

    refresh();

    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            return 1;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                ::read(timer_fd_, &expirations, sizeof(expirations));
                refresh();
            }
        }
    }
    return 0;
}

int LinuxEventLoop::run_job(Job job) {
    int result = 1;

    worker_ = std::jthread([this, &result, job = std::move(job)](std::stop_token stop) {
        result = job(stop);
        uint64_t val = 1;
        ::write(worker_event_fd_, &val, sizeof(val));
    });

    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];
    bool done = false;

    while (!done) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            worker_.request_stop();
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                if (!worker_.get_stop_token().stop_requested()) {
                    std::println(stderr, "Interrupted, stopping after the current tmux command");
                }
                worker_.request_stop();
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                ::read(worker_event_fd_, &val, sizeof(val));
                done = true;
            }
        }
    }

    worker_.join();
    return result;
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) worker_.request_stop();
}

void LinuxEventLoop::refresh() {
    if (!app_.monitor().cycle()) return;  // already reported; try again next tick

    if (::isatty(STDOUT_FILENO)) std::print("\x1b[H\x1b[2J");
    print_summary(app_.monitor().snapshot());
    std::fflush(stdout);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tmuxtop] {}", msg);
    }
}
