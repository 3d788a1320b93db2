#pragma once

#include "app.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

// Drives App from an epoll loop: a timerfd paces watch mode, a signalfd turns
// SIGINT/SIGTERM into a clean stop, and an eventfd reports background jobs done.
class LinuxEventLoop {
public:
    using Job = std::function<int(std::stop_token)>;

    LinuxEventLoop(App& app, std::chrono::milliseconds interval, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();

    // Sample and reprint every interval until a signal arrives.
    int watch();

    // Run `job` on a worker thread. A signal requests stop through the job's token;
    // the job finishes its current tmux command before it sees it.
    int run_job(Job job);

    void request_stop();

private:
    void refresh();
    void log(const std::string& msg);

    App& app_;
    std::chrono::milliseconds interval_;
    bool verbose_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
    std::jthread worker_;
};
