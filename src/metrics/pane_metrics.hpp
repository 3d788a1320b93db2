#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ProcessRecord {
    int pid = 0;
    int ppid = 0;
    std::string command;
    std::optional<double> cpu_percent;  // absent until the process has been seen twice
    uint64_t rss_bytes = 0;
    double mem_percent = 0.0;
    bool readable = true;               // false if its usage could not be read this cycle
    std::string username;
    double create_time = 0.0;           // seconds since the epoch, 0 if unknown
    std::vector<std::string> cmdline;
};

struct PaneMetrics {
    double cpu_percent = 0.0;
    uint64_t rss_bytes = 0;
    double mem_percent = 0.0;
    size_t process_count = 0;

    PaneMetrics& operator+=(const PaneMetrics& o) {
        cpu_percent += o.cpu_percent;
        rss_bytes += o.rss_bytes;
        mem_percent += o.mem_percent;
        process_count += o.process_count;
        return *this;
    }
};

struct PaneSample {
    int index = 0;
    std::string id;
    int pid = 0;
    PaneMetrics metrics;
    std::vector<ProcessRecord> processes;
};

struct WindowSample {
    int index = 0;
    std::string name;
    PaneMetrics metrics;
    std::vector<PaneSample> panes;

    const PaneSample* find_pane(int pane_index) const {
        auto it = std::ranges::find(panes, pane_index, &PaneSample::index);
        return it == panes.end() ? nullptr : &*it;
    }
};

struct SessionSample {
    std::string name;
    PaneMetrics metrics;
    std::vector<WindowSample> windows;

    const WindowSample* find_window(int window_index) const {
        auto it = std::ranges::find(windows, window_index, &WindowSample::index);
        return it == windows.end() ? nullptr : &*it;
    }
};

// One sampling cycle, shaped like the session tree it was taken from.
struct MetricsSnapshot {
    std::vector<SessionSample> sessions;
    PaneMetrics total;

    const SessionSample* find_session(const std::string& name) const {
        auto it = std::ranges::find(sessions, name, &SessionSample::name);
        return it == sessions.end() ? nullptr : &*it;
    }

    const PaneSample* find_pane(const std::string& session, int window, int pane) const {
        auto s = find_session(session);
        if (!s) return nullptr;
        auto w = s->find_window(window);
        return w ? w->find_pane(pane) : nullptr;
    }
};
