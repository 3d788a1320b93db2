#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

struct Pane {
    int index = 0;             // position within the window
    std::string id;            // tmux pane id, e.g. "%3"
    int pid = 0;               // root process of the pane (usually the shell)
    std::string working_dir;
    std::string command;       // tmux pane_current_command, e.g. "vim"
    std::string command_line;  // full argv of the foreground process, filled by the monitor
    int left = 0;
    int top = 0;
    int width = 0;
    int height = 0;
    bool active = false;
};

struct Window {
    int index = 0;
    std::string name;
    std::string layout;        // tmux window_layout, kept verbatim
    bool active = false;
    std::vector<Pane> panes;
};

struct Session {
    std::string name;
    std::vector<Window> windows;

    const Window* find_window(int index) const {
        auto it = std::ranges::find(windows, index, &Window::index);
        return it == windows.end() ? nullptr : &*it;
    }
};

struct SessionTree {
    std::vector<Session> sessions;

    bool empty() const { return sessions.empty(); }

    const Session* find(const std::string& name) const {
        auto it = std::ranges::find(sessions, name, &Session::name);
        return it == sessions.end() ? nullptr : &*it;
    }

    size_t pane_count() const {
        size_t n = 0;
        for (const auto& s : sessions)
            for (const auto& w : s.windows) n += w.panes.size();
        return n;
    }
};
