#include "inspector.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <unordered_map>
#include <vector>

namespace {

enum Field {
    SessionName,
    WindowIndex,
    WindowName,
    WindowActive,
    WindowLayout,
    PaneIndex,
    PaneId,
    PanePid,
    PaneActive,
    PanePath,
    PaneCommand,
    PaneLeft,
    PaneTop,
    PaneWidth,
    PaneHeight,
    FieldCount,
};

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        auto end = line.find('\t', start);
        if (end == std::string::npos) {
            fields.emplace_back(line, start);
            break;
        }
        fields.emplace_back(line, start, end - start);
        start = end + 1;
    }
    return fields;
}

bool to_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // namespace

Inspector::Inspector(Multiplexer& mux) : mux_(mux) {}

const std::string& Inspector::format() {
    static const std::string fmt =
        "#{session_name}\t#{window_index}\t#{window_name}\t#{window_active}\t"
        "#{window_layout}\t#{pane_index}\t#{pane_id}\t#{pane_pid}\t#{pane_active}\t"
        "#{pane_current_path}\t#{pane_current_command}\t"
        "#{pane_left}\t#{pane_top}\t#{pane_width}\t#{pane_height}";
    return fmt;
}

std::expected<SessionTree, InspectionError> Inspector::inspect() {
    auto output = mux_.list_panes(format());
    if (!output) return std::unexpected(InspectionError{output.error()});
    return parse(*output);
}

std::expected<SessionTree, InspectionError> Inspector::parse(const std::string& output) {
    SessionTree tree;
    std::unordered_map<std::string, size_t> session_pos;

    size_t line_no = 0;
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string::npos) end = output.size();
        std::string line = output.substr(start, end - start);
        start = end + 1;
        line_no++;

        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto f = split_tabs(line);
        if (f.size() != FieldCount) {
            return std::unexpected(InspectionError{std::format(
                "list-panes line {}: expected {} fields, got {}", line_no,
                static_cast<int>(FieldCount), f.size())});
        }

        int window_index = 0;
        Pane pane;
        if (f[SessionName].empty() || !to_int(f[WindowIndex], window_index) ||
            !to_int(f[PaneIndex], pane.index) || !to_int(f[PanePid], pane.pid)) {
            return std::unexpected(InspectionError{
                std::format("list-panes line {}: malformed identifiers", line_no)});
        }

        // Geometry is informational; tmux may leave it blank for a pane that is
        // being resized.
        to_int(f[PaneLeft], pane.left);
        to_int(f[PaneTop], pane.top);
        to_int(f[PaneWidth], pane.width);
        to_int(f[PaneHeight], pane.height);

        pane.id = f[PaneId];
        pane.working_dir = f[PanePath];
        pane.command = f[PaneCommand];
        pane.active = f[PaneActive] == "1";

        auto [it, inserted] = session_pos.try_emplace(f[SessionName], tree.sessions.size());
        if (inserted) tree.sessions.push_back(Session{.name = f[SessionName], .windows = {}});
        auto& session = tree.sessions[it->second];

        auto win = std::ranges::find(session.windows, window_index, &Window::index);
        if (win == session.windows.end()) {
            session.windows.push_back(Window{
                .index = window_index,
                .name = f[WindowName],
                .layout = f[WindowLayout],
                .active = f[WindowActive] == "1",
                .panes = {},
            });
            win = std::prev(session.windows.end());
        }

        if (std::ranges::find(win->panes, pane.index, &Pane::index) != win->panes.end()) {
            return std::unexpected(InspectionError{std::format(
                "list-panes line {}: duplicate pane {}:{}.{}", line_no,
                session.name, window_index, pane.index)});
        }
        win->panes.push_back(std::move(pane));
    }

    for (auto& session : tree.sessions) {
        std::ranges::stable_sort(session.windows, {}, &Window::index);
        for (auto& window : session.windows) {
            std::ranges::stable_sort(window.panes, {}, &Pane::index);
        }
    }
    return tree;
}
