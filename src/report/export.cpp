#include "export.hpp"

#include <fstream>

using json = nlohmann::json;

namespace {

json metrics_json(const PaneMetrics& m) {
    return {
        {"cpu_percent", m.cpu_percent},
        {"rss_bytes", m.rss_bytes},
        {"mem_percent", m.mem_percent},
        {"process_count", m.process_count},
    };
}

json process_json(const ProcessRecord& p) {
    json j = {
        {"pid", p.pid},
        {"ppid", p.ppid},
        {"command", p.command},
        {"cpu_percent", nullptr},
        {"rss_bytes", p.rss_bytes},
        {"mem_percent", p.mem_percent},
        {"readable", p.readable},
        {"username", p.username},
        {"create_time", p.create_time},
        {"cmdline", p.cmdline},
    };
    if (p.cpu_percent) j["cpu_percent"] = *p.cpu_percent;
    return j;
}

} // namespace

json export_json(const MonitorSnapshot& snapshot) {
    auto ts = std::chrono::duration<double>(snapshot.taken_at.time_since_epoch()).count();

    json sessions = json::array();
    for (const auto& session : snapshot.tree.sessions) {
        auto ss = snapshot.metrics.find_session(session.name);

        json windows = json::array();
        for (const auto& window : session.windows) {
            auto ws = ss ? ss->find_window(window.index) : nullptr;

            json panes = json::array();
            for (const auto& pane : window.panes) {
                auto ps = ws ? ws->find_pane(pane.index) : nullptr;

                json processes = json::array();
                if (ps) {
                    for (const auto& p : ps->processes) processes.push_back(process_json(p));
                }
                panes.push_back({
                    {"index", pane.index},
                    {"id", pane.id},
                    {"pid", pane.pid},
                    {"working_dir", pane.working_dir},
                    {"command", pane.command_line.empty() ? pane.command : pane.command_line},
                    {"metrics", metrics_json(ps ? ps->metrics : PaneMetrics{})},
                    {"processes", std::move(processes)},
                });
            }
            windows.push_back({
                {"index", window.index},
                {"name", window.name},
                {"layout", window.layout},
                {"metrics", metrics_json(ws ? ws->metrics : PaneMetrics{})},
                {"panes", std::move(panes)},
            });
        }
        sessions.push_back({
            {"name", session.name},
            {"metrics", metrics_json(ss ? ss->metrics : PaneMetrics{})},
            {"windows", std::move(windows)},
        });
    }

    return {
        {"timestamp", ts},
        {"total", metrics_json(snapshot.metrics.total)},
        {"sessions", std::move(sessions)},
    };
}

std::expected<void, std::string> write_export(const MonitorSnapshot& snapshot,
                                              const std::string& path) {
    std::ofstream f(path);
    if (!f.is_open()) return std::unexpected("cannot open " + path + " for writing");
    f << export_json(snapshot).dump(2) << '\n';
    if (!f.good()) return std::unexpected("write to " + path + " failed");
    return {};
}
