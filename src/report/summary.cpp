#include "summary.hpp"

#include <format>
#include <print>

std::string human_bytes(uint64_t bytes) {
    constexpr const char* units[] = {"B", "K", "M", "G", "T"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        u++;
    }
    if (u == 0) return std::format("{}B", bytes);
    return std::format("{:.1f}{}", v, units[u]);
}

namespace {

std::string usage(const PaneMetrics& m) {
    return std::format("{:6.1f}% {:5.1f}% {:>8} {:>5}", m.cpu_percent, m.mem_percent,
                       human_bytes(m.rss_bytes), m.process_count);
}

} // namespace

void print_summary(const MonitorSnapshot& snapshot, std::FILE* out) {
    std::println(out, "{:<44} {:>7} {:>6} {:>8} {:>5}", "SESSION / WINDOW / PANE", "CPU",
                 "MEM", "RSS", "PROCS");

    if (snapshot.tree.empty()) {
        std::println(out, "(no tmux sessions)");
        return;
    }

    for (const auto& session : snapshot.tree.sessions) {
        auto ss = snapshot.metrics.find_session(session.name);
        std::println(out, "{:<44.44} {}", session.name, usage(ss ? ss->metrics : PaneMetrics{}));

        for (const auto& window : session.windows) {
            auto ws = ss ? ss->find_window(window.index) : nullptr;
            auto label = std::format("  {}:{}", window.index, window.name);
            std::println(out, "{:<44.44} {}", label, usage(ws ? ws->metrics : PaneMetrics{}));

            for (const auto& pane : window.panes) {
                auto ps = ws ? ws->find_pane(pane.index) : nullptr;
                const auto& cmd = pane.command_line.empty() ? pane.command : pane.command_line;
                auto pane_label = std::format("    {} {}", pane.index, cmd);
                std::println(out, "{:<44.44} {}", pane_label, usage(ps ? ps->metrics : PaneMetrics{}));
            }
        }
    }

    std::println(out, "{:<44} {}", "total", usage(snapshot.metrics.total));
}
