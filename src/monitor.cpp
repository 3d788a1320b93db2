#include "monitor.hpp"

#include <format>
#include <print>

Monitor::Monitor(Multiplexer& mux, const ProcessTable& table, bool verbose)
    : inspector_(mux), table_(table), aggregator_(table), verbose_(verbose) {}

std::expected<void, InspectionError> Monitor::cycle() {
    auto tree = inspector_.inspect();
    if (!tree) {
        std::println(stderr, "tmux: inspection failed: {}", tree.error().message);
        return std::unexpected(tree.error());
    }

    auto index = ProcessIndex::build(table_);
    fill_commands(*tree, index);

    snapshot_.metrics = aggregator_.sample(*tree, index);
    snapshot_.tree = std::move(*tree);
    snapshot_.taken_at = std::chrono::system_clock::now();
    snapshot_.cycle++;

    log(std::format("cycle {}: {} sessions, {} panes, {} processes indexed",
                    snapshot_.cycle, snapshot_.tree.sessions.size(),
                    snapshot_.tree.pane_count(), index.size()));
    return {};
}

std::expected<SessionTree, InspectionError> Monitor::inspect_with_commands() {
    auto tree = inspector_.inspect();
    if (!tree) return tree;

    auto index = ProcessIndex::build(table_);
    fill_commands(*tree, index);
    return tree;
}

void Monitor::fill_commands(SessionTree& tree, const ProcessIndex& index) const {
    for (auto& session : tree.sessions) {
        for (auto& window : session.windows) {
            for (auto& pane : window.panes) {
                pane.command_line = index.foreground_command(table_, pane.pid, pane.command);
            }
        }
    }
}

void Monitor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tmuxtop] {}", msg);
    }
}
