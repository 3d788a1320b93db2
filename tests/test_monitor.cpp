#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "monitor.hpp"

namespace {

// dev:0 has two panes, vim in the first and an idle shell in the second.
void setup(FakeMultiplexer& mux, FakeProcessTable& table) {
    REQUIRE(mux.new_session("dev", "editor", "/src").has_value());   // %0, pid 1000
    REQUIRE(mux.split_pane("%0", "/src").has_value());                // %1, pid 1001
    mux.sessions[0].windows[0].panes[0].command = "vim";

    table.add(1, 0, "systemd");
    table.add(900, 1, "tmux: server");
    table.add(1000, 900, "bash", 10, 4096);
    table.add(1001, 900, "bash", 5, 4096);
    table.add(1100, 1000, "vim", 50, 8192).argv = {"vim", "notes.md"};
    table.add(1101, 1100, "rust-analyzer", 500, 65536);
}

} // namespace

TEST_CASE("Monitor", "[monitor]") {
    FakeMultiplexer mux;
    FakeProcessTable table;
    Monitor monitor(mux, table);

    SECTION("NothingBeforeFirstCycle") {
        REQUIRE(monitor.snapshot().cycle == 0);
        REQUIRE(monitor.snapshot().tree.empty());
    }

    SECTION("CycleBuildsSnapshot") {
        setup(mux, table);
        REQUIRE(monitor.cycle().has_value());

        const auto& snap = monitor.snapshot();
        REQUIRE(snap.cycle == 1);
        REQUIRE(snap.tree.pane_count() == 2);

        const auto& panes = snap.tree.sessions[0].windows[0].panes;
        REQUIRE(panes[0].command_line == "vim notes.md");
        REQUIRE(panes[1].command_line == "bash");

        auto vim_pane = snap.metrics.find_pane("dev", 0, 0);
        REQUIRE(vim_pane != nullptr);
        REQUIRE(vim_pane->metrics.process_count == 3);
        REQUIRE(vim_pane->metrics.rss_bytes == 4096 + 8192 + 65536);
        REQUIRE(vim_pane->processes[0].pid == 1000);
        REQUIRE_FALSE(vim_pane->processes[0].cpu_percent.has_value());

        REQUIRE(snap.metrics.total.process_count == 4);
        // tmux itself and unrelated processes are not attributed to any pane
        REQUIRE(snap.metrics.total.rss_bytes == 4096 + 4096 + 8192 + 65536);
    }

    SECTION("FollowsChanges") {
        setup(mux, table);
        REQUIRE(monitor.cycle().has_value());

        table.procs.erase(1101);
        REQUIRE(mux.new_window("dev", "logs", "/var/log").has_value());  // %2, pid 1002
        table.add(1002, 900, "bash");

        REQUIRE(monitor.cycle().has_value());
        const auto& snap = monitor.snapshot();
        REQUIRE(snap.cycle == 2);
        REQUIRE(snap.tree.pane_count() == 3);
        REQUIRE(snap.metrics.find_pane("dev", 0, 0)->metrics.process_count == 2);
        REQUIRE(snap.metrics.find_pane("dev", 1, 0)->metrics.process_count == 1);
    }

    SECTION("FailedInspectionKeepsPreviousSnapshot") {
        setup(mux, table);
        REQUIRE(monitor.cycle().has_value());

        mux.unreachable = "tmux timed out after 2000ms";
        auto r = monitor.cycle();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().message.find("timed out") != std::string::npos);

        REQUIRE(monitor.snapshot().cycle == 1);
        REQUIRE(monitor.snapshot().tree.pane_count() == 2);
    }

    SECTION("NoSessions") {
        REQUIRE(monitor.cycle().has_value());
        REQUIRE(monitor.snapshot().cycle == 1);
        REQUIRE(monitor.snapshot().tree.empty());
        REQUIRE(monitor.snapshot().metrics.total.process_count == 0);
    }

    SECTION("InspectWithCommands") {
        setup(mux, table);
        auto tree = monitor.inspect_with_commands();
        REQUIRE(tree.has_value());
        REQUIRE(tree->sessions[0].windows[0].panes[0].command_line == "vim notes.md");
        REQUIRE(monitor.snapshot().cycle == 0);
    }
}
