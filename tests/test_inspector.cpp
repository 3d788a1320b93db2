#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "tmux/inspector.hpp"

#include <string>

namespace {

std::string row(const std::string& session, int window, const std::string& window_name,
                int pane, int pid, const std::string& cwd, const std::string& cmd,
                const std::string& layout = "c3b1,80x24,0,0,1") {
    return session + "\t" + std::to_string(window) + "\t" + window_name + "\t1\t" + layout +
           "\t" + std::to_string(pane) + "\t%" + std::to_string(pid) + "\t" +
           std::to_string(pid) + "\t0\t" + cwd + "\t" + cmd + "\t0\t0\t80\t24\n";
}

} // namespace

TEST_CASE("Inspector", "[inspector]") {

    SECTION("EmptyOutputIsZeroSessions") {
        auto tree = Inspector::parse("");
        REQUIRE(tree.has_value());
        REQUIRE(tree->empty());
        REQUIRE(tree->pane_count() == 0);
    }

    SECTION("ParsesHierarchy") {
        std::string out = row("dev", 0, "editor", 0, 100, "/src", "vim") +
                          row("dev", 0, "editor", 1, 101, "/src", "bash") +
                          row("dev", 1, "logs", 0, 200, "/var/log", "tail") +
                          row("ops", 0, "main", 0, 300, "/", "htop");

        auto tree = Inspector::parse(out);
        REQUIRE(tree.has_value());
        REQUIRE(tree->sessions.size() == 2);
        REQUIRE(tree->pane_count() == 4);

        auto dev = tree->find("dev");
        REQUIRE(dev != nullptr);
        REQUIRE(dev->windows.size() == 2);
        REQUIRE(dev->windows[0].name == "editor");
        REQUIRE(dev->windows[0].layout == "c3b1,80x24,0,0,1");
        REQUIRE(dev->windows[0].panes.size() == 2);
        REQUIRE(dev->windows[0].panes[0].pid == 100);
        REQUIRE(dev->windows[0].panes[0].id == "%100");
        REQUIRE(dev->windows[0].panes[0].working_dir == "/src");
        REQUIRE(dev->windows[0].panes[0].command == "vim");
        REQUIRE(dev->windows[0].panes[0].width == 80);
        REQUIRE(dev->windows[1].panes[0].command == "tail");
    }

    SECTION("SortsWindowsAndPanesByIndex") {
        std::string out = row("dev", 3, "c", 1, 31, "/", "bash") +
                          row("dev", 1, "a", 0, 10, "/", "bash") +
                          row("dev", 3, "c", 0, 30, "/", "bash");

        auto tree = Inspector::parse(out);
        REQUIRE(tree.has_value());
        auto& windows = tree->sessions[0].windows;
        REQUIRE(windows.size() == 2);
        REQUIRE(windows[0].index == 1);
        REQUIRE(windows[1].index == 3);
        REQUIRE(windows[1].panes[0].pid == 30);
        REQUIRE(windows[1].panes[1].pid == 31);
    }

    SECTION("EmptyWorkingDirIsAllowed") {
        auto tree = Inspector::parse(row("dev", 0, "w", 0, 1, "", "bash"));
        REQUIRE(tree.has_value());
        REQUIRE(tree->sessions[0].windows[0].panes[0].working_dir.empty());
    }

    SECTION("WrongFieldCountIsMalformed") {
        auto tree = Inspector::parse("dev\t0\tmain\n");
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error().message.find("line 1") != std::string::npos);
    }

    SECTION("NonNumericPidIsMalformed") {
        std::string out = "dev\t0\tw\t1\tlayout\t0\t%1\tabc\t1\t/\tbash\t0\t0\t80\t24\n";
        REQUIRE_FALSE(Inspector::parse(out).has_value());
    }

    SECTION("DuplicatePaneIsMalformed") {
        std::string out = row("dev", 0, "w", 0, 1, "/", "bash") + row("dev", 0, "w", 0, 2, "/", "bash");
        REQUIRE_FALSE(Inspector::parse(out).has_value());
    }

    SECTION("UnreachableMultiplexerFails") {
        FakeMultiplexer mux;
        mux.unreachable = "tmux timed out after 2000ms";
        Inspector inspector(mux);

        auto tree = inspector.inspect();
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error().message == "tmux timed out after 2000ms");
    }

    SECTION("InspectsFakeServer") {
        FakeMultiplexer mux;
        REQUIRE(mux.new_session("dev", "editor", "/src"));
        REQUIRE(mux.new_window("dev", "logs", "/var/log"));

        Inspector inspector(mux);
        auto tree = inspector.inspect();
        REQUIRE(tree.has_value());
        REQUIRE(tree->sessions.size() == 1);
        REQUIRE(tree->sessions[0].windows.size() == 2);
        REQUIRE(tree->sessions[0].windows[1].name == "logs");
        REQUIRE(tree->sessions[0].windows[1].panes[0].working_dir == "/var/log");
    }
}
