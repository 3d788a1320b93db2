#include <catch2/catch_test_macros.hpp>

#include "app.hpp"
#include "backup/restore_artifact.hpp"
#include "fakes.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("tmuxtop_test_app_" + std::to_string(getpid()));
        fs::remove_all(path);
    }

    ~TmpDir() { fs::remove_all(path); }
};

Config config_for(const TmpDir& dir) {
    Config cfg;
    cfg.backup.dir = dir.path.string();
    return cfg;
}

} // namespace

TEST_CASE("App backup and restore", "[app]") {
    TmpDir dir;
    FakeProcessTable table;

    SECTION("NothingToBackUp") {
        FakeMultiplexer mux;
        App app(config_for(dir), mux, table);
        REQUIRE(app.backup("") == 1);
        REQUIRE_FALSE(fs::exists(dir.path));
    }

    SECTION("RestoreWithoutBackups") {
        FakeMultiplexer mux;
        App app(config_for(dir), mux, table);
        REQUIRE(app.restore("", ConflictPolicy::Skip) == 1);
        REQUIRE(mux.calls.empty());
    }

    SECTION("BackupThenRestoreElsewhere") {
        FakeMultiplexer source;
        REQUIRE(source.new_session("dev", "editor", "/src").has_value());   // pid 1000
        REQUIRE(source.new_window("dev", "shell", "/tmp").has_value());     // pid 1001
        source.sessions[0].windows[0].panes[0].command = "vim";
        table.add(1000, 1, "bash");
        table.add(1100, 1000, "vim").argv = {"vim", "notes.md"};
        table.add(1001, 1, "bash");

        App backup_app(config_for(dir), source, table);
        REQUIRE(backup_app.backup("") == 0);

        auto latest = latest_artifact(dir.path.string());
        REQUIRE(latest.has_value());
        auto artifact = load_artifact(*latest);
        REQUIRE(artifact.has_value());
        REQUIRE(artifact->sessions[0].windows[0].panes[0].command == "vim notes.md");
        REQUIRE(artifact->sessions[0].windows[1].panes[0].command.empty());

        FakeMultiplexer target;
        App restore_app(config_for(dir), target, table);
        REQUIRE(restore_app.restore("", ConflictPolicy::Skip) == 0);

        auto dev = target.find_session("dev");
        REQUIRE(dev != nullptr);
        REQUIRE(dev->windows.size() == 2);
        REQUIRE(dev->windows[0].panes[0].typed == std::vector<std::string>{"vim notes.md"});
        REQUIRE(dev->windows[1].panes[0].cwd == "/tmp");

        // Running it again only finds conflicts.
        REQUIRE(restore_app.restore(*latest, ConflictPolicy::Skip) == 0);
        REQUIRE(restore_app.restore(*latest, ConflictPolicy::Abort) == 1);
        REQUIRE(target.sessions.size() == 1);
    }

    SECTION("RestoreMissingFile") {
        FakeMultiplexer mux;
        App app(config_for(dir), mux, table);
        REQUIRE(app.restore((dir.path / "nope.json").string(), ConflictPolicy::Skip) == 1);
    }
}

TEST_CASE("App sampling modes", "[app]") {
    FakeMultiplexer mux;
    FakeProcessTable table;
    REQUIRE(mux.new_session("dev", "editor", "/src").has_value());
    table.add(1000, 1, "bash");

    Config cfg;
    cfg.report.path = (fs::temp_directory_path() /
                       ("tmuxtop_test_app_export_" + std::to_string(getpid()) + ".json")).string();
    App app(cfg, mux, table);

    SECTION("Export") {
        REQUIRE(app.export_to("") == 0);
        REQUIRE(fs::exists(cfg.report.path));
        fs::remove(cfg.report.path);
    }

    SECTION("InspectionFailure") {
        mux.unreachable = "could not execute tmux";
        REQUIRE(app.show_once() == 1);
        REQUIRE(app.export_to("") == 1);
    }
}

TEST_CASE("parse_conflict_policy", "[app]") {
    REQUIRE(parse_conflict_policy("skip").value() == ConflictPolicy::Skip);
    REQUIRE(parse_conflict_policy("abort").value() == ConflictPolicy::Abort);
    REQUIRE_FALSE(parse_conflict_policy("overwrite").has_value());
    REQUIRE_FALSE(parse_conflict_policy("").has_value());
}

TEST_CASE("LinuxEventLoop jobs", "[event_loop]") {
    FakeMultiplexer mux;
    FakeProcessTable table;
    App app(Config{}, mux, table);
    LinuxEventLoop loop(app, 1000ms);
    REQUIRE(loop.init());

    SECTION("ReturnsJobStatus") {
        REQUIRE(loop.run_job([](std::stop_token) { return 7; }) == 7);
    }

    SECTION("SignalStopsJob") {
        int rc = loop.run_job([](std::stop_token stop) {
            ::kill(::getpid(), SIGTERM);
            for (int i = 0; i < 500 && !stop.stop_requested(); i++) {
                std::this_thread::sleep_for(10ms);
            }
            return stop.stop_requested() ? 3 : 0;
        });
        REQUIRE(rc == 3);
    }
}
