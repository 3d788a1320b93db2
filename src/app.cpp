#include "app.hpp"

#include "backup/restore_artifact.hpp"
#include "backup/snapshotter.hpp"
#include "report/export.hpp"
#include "report/summary.hpp"

#include <format>
#include <print>

App::App(Config config, Multiplexer& mux, const ProcessTable& table, bool verbose)
    : config_(std::move(config)), verbose_(verbose), mux_(mux),
      monitor_(mux, table, verbose) {}

int App::show_once() {
    if (!monitor_.cycle()) return 1;
    print_summary(monitor_.snapshot());
    return 0;
}

int App::export_to(const std::string& path) {
    if (!monitor_.cycle()) return 1;

    auto target = path.empty() ? config_.report.path : path;
    auto res = write_export(monitor_.snapshot(), target);
    if (!res) {
        std::println(stderr, "export: {}", res.error());
        return 1;
    }
    std::println("Data exported to {}", target);
    return 0;
}

int App::backup(const std::string& dir, std::stop_token stop) {
    auto tree = monitor_.inspect_with_commands();
    if (!tree) {
        std::println(stderr, "backup: {}", tree.error().message);
        return 1;
    }
    if (tree->empty()) {
        std::println(stderr, "No tmux sessions to backup");
        return 1;
    }
    if (stop.stop_requested()) {
        std::println(stderr, "backup: cancelled");
        return 1;
    }

    Snapshotter snapshotter(config_.shells);
    auto artifact = snapshotter.capture(*tree);

    auto target = dir.empty() ? config_.backup.resolved_dir() : dir;
    auto path = save_artifact(artifact, target);
    if (!path) {
        std::println(stderr, "backup: {}", path.error());
        return 1;
    }

    log(std::format("captured {} sessions, {} panes", artifact.sessions.size(),
                    tree->pane_count()));
    std::println("Sessions backed up to {}", *path);
    return 0;
}

int App::restore(const std::string& path, ConflictPolicy policy, std::stop_token stop) {
    std::string source = path;
    if (source.empty()) {
        auto latest = latest_artifact(config_.backup.resolved_dir());
        if (!latest) {
            std::println(stderr, "restore: {}", latest.error());
            return 1;
        }
        source = *latest;
    }

    auto artifact = load_artifact(source);
    if (!artifact) {
        std::println(stderr, "restore: {}", artifact.error());
        return 1;
    }
    log("restoring from " + source);

    Restorer restorer(mux_, {.on_conflict = policy,
                             .restore_commands = config_.backup.restore_commands},
                      verbose_);
    auto outcome = restorer.restore(std::move(*artifact), stop);

    for (const auto& s : outcome.sessions) {
        if (s.reason.empty()) {
            std::println("{}: {}", s.name, to_string(s.status));
        } else {
            std::println("{}: {} ({})", s.name, to_string(s.status), s.reason);
        }
        if (!s.failed_windows.empty()) {
            std::string windows;
            for (int w : s.failed_windows) {
                if (!windows.empty()) windows += ", ";
                windows += std::to_string(w);
            }
            std::println("  windows not restored: {}", windows);
        }
    }
    std::println("Restored {} of {} sessions from {}", outcome.count(SessionStatus::Restored),
                 outcome.sessions.size(), source);

    // Skipped conflicts are the expected result of re-running a restore.
    bool ok = outcome.count(SessionStatus::Failed) == 0 &&
              outcome.count(SessionStatus::Cancelled) == 0 &&
              (policy == ConflictPolicy::Skip || outcome.count(SessionStatus::Conflict) == 0);
    return ok ? 0 : 1;
}

void App::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tmuxtop] {}", msg);
    }
}

std::expected<ConflictPolicy, std::string> parse_conflict_policy(const std::string& s) {
    if (s == "skip") return ConflictPolicy::Skip;
    if (s == "abort") return ConflictPolicy::Abort;
    return std::unexpected(std::format("unknown conflict policy '{}' (expected skip or abort)", s));
}
