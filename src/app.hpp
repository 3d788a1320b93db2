#pragma once

#include "backup/restorer.hpp"
#include "config.hpp"
#include "monitor.hpp"
#include "platform/multiplexer.hpp"
#include "platform/process_table.hpp"

#include <stop_token>
#include <string>

// The tool's modes, independent of how they are scheduled. Each returns a
// process exit status.
class App {
public:
    App(Config config, Multiplexer& mux, const ProcessTable& table, bool verbose = false);

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // One sampling cycle, then the summary table on stdout.
    int show_once();

    // One sampling cycle, then the JSON export. Empty path: config report.path.
    int export_to(const std::string& path);

    // Capture every session into a new artifact. Empty dir: config backup dir.
    int backup(const std::string& dir, std::stop_token stop = {});

    // Restore from `path`, or from the newest artifact in the backup dir if empty.
    int restore(const std::string& path, ConflictPolicy policy, std::stop_token stop = {});

    Monitor& monitor() { return monitor_; }
    const Config& config() const { return config_; }

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Multiplexer& mux_;
    Monitor monitor_;
};

// "skip" or "abort"; anything else is rejected.
std::expected<ConflictPolicy, std::string> parse_conflict_policy(const std::string& s);
