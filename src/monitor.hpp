#pragma once

#include "metrics/aggregator.hpp"
#include "platform/multiplexer.hpp"
#include "platform/process_table.hpp"
#include "tmux/inspector.hpp"

#include <chrono>
#include <expected>
#include <string>

struct MonitorSnapshot {
    SessionTree tree;
    MetricsSnapshot metrics;
    std::chrono::system_clock::time_point taken_at{};
    size_t cycle = 0;   // 0 until the first successful cycle
};

// One sampling cycle: inspect tmux, index the process table, resolve each pane's
// processes and aggregate their usage. Cycles run one at a time.
class Monitor {
public:
    Monitor(Multiplexer& mux, const ProcessTable& table, bool verbose = false);

    // On failure the previous snapshot is kept.
    std::expected<void, InspectionError> cycle();

    const MonitorSnapshot& snapshot() const { return snapshot_; }

    // Inspection only, with each pane's full foreground command line filled in.
    std::expected<SessionTree, InspectionError> inspect_with_commands();

private:
    void fill_commands(SessionTree& tree, const ProcessIndex& index) const;
    void log(const std::string& msg);

    Inspector inspector_;
    const ProcessTable& table_;
    MetricsAggregator aggregator_;
    MonitorSnapshot snapshot_;
    bool verbose_;
};
