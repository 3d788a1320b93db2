#pragma once

#include "pane_metrics.hpp"
#include "platform/process_table.hpp"
#include "process/process_index.hpp"
#include "tmux/topology.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>

// Rolls per-process usage up into pane, window and session totals. CPU usage is
// the change in CPU time since the previous sample() divided by the elapsed time,
// so the aggregator remembers each process's last CPU time between calls.
class MetricsAggregator {
public:
    using Clock = std::chrono::steady_clock;

    explicit MetricsAggregator(const ProcessTable& table);

    MetricsSnapshot sample(const SessionTree& tree, const ProcessIndex& index,
                           Clock::time_point now = Clock::now());

    // Number of processes with CPU history, i.e. seen in the last sample().
    size_t tracked() const { return prior_.size(); }

    void reset() { prior_.clear(); }

private:
    struct Prior {
        uint64_t cpu_ticks;
        uint64_t start_ticks;
        Clock::time_point at;
    };

    ProcessRecord measure(const ProcessLink& link, Clock::time_point now, uint64_t total_memory,
                          uint64_t boot, std::unordered_map<int, Prior>& next);

    const ProcessTable& table_;
    std::unordered_map<int, Prior> prior_;
};
