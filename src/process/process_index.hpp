#pragma once

#include "platform/process_table.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Snapshot of the process table as a parent -> children index. Built once per
// sampling cycle and shared by every pane; it never changes after build().
class ProcessIndex {
public:
    // Processes that exit while the table is being read are left out.
    static ProcessIndex build(const ProcessTable& table);

    void add(ProcessLink link);
    // Sort children by pid. Called by build(); call after add() when assembling by hand.
    void finalize();

    // The root and all of its descendants, breadth-first, root first.
    // Empty if the root is not in the snapshot.
    std::vector<int> resolve(int root_pid) const;

    const ProcessLink* find(int pid) const;
    const std::vector<int>& children(int pid) const;
    size_t size() const { return procs_.size(); }

    // Full command line of the first process in resolve(root_pid) whose program name
    // is `command`, e.g. "vim notes.md" for a pane showing "vim". Empty if none matches.
    std::string foreground_command(const ProcessTable& table, int root_pid,
                                   const std::string& command) const;

private:
    std::unordered_map<int, ProcessLink> procs_;
    std::unordered_map<int, std::vector<int>> children_;
};

// "/usr/bin/vim" -> "vim", "-bash" -> "bash".
std::string program_name(std::string_view argv0);

// Join argv into one line a shell reads back as the same words.
std::string join_argv(const std::vector<std::string>& argv);
