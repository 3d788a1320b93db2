#pragma once

#include "restore_artifact.hpp"
#include "tmux/topology.hpp"

#include <string>
#include <vector>

// Turns a live session tree into a restore artifact. Layout strings are copied
// untouched; the order of sessions, windows and panes is the tree's order.
class Snapshotter {
public:
    explicit Snapshotter(std::vector<std::string> shells);

    RestoreArtifact capture(const SessionTree& tree) const;

    // The command worth re-running in a pane, empty if it sits at a shell prompt.
    std::string command_for(const Pane& pane) const;

private:
    bool is_shell(const std::string& comm) const;

    std::vector<std::string> shells_;
};
