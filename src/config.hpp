#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Tmux {
        std::string binary = "tmux";
        std::string socket;          // tmux -L name, empty for the default server
        uint32_t timeout_ms = 2000;  // per tmux invocation
    } tmux;

    struct Sampling {
        uint32_t interval_ms = 2000;
    } sampling;

    struct Procfs {
        std::string root = "/proc";
    } procfs;

    struct Backup {
        std::string dir;                   // empty: platform::backup_dir()
        std::string on_conflict = "skip";  // "skip" or "abort"
        bool restore_commands = true;

        std::string resolved_dir() const;
    } backup;

    struct Report {
        std::string path = "tmuxtop_export.json";
    } report;

    // Commands that mean "the pane is sitting at a prompt".
    std::vector<std::string> shells = {"bash", "zsh", "fish", "sh", "dash"};

    static Config load(const std::string& path);
    static Config load_default();
};
