#pragma once

#include <cstdint>
#include <expected>
#include <string>

enum class Mode { Watch, Once, Export, Backup, Restore };

struct CliOptions {
    Mode mode = Mode::Watch;
    bool verbose = false;
    bool help = false;
    std::string config_path;
    std::string target;       // --export PATH, --backup DIR, --restore FILE
    std::string on_conflict;  // empty: config value
    uint32_t interval_ms = 0; // 0: config value
};

// Parses argv. The error names the offending option.
std::expected<CliOptions, std::string> parse_args(int argc, char* argv[]);

void print_usage(const char* prog);
