#include "cli.hpp"

#include <charconv>
#include <format>
#include <print>

namespace {

// Optional value following a flag, e.g. "--backup /tmp/x" vs "--backup --verbose".
std::string optional_value(int argc, char* argv[], int& i) {
    if (i + 1 < argc && argv[i + 1][0] != '-') return argv[++i];
    return {};
}

std::expected<std::string, std::string> required_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) return std::unexpected(std::format("Missing value for {}", argv[i]));
    return argv[++i];
}

} // namespace

std::expected<CliOptions, std::string> parse_args(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--once") {
            opts.mode = Mode::Once;
        } else if (arg == "--export") {
            opts.mode = Mode::Export;
            opts.target = optional_value(argc, argv, i);
        } else if (arg == "--backup") {
            opts.mode = Mode::Backup;
            opts.target = optional_value(argc, argv, i);
        } else if (arg == "--restore") {
            opts.mode = Mode::Restore;
            opts.target = optional_value(argc, argv, i);
        } else if (arg == "--on-conflict") {
            auto v = required_value(argc, argv, i);
            if (!v) return std::unexpected(v.error());
            if (*v != "skip" && *v != "abort") {
                return std::unexpected(std::format("Invalid value for --on-conflict: {}", *v));
            }
            opts.on_conflict = std::move(*v);
        } else if (arg == "--interval" || arg == "-i") {
            auto v = required_value(argc, argv, i);
            if (!v) return std::unexpected(v.error());
            uint32_t ms = 0;
            auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), ms);
            if (ec != std::errc{} || ptr != v->data() + v->size() || ms == 0) {
                return std::unexpected(std::format("Invalid value for {}: {}", arg, *v));
            }
            opts.interval_ms = ms;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            auto v = required_value(argc, argv, i);
            if (!v) return std::unexpected(v.error());
            opts.config_path = std::move(*v);
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            return std::unexpected(std::format("Unknown option: {}", arg));
        }
    }
    return opts;
}

void print_usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Monitor processes running in tmux panes, back up and restore sessions.");
    std::println("Options:");
    std::println("  --once                   Sample once and print the summary");
    std::println("  --export [PATH]          Sample once and write JSON (default tmuxtop_export.json)");
    std::println("  --backup [DIR]           Save all sessions to a restore artifact");
    std::println("  --restore [FILE]         Restore sessions (default: newest backup)");
    std::println("  --on-conflict POLICY     skip or abort when a session already exists");
    std::println("  -i, --interval MS        Refresh interval in watch mode");
    std::println("  -c, --config PATH        Config file path");
    std::println("  -v, --verbose            Enable verbose logging");
    std::println("  -h, --help               Show this help");
}
