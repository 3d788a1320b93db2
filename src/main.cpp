#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/procfs_table.hpp"
#include "platform/linux/tmux_multiplexer.hpp"

#include <chrono>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        std::println(stderr, "{}", opts.error());
        print_usage(argv[0]);
        return 1;
    }
    if (opts->help) {
        print_usage(argv[0]);
        return 0;
    }

    const Mode mode = opts->mode;
    const bool verbose = opts->verbose;
    const std::string& target = opts->target;
    const std::string& config_path = opts->config_path;
    const std::string& on_conflict = opts->on_conflict;
    const uint32_t interval_ms = opts->interval_ms;

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (interval_ms > 0) config.sampling.interval_ms = interval_ms;

    auto policy = parse_conflict_policy(on_conflict.empty() ? config.backup.on_conflict : on_conflict);
    if (!policy) {
        std::println(stderr, "{}", policy.error());
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[tmuxtop] Starting (tmux: {}, procfs: {})",
                     config.tmux.binary, config.procfs.root);
    }

    TmuxMultiplexer mux(config.tmux.binary, config.tmux.socket,
                        std::chrono::milliseconds(config.tmux.timeout_ms));
    ProcfsTable table(config.procfs.root);
    auto interval = std::chrono::milliseconds(config.sampling.interval_ms);

    App app(std::move(config), mux, table, verbose);

    switch (mode) {
        case Mode::Once:
            return app.show_once();
        case Mode::Export:
            return app.export_to(target);
        default:
            break;
    }

    LinuxEventLoop loop(app, interval, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    switch (mode) {
        case Mode::Backup:
            return loop.run_job([&](std::stop_token stop) { return app.backup(target, stop); });
        case Mode::Restore:
            return loop.run_job([&, p = *policy](std::stop_token stop) {
                return app.restore(target, p, stop);
            });
        default:
            return loop.watch();
    }
}
