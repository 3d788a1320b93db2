#include "platform/linux/tmux_multiplexer.hpp"

#include "platform/linux/subprocess.hpp"

#include <format>

TmuxMultiplexer::TmuxMultiplexer(std::string binary, std::string socket,
                                 std::chrono::milliseconds timeout)
    : binary_(std::move(binary)), socket_(std::move(socket)), timeout_(timeout) {}

std::expected<std::string, std::string> TmuxMultiplexer::list_panes(const std::string& format) {
    auto reply = run({"list-panes", "-a", "-F", format});
    if (!reply) return std::unexpected(reply.error());

    if (reply->exit_code != 0) {
        if (is_no_server(reply->err)) return std::string{};
        return std::unexpected(std::format("list-panes exited with code {}: {}",
                                           reply->exit_code, reply->err));
    }
    return std::move(reply->out);
}

std::expected<bool, std::string> TmuxMultiplexer::has_session(const std::string& name) {
    // '=' prefix disables tmux's prefix matching of session names
    auto reply = run({"has-session", "-t", "=" + name});
    if (!reply) return std::unexpected(reply.error());
    if (reply->exit_code == 127) {
        return std::unexpected(std::format("could not execute {}", binary_));
    }
    return reply->exit_code == 0;
}

std::expected<std::string, std::string>
TmuxMultiplexer::new_session(const std::string& name, const std::string& window_name,
                             const std::string& cwd) {
    std::vector<std::string> args = {"new-session", "-d", "-s", name, "-P", "-F", "#{pane_id}"};
    if (!window_name.empty()) {
        args.push_back("-n");
        args.push_back(window_name);
    }
    if (!cwd.empty()) {
        args.push_back("-c");
        args.push_back(cwd);
    }

    auto out = run_checked(std::move(args));
    if (!out) return std::unexpected(out.error());
    return pane_id_from(std::move(*out));
}

std::expected<std::string, std::string>
TmuxMultiplexer::new_window(const std::string& session, const std::string& window_name,
                            const std::string& cwd) {
    // Trailing ':' picks the next free window index in the session.
    std::vector<std::string> args = {"new-window", "-d", "-t", "=" + session + ":",
                                     "-P", "-F", "#{pane_id}"};
    if (!window_name.empty()) {
        args.push_back("-n");
        args.push_back(window_name);
    }
    if (!cwd.empty()) {
        args.push_back("-c");
        args.push_back(cwd);
    }

    auto out = run_checked(std::move(args));
    if (!out) return std::unexpected(out.error());
    return pane_id_from(std::move(*out));
}

std::expected<std::string, std::string>
TmuxMultiplexer::split_pane(const std::string& target_pane, const std::string& cwd) {
    std::vector<std::string> args = {"split-window", "-d", "-t", target_pane,
                                     "-P", "-F", "#{pane_id}"};
    if (!cwd.empty()) {
        args.push_back("-c");
        args.push_back(cwd);
    }

    auto out = run_checked(std::move(args));
    if (!out) return std::unexpected(out.error());
    return pane_id_from(std::move(*out));
}

std::expected<void, std::string>
TmuxMultiplexer::select_layout(const std::string& target, const std::string& layout) {
    auto out = run_checked({"select-layout", "-t", target, layout});
    if (!out) return std::unexpected(out.error());
    return {};
}

std::expected<void, std::string> TmuxMultiplexer::select_window(const std::string& target_pane) {
    auto out = run_checked({"select-window", "-t", target_pane});
    if (!out) return std::unexpected(out.error());
    return {};
}

std::expected<void, std::string> TmuxMultiplexer::select_pane(const std::string& target_pane) {
    auto out = run_checked({"select-pane", "-t", target_pane});
    if (!out) return std::unexpected(out.error());
    return {};
}

std::expected<void, std::string>
TmuxMultiplexer::send_keys(const std::string& target_pane, const std::string& text) {
    auto typed = run_checked({"send-keys", "-t", target_pane, "-l", text});
    if (!typed) return std::unexpected(typed.error());

    auto enter = run_checked({"send-keys", "-t", target_pane, "Enter"});
    if (!enter) return std::unexpected(enter.error());
    return {};
}

bool TmuxMultiplexer::is_no_server(const std::string& err) {
    return err.find("no server running") != std::string::npos ||
           err.find("error connecting to") != std::string::npos;
}

std::expected<TmuxMultiplexer::Reply, std::string>
TmuxMultiplexer::run(std::vector<std::string> args) {
    std::vector<std::string> argv = {binary_};
    if (!socket_.empty()) {
        argv.push_back("-L");
        argv.push_back(socket_);
    }
    argv.insert(argv.end(), std::make_move_iterator(args.begin()),
                std::make_move_iterator(args.end()));

    auto result = run_process(argv, timeout_);
    if (!result) return std::unexpected("tmux: " + result.error());
    return Reply{result->exit_code, std::move(result->out), std::move(result->err)};
}

std::expected<std::string, std::string>
TmuxMultiplexer::run_checked(std::vector<std::string> args) {
    std::string cmd = args.empty() ? std::string{} : args.front();
    auto reply = run(std::move(args));
    if (!reply) return std::unexpected(reply.error());

    if (reply->exit_code == 127) {
        return std::unexpected(std::format("could not execute {}", binary_));
    }
    if (reply->exit_code != 0) {
        auto err = reply->err;
        while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
        return std::unexpected(std::format("{} exited with code {}: {}", cmd, reply->exit_code, err));
    }
    return std::move(reply->out);
}

std::expected<std::string, std::string> TmuxMultiplexer::pane_id_from(std::string out) {
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    if (out.empty() || out.front() != '%') {
        return std::unexpected("unexpected pane id from tmux: '" + out + "'");
    }
    return out;
}
