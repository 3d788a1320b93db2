#pragma once

#include "platform/multiplexer.hpp"

#include <chrono>
#include <string>
#include <vector>

class TmuxMultiplexer : public Multiplexer {
public:
    TmuxMultiplexer(std::string binary, std::string socket, std::chrono::milliseconds timeout);

    std::expected<std::string, std::string> list_panes(const std::string& format) override;
    std::expected<bool, std::string> has_session(const std::string& name) override;
    std::expected<std::string, std::string>
        new_session(const std::string& name, const std::string& window_name,
                    const std::string& cwd) override;
    std::expected<std::string, std::string>
        new_window(const std::string& session, const std::string& window_name,
                   const std::string& cwd) override;
    std::expected<std::string, std::string>
        split_pane(const std::string& target_pane, const std::string& cwd) override;
    std::expected<void, std::string>
        select_layout(const std::string& target, const std::string& layout) override;
    std::expected<void, std::string> select_window(const std::string& target_pane) override;
    std::expected<void, std::string> select_pane(const std::string& target_pane) override;
    std::expected<void, std::string>
        send_keys(const std::string& target_pane, const std::string& text) override;

    // True if tmux's stderr says there is no server to talk to.
    static bool is_no_server(const std::string& err);

private:
    struct Reply {
        int exit_code;
        std::string out;
        std::string err;
    };

    std::expected<Reply, std::string> run(std::vector<std::string> args);
    // Like run(), but a non-zero exit is an error.
    std::expected<std::string, std::string> run_checked(std::vector<std::string> args);
    // Strips the trailing newline from a -P -F '#{pane_id}' reply.
    static std::expected<std::string, std::string> pane_id_from(std::string out);

    std::string binary_;
    std::string socket_;
    std::chrono::milliseconds timeout_;
};
