#pragma once

#include <expected>
#include <string>

// Text-based command interface to the terminal multiplexer. Creation calls return the
// id of the pane they created, which later calls use as their target.
class Multiplexer {
public:
    virtual ~Multiplexer() = default;

    // One line per pane on the server, formatted with `format`.
    // Empty when no server is running.
    virtual std::expected<std::string, std::string> list_panes(const std::string& format) = 0;

    virtual std::expected<bool, std::string> has_session(const std::string& name) = 0;

    virtual std::expected<std::string, std::string>
        new_session(const std::string& name, const std::string& window_name,
                    const std::string& cwd) = 0;

    virtual std::expected<std::string, std::string>
        new_window(const std::string& session, const std::string& window_name,
                   const std::string& cwd) = 0;

    virtual std::expected<std::string, std::string>
        split_pane(const std::string& target_pane, const std::string& cwd) = 0;

    virtual std::expected<void, std::string>
        select_layout(const std::string& target, const std::string& layout) = 0;

    // Makes the window holding `target_pane` the session's current window.
    virtual std::expected<void, std::string> select_window(const std::string& target_pane) = 0;

    // Makes `target_pane` the active pane of its window.
    virtual std::expected<void, std::string> select_pane(const std::string& target_pane) = 0;

    // Types `text` literally into the pane and presses Enter.
    virtual std::expected<void, std::string>
        send_keys(const std::string& target_pane, const std::string& text) = 0;
};
