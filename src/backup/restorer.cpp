#include "restorer.hpp"

#include <algorithm>
#include <format>
#include <print>

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Restored: return "restored";
        case SessionStatus::Conflict: return "conflict";
        case SessionStatus::Failed: return "failed";
        case SessionStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool RestoreOutcome::all_restored() const {
    return std::ranges::all_of(sessions, [](const auto& s) {
        return s.status == SessionStatus::Restored;
    });
}

size_t RestoreOutcome::count(SessionStatus status) const {
    return static_cast<size_t>(std::ranges::count(sessions, status, &SessionOutcome::status));
}

const SessionOutcome* RestoreOutcome::find(const std::string& name) const {
    auto it = std::ranges::find(sessions, name, &SessionOutcome::name);
    return it == sessions.end() ? nullptr : &*it;
}

Restorer::Restorer(Multiplexer& mux, Options options, bool verbose)
    : mux_(mux), options_(options), verbose_(verbose) {}

std::vector<RestoreStep> Restorer::plan(const ArtifactSession& session, bool restore_commands) {
    using Kind = RestoreStep::Kind;
    std::vector<RestoreStep> steps;

    for (size_t w = 0; w < session.windows.size(); w++) {
        const auto& window = session.windows[w];

        steps.push_back(RestoreStep{
            .kind = w == 0 ? Kind::NewSession : Kind::NewWindow,
            .window = w,
            .pane = 0,
            .text = window.name,
            .cwd = window.panes.front().working_dir,
        });

        for (size_t p = 1; p < window.panes.size(); p++) {
            steps.push_back(RestoreStep{.kind = Kind::SplitPane, .window = w, .pane = p,
                                        .text = {}, .cwd = window.panes[p].working_dir});
            steps.push_back(RestoreStep{.kind = Kind::Tile, .window = w, .pane = 0,
                                        .text = {}, .cwd = {}});
        }

        if (!window.layout.empty()) {
            steps.push_back(RestoreStep{.kind = Kind::SelectLayout, .window = w, .pane = 0,
                                        .text = window.layout, .cwd = {}});
        }
    }

    for (size_t w = 0; w < session.windows.size(); w++) {
        const auto& panes = session.windows[w].panes;
        auto active = std::ranges::find_if(panes, &ArtifactPane::active);
        if (active == panes.end()) continue;
        steps.push_back(RestoreStep{.kind = Kind::SelectPane, .window = w,
                                    .pane = static_cast<size_t>(active - panes.begin()),
                                    .text = {}, .cwd = {}});
    }

    auto active_window = std::ranges::find_if(session.windows, &ArtifactWindow::active);
    if (active_window != session.windows.end()) {
        steps.push_back(RestoreStep{.kind = Kind::SelectWindow,
                                    .window = static_cast<size_t>(active_window - session.windows.begin()),
                                    .pane = 0, .text = {}, .cwd = {}});
    }

    if (restore_commands) {
        for (size_t w = 0; w < session.windows.size(); w++) {
            const auto& panes = session.windows[w].panes;
            for (size_t p = 0; p < panes.size(); p++) {
                if (panes[p].command.empty()) continue;
                steps.push_back(RestoreStep{.kind = Kind::SendKeys, .window = w, .pane = p,
                                            .text = panes[p].command, .cwd = {}});
            }
        }
    }
    return steps;
}

RestoreOutcome Restorer::restore(RestoreArtifact artifact, std::stop_token stop) {
    RestoreOutcome outcome;
    bool halted = false;

    for (const auto& session : artifact.sessions) {
        if (halted || stop.stop_requested()) {
            outcome.sessions.push_back(SessionOutcome{
                .name = session.name,
                .status = SessionStatus::Cancelled,
                .reason = halted ? "restore aborted after conflict" : "cancelled",
                .windows_restored = 0,
                .failed_windows = {},
            });
            continue;
        }

        auto result = restore_session(session, stop);
        log(std::format("session {}: {}{}", result.name, to_string(result.status),
                        result.reason.empty() ? "" : " (" + result.reason + ")"));

        if (result.status == SessionStatus::Conflict &&
            options_.on_conflict == ConflictPolicy::Abort) {
            halted = true;
        }
        outcome.sessions.push_back(std::move(result));
    }
    return outcome;
}

SessionOutcome Restorer::restore_session(const ArtifactSession& session, std::stop_token stop) {
    using Kind = RestoreStep::Kind;

    SessionOutcome out{.name = session.name, .status = SessionStatus::Restored,
                       .reason = {}, .windows_restored = 0, .failed_windows = {}};

    auto fail_from = [&](size_t window, SessionStatus status, std::string reason) {
        out.status = status;
        out.reason = std::move(reason);
        for (size_t w = window; w < session.windows.size(); w++) {
            out.failed_windows.push_back(session.windows[w].index);
        }
    };

    auto exists = mux_.has_session(session.name);
    if (!exists) {
        fail_from(0, SessionStatus::Failed, exists.error());
        return out;
    }
    if (*exists) {
        out.status = SessionStatus::Conflict;
        out.reason = std::format("session '{}' already exists", session.name);
        return out;
    }

    auto steps = plan(session, options_.restore_commands);

    // pane ids handed back by tmux, by artifact position
    std::vector<std::vector<std::string>> ids(session.windows.size());
    for (size_t w = 0; w < session.windows.size(); w++) {
        ids[w].resize(session.windows[w].panes.size());
    }

    for (size_t i = 0; i < steps.size(); i++) {
        const auto& step = steps[i];

        if (stop.stop_requested()) {
            fail_from(out.windows_restored, SessionStatus::Cancelled, "cancelled");
            return out;
        }

        std::expected<void, std::string> result;
        const char* what = "";

        switch (step.kind) {
            case Kind::NewSession:
            case Kind::NewWindow: {
                what = step.kind == Kind::NewSession ? "new-session" : "new-window";
                auto id = step.kind == Kind::NewSession
                    ? mux_.new_session(session.name, step.text, step.cwd)
                    : mux_.new_window(session.name, step.text, step.cwd);
                if (id) ids[step.window][0] = *id;
                else result = std::unexpected(id.error());
                break;
            }
            case Kind::SplitPane: {
                what = "split-window";
                auto id = mux_.split_pane(ids[step.window][step.pane - 1], step.cwd);
                if (id) ids[step.window][step.pane] = *id;
                else result = std::unexpected(id.error());
                break;
            }
            case Kind::Tile:
                what = "select-layout tiled";
                result = mux_.select_layout(ids[step.window][0], "tiled");
                break;
            case Kind::SelectLayout:
                what = "select-layout";
                result = mux_.select_layout(ids[step.window][0], step.text);
                break;
            case Kind::SelectPane:
                what = "select-pane";
                result = mux_.select_pane(ids[step.window][step.pane]);
                break;
            case Kind::SelectWindow:
                what = "select-window";
                result = mux_.select_window(ids[step.window][0]);
                break;
            case Kind::SendKeys:
                what = "send-keys";
                result = mux_.send_keys(ids[step.window][step.pane], step.text);
                break;
        }

        if (!result) {
            const auto& window = session.windows[step.window];
            auto reason = std::format("{} in window {} failed: {}", what, window.index,
                                      result.error());
            if (!step.structural()) {
                // The layout is complete; only this window's selection or commands are missing.
                out.status = SessionStatus::Failed;
                out.reason = std::move(reason);
                out.failed_windows.push_back(window.index);
            } else {
                fail_from(step.window, SessionStatus::Failed, std::move(reason));
            }
            return out;
        }

        bool window_done = step.structural() &&
            (i + 1 == steps.size() || steps[i + 1].window != step.window ||
             !steps[i + 1].structural());
        if (window_done) out.windows_restored = step.window + 1;
    }

    return out;
}

void Restorer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tmuxtop] restore: {}", msg);
    }
}
