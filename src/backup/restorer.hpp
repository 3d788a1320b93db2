#pragma once

#include "platform/multiplexer.hpp"
#include "restore_artifact.hpp"

#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

enum class ConflictPolicy { Skip, Abort };

enum class SessionStatus {
    Restored,
    Conflict,   // a session with that name already exists; nothing was created
    Failed,     // a step failed; steps before it stay applied
    Cancelled,  // stop was requested before or during this session
};

const char* to_string(SessionStatus status);

struct SessionOutcome {
    std::string name;
    SessionStatus status = SessionStatus::Restored;
    std::string reason;
    size_t windows_restored = 0;     // windows fully created, in artifact order
    std::vector<int> failed_windows; // artifact window indexes not (fully) restored
};

struct RestoreOutcome {
    std::vector<SessionOutcome> sessions;

    bool all_restored() const;
    size_t count(SessionStatus status) const;
    const SessionOutcome* find(const std::string& name) const;
};

// One multiplexer command. Panes are addressed by their position in the artifact
// (window, pane); the restorer maps positions to the pane ids tmux hands back.
struct RestoreStep {
    enum class Kind {
        NewSession,    // creates pane (0, 0)
        NewWindow,     // creates pane (window, 0)
        SplitPane,     // splits (window, pane - 1), creating (window, pane)
        Tile,          // evens out the window so the next split has room
        SelectLayout,  // applies the captured layout string
        SelectPane,    // makes (window, pane) the window's active pane
        SelectWindow,  // makes `window` the session's current window
        SendKeys,      // re-runs the captured command in (window, pane)
    };

    // Steps that build the window itself; the rest only act on existing panes.
    bool structural() const {
        return kind != Kind::SelectPane && kind != Kind::SelectWindow && kind != Kind::SendKeys;
    }

    Kind kind;
    size_t window = 0;
    size_t pane = 0;
    std::string text;  // window name, layout or command, by kind
    std::string cwd;
};

class Restorer {
public:
    struct Options {
        ConflictPolicy on_conflict = ConflictPolicy::Skip;
        bool restore_commands = true;
    };

    Restorer(Multiplexer& mux, Options options, bool verbose = false);

    // Sessions are restored one after another in artifact order. A failed session does
    // not undo earlier ones. `stop` is honoured between commands.
    RestoreOutcome restore(RestoreArtifact artifact, std::stop_token stop = {});

    // The exact command sequence for one session. Each window's panes are split in
    // captured order, always from the previously created pane. Once every window
    // exists the captured active pane and window are selected, then commands are sent.
    static std::vector<RestoreStep> plan(const ArtifactSession& session, bool restore_commands);

private:
    SessionOutcome restore_session(const ArtifactSession& session, std::stop_token stop);
    void log(const std::string& msg);

    Multiplexer& mux_;
    Options options_;
    bool verbose_;
};
