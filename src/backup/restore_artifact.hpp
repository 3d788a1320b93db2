#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ArtifactPane {
    int index = 0;
    std::string working_dir;
    std::string command;     // empty: nothing to re-run
    bool active = false;
};

struct ArtifactWindow {
    int index = 0;
    std::string name;
    std::string layout;      // tmux layout string, opaque
    bool active = false;
    std::vector<ArtifactPane> panes;
};

struct ArtifactSession {
    std::string name;
    std::vector<ArtifactWindow> windows;
};

// Everything needed to rebuild a set of sessions. Sessions, windows and panes are in
// the order they must be created.
struct RestoreArtifact {
    static constexpr int kVersion = 1;

    int version = kVersion;
    std::string created_at;  // ISO 8601, UTC
    std::vector<ArtifactSession> sessions;
};

nlohmann::json artifact_to_json(const RestoreArtifact& artifact);
std::expected<RestoreArtifact, std::string> artifact_from_json(const nlohmann::json& j);
std::expected<RestoreArtifact, std::string> parse_artifact(const std::string& text);

// Writes tmux_backup_<unix-seconds>.json into `dir` (created if needed) and
// returns the path written.
std::expected<std::string, std::string> save_artifact(const RestoreArtifact& artifact,
                                                      const std::string& dir);
std::expected<RestoreArtifact, std::string> load_artifact(const std::string& path);

// Most recently written tmux_backup_*.json in `dir`.
std::expected<std::string, std::string> latest_artifact(const std::string& dir);
