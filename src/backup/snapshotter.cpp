#include "snapshotter.hpp"

#include <algorithm>
#include <chrono>
#include <format>

Snapshotter::Snapshotter(std::vector<std::string> shells)
    : shells_(std::move(shells)) {}

RestoreArtifact Snapshotter::capture(const SessionTree& tree) const {
    RestoreArtifact artifact;
    artifact.created_at = std::format("{:%FT%TZ}",
        std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));

    for (const auto& session : tree.sessions) {
        ArtifactSession as{.name = session.name, .windows = {}};

        for (const auto& window : session.windows) {
            ArtifactWindow aw{
                .index = window.index,
                .name = window.name,
                .layout = window.layout,
                .active = window.active,
                .panes = {},
            };
            for (const auto& pane : window.panes) {
                aw.panes.push_back(ArtifactPane{
                    .index = pane.index,
                    .working_dir = pane.working_dir,
                    .command = command_for(pane),
                    .active = pane.active,
                });
            }
            if (!aw.panes.empty()) as.windows.push_back(std::move(aw));
        }

        if (!as.windows.empty()) artifact.sessions.push_back(std::move(as));
    }
    return artifact;
}

std::string Snapshotter::command_for(const Pane& pane) const {
    if (pane.command.empty() || is_shell(pane.command)) return {};
    if (!pane.command_line.empty()) return pane.command_line;
    return pane.command;
}

bool Snapshotter::is_shell(const std::string& comm) const {
    // Login shells show up as "-bash".
    std::string_view name = comm;
    if (name.starts_with('-')) name.remove_prefix(1);
    return std::ranges::any_of(shells_, [&](const auto& s) { return name == s; });
}
