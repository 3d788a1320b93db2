#include "restore_artifact.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::string_view kPrefix = "tmux_backup_";
constexpr std::string_view kSuffix = ".json";

bool is_artifact_name(const std::string& name) {
    return name.size() > kPrefix.size() + kSuffix.size() &&
           name.starts_with(kPrefix) && name.ends_with(kSuffix);
}

} // namespace

json artifact_to_json(const RestoreArtifact& artifact) {
    json sessions = json::array();
    for (const auto& s : artifact.sessions) {
        json windows = json::array();
        for (const auto& w : s.windows) {
            json panes = json::array();
            for (const auto& p : w.panes) {
                panes.push_back({
                    {"index", p.index},
                    {"working_dir", p.working_dir},
                    {"command", p.command},
                    {"active", p.active},
                });
            }
            windows.push_back({
                {"index", w.index},
                {"name", w.name},
                {"layout", w.layout},
                {"active", w.active},
                {"panes", std::move(panes)},
            });
        }
        sessions.push_back({{"name", s.name}, {"windows", std::move(windows)}});
    }

    return {
        {"version", artifact.version},
        {"created_at", artifact.created_at},
        {"sessions", std::move(sessions)},
    };
}

std::expected<RestoreArtifact, std::string> artifact_from_json(const json& j) {
    RestoreArtifact artifact;
    try {
        artifact.version = j.value("version", 0);
        if (artifact.version != RestoreArtifact::kVersion) {
            return std::unexpected(std::format("unsupported artifact version {}", artifact.version));
        }
        artifact.created_at = j.value("created_at", "");

        if (!j.contains("sessions") || !j["sessions"].is_array()) {
            return std::unexpected(std::string("artifact has no sessions array"));
        }

        for (const auto& js : j["sessions"]) {
            ArtifactSession s;
            s.name = js.value("name", "");
            if (s.name.empty()) {
                return std::unexpected(std::string("artifact session without a name"));
            }

            if (js.contains("windows")) {
                for (const auto& jw : js["windows"]) {
                    ArtifactWindow w;
                    w.index = jw.value("index", 0);
                    w.name = jw.value("name", "");
                    w.layout = jw.value("layout", "");
                    w.active = jw.value("active", false);

                    if (jw.contains("panes")) {
                        for (const auto& jp : jw["panes"]) {
                            w.panes.push_back(ArtifactPane{
                                .index = jp.value("index", 0),
                                .working_dir = jp.value("working_dir", ""),
                                .command = jp.value("command", ""),
                                .active = jp.value("active", false),
                            });
                        }
                    }
                    if (w.panes.empty()) {
                        return std::unexpected(std::format(
                            "artifact window {}:{} has no panes", s.name, w.index));
                    }
                    s.windows.push_back(std::move(w));
                }
            }
            if (s.windows.empty()) {
                return std::unexpected(std::format("artifact session {} has no windows", s.name));
            }
            artifact.sessions.push_back(std::move(s));
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed artifact: ") + e.what());
    }
    return artifact;
}

std::expected<RestoreArtifact, std::string> parse_artifact(const std::string& text) {
    try {
        return artifact_from_json(json::parse(text));
    } catch (const json::exception& e) {
        return std::unexpected(std::string("artifact parse error: ") + e.what());
    }
}

std::expected<std::string, std::string> save_artifact(const RestoreArtifact& artifact,
                                                      const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", dir, ec.message()));
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // Artifacts are never overwritten.
    auto path = fs::path(dir) / std::format("{}{}{}", kPrefix, seconds, kSuffix);
    for (int n = 1; fs::exists(path); n++) {
        path = fs::path(dir) / std::format("{}{}-{}{}", kPrefix, seconds, n, kSuffix);
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp);
        if (!f.is_open()) {
            return std::unexpected(std::format("cannot write {}", tmp.string()));
        }
        f << artifact_to_json(artifact).dump(2) << '\n';
        if (!f.good()) {
            return std::unexpected(std::format("write to {} failed", tmp.string()));
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return std::unexpected(std::format("cannot rename to {}", path.string()));
    }
    return path.string();
}

std::expected<RestoreArtifact, std::string> load_artifact(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(std::format("cannot open {}", path));
    }
    try {
        auto result = artifact_from_json(json::parse(f));
        if (!result) return std::unexpected(path + ": " + result.error());
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("{}: parse error: {}", path, e.what()));
    }
}

std::expected<std::string, std::string> latest_artifact(const std::string& dir) {
    std::error_code ec;
    fs::path best;
    fs::file_time_type best_time{};

    for (auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (!is_artifact_name(name) || !entry.is_regular_file(ec)) continue;

        auto t = entry.last_write_time(ec);
        if (ec) continue;
        if (best.empty() || t > best_time || (t == best_time && entry.path() > best)) {
            best = entry.path();
            best_time = t;
        }
    }

    if (best.empty()) {
        return std::unexpected(std::format("no backup files found in {}", dir));
    }
    return best.string();
}
