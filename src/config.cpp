#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Backup::resolved_dir() const {
    if (!dir.empty()) return dir;
    return platform::backup_dir();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("tmux")) {
            auto& t = j["tmux"];
            if (t.contains("binary")) cfg.tmux.binary = t["binary"].get<std::string>();
            if (t.contains("socket")) cfg.tmux.socket = t["socket"].get<std::string>();
            if (t.contains("timeout_ms")) cfg.tmux.timeout_ms = t["timeout_ms"].get<uint32_t>();
        }

        if (j.contains("sampling")) {
            auto& s = j["sampling"];
            if (s.contains("interval_ms")) cfg.sampling.interval_ms = s["interval_ms"].get<uint32_t>();
        }

        if (j.contains("procfs")) {
            auto& p = j["procfs"];
            if (p.contains("root")) cfg.procfs.root = p["root"].get<std::string>();
        }

        if (j.contains("backup")) {
            auto& b = j["backup"];
            if (b.contains("dir")) cfg.backup.dir = b["dir"].get<std::string>();
            if (b.contains("on_conflict")) cfg.backup.on_conflict = b["on_conflict"].get<std::string>();
            if (b.contains("restore_commands")) cfg.backup.restore_commands = b["restore_commands"].get<bool>();
        }

        if (j.contains("report")) {
            auto& r = j["report"];
            if (r.contains("path")) cfg.report.path = r["path"].get<std::string>();
        }

        if (j.contains("shells")) {
            cfg.shells = j["shells"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.sampling.interval_ms == 0) {
        std::println(stderr, "config: sampling.interval_ms must be positive, using 2000");
        cfg.sampling.interval_ms = 2000;
    }
    if (cfg.backup.on_conflict != "skip" && cfg.backup.on_conflict != "abort") {
        std::println(stderr, "config: unknown backup.on_conflict '{}', using skip",
                     cfg.backup.on_conflict);
        cfg.backup.on_conflict = "skip";
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
