#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace platform {

namespace {

// An unset or empty XDG variable falls back to $HOME/<home_rel>.
fs::path xdg_base(const char* var, const char* home_rel) {
    if (const char* v = std::getenv(var); v && *v) return v;
    if (const char* home = std::getenv("HOME"); home && *home) return fs::path(home) / home_rel;
    return {};
}

} // namespace

std::string config_dir() {
    auto base = xdg_base("XDG_CONFIG_HOME", ".config");
    return base.empty() ? std::string{} : (base / "tmuxtop").string();
}

std::string backup_dir() {
    auto base = xdg_base("XDG_DATA_HOME", ".local/share");
    if (base.empty()) return "/tmp/tmuxtop/backups";
    return (base / "tmuxtop" / "backups").string();
}

} // namespace platform
