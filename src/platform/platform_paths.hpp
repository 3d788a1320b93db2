#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/tmuxtop, else ~/.config/tmuxtop. Empty if neither is set.
std::string config_dir();

// Default location for restore artifacts: $XDG_DATA_HOME/tmuxtop/backups, else
// ~/.local/share/tmuxtop/backups, else /tmp/tmuxtop/backups.
std::string backup_dir();

} // namespace platform
