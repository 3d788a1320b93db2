#pragma once

#include "monitor.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Read-only projection of the latest snapshot for external tools.
nlohmann::json export_json(const MonitorSnapshot& snapshot);

std::expected<void, std::string> write_export(const MonitorSnapshot& snapshot,
                                              const std::string& path);
