#pragma once

#include "monitor.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

// e.g. "512K", "12.5M", "1.2G"
std::string human_bytes(uint64_t bytes);

// Indented session / window / pane table with aggregated usage.
void print_summary(const MonitorSnapshot& snapshot, std::FILE* out = stdout);
