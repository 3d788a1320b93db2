#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct ProcessLink {
    int pid = 0;
    int ppid = 0;
    std::string comm;
};

struct ProcessUsage {
    uint64_t cpu_ticks = 0;    // utime + stime
    uint64_t start_ticks = 0;  // start time since boot, distinguishes reused pids
    uint64_t rss_bytes = 0;
};

// Read-only view of the OS process table. Every read may fail because the process
// exited; callers treat that as a normal outcome.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;
    virtual std::vector<int> list_pids() const = 0;
    virtual std::expected<ProcessLink, std::string> read_link(int pid) const = 0;
    virtual std::expected<ProcessUsage, std::string> read_usage(int pid) const = 0;
    virtual std::expected<std::vector<std::string>, std::string> read_cmdline(int pid) const = 0;
    // Login name of the real uid, or the uid itself if it has no passwd entry.
    virtual std::expected<std::string, std::string> read_user(int pid) const = 0;
    virtual long ticks_per_second() const = 0;
    // Seconds since the epoch at boot; start_ticks count from here. 0 if unknown.
    virtual uint64_t boot_time() const = 0;
    virtual uint64_t total_memory_bytes() const = 0;
};
