#pragma once

#include "platform/process_table.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

class ProcfsTable : public ProcessTable {
public:
    explicit ProcfsTable(std::string root = "/proc");

    std::vector<int> list_pids() const override;
    std::expected<ProcessLink, std::string> read_link(int pid) const override;
    std::expected<ProcessUsage, std::string> read_usage(int pid) const override;
    std::expected<std::vector<std::string>, std::string> read_cmdline(int pid) const override;
    std::expected<std::string, std::string> read_user(int pid) const override;
    long ticks_per_second() const override { return ticks_per_second_; }
    uint64_t boot_time() const override;
    uint64_t total_memory_bytes() const override;

    struct StatFields {
        int pid = 0;
        std::string comm;
        int ppid = 0;
        uint64_t utime = 0;
        uint64_t stime = 0;
        uint64_t starttime = 0;
        int64_t rss_pages = 0;
    };

    // Parse the contents of /proc/<pid>/stat. The command name may itself contain
    // spaces and parentheses, so it ends at the last ')'.
    static std::expected<StatFields, std::string> parse_stat(const std::string& content);

private:
    std::expected<StatFields, std::string> read_stat(int pid) const;
    std::string pid_path(int pid, const char* leaf) const;
    std::string user_name(uint32_t uid) const;

    std::string root_;
    long ticks_per_second_;
    long page_size_;
    mutable std::unordered_map<uint32_t, std::string> users_;
};
