#include "platform/linux/procfs_table.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <pwd.h>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

ProcfsTable::ProcfsTable(std::string root)
    : root_(std::move(root)),
      ticks_per_second_(::sysconf(_SC_CLK_TCK)),
      page_size_(::sysconf(_SC_PAGESIZE)) {
    if (ticks_per_second_ <= 0) ticks_per_second_ = 100;
    if (page_size_ <= 0) page_size_ = 4096;
}

std::vector<int> ProcfsTable::list_pids() const {
    std::vector<int> pids;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(root_, ec)) {
        auto name = entry.path().filename().string();
        int pid = 0;
        auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (err != std::errc{} || ptr != name.data() + name.size() || pid <= 0) continue;
        pids.push_back(pid);
    }
    return pids;
}

std::expected<ProcessLink, std::string> ProcfsTable::read_link(int pid) const {
    auto stat = read_stat(pid);
    if (!stat) return std::unexpected(stat.error());
    return ProcessLink{.pid = stat->pid, .ppid = stat->ppid, .comm = std::move(stat->comm)};
}

std::expected<ProcessUsage, std::string> ProcfsTable::read_usage(int pid) const {
    auto stat = read_stat(pid);
    if (!stat) return std::unexpected(stat.error());

    ProcessUsage usage;
    usage.cpu_ticks = stat->utime + stat->stime;
    usage.start_ticks = stat->starttime;
    usage.rss_bytes = stat->rss_pages > 0
        ? static_cast<uint64_t>(stat->rss_pages) * static_cast<uint64_t>(page_size_)
        : 0;
    return usage;
}

std::expected<std::vector<std::string>, std::string> ProcfsTable::read_cmdline(int pid) const {
    auto path = pid_path(pid, "cmdline");
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(std::format("procfs: cannot open {}: {}", path, std::strerror(errno)));
    }
    std::string raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    // NUL-separated, usually with a trailing NUL. Kernel threads have none.
    std::vector<std::string> args;
    size_t start = 0;
    while (start < raw.size()) {
        auto end = raw.find('\0', start);
        if (end == std::string::npos) end = raw.size();
        args.emplace_back(raw, start, end - start);
        start = end + 1;
    }
    return args;
}

std::expected<std::string, std::string> ProcfsTable::read_user(int pid) const {
    auto path = pid_path(pid, "status");
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(std::format("procfs: cannot open {}: {}", path, std::strerror(errno)));
    }

    // Uid:	real	effective	saved	filesystem
    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("Uid:", 0) != 0) continue;
        std::istringstream ss(line.substr(4));
        uint32_t uid = 0;
        if (!(ss >> uid)) break;
        return user_name(uid);
    }
    return std::unexpected(std::format("procfs: no Uid line in {}", path));
}

std::string ProcfsTable::user_name(uint32_t uid) const {
    if (auto it = users_.find(uid); it != users_.end()) return it->second;

    long size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(size > 0 ? static_cast<size_t>(size) : 16384);
    passwd pw{};
    passwd* found = nullptr;
    std::string name;
    if (::getpwuid_r(uid, &pw, buf.data(), buf.size(), &found) == 0 && found) {
        name = found->pw_name;
    } else {
        name = std::to_string(uid);
    }
    users_.emplace(uid, name);
    return name;
}

uint64_t ProcfsTable::boot_time() const {
    std::ifstream f(root_ + "/stat");
    if (!f.is_open()) return 0;

    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("btime ", 0) != 0) continue;
        std::istringstream ss(line.substr(6));
        uint64_t secs = 0;
        ss >> secs;
        return secs;
    }
    return 0;
}

uint64_t ProcfsTable::total_memory_bytes() const {
    std::ifstream f(root_ + "/meminfo");
    if (!f.is_open()) return 0;

    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("MemTotal:", 0) != 0) continue;
        std::istringstream ss(line.substr(9));
        uint64_t kb = 0;
        ss >> kb;
        return kb * 1024;
    }
    return 0;
}

std::expected<ProcfsTable::StatFields, std::string>
ProcfsTable::parse_stat(const std::string& content) {
    auto open = content.find('(');
    auto close = content.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::unexpected(std::string("procfs: malformed stat line"));
    }

    StatFields s;
    auto pid_str = content.substr(0, open);
    std::istringstream pid_ss(pid_str);
    if (!(pid_ss >> s.pid)) return std::unexpected(std::string("procfs: malformed pid"));
    s.comm = content.substr(open + 1, close - open - 1);

    // Fields after the command, numbered from 3 (state) as in proc(5).
    std::istringstream ss(content.substr(close + 1));
    std::string state;
    ss >> state >> s.ppid;

    std::string skip;
    for (int i = 5; i <= 13; i++) ss >> skip;  // pgrp .. cmajflt
    ss >> s.utime >> s.stime;
    for (int i = 16; i <= 21; i++) ss >> skip;  // cutime .. itrealvalue
    ss >> s.starttime;
    ss >> skip;                                 // vsize
    ss >> s.rss_pages;

    if (ss.fail()) return std::unexpected(std::string("procfs: truncated stat line"));
    return s;
}

std::expected<ProcfsTable::StatFields, std::string> ProcfsTable::read_stat(int pid) const {
    auto path = pid_path(pid, "stat");
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(std::format("procfs: cannot open {}: {}", path, std::strerror(errno)));
    }
    std::string line;
    if (!std::getline(f, line)) {
        return std::unexpected(std::format("procfs: cannot read {}", path));
    }
    return parse_stat(line);
}

std::string ProcfsTable::pid_path(int pid, const char* leaf) const {
    return std::format("{}/{}/{}", root_, pid, leaf);
}
