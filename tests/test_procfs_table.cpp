#include <catch2/catch_test_macros.hpp>

#include "platform/linux/procfs_table.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// A /proc lookalike in a temp dir.
struct FakeProcRoot {
    fs::path path;

    FakeProcRoot() {
        path = fs::temp_directory_path() / ("tmuxtop_test_proc_" + std::to_string(getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~FakeProcRoot() { fs::remove_all(path); }

    void write(const std::string& rel, const std::string& content) {
        auto p = path / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
    }
};

// pid (comm) state ppid, then fields 5..24 of proc(5): utime=250 stime=50
// starttime=98765 rss=321 pages.
const std::string kStat =
    "4242 (tmux: server (odd) name) S 17 4242 4242 0 -1 4194560 100 0 0 0 "
    "250 50 0 0 20 0 1 0 98765 1000000 321 18446744073709551615 1 1 0 0 0";

} // namespace

TEST_CASE("ProcfsTable", "[procfs]") {

    SECTION("ParseStatWithParensInName") {
        auto s = ProcfsTable::parse_stat(kStat);
        REQUIRE(s.has_value());
        REQUIRE(s->pid == 4242);
        REQUIRE(s->comm == "tmux: server (odd) name");
        REQUIRE(s->ppid == 17);
        REQUIRE(s->utime == 250);
        REQUIRE(s->stime == 50);
        REQUIRE(s->starttime == 98765);
        REQUIRE(s->rss_pages == 321);
    }

    SECTION("ParseStatRejectsGarbage") {
        REQUIRE_FALSE(ProcfsTable::parse_stat("").has_value());
        REQUIRE_FALSE(ProcfsTable::parse_stat("12 no parens here").has_value());
        REQUIRE_FALSE(ProcfsTable::parse_stat("12 (sh) S 1").has_value());
    }

    SECTION("FakeRoot") {
        FakeProcRoot root;
        root.write("4242/stat", kStat + "\n");
        root.write("4242/cmdline", std::string("vim\0notes.md\0", 13));
        root.write("7/stat", "7 (kworker/0:1) I 2 0 0 0 -1 0 0 0 0 0 0 0 0 0 20 0 1 0 5 0 0");
        root.write("7/cmdline", "");
        root.write("self/stat", kStat);
        root.write("sys/x", "");
        root.write("meminfo", "MemTotal:       16384 kB\nMemFree:         1024 kB\n");
        root.write("4242/status", "Name:\ttmux: server\nUid:\t0\t0\t0\t0\nGid:\t0\t0\t0\t0\n");
        root.write("7/status", "Name:\tkworker/0:1\nUid:\t3999999\t0\t0\t0\n");
        root.write("stat", "cpu  1 2 3 4\nbtime 1700000000\nprocesses 99\n");

        ProcfsTable table(root.path.string());

        auto pids = table.list_pids();
        std::ranges::sort(pids);
        REQUIRE(pids == std::vector<int>{7, 4242});

        auto link = table.read_link(4242);
        REQUIRE(link.has_value());
        REQUIRE(link->ppid == 17);
        REQUIRE(link->comm == "tmux: server (odd) name");

        auto usage = table.read_usage(4242);
        REQUIRE(usage.has_value());
        REQUIRE(usage->cpu_ticks == 300);
        REQUIRE(usage->start_ticks == 98765);
        REQUIRE(usage->rss_bytes == 321 * static_cast<uint64_t>(::sysconf(_SC_PAGESIZE)));

        auto argv = table.read_cmdline(4242);
        REQUIRE(argv.has_value());
        REQUIRE(*argv == std::vector<std::string>{"vim", "notes.md"});

        auto kthread = table.read_cmdline(7);
        REQUIRE(kthread.has_value());
        REQUIRE(kthread->empty());

        REQUIRE(table.total_memory_bytes() == 16384ull * 1024);
        REQUIRE(table.boot_time() == 1700000000);

        REQUIRE(table.read_user(4242).value() == "root");
        // no passwd entry
        REQUIRE(table.read_user(7).value() == "3999999");
    }

    SECTION("MissingProcess") {
        FakeProcRoot root;
        ProcfsTable table(root.path.string());
        REQUIRE(table.list_pids().empty());
        REQUIRE_FALSE(table.read_link(99).has_value());
        REQUIRE_FALSE(table.read_usage(99).has_value());
        REQUIRE_FALSE(table.read_cmdline(99).has_value());
        REQUIRE(table.total_memory_bytes() == 0);
        REQUIRE(table.boot_time() == 0);
        REQUIRE_FALSE(table.read_user(99).has_value());
    }

    SECTION("LiveProc") {
        ProcfsTable table;
        REQUIRE(table.ticks_per_second() > 0);
        REQUIRE(table.total_memory_bytes() > 0);

        auto self = table.read_link(getpid());
        REQUIRE(self.has_value());
        REQUIRE(self->pid == getpid());
        REQUIRE(self->ppid == getppid());

        auto usage = table.read_usage(getpid());
        REQUIRE(usage.has_value());
        REQUIRE(usage->rss_bytes > 0);

        auto pids = table.list_pids();
        REQUIRE(std::ranges::find(pids, getpid()) != pids.end());

        REQUIRE(table.boot_time() > 0);
        auto user = table.read_user(getpid());
        REQUIRE(user.has_value());
        REQUIRE_FALSE(user->empty());
    }
}
