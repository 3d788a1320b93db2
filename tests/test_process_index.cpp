#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "process/process_index.hpp"

#include <algorithm>
#include <set>

TEST_CASE("ProcessIndex", "[correlator]") {
    FakeProcessTable table;
    table.add(1, 0, "init");
    table.add(100, 1, "bash");
    table.add(101, 100, "make");
    table.add(102, 101, "cc1");
    table.add(103, 101, "cc1");
    table.add(200, 1, "bash");

    SECTION("ResolveRootFirstThenDescendants") {
        auto index = ProcessIndex::build(table);
        auto pids = index.resolve(100);
        REQUIRE(pids == std::vector<int>{100, 101, 102, 103});
    }

    SECTION("ClosedUnderParentChild") {
        auto index = ProcessIndex::build(table);
        auto pids = index.resolve(1);
        std::set<int> in(pids.begin(), pids.end());

        REQUIRE(in.contains(1));
        for (const auto& [pid, proc] : table.procs) {
            if (in.contains(proc.ppid) && pid != proc.ppid) {
                REQUIRE(in.contains(pid));
            }
        }
    }

    SECTION("SiblingsStayOutOfTheSet") {
        auto index = ProcessIndex::build(table);
        auto pids = index.resolve(200);
        REQUIRE(pids == std::vector<int>{200});
    }

    SECTION("UnknownRootIsEmpty") {
        auto index = ProcessIndex::build(table);
        REQUIRE(index.resolve(999).empty());
    }

    SECTION("SelfParentDoesNotLoop") {
        table.add(300, 300, "weird");
        table.add(301, 300, "child");
        auto index = ProcessIndex::build(table);
        REQUIRE(index.resolve(300) == std::vector<int>{300, 301});
    }

    SECTION("ParentCycleTerminates") {
        ProcessIndex index;
        index.add({.pid = 10, .ppid = 11, .comm = "a"});
        index.add({.pid = 11, .ppid = 10, .comm = "b"});
        index.finalize();

        auto pids = index.resolve(10);
        REQUIRE(pids == std::vector<int>{10, 11});
    }

    SECTION("VanishedProcessIsSkipped") {
        // Listed by list_pids() but gone by the time it is read.
        class RacyTable : public FakeProcessTable {
        public:
            std::vector<int> list_pids() const override {
                auto pids = FakeProcessTable::list_pids();
                pids.push_back(555);
                return pids;
            }
        } racy;
        racy.procs = table.procs;

        auto index = ProcessIndex::build(racy);
        REQUIRE(index.find(555) == nullptr);
        REQUIRE(index.size() == table.procs.size());
        REQUIRE(index.resolve(100).size() == 4);
    }

    SECTION("ForegroundCommandLine") {
        table.procs[101].argv = {"make", "-j8", "all"};
        auto index = ProcessIndex::build(table);

        REQUIRE(index.foreground_command(table, 100, "make") == "make -j8 all");
        REQUIRE(index.foreground_command(table, 100, "bash") == "bash");
        REQUIRE(index.foreground_command(table, 100, "vim").empty());
        REQUIRE(index.foreground_command(table, 100, "").empty());
    }

    SECTION("ForegroundCommandWithLongProgramName") {
        // comm is truncated to 15 characters, argv[0] is not
        table.add(104, 100, "docker-compose-").argv =
            {"/usr/local/bin/docker-compose-wrapper", "up", "--build"};
        auto index = ProcessIndex::build(table);

        REQUIRE(index.foreground_command(table, 100, "docker-compose-wrapper") ==
                "/usr/local/bin/docker-compose-wrapper up --build");
    }

    SECTION("ForegroundCommandFallsBackToComm") {
        table.procs[101].argv.clear();
        auto index = ProcessIndex::build(table);
        REQUIRE(index.foreground_command(table, 100, table.procs[101].comm) ==
                table.procs[101].comm);
    }

    SECTION("ProgramName") {
        REQUIRE(program_name("/usr/bin/vim") == "vim");
        REQUIRE(program_name("-bash") == "bash");
        REQUIRE(program_name("htop") == "htop");
    }

    SECTION("JoinArgvQuotes") {
        REQUIRE(join_argv({"vim", "notes.md"}) == "vim notes.md");
        REQUIRE(join_argv({"grep", "a b"}) == "grep 'a b'");
        REQUIRE(join_argv({"echo", "it's"}) == "echo 'it'\\''s'");
        REQUIRE(join_argv({"printf", ""}) == "printf ''");
    }
}
