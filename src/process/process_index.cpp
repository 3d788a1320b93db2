#include "process_index.hpp"

#include <algorithm>
#include <deque>
#include <string_view>
#include <unordered_set>

ProcessIndex ProcessIndex::build(const ProcessTable& table) {
    ProcessIndex index;
    for (int pid : table.list_pids()) {
        auto link = table.read_link(pid);
        if (!link) continue;
        index.add(std::move(*link));
    }
    index.finalize();
    return index;
}

void ProcessIndex::add(ProcessLink link) {
    int pid = link.pid;
    int ppid = link.ppid;
    bool inserted = procs_.insert_or_assign(pid, std::move(link)).second;
    if (!inserted) return;
    // A process listing itself as its parent must not become its own child.
    if (ppid != pid) children_[ppid].push_back(pid);
}

void ProcessIndex::finalize() {
    for (auto& [ppid, kids] : children_) {
        std::ranges::sort(kids);
        auto dup = std::ranges::unique(kids);
        kids.erase(dup.begin(), dup.end());
    }
}

std::vector<int> ProcessIndex::resolve(int root_pid) const {
    std::vector<int> out;
    if (!procs_.contains(root_pid)) return out;

    std::unordered_set<int> seen{root_pid};
    std::deque<int> queue{root_pid};
    while (!queue.empty()) {
        int pid = queue.front();
        queue.pop_front();
        out.push_back(pid);

        for (int child : children(pid)) {
            if (seen.insert(child).second) queue.push_back(child);
        }
    }
    return out;
}

const ProcessLink* ProcessIndex::find(int pid) const {
    auto it = procs_.find(pid);
    return it == procs_.end() ? nullptr : &it->second;
}

const std::vector<int>& ProcessIndex::children(int pid) const {
    static const std::vector<int> none;
    auto it = children_.find(pid);
    return it == children_.end() ? none : it->second;
}

std::string ProcessIndex::foreground_command(const ProcessTable& table, int root_pid,
                                             const std::string& command) const {
    if (command.empty()) return {};

    for (int pid : resolve(root_pid)) {
        auto link = find(pid);
        if (!link) continue;

        // tmux names a pane after argv[0]; comm is cut to 15 characters and only
        // stands in when there is no command line.
        auto argv = table.read_cmdline(pid);
        if (argv && !argv->empty()) {
            if (program_name(argv->front()) == command) return join_argv(*argv);
        } else if (link->comm == command) {
            return command;
        }
    }
    return {};
}

std::string program_name(std::string_view argv0) {
    if (argv0.starts_with('-')) argv0.remove_prefix(1);
    auto slash = argv0.rfind('/');
    if (slash != std::string_view::npos) argv0.remove_prefix(slash + 1);
    return std::string(argv0);
}

std::string join_argv(const std::vector<std::string>& argv) {
    static constexpr std::string_view safe =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
        "@%_-+=:,./";

    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';

        bool plain = !arg.empty() &&
            std::ranges::all_of(arg, [](char c) { return safe.find(c) != std::string_view::npos; });
        if (plain) {
            line += arg;
            continue;
        }

        line += '\'';
        for (char c : arg) {
            if (c == '\'') line += "'\\''";
            else line += c;
        }
        line += '\'';
    }
    return line;
}
