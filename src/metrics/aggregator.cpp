#include "aggregator.hpp"

MetricsAggregator::MetricsAggregator(const ProcessTable& table) : table_(table) {}

MetricsSnapshot MetricsAggregator::sample(const SessionTree& tree, const ProcessIndex& index,
                                          Clock::time_point now) {
    const uint64_t total_memory = table_.total_memory_bytes();
    const uint64_t boot = table_.boot_time();

    MetricsSnapshot snap;
    std::unordered_map<int, Prior> next;
    // A process is read once per cycle even if two panes reach it.
    std::unordered_map<int, ProcessRecord> measured;

    for (const auto& session : tree.sessions) {
        SessionSample ss{.name = session.name, .metrics = {}, .windows = {}};

        for (const auto& window : session.windows) {
            WindowSample ws{.index = window.index, .name = window.name, .metrics = {}, .panes = {}};

            for (const auto& pane : window.panes) {
                PaneSample ps{.index = pane.index, .id = pane.id, .pid = pane.pid,
                              .metrics = {}, .processes = {}};

                for (int pid : index.resolve(pane.pid)) {
                    auto link = index.find(pid);
                    if (!link) continue;

                    auto it = measured.find(pid);
                    if (it == measured.end()) {
                        it = measured.emplace(pid, measure(*link, now, total_memory, boot, next))
                                 .first;
                    }
                    const auto& rec = it->second;

                    ps.metrics.cpu_percent += rec.cpu_percent.value_or(0.0);
                    ps.metrics.rss_bytes += rec.rss_bytes;
                    ps.metrics.mem_percent += rec.mem_percent;
                    ps.metrics.process_count++;
                    ps.processes.push_back(rec);
                }

                ws.metrics += ps.metrics;
                ws.panes.push_back(std::move(ps));
            }

            ss.metrics += ws.metrics;
            ss.windows.push_back(std::move(ws));
        }

        snap.total += ss.metrics;
        snap.sessions.push_back(std::move(ss));
    }

    // History for processes that were not seen this cycle is dropped.
    prior_ = std::move(next);
    return snap;
}

ProcessRecord MetricsAggregator::measure(const ProcessLink& link, Clock::time_point now,
                                         uint64_t total_memory, uint64_t boot,
                                         std::unordered_map<int, Prior>& next) {
    ProcessRecord rec{.pid = link.pid, .ppid = link.ppid, .command = link.comm,
                      .cpu_percent = std::nullopt, .rss_bytes = 0, .mem_percent = 0.0,
                      .readable = true, .username = {}, .create_time = 0.0, .cmdline = {}};

    // Descriptive fields; a failed read leaves them empty.
    if (auto user = table_.read_user(link.pid)) rec.username = std::move(*user);
    if (auto argv = table_.read_cmdline(link.pid)) rec.cmdline = std::move(*argv);

    auto usage = table_.read_usage(link.pid);
    if (!usage) {
        rec.readable = false;
        return rec;
    }

    rec.rss_bytes = usage->rss_bytes;
    if (boot > 0) {
        rec.create_time = static_cast<double>(boot) +
                          static_cast<double>(usage->start_ticks) /
                          static_cast<double>(table_.ticks_per_second());
    }
    if (total_memory > 0) {
        rec.mem_percent = 100.0 * static_cast<double>(usage->rss_bytes) /
                          static_cast<double>(total_memory);
    }

    auto prev = prior_.find(link.pid);
    if (prev != prior_.end() && prev->second.start_ticks == usage->start_ticks &&
        usage->cpu_ticks >= prev->second.cpu_ticks && now > prev->second.at) {
        double elapsed = std::chrono::duration<double>(now - prev->second.at).count();
        double cpu_seconds = static_cast<double>(usage->cpu_ticks - prev->second.cpu_ticks) /
                             static_cast<double>(table_.ticks_per_second());
        rec.cpu_percent = 100.0 * cpu_seconds / elapsed;
    }

    next[link.pid] = Prior{usage->cpu_ticks, usage->start_ticks, now};
    return rec;
}
