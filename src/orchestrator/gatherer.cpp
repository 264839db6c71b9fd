/**
 * @file gatherer.cpp
 * @brief Gatherer implementation and snapshot persistence.
 */

#include "orchestrator/gatherer.hpp"

#include "executor/thread_pool.hpp"
#include "model/snapshot_codec.hpp"
#include "remote/ssh_executor.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <future>
#include <optional>
#include <system_error>
#include <unordered_set>

namespace fleet_usage {

Gatherer::Gatherer(IRemoteExecutor& executor, Logger& logger, GatherOptions options,
                   Clock clock)
    : executor_(executor)
    , logger_(logger)
    , options_(std::move(options))
    , clock_(std::move(clock)) {
    if (options_.max_concurrency == 0) options_.max_concurrency = 1;
}

Roster Gatherer::distinct_hosts(const Roster& roster) {
    Roster hosts;
    hosts.reserve(roster.size());
    std::unordered_set<std::string> seen;
    for (const auto& identity : roster) {
        if (!seen.insert(identity.hostname).second) {
            logger_.warn("duplicate roster host skipped",
                         {{"host", identity.hostname}, {"room", identity.room}});
            continue;
        }
        hosts.push_back(identity);
    }
    return hosts;
}

UnixSeconds Gatherer::next_timestamp() {
    last_timestamp_ = std::max(last_timestamp_, clock_());
    return last_timestamp_;
}

Result<Snapshot> Gatherer::gather_one(const MachineIdentity& identity) {
    auto output = executor_.run(identity.hostname, options_.sampler_command,
                                options_.host_timeout);
    if (!output) {
        return output.error().context("sampler on " + identity.hostname + " failed");
    }

    auto snapshot = decode_snapshot(*output);
    if (!snapshot) {
        return snapshot.error().context("bad snapshot from " + identity.hostname);
    }
    return snapshot;
}

GatherOutcome Gatherer::gather(const Roster& roster) {
    std::lock_guard lock(gather_mutex_);

    auto hosts = distinct_hosts(roster);
    GatherOutcome outcome;
    outcome.summary.total = hosts.size();

    // One slot per host, filled in roster order regardless of completion order.
    std::vector<std::optional<Result<Snapshot>>> results(hosts.size());
    size_t workers = 0;

    if (!hosts.empty()) {
        ThreadPool pool(std::min(options_.max_concurrency, hosts.size()));
        workers = pool.thread_count();
        std::vector<std::future<Result<Snapshot>>> pending;
        pending.reserve(hosts.size());
        for (const auto& identity : hosts) {
            pending.push_back(pool.submit([this, &identity] { return gather_one(identity); }));
        }

        // Barrier: nothing is aggregated until every host has answered.
        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                results[i].emplace(pending[i].get());
            } catch (const std::exception& e) {
                results[i].emplace(Error{ErrorKind::Connection,
                                         std::string{"gather task threw: "} + e.what()});
            }
        }
    }

    for (size_t i = 0; i < hosts.size(); ++i) {
        auto& result = *results[i];
        if (result) {
            outcome.snapshot.entries.push_back(ClusterEntry{
                .identity = hosts[i],
                .snapshot = std::move(*result),
            });
            continue;
        }
        const auto& error = result.error();
        logger_.warn("gather failed", {
            {"host", hosts[i].hostname},
            {"kind", std::string{to_string(error.kind)}},
            {"error", error.message},
            {"cause", error.root_cause()},
        });
        outcome.failures.push_back(HostFailure{hosts[i].hostname, error});
    }

    outcome.summary.successes = outcome.snapshot.entries.size();
    outcome.snapshot.timestamp = next_timestamp();

    logger_.info("gather finished (" + std::to_string(outcome.summary.successes) + "/"
                     + std::to_string(outcome.summary.total) + " success)",
                 {{"successes", std::to_string(outcome.summary.successes)},
                  {"total", std::to_string(outcome.summary.total)},
                  {"workers", std::to_string(workers)}});
    return outcome;
}

// ─────────────────────────────────────────────
// Free functions
// ─────────────────────────────────────────────

std::string sampler_command(const std::string& sampler, const std::string& policy_path) {
    if (policy_path.empty()) return sampler;
    return sampler + " " + shell_quote(policy_path);
}

Result<void> persist(const ClusterSnapshot& snapshot, const std::filesystem::path& path) {
    std::string buffer;
    try {
        buffer = encode_cluster_snapshot(snapshot);
    } catch (const std::exception& e) {
        return Error{ErrorKind::Persistence, std::string{"cannot serialize snapshot: "} + e.what()};
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::Persistence, "cannot open " + tmp.string() + " for writing"};
        }
        out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return Error{ErrorKind::Persistence, "write to " + tmp.string() + " failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return Error{ErrorKind::Persistence,
                     "cannot move " + tmp.string() + " to " + path.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

}  // namespace fleet_usage
