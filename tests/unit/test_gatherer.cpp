/**
 * @file test_gatherer.cpp
 * @brief Unit tests for the Gatherer fan-out and snapshot persistence.
 */

#include "model/snapshot_codec.hpp"
#include "model/text_file.hpp"
#include "orchestrator/gatherer.hpp"

#include <gtest/gtest.h>
#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace fleet_usage;

namespace {

/// Collects log records in memory.
class CaptureSink : public ILogSink {
public:
    void write(std::string_view json_line) override {
        std::lock_guard lock(mutex_);
        lines_.emplace_back(json_line);
    }
    void flush() override {}

    std::vector<std::string> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

Snapshot snapshot_for(const std::string& host) {
    return Snapshot{
        .hostname = host,
        .global_cpu_percent = 10.0f,
        .per_core_percent = {10.0f, 20.0f},
        .load_avg = {.one = 0.1, .five = 0.2, .fifteen = 0.3},
        .memory = {.used = 1, .total = 2},
        .samples = {{"python", "ann", 55.0f}},
    };
}

/// Answers from a script: a canned reply per host, a snapshot otherwise.
class FakeExecutor : public IRemoteExecutor {
public:
    std::map<std::string, Result<std::string>> replies;
    std::chrono::milliseconds delay{0};
    std::atomic<size_t> calls{0};
    std::atomic<size_t> running{0};
    std::atomic<size_t> peak{0};
    std::string last_command;

    Result<std::string> run(const std::string& host, const std::string& command,
                            std::chrono::milliseconds /*timeout*/) override {
        ++calls;
        auto now = ++running;
        auto seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        --running;

        {
            std::lock_guard lock(mutex_);
            last_command = command;
        }
        if (auto it = replies.find(host); it != replies.end()) return it->second;
        return encode_snapshot(snapshot_for(host));
    }

private:
    std::mutex mutex_;
};

Roster make_roster(size_t n) {
    Roster roster;
    for (size_t i = 0; i < n; ++i) {
        roster.push_back({.hostname = "m" + std::to_string(i + 1), .room = "lab", .owner = {}});
    }
    return roster;
}

}  // namespace

class GathererTest : public ::testing::Test {
protected:
    FakeExecutor executor_;
    CaptureSink* sink_ = new CaptureSink;
    Logger logger_{std::unique_ptr<ILogSink>(sink_), LogLevel::Debug};

    GatherOptions options(size_t jobs = 4) {
        return GatherOptions{.sampler_command = "/opt/fleet/fleet_sampler",
                             .max_concurrency = jobs,
                             .host_timeout = std::chrono::milliseconds(1000)};
    }
};

TEST_F(GathererTest, AllHostsSucceed) {
    Gatherer gatherer(executor_, logger_, options(), [] { return UnixSeconds{1000}; });
    auto roster = make_roster(5);

    auto outcome = gatherer.gather(roster);
    EXPECT_EQ(outcome.summary, (GatherSummary{5, 5}));
    ASSERT_EQ(outcome.snapshot.entries.size(), 5u);
    for (size_t i = 0; i < roster.size(); ++i) {
        EXPECT_EQ(outcome.snapshot.entries[i].identity, roster[i]);
        EXPECT_EQ(outcome.snapshot.entries[i].snapshot, snapshot_for(roster[i].hostname));
    }
    EXPECT_EQ(outcome.snapshot.timestamp, 1000u);
    EXPECT_TRUE(outcome.failures.empty());
    EXPECT_EQ(executor_.last_command, "/opt/fleet/fleet_sampler");
}

TEST_F(GathererTest, FailuresAreIsolated) {
    executor_.replies.emplace("m2", Error{ErrorKind::Connection, "No route to host"});
    executor_.replies.emplace("m4", Result<std::string>{std::string{"not json at all"}});
    Gatherer gatherer(executor_, logger_, options());

    auto outcome = gatherer.gather(make_roster(5));
    EXPECT_EQ(outcome.summary, (GatherSummary{3, 5}));
    ASSERT_EQ(outcome.snapshot.entries.size(), 3u);
    EXPECT_EQ(outcome.snapshot.entries[0].identity.hostname, "m1");
    EXPECT_EQ(outcome.snapshot.entries[1].identity.hostname, "m3");
    EXPECT_EQ(outcome.snapshot.entries[2].identity.hostname, "m5");

    ASSERT_EQ(outcome.failures.size(), 2u);
    EXPECT_EQ(outcome.failures[0].host, "m2");
    EXPECT_EQ(outcome.failures[0].error.kind, ErrorKind::Connection);
    EXPECT_EQ(outcome.failures[0].error.root_cause(), "No route to host");
    EXPECT_EQ(outcome.failures[1].host, "m4");
    EXPECT_EQ(outcome.failures[1].error.kind, ErrorKind::Deserialization);
}

TEST_F(GathererTest, FailuresAreLoggedWithHostAndCause) {
    executor_.replies.emplace("m2", Error{ErrorKind::Connection, "Connection refused"});
    Gatherer gatherer(executor_, logger_, options());
    (void)gatherer.gather(make_roster(2));

    bool found_failure = false;
    bool found_summary = false;
    for (const auto& line : sink_->lines()) {
        if (line.find("\"host\":\"m2\"") != std::string::npos
            && line.find("Connection refused") != std::string::npos) {
            found_failure = true;
        }
        if (line.find("(1/2 success)") != std::string::npos) {
            found_summary = true;
            // Pool is sized to the smaller of --jobs and the host count.
            EXPECT_NE(line.find("\"workers\":\"2\""), std::string::npos) << line;
        }
    }
    EXPECT_TRUE(found_failure);
    EXPECT_TRUE(found_summary);
}

TEST_F(GathererTest, AllHostsFail) {
    for (const auto& identity : make_roster(3)) {
        executor_.replies.emplace(identity.hostname, Error{ErrorKind::Connection, "down"});
    }
    Gatherer gatherer(executor_, logger_, options());
    auto outcome = gatherer.gather(make_roster(3));
    EXPECT_EQ(outcome.summary, (GatherSummary{0, 3}));
    EXPECT_TRUE(outcome.snapshot.entries.empty());
}

TEST_F(GathererTest, EmptyRoster) {
    Gatherer gatherer(executor_, logger_, options());
    auto outcome = gatherer.gather({});
    EXPECT_EQ(outcome.summary, (GatherSummary{0, 0}));
    EXPECT_EQ(executor_.calls.load(), 0u);
}

TEST_F(GathererTest, DuplicateHostsGatheredOnce) {
    Roster roster = make_roster(2);
    roster.push_back({.hostname = "m1", .room = "elsewhere", .owner = {}});

    Gatherer gatherer(executor_, logger_, options());
    auto outcome = gatherer.gather(roster);
    EXPECT_EQ(outcome.summary, (GatherSummary{2, 2}));
    EXPECT_EQ(executor_.calls.load(), 2u);
    ASSERT_EQ(outcome.snapshot.entries.size(), 2u);
    EXPECT_EQ(outcome.snapshot.entries[0].identity.room, "lab");
}

TEST_F(GathererTest, ConcurrencyIsBounded) {
    executor_.delay = std::chrono::milliseconds(20);
    Gatherer gatherer(executor_, logger_, options(3));

    auto outcome = gatherer.gather(make_roster(12));
    EXPECT_EQ(outcome.summary.successes, 12u);
    EXPECT_LE(executor_.peak.load(), 3u);
    EXPECT_GE(executor_.peak.load(), 1u);
}

TEST_F(GathererTest, TimestampNeverGoesBackwards) {
    std::vector<UnixSeconds> ticks{2000, 1500, 2500};
    size_t next = 0;
    Gatherer gatherer(executor_, logger_, options(), [&] { return ticks[next++]; });

    auto roster = make_roster(1);
    EXPECT_EQ(gatherer.gather(roster).snapshot.timestamp, 2000u);
    EXPECT_EQ(gatherer.gather(roster).snapshot.timestamp, 2000u);
    EXPECT_EQ(gatherer.gather(roster).snapshot.timestamp, 2500u);
}

TEST(SamplerCommandTest, QuotesPolicyPath) {
    EXPECT_EQ(sampler_command("/opt/fleet/fleet_sampler"), "/opt/fleet/fleet_sampler");
    EXPECT_EQ(sampler_command("fleet_sampler", "/etc/fleet usage/it's.policy"),
              "fleet_sampler '/etc/fleet usage/it'\\''s.policy'");
}

// ─────────────────────────────────────────────
// persist()
// ─────────────────────────────────────────────

class PersistTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
             / ("fleet_usage_test_persist_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(PersistTest, WritesDecodableSnapshotAndReplaces) {
    auto path = dir_ / "cluster.json";
    ClusterSnapshot first{.timestamp = 1, .entries = {}};
    ClusterSnapshot second{
        .timestamp = 2,
        .entries = {{.identity = {.hostname = "m1", .room = "lab", .owner = {}},
                     .snapshot = snapshot_for("m1")}},
    };

    ASSERT_TRUE(persist(first, path).has_value());
    ASSERT_TRUE(persist(second, path).has_value());

    auto text = read_text_file(path);
    ASSERT_TRUE(text.has_value());
    auto decoded = decode_cluster_snapshot(*text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, second);

    auto tmp = path;
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(PersistTest, MissingDirectoryIsPersistenceError) {
    auto result = persist(ClusterSnapshot{}, dir_ / "no" / "such" / "dir" / "cluster.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Persistence);
}
