/**
 * @file gather_main.cpp
 * @brief fleet_gather: collect Snapshots from every roster host over ssh and
 *        persist one ClusterSnapshot.
 *
 * Wiring:
 *   Config → Logger → Roster → SshExecutor → Gatherer → persist
 *
 * Per-host failures are logged and never change the exit status. A roster
 * that cannot be loaded or a snapshot that cannot be written exits with 1.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "model/roster.hpp"
#include "orchestrator/gatherer.hpp"
#include "remote/ssh_executor.hpp"
#include "telemetry/log_sinks.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace fleet_usage;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int kExitUsage = 2;

void print_usage() {
    std::cout << "Usage: fleet_gather [OPTIONS]\n"
              << "  --config <path>      TOML configuration file\n"
              << "  --roster <path>      Roster of machines to gather from\n"
              << "  --output <path>      Where to write the ClusterSnapshot\n"
              << "  --sampler <path>     fleet_sampler path on the remote hosts\n"
              << "  --policy <path>      Filter policy path on the remote hosts\n"
              << "  --jobs <n>           Maximum simultaneous ssh sessions\n"
              << "  --timeout-ms <ms>    Per-host deadline\n"
              << "  --repeat <seconds>   Gather again every <seconds> until interrupted\n"
              << "  --log-dir <path>     Write NDJSON logs here instead of stderr\n"
              << "  --log-level <level>  debug, info, warn or error\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<uint32_t> parse_count(const std::string& text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> roster;
    std::optional<std::string> output;
    std::optional<std::string> sampler;
    std::optional<std::string> policy;
    std::optional<uint32_t> jobs;
    std::optional<uint32_t> timeout_ms;
    std::optional<uint32_t> repeat_s;
    std::optional<std::string> log_dir;
    std::optional<std::string> log_level;
};

/// Returns nullopt after printing a message when the arguments are unusable.
std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        }
        if (i + 1 >= argc) {
            std::cerr << "fleet_gather: missing value for " << arg << "\n";
            return std::nullopt;
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            args.config_path = value;
        } else if (arg == "--roster") {
            args.roster = value;
        } else if (arg == "--output") {
            args.output = value;
        } else if (arg == "--sampler") {
            args.sampler = value;
        } else if (arg == "--policy") {
            args.policy = value;
        } else if (arg == "--log-dir") {
            args.log_dir = value;
        } else if (arg == "--log-level") {
            args.log_level = value;
        } else if (arg == "--jobs" || arg == "--timeout-ms" || arg == "--repeat") {
            auto number = parse_count(value);
            if (!number) {
                std::cerr << "fleet_gather: " << arg << " expects a number, got '" << value << "'\n";
                return std::nullopt;
            }
            if (arg == "--jobs") args.jobs = *number;
            else if (arg == "--timeout-ms") args.timeout_ms = *number;
            else args.repeat_s = *number;
        } else {
            std::cerr << "fleet_gather: unknown option " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

/// Sleep in short steps so SIGINT ends the wait promptly.
void interruptible_sleep(std::chrono::seconds duration) {
    auto until = std::chrono::steady_clock::now() + duration;
    while (!g_shutdown_requested && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return kExitUsage;
    }
    auto& args = *parsed;

    // ── Configuration ────────────────────────
    auto config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) {
            std::cerr << "fleet_gather: " << loaded.error().message << std::endl;
            return 1;
        }
        config = std::move(*loaded);
    }

    // Apply CLI overrides
    if (args.roster) config.gather.roster = *args.roster;
    if (args.output) config.gather.output = *args.output;
    if (args.sampler) config.gather.sampler = *args.sampler;
    if (args.policy) config.gather.sampler_policy = *args.policy;
    if (args.jobs) config.gather.max_concurrency = *args.jobs;
    if (args.timeout_ms) config.gather.host_timeout_ms = *args.timeout_ms;
    if (args.repeat_s) config.gather.repeat_interval_s = *args.repeat_s;
    if (args.log_dir) config.telemetry.log_dir = *args.log_dir;
    if (args.log_level) config.telemetry.log_level = *args.log_level;

    if (config.gather.roster.empty() || config.gather.output.empty()
        || config.gather.sampler.empty()) {
        std::cerr << "fleet_gather: --roster, --output and --sampler are required\n";
        print_usage();
        return kExitUsage;
    }
    if (config.gather.max_concurrency == 0) {
        std::cerr << "fleet_gather: --jobs must be at least 1\n";
        return kExitUsage;
    }
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "fleet_gather: unknown log level '" << config.telemetry.log_level << "'\n";
        return kExitUsage;
    }

    // ── Logger ───────────────────────────────
    auto sink = make_log_sink(config.telemetry, "fleet_gather");
    if (!sink) {
        std::cerr << "fleet_gather: " << sink.error().message << std::endl;
        return 1;
    }
    Logger logger(std::move(*sink), *level);

    // ── Roster ───────────────────────────────
    auto roster = load_roster(config.gather.roster);
    if (!roster) {
        logger.error("cannot load roster", {{"path", config.gather.roster.string()},
                                            {"error", roster.error().message}});
        std::cerr << "fleet_gather: " << roster.error().message << std::endl;
        return 1;
    }
    logger.info("roster loaded", {{"path", config.gather.roster.string()},
                                  {"machines", std::to_string(roster->size())}});

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SshExecutor executor(config.ssh);
    Gatherer gatherer(executor, logger, GatherOptions{
        .sampler_command = sampler_command(config.gather.sampler, config.gather.sampler_policy),
        .max_concurrency = config.gather.max_concurrency,
        .host_timeout = std::chrono::milliseconds{config.gather.host_timeout_ms},
    });

    // ── Gather loop ──────────────────────────
    do {
        auto start = std::chrono::steady_clock::now();
        auto outcome = gatherer.gather(*roster);

        auto persisted = persist(outcome.snapshot, config.gather.output);
        if (!persisted) {
            logger.error("cannot persist snapshot", {{"path", config.gather.output.string()},
                                                     {"error", persisted.error().message}});
            std::cerr << "fleet_gather: " << persisted.error().message << std::endl;
            return 1;
        }

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
        logger.info("snapshot written", {
            {"path", config.gather.output.string()},
            {"successes", std::to_string(outcome.summary.successes)},
            {"total", std::to_string(outcome.summary.total)},
            {"elapsed_s", std::to_string(elapsed.count())},
        });

        if (config.gather.repeat_interval_s == 0) break;
        interruptible_sleep(std::chrono::seconds{config.gather.repeat_interval_s});
    } while (!g_shutdown_requested);

    logger.flush();
    return 0;
}
