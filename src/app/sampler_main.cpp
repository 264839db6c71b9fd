/**
 * @file sampler_main.cpp
 * @brief fleet_sampler: print this machine's Snapshot as JSON on stdout.
 *
 * Usage: fleet_sampler [--pretty] [policy-file]
 *
 * A missing or unreadable policy file means an empty policy. Diagnostics go
 * to stderr; stdout carries nothing but the Snapshot.
 */

#include "core/logger.hpp"
#include "model/filter_policy.hpp"
#include "model/snapshot_codec.hpp"
#include "probe/probe.hpp"
#include "sampler/local_sampler.hpp"
#include "telemetry/log_sinks.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace fleet_usage;

int main(int argc, char* argv[]) {
    Logger logger(std::make_unique<StderrSink>(), LogLevel::Warn);

    std::string policy_path;
    bool pretty = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pretty") {
            pretty = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: fleet_sampler [--pretty] [policy-file]\n"
                      << "  policy-file   ignore-user / ignore-proc / rename-proc rules\n"
                      << "  --pretty      Indent the JSON output\n";
            return 0;
        } else {
            policy_path = arg;
        }
    }

    FilterPolicy policy;
    if (!policy_path.empty()) {
        auto loaded = load_filter_policy_or_empty(policy_path);
        if (!loaded) {
            logger.error("invalid filter policy", {{"path", policy_path},
                                                   {"error", loaded.error().message}});
            return 1;
        }
        policy = std::move(*loaded);
    }

    LinuxProbe probe;
    auto snapshot = sample(probe, policy);
    if (!snapshot) {
        logger.error("sampling failed", {{"error", snapshot.error().message},
                                         {"cause", snapshot.error().root_cause()}});
        return 1;
    }

    std::cout << encode_snapshot(*snapshot, pretty) << '\n';
    std::cout.flush();
    return std::cout ? 0 : 1;
}
