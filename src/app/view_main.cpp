/**
 * @file view_main.cpp
 * @brief fleet_view: poll the persisted ClusterSnapshot and print it.
 *
 * Read failures never end the program: the last good snapshot stays on
 * screen with a failure marker until the file can be read again.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"
#include "view/host_info.hpp"
#include "view/snapshot_poller.hpp"
#include "view/text_renderer.hpp"
#include "view/view_model.hpp"

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace fleet_usage;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path;
    std::filesystem::path data_path;
    bool show_room = false;
    bool once = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--room" || arg == "-r") {
            args.show_room = true;
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: fleet_view [OPTIONS] [snapshot-path]\n"
                      << "  --config <path>   TOML configuration file\n"
                      << "  --room, -r        Show the room column\n"
                      << "  --once            Print a single frame and exit\n"
                      << "  --help, -h        Show this help message\n";
            std::exit(0);
        } else {
            args.data_path = arg;
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    auto config = default_config();
    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            std::cerr << "fleet_view: " << loaded.error().message << std::endl;
            return 1;
        }
        config = std::move(*loaded);
    }
    if (!args.data_path.empty()) config.viewer.data_path = args.data_path;
    if (args.show_room) config.viewer.show_room = true;

    auto sink = make_log_sink(config.telemetry, "fleet_view");
    if (!sink) {
        std::cerr << "fleet_view: " << sink.error().message << std::endl;
        return 1;
    }
    Logger logger(std::move(*sink),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Warn));

    auto host_info = HostInfo::current();
    bool logged = log_access(host_info, access_log_path());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SnapshotPoller poller(config.viewer.data_path);
    const bool interactive = ::isatty(STDOUT_FILENO) == 1 && !args.once;
    const auto interval = std::chrono::milliseconds{config.viewer.refresh_interval_ms};
    const auto stale_after = std::chrono::seconds{config.viewer.stale_after_s};

    while (!g_shutdown_requested) {
        if (auto refreshed = poller.refresh(); !refreshed) {
            logger.warn("snapshot refresh failed", {{"path", poller.path().string()},
                                                    {"error", refreshed.error().message}});
        }

        auto now = std::chrono::system_clock::now();
        if (interactive) std::cout << "\033[2J\033[H";
        if (poller.has_snapshot()) {
            RenderOptions options{
                .show_room = config.viewer.show_room,
                .viewer = host_info,
                .notes = RenderNotes{
                    .age = poller.age(now),
                    .refresh_ok = poller.last_refresh_ok(),
                    .logged = logged,
                    .stale = poller.is_stale(now, stale_after),
                },
            };
            std::cout << render_text(build_fleet_view(*poller.snapshot()), options);
        } else {
            std::cout << "No snapshot available yet from " << poller.path().string();
            if (poller.last_error()) std::cout << ": " << poller.last_error()->message;
            std::cout << '\n';
        }
        std::cout.flush();

        if (args.once) return poller.has_snapshot() ? 0 : 1;

        auto until = std::chrono::steady_clock::now() + interval;
        while (!g_shutdown_requested && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    return 0;
}
