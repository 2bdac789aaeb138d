// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_constants.h"
#include "cli_args.h"
#include "config.h"
#include "event_scheduler_hv.h"
#include "logging_init.h"
#include "nmcli_runner.h"
#include "wifi_service.h"

#include "hv/EventLoop.h"
#include "spdlog/spdlog.h"

#include <csignal>
#include <memory>

using namespace tether;

namespace {

/// How often the loop checks for a pending SIGINT/SIGTERM
constexpr int SIGNAL_CHECK_INTERVAL_MS = 200;

volatile sig_atomic_t g_quit = 0;

void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

void init_logging(const CliArgs& args, Config& config) {
    logging::LogConfig log_config;

    // CLI -v flags take precedence over the config file
    if (args.verbosity > 0) {
        log_config.level = logging::verbosity_to_level(args.verbosity);
    } else {
        log_config.level = logging::parse_level(config.get<std::string>("/log_level", "warn"),
                                                spdlog::level::warn);
    }

    std::string log_dest = args.log_dest;
    if (log_dest.empty()) {
        log_dest = config.get<std::string>("/log_dest", "auto");
    }
    log_config.target = logging::parse_log_target(log_dest);

    log_config.file_path = args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = config.get<std::string>("/log_file", "");
    }

    logging::init(log_config);
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help ? 0 : 1;
    }

    std::string config_path =
        args.config_path.empty() ? AppConstants::Paths::DEFAULT_CONFIG : args.config_path;
    Config* config = Config::get_instance();
    config->init(config_path);

    init_logging(args, *config);
    spdlog::info("[Main] tether-wifid starting (config: {})", config_path);

    WifiSettings settings = config->wifi_settings();
    if (!args.interface.empty()) {
        settings.interface = args.interface;
    }

    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);

    // Declaration order is destruction order in reverse: the service goes
    // first, then the runner (joins its workers), then the loop
    auto loop = std::make_shared<hv::EventLoop>();
    HvEventScheduler scheduler(loop);
    std::unique_ptr<NmcliRunner> runner = NmcliRunner::create(scheduler, args.mock);
    WifiService service(scheduler, *runner, *config, settings);

    auto unsubscribe_state = service.on_state_change([](WiFiState state, WiFiState previous) {
        spdlog::info("[Main] WiFi state {} -> {}", wifi_state_name(previous),
                     wifi_state_name(state));
    });
    auto unsubscribe_connection = service.on_connection_change([](bool connected) {
        spdlog::info("[Main] Network {}", connected ? "connected" : "disconnected");
    });

    int exit_code = 0;
    service.initialize([&](const WiFiError& err) {
        if (!err.success()) {
            spdlog::critical("[Main] WiFi service failed to start: {}", err.technical_msg);
            exit_code = 1;
            loop->stop();
            return;
        }
        spdlog::info("[Main] WiFi service ready (mode {}, state {})",
                     wifi_mode_name(service.get_mode()), wifi_state_name(service.get_state()));
        if (args.clients >= 0) {
            service.set_websocket_client_count(args.clients);
        }
    });

    loop->setInterval(SIGNAL_CHECK_INTERVAL_MS, [&](hv::TimerID) {
        if (!g_quit) {
            return;
        }
        spdlog::info("[Main] Shutdown requested");
        unsubscribe_state();
        unsubscribe_connection();
        service.dispose();
        loop->stop();
    });

    loop->run();

    spdlog::info("[Main] tether-wifid exiting ({})", exit_code);
    return exit_code;
}
