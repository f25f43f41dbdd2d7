#include "config.hpp"
#include "params.hpp"
#include "replay.hpp"
#include "snapshot.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, stopping after current event", signal);
    shutdown_requested = true;
}

// Logs go to stderr; stdout carries one JSON result per event
void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void replay(ReplaySession& session) {
    std::string line;
    while (!shutdown_requested && std::getline(std::cin, line)) {
        line = util::trim(line);
        if (line.empty()) continue;
        std::cout << session.process_line(line).dump() << std::endl;
    }

    spdlog::info("Replay complete: {} events, {} rejected",
                 session.processed(), session.failed());
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);

        spdlog::info("==============================================");
        spdlog::info("Dynamic Fee Controller replay v1.0");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        FeeSettings settings = config.params_file.empty()
            ? FeeSettings::defaults()
            : FeeSettings::load_file(config.params_file);

        ManualClock clock;
        FeeControllerRegistry registry = load_registry(config, settings, clock);

        ReplaySession session(registry, clock);
        replay(session);

        if (!config.state_file.empty()) {
            StateSnapshot::save_file(registry, config.state_file);
        }

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
