#include "config.hpp"
#include "trader_service.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <memory>

// Global pointer to the service to allow signal handler to access it
std::unique_ptr<TraderService> service_ptr;

void signal_handler(int signum) {
    spdlog::info("Caught signal {}, shutting down...", signum);
    if (service_ptr) {
        service_ptr->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        // 1. Load configuration (optional JSON file, environment wins)
        Config config = argc > 1 ? Config::load(argv[1]) : Config::from_env();
        config.validate();

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        spdlog::flush_on(spdlog::level::info);
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {} in {} mode...", config.service_name, to_string(config.mode));
        spdlog::debug("Effective configuration: {}", config.to_json().dump());

        // 3. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Create and run the service
        service_ptr = std::make_unique<TraderService>(config);
        service_ptr->run();
        service_ptr.reset();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        service_ptr.reset();
        return 1;
    }

    spdlog::info("Trader has shut down gracefully.");
    return 0;
}
