#include "config.hpp"
#include "moderator_service.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <condition_variable>
#include <mutex>

// For graceful shutdown
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;
bool shutdown_requested = false;

void signal_handler(int signum) {
    spdlog::warn("Signal {} received, initiating graceful shutdown.", signum);
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex);
        if (shutdown_requested) return;
        shutdown_requested = true;
    }
    shutdown_cv.notify_one();
}

int main() {
    // Setup logging
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("moderator", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::info);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        // 1. Load configuration
        Config config = Config::from_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        config.validate();
        spdlog::info("Starting {}...", config.service_name);

        // 2. Create and run the service
        ModeratorService service(config);
        service.run();

        // 3. Wait for shutdown signal
        {
            std::unique_lock<std::mutex> lock(shutdown_mutex);
            shutdown_cv.wait(lock, [] { return shutdown_requested; });
        }

        service.stop();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred during initialization or runtime: {}", e.what());
        return 1;
    }

    spdlog::info("Moderator has shut down gracefully.");
    return 0;
}
