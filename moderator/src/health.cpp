#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <thread>

class HealthChecker::Impl {
public:
    Impl(const Config& config, BrokerConnection& broker, ViolationStore& store)
        : config_(config), broker_(broker), store_(store), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) return;
        running_ = true;

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            health_status["service"] = config_.service_name;
            health_status["status"] = "healthy";
            health_status["timestamp"] = util::current_iso8601();

            // The broker reconnects on demand, so its state is informational
            health_status["components"]["broker"] = to_string(broker_.state());

            bool db_healthy = store_.check_health();
            health_status["components"]["database"] = db_healthy ? "healthy" : "unhealthy";

            if (!db_healthy) {
                health_status["status"] = "unhealthy";
                res.status = 503;
            } else {
                res.status = 200;
            }

            res.set_content(health_status.dump(2), "application/json");
        });

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server starting on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Health check server failed to listen on {}:{}", config_.health_host, config_.health_port);
            }
            listen_returned_ = true;
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            // stop() is a no-op until listen() is accepting
            while (!server_.is_running() && !listen_returned_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    const Config& config_;
    BrokerConnection& broker_;
    ViolationStore& store_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::atomic<bool> listen_returned_{false};
    std::thread server_thread_;
};

HealthChecker::HealthChecker(const Config& config, BrokerConnection& broker, ViolationStore& store)
    : pImpl_(std::make_unique<Impl>(config, broker, store)) {}

HealthChecker::~HealthChecker() = default;

void HealthChecker::start() {
    pImpl_->start();
}

void HealthChecker::stop() {
    pImpl_->stop();
}
