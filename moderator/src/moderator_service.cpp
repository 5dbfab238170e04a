#include "moderator_service.hpp"
#include "redis_broker.hpp"
#include <spdlog/spdlog.h>

ModeratorService::ModeratorService(const Config& config)
    : config_(config),
      broker_(std::make_unique<RedisBrokerConnector>(config_), config_.broker_exchange),
      fallback_log_(config_.fallback_log_path),
      publisher_(broker_, fallback_log_,
                 BackoffPolicy(config_.publish_max_retries,
                               std::chrono::milliseconds(config_.publish_backoff_base_ms))),
      store_(config_),
      engine_(store_, publisher_, EscalationPolicy{config_.ban_threshold, config_.violation_routing_key}),
      verdict_bus_(config_),
      verdict_handler_(engine_, verdict_bus_),
      health_checker_(config_, broker_, store_),
      verdict_queue_(static_cast<size_t>(config_.verdict_queue_capacity)) {
    store_.initialize_schema();
}

ModeratorService::~ModeratorService() {
    stop();
}

void ModeratorService::run() {
    if (running_) return;
    running_ = true;

    health_checker_.start();

    for (int i = 0; i < config_.worker_threads; ++i) {
        workers_.emplace_back(&ModeratorService::worker_loop, this);
    }

    // Blocks the consumer while every worker is busy and the queue is full
    verdict_bus_.start_consumer([this](const VerdictRequest& request) {
        return verdict_queue_.push(request);
    });

    spdlog::info("ModeratorService started with {} workers (ban threshold {}, exchange '{}').",
                 config_.worker_threads, config_.ban_threshold, config_.broker_exchange);
}

void ModeratorService::stop() {
    if (!running_) return;
    running_ = false;

    // Closing first releases a consumer blocked on a full queue
    verdict_queue_.close();
    verdict_bus_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    health_checker_.stop();
    broker_.close();
    spdlog::info("ModeratorService stopped.");
}

void ModeratorService::worker_loop() {
    VerdictRequest request;
    while (verdict_queue_.pop(request)) {
        verdict_handler_.handle(request);
    }
}
