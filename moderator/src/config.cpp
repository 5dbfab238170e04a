
#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = get_env_var("LOG_LEVEL", config.log_level);

    // Broker
    config.broker_host = get_env_var("BROKER_HOST", config.broker_host);
    config.broker_port = get_env_int("BROKER_PORT", config.broker_port);
    config.broker_password = get_env_var("BROKER_PASSWORD");
    config.broker_exchange = get_env_var("BROKER_EXCHANGE", config.broker_exchange);
    config.broker_timeout_ms = get_env_int("BROKER_TIMEOUT_MS", config.broker_timeout_ms);

    // Publishing
    config.violation_routing_key = get_env_var("VIOLATION_ROUTING_KEY", config.violation_routing_key);
    config.publish_max_retries = get_env_int("PUBLISH_MAX_RETRIES", config.publish_max_retries);
    config.publish_backoff_base_ms = get_env_int("PUBLISH_BACKOFF_BASE_MS", config.publish_backoff_base_ms);
    config.fallback_log_path = get_env_var("FALLBACK_LOG_PATH", config.fallback_log_path);

    // Database
    config.db_conn_string = get_env_var("DATABASE_URL");

    // Escalation
    config.ban_threshold = get_env_int("BAN_THRESHOLD", config.ban_threshold);

    // Intake
    config.verdict_stream = get_env_var("VERDICT_STREAM", config.verdict_stream);
    config.outcome_stream = get_env_var("OUTCOME_STREAM", config.outcome_stream);
    config.consumer_name = get_env_var("CONSUMER_NAME", config.consumer_name);
    config.worker_threads = get_env_int("WORKER_THREADS", config.worker_threads);
    config.verdict_queue_capacity = get_env_int("VERDICT_QUEUE_CAPACITY", config.verdict_queue_capacity);

    // Health
    config.health_host = get_env_var("HEALTH_HOST", config.health_host);
    config.health_port = get_env_int("HEALTH_PORT", config.health_port);

    return config;
}

void Config::validate() const {
    if (db_conn_string.empty()) {
        throw std::runtime_error("DATABASE_URL is required");
    }

    if (broker_host.empty() || broker_exchange.empty() || violation_routing_key.empty()) {
        throw std::runtime_error("Broker host, exchange and routing key must not be empty");
    }

    if (broker_port < 1 || broker_port > 65535 || health_port < 1 || health_port > 65535) {
        throw std::runtime_error("Ports must be between 1 and 65535");
    }

    if (broker_timeout_ms < 1) {
        throw std::runtime_error("Broker timeout must be positive");
    }

    if (publish_max_retries < 0) {
        throw std::runtime_error("Publish retry count must not be negative");
    }

    if (publish_backoff_base_ms < 1) {
        throw std::runtime_error("Publish backoff base must be positive");
    }

    if (ban_threshold < 1) {
        throw std::runtime_error("Ban threshold must be at least 1");
    }

    if (worker_threads < 1) {
        throw std::runtime_error("At least one worker thread is required");
    }

    if (verdict_queue_capacity < 1) {
        throw std::runtime_error("Verdict queue capacity must be at least 1");
    }

    if (consumer_name.empty()) {
        throw std::runtime_error("Consumer name must not be empty");
    }

    spdlog::info("Configuration validated successfully");
}
