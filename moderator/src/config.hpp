
#pragma once
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "moderator";
    std::string log_level = "info";

    // Broker (Redis streams acting as the durable topic exchange)
    std::string broker_host = "localhost";
    int broker_port = 5672;
    std::string broker_password;
    std::string broker_exchange = "social.events";
    int broker_timeout_ms = 5000;

    // Publishing policy
    std::string violation_routing_key = "violation.events";
    int publish_max_retries = 3;
    int publish_backoff_base_ms = 1000;
    std::string fallback_log_path = "failed_events.log";

    // Database
    std::string db_conn_string;

    // Escalation policy
    int ban_threshold = 3;

    // Verdict intake
    std::string verdict_stream = "moderation.verdicts";
    std::string outcome_stream = "moderation.outcomes";
    std::string consumer_name = "moderator-1"; // stable across restarts so pending verdicts are replayed
    int worker_threads = 4;
    int verdict_queue_capacity = 64;

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    static Config from_env();
    void validate() const;
};
