#pragma once

#include "config.hpp"
#include "broker_connection.hpp"
#include "fallback_log.hpp"
#include "event_publisher.hpp"
#include "pg_violation_store.hpp"
#include "escalation_engine.hpp"
#include "verdict_bus.hpp"
#include "verdict_handler.hpp"
#include "verdict_queue.hpp"
#include "health.hpp"
#include "types.hpp"

#include <atomic>
#include <thread>
#include <vector>

class ModeratorService {
public:
    explicit ModeratorService(const Config& config);
    ~ModeratorService();

    void run();
    void stop();

private:
    void worker_loop();

    Config config_;

    // Service components, in dependency order
    BrokerConnection broker_;
    FallbackLog fallback_log_;
    EventPublisher publisher_;
    PgViolationStore store_;
    EscalationEngine engine_;
    VerdictBus verdict_bus_;
    VerdictHandler verdict_handler_;
    HealthChecker health_checker_;

    // Thread management
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;

    // Decouples the Redis consumer thread from processing
    VerdictQueue verdict_queue_;
};
