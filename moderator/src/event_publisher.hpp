#pragma once

#include "backoff_policy.hpp"
#include "broker_connection.hpp"
#include "fallback_log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <string>

// Delivers events to the broker's topic exchange with publisher confirms.
// Each call gets one message id that is reused by every retry of that call.
// Events that exhaust the retry budget go to the fallback log.
class EventPublisher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    EventPublisher(BrokerConnection& connection,
                   FallbackLog& fallback_log,
                   BackoffPolicy backoff = BackoffPolicy(),
                   Sleeper sleeper = default_sleeper());

    // Never throws; every outcome is reported in the result
    PublishResult publish(const std::string& routing_key, const nlohmann::json& payload);

    const BackoffPolicy& backoff() const { return backoff_; }

    static Sleeper default_sleeper();

private:
    BrokerConnection& connection_;
    FallbackLog& fallback_log_;
    BackoffPolicy backoff_;
    Sleeper sleeper_;
};
