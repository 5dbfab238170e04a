#include "event_publisher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <thread>

EventPublisher::EventPublisher(BrokerConnection& connection,
                               FallbackLog& fallback_log,
                               BackoffPolicy backoff,
                               Sleeper sleeper)
    : connection_(connection),
      fallback_log_(fallback_log),
      backoff_(backoff),
      sleeper_(std::move(sleeper)) {
}

EventPublisher::Sleeper EventPublisher::default_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

PublishResult EventPublisher::publish(const std::string& routing_key, const nlohmann::json& payload) {
    OutboundEvent event;
    event.message_id = util::generate_uuid();
    event.routing_key = routing_key;
    event.payload = payload;

    if (routing_key.empty()) {
        spdlog::error("Refusing to publish event {}: empty routing key", event.message_id);
        return {false, "Routing key must not be empty", event.message_id};
    }
    if (!payload.is_object()) {
        spdlog::error("Refusing to publish event {}: payload is not a JSON object", event.message_id);
        return {false, "Payload must be a JSON object", event.message_id};
    }

    MessageProperties properties;
    properties.message_id = event.message_id;

    std::string body;
    std::string last_error;
    try {
        body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const std::exception& e) {
        spdlog::error("Failed to serialize event {}: {}", event.message_id, e.what());
        return {false, fmt::format("Payload serialization failed: {}", e.what()), event.message_id};
    }

    for (int attempt = 0; attempt < backoff_.max_attempts(); ++attempt) {
        auto delay = backoff_.delay_for_attempt(attempt);
        if (delay.count() > 0) {
            spdlog::info("Retrying event {} to '{}' in {} ms (attempt {}/{})",
                         event.message_id, routing_key, delay.count(), attempt, backoff_.max_retries());
            sleeper_(delay);
        }

        try {
            auto confirm = connection_.publish(routing_key, body, properties);
            switch (confirm.status) {
                case ConfirmStatus::Ack:
                    spdlog::info("Published event '{}' | MsgID: {}", routing_key, event.message_id);
                    return {true, "Success", event.message_id};
                case ConfirmStatus::Ambiguous:
                    // Re-sending could duplicate an event the broker already holds
                    spdlog::warn("No definitive confirm for event {} ({}); treating as delivered",
                                 event.message_id, confirm.detail);
                    return {true, "Success", event.message_id};
                case ConfirmStatus::Nack:
                    last_error = fmt::format("Message rejected by broker: {}", confirm.detail);
                    spdlog::warn("Broker rejected event {} to '{}': {}", event.message_id, routing_key, confirm.detail);
                    break;
            }
        } catch (const BrokerConnectionError& e) {
            last_error = e.what();
            spdlog::warn("Connection error publishing event {} (attempt {}): {}", event.message_id, attempt, e.what());
        } catch (const std::exception& e) {
            last_error = e.what();
            connection_.reset();
            spdlog::error("Unexpected error publishing event {} (attempt {}): {}", event.message_id, attempt, e.what());
        }
    }

    spdlog::error("Giving up on event {} to '{}' after {} attempts: {}",
                  event.message_id, routing_key, backoff_.max_attempts(), last_error);
    if (!fallback_log_.append(event)) {
        spdlog::critical("Event {} to '{}' was not delivered and could not be saved", event.message_id, routing_key);
    }

    return {false, last_error, event.message_id};
}
