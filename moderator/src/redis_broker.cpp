#include "redis_broker.hpp"
#include "topic_matcher.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <unordered_map>
#include <unordered_set>
#include <iterator>

namespace {

std::string meta_key(const std::string& exchange) { return exchange + ":meta"; }
std::string bindings_key(const std::string& exchange) { return exchange + ":bindings"; }

} // namespace

RedisBrokerChannel::RedisBrokerChannel(std::unique_ptr<sw::redis::Redis> redis)
    : redis_(std::move(redis)) {
}

void RedisBrokerChannel::declare_exchange(const std::string& exchange, const std::string& type, bool durable) {
    if (!is_open()) {
        throw BrokerConnectionError("Channel is closed");
    }

    try {
        redis_->hsetnx(meta_key(exchange), "type", type);
        redis_->hsetnx(meta_key(exchange), "durable", durable ? "1" : "0");

        auto declared_type = redis_->hget(meta_key(exchange), "type");
        if (declared_type && *declared_type != type) {
            open_ = false;
            throw BrokerConnectionError(fmt::format(
                "PRECONDITION_FAILED: exchange '{}' already declared as '{}'", exchange, *declared_type));
        }
    } catch (const sw::redis::Error& e) {
        open_ = false;
        throw BrokerConnectionError(fmt::format("Failed to declare exchange '{}': {}", exchange, e.what()));
    }

    spdlog::debug("Declared {} exchange '{}' (durable={})", type, exchange, durable);
}

void RedisBrokerChannel::enable_confirms() {
    if (!is_open()) {
        throw BrokerConnectionError("Channel is closed");
    }
    confirms_ = true;
}

bool RedisBrokerChannel::has_route(const std::string& exchange, const std::string& routing_key) {
    std::unordered_set<std::string> bindings;
    redis_->smembers(bindings_key(exchange), std::inserter(bindings, bindings.begin()));
    for (const auto& binding : bindings) {
        if (topic_matches(binding, routing_key)) {
            return true;
        }
    }
    return false;
}

ConfirmResult RedisBrokerChannel::publish(const std::string& exchange,
                                          const std::string& routing_key,
                                          const std::string& body,
                                          const MessageProperties& properties,
                                          bool mandatory) {
    if (!is_open()) {
        throw BrokerConnectionError("Channel is closed");
    }
    if (!confirms_) {
        throw BrokerConnectionError("Channel is not in confirm mode");
    }

    // Nothing has been sent yet, so any failure here is a plain connection error
    try {
        if (mandatory && !has_route(exchange, routing_key)) {
            return {ConfirmStatus::Nack, fmt::format("NO_ROUTE: no binding on '{}' matches '{}'", exchange, routing_key)};
        }
    } catch (const sw::redis::Error& e) {
        open_ = false;
        throw BrokerConnectionError(fmt::format("Route lookup failed: {}", e.what()));
    }

    std::unordered_map<std::string, std::string> fields = {
        {"routing_key", routing_key},
        {"message_id", properties.message_id},
        {"content_type", properties.content_type},
        {"delivery_mode", properties.persistent ? "2" : "1"},
        {"body", body}
    };

    try {
        auto entry_id = redis_->xadd(exchange, "*", fields.begin(), fields.end());
        return {ConfirmStatus::Ack, entry_id};
    } catch (const sw::redis::ReplyError& e) {
        return {ConfirmStatus::Nack, e.what()};
    } catch (const sw::redis::Error& e) {
        // The command may or may not have reached the server
        open_ = false;
        return {ConfirmStatus::Ambiguous, e.what()};
    }
}

bool RedisBrokerChannel::is_open() const {
    return open_ && redis_ != nullptr;
}

void RedisBrokerChannel::close() {
    open_ = false;
    redis_.reset();
}

RedisBrokerConnector::RedisBrokerConnector(const Config& config) : config_(config) {}

std::unique_ptr<BrokerChannel> RedisBrokerConnector::open() {
    sw::redis::ConnectionOptions connection_opts;
    connection_opts.host = config_.broker_host;
    connection_opts.port = config_.broker_port;
    connection_opts.connect_timeout = std::chrono::milliseconds(config_.broker_timeout_ms);
    connection_opts.socket_timeout = std::chrono::milliseconds(config_.broker_timeout_ms);

    if (!config_.broker_password.empty()) {
        connection_opts.password = config_.broker_password;
    }

    // A single connection: the channel is the one serialization point
    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = 1;

    try {
        auto redis = std::make_unique<sw::redis::Redis>(connection_opts, pool_opts);
        redis->ping();
        return std::make_unique<RedisBrokerChannel>(std::move(redis));
    } catch (const sw::redis::Error& e) {
        throw BrokerConnectionError(fmt::format("Could not connect to broker at {}: {}", endpoint(), e.what()));
    }
}

std::string RedisBrokerConnector::endpoint() const {
    return fmt::format("{}:{}", config_.broker_host, config_.broker_port);
}
