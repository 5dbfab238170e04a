#include "broker_connection.hpp"
#include <spdlog/spdlog.h>

BrokerConnection::BrokerConnection(std::unique_ptr<BrokerConnector> connector, std::string exchange)
    : connector_(std::move(connector)), exchange_(std::move(exchange)) {
}

BrokerConnection::~BrokerConnection() {
    close();
}

void BrokerConnection::connect_locked() {
    state_ = State::Connecting;
    spdlog::info("Connecting to broker at {}...", connector_->endpoint());

    try {
        auto channel = connector_->open();
        // First use and recovery share this path
        channel->declare_exchange(exchange_, "topic", true);
        channel->enable_confirms();
        channel_ = std::move(channel);
        state_ = State::Connected;
        spdlog::info("Connected to broker at {} (exchange '{}', confirm mode)", connector_->endpoint(), exchange_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to broker: {}", e.what());
        drop_locked();
        throw BrokerConnectionError(e.what());
    }
}

void BrokerConnection::drop_locked() {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    state_ = State::Disconnected;
}

ConfirmResult BrokerConnection::publish(const std::string& routing_key,
                                        const std::string& body,
                                        const MessageProperties& properties) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!channel_ || !channel_->is_open()) {
        if (channel_) {
            spdlog::info("Broker connection closed. Reconnecting...");
        }
        connect_locked();
    }

    ConfirmResult result;
    try {
        result = channel_->publish(exchange_, routing_key, body, properties, true);
    } catch (const BrokerConnectionError&) {
        drop_locked();
        throw;
    }

    if (result.status == ConfirmStatus::Ambiguous || !channel_->is_open()) {
        drop_locked();
    }
    return result;
}

void BrokerConnection::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_locked();
}

void BrokerConnection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (channel_) {
        drop_locked();
        spdlog::info("Broker connection closed.");
    }
}

BrokerConnection::State BrokerConnection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string BrokerConnection::endpoint() const {
    return connector_->endpoint();
}

std::string to_string(BrokerConnection::State state) {
    switch (state) {
        case BrokerConnection::State::Disconnected: return "disconnected";
        case BrokerConnection::State::Connecting: return "connecting";
        case BrokerConnection::State::Connected: return "connected";
    }
    return "unknown";
}
