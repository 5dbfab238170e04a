#pragma once

#include "broker_channel.hpp"
#include <memory>
#include <mutex>
#include <string>

// Process-wide connection to the broker, owned by the composition root and
// shared by every publisher. All channel use happens under one mutex, which
// also covers reconnecting so two callers never connect at the same time.
class BrokerConnection {
public:
    enum class State {
        Disconnected,
        Connecting,
        Connected
    };

    BrokerConnection(std::unique_ptr<BrokerConnector> connector, std::string exchange);
    ~BrokerConnection();

    BrokerConnection(const BrokerConnection&) = delete;
    BrokerConnection& operator=(const BrokerConnection&) = delete;

    // Connects if needed, then publishes with the mandatory flag set.
    // Throws BrokerConnectionError on connection-level failure, after which
    // the connection is back in Disconnected.
    ConfirmResult publish(const std::string& routing_key,
                          const std::string& body,
                          const MessageProperties& properties);

    // Drops the current channel so the next publish reconnects
    void reset();
    void close();

    State state() const;
    const std::string& exchange() const { return exchange_; }
    std::string endpoint() const;

private:
    void connect_locked();
    void drop_locked();

    std::unique_ptr<BrokerConnector> connector_;
    std::string exchange_;
    std::unique_ptr<BrokerChannel> channel_;
    State state_ = State::Disconnected;
    mutable std::mutex mutex_;
};

std::string to_string(BrokerConnection::State state);
