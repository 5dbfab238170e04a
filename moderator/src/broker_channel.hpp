#pragma once

#include <memory>
#include <stdexcept>
#include <string>

// Connection-level broker failure: unreachable endpoint, failed handshake,
// socket error or a closed channel. Always answered by reconnecting.
class BrokerConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MessageProperties {
    std::string message_id;
    std::string content_type = "application/json";
    bool persistent = true;
};

enum class ConfirmStatus {
    Ack,       // broker accepted the message
    Nack,      // broker refused this specific message
    Ambiguous  // channel went away before a definitive answer
};

struct ConfirmResult {
    ConfirmStatus status = ConfirmStatus::Ack;
    std::string detail;
};

// One open channel to the broker. Not safe for concurrent use.
class BrokerChannel {
public:
    virtual ~BrokerChannel() = default;

    // Idempotent declaration of a durable exchange
    virtual void declare_exchange(const std::string& exchange, const std::string& type, bool durable) = 0;

    virtual void enable_confirms() = 0;

    // Throws BrokerConnectionError if the message could not be handed to the broker
    virtual ConfirmResult publish(const std::string& exchange,
                                  const std::string& routing_key,
                                  const std::string& body,
                                  const MessageProperties& properties,
                                  bool mandatory) = 0;

    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

class BrokerConnector {
public:
    virtual ~BrokerConnector() = default;

    // Throws BrokerConnectionError when the broker cannot be reached
    virtual std::unique_ptr<BrokerChannel> open() = 0;

    virtual std::string endpoint() const = 0;
};
