#pragma once

#include "broker_channel.hpp"
#include "config.hpp"
#include <sw/redis++/redis++.h>
#include <memory>

// Topic exchange on Redis streams. The exchange is a stream keyed by its name,
// bindings live in the set "<exchange>:bindings" and exchange metadata in the
// hash "<exchange>:meta".
class RedisBrokerChannel : public BrokerChannel {
public:
    explicit RedisBrokerChannel(std::unique_ptr<sw::redis::Redis> redis);

    void declare_exchange(const std::string& exchange, const std::string& type, bool durable) override;
    void enable_confirms() override;
    ConfirmResult publish(const std::string& exchange,
                          const std::string& routing_key,
                          const std::string& body,
                          const MessageProperties& properties,
                          bool mandatory) override;
    bool is_open() const override;
    void close() override;

private:
    bool has_route(const std::string& exchange, const std::string& routing_key);

    std::unique_ptr<sw::redis::Redis> redis_;
    bool open_ = true;
    bool confirms_ = false;
};

class RedisBrokerConnector : public BrokerConnector {
public:
    explicit RedisBrokerConnector(const Config& config);

    std::unique_ptr<BrokerChannel> open() override;
    std::string endpoint() const override;

private:
    const Config& config_;
};
