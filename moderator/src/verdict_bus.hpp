#pragma once

#include "config.hpp"
#include "types.hpp"
#include "verdict_channel.hpp"
#include <sw/redis++/redis++.h>
#include <thread>
#include <atomic>
#include <mutex>
#include <memory>

// Intake of classifier verdicts and replies with their outcomes, over the
// same Redis that hosts the event exchange.
class VerdictBus : public VerdictChannel {
public:
    explicit VerdictBus(const Config& config);
    ~VerdictBus() override;

    void start_consumer(VerdictCallback verdict_callback) override;
    void stop() override;

    bool publish_reply(const VerdictReply& reply) override;
    bool acknowledge(const std::string& entry_id) override;

    bool is_connected();

private:
    void verdict_consumer_loop(VerdictCallback callback);
    bool ensure_connection();
    std::shared_ptr<sw::redis::Redis> current();

    const Config& config_;
    const std::string consumer_group_;
    std::shared_ptr<sw::redis::Redis> redis_;
    std::mutex redis_mutex_;
    std::atomic<bool> running_{false};

    std::thread verdict_consumer_thread_;
};
