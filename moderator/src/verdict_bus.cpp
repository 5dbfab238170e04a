#include "verdict_bus.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <vector>
#include <iterator>
#include <optional>

namespace {

using Attrs = std::vector<std::pair<std::string, std::string>>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;

} // namespace

VerdictBus::VerdictBus(const Config& config)
    : config_(config), consumer_group_(config.service_name + "_verdicts") {
    ensure_connection();
}

VerdictBus::~VerdictBus() {
    stop();
}

bool VerdictBus::ensure_connection() {
    std::shared_ptr<sw::redis::Redis> redis;
    {
        std::lock_guard<std::mutex> lock(redis_mutex_);
        redis = redis_;
    }
    try {
        if (redis) {
            redis->ping();
            return true;
        }
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Verdict bus lost its Redis connection: {}", e.what());
    }

    try {
        sw::redis::ConnectionOptions connection_opts;
        connection_opts.host = config_.broker_host;
        connection_opts.port = config_.broker_port;
        connection_opts.connect_timeout = std::chrono::milliseconds(config_.broker_timeout_ms);
        if (!config_.broker_password.empty()) {
            connection_opts.password = config_.broker_password;
        }

        sw::redis::ConnectionPoolOptions pool_opts;
        // Blocking consumer plus the workers' replies and acknowledgements
        pool_opts.size = static_cast<std::size_t>(config_.worker_threads) + 1;

        auto fresh = std::make_shared<sw::redis::Redis>(connection_opts, pool_opts);
        fresh->ping();

        std::lock_guard<std::mutex> lock(redis_mutex_);
        redis_ = fresh;
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to connect verdict bus to Redis: {}", e.what());
        std::lock_guard<std::mutex> lock(redis_mutex_);
        redis_.reset();
        return false;
    }
}

std::shared_ptr<sw::redis::Redis> VerdictBus::current() {
    std::lock_guard<std::mutex> lock(redis_mutex_);
    return redis_;
}

void VerdictBus::start_consumer(VerdictCallback verdict_callback) {
    if (running_) return;
    running_ = true;

    verdict_consumer_thread_ = std::thread([this, callback = std::move(verdict_callback)]() {
        verdict_consumer_loop(callback);
    });
}

void VerdictBus::stop() {
    if (!running_) return;
    running_ = false;
    if (verdict_consumer_thread_.joinable()) {
        verdict_consumer_thread_.join();
    }
}

bool VerdictBus::is_connected() {
    return ensure_connection();
}

void VerdictBus::verdict_consumer_loop(VerdictCallback callback) {
    bool group_ready = false;
    // Entries this consumer read but never acknowledged are replayed first
    std::string read_from = "0";

    while (running_) {
        try {
            if (!ensure_connection()) {
                std::this_thread::sleep_for(std::chrono::seconds(5));
                continue;
            }

            auto redis = current();
            if (!redis) continue;

            if (!group_ready) {
                try {
                    redis->xgroup_create(config_.verdict_stream, consumer_group_, "0", true);
                } catch (const sw::redis::ReplyError&) { /* Group likely exists */ }
                group_ready = true;
            }

            std::unordered_map<std::string, ItemStream> result;
            redis->xreadgroup(consumer_group_, config_.consumer_name, config_.verdict_stream, read_from,
                              std::chrono::milliseconds(1000), 16,
                              std::inserter(result, result.end()));

            size_t delivered = 0;
            bool accepting = true;
            for (const auto& stream : result) {
                if (!accepting) break;
                for (const auto& msg : stream.second) {
                    if (!accepting) break;
                    const auto& entry_id = msg.first;
                    ++delivered;
                    if (read_from != ">") read_from = entry_id;

                    std::optional<VerdictRequest> request;
                    if (msg.second) {
                        for (const auto& field : *msg.second) {
                            if (field.first != "data") continue;
                            try {
                                request = VerdictRequest::from_json(nlohmann::json::parse(field.second));
                                request->entry_id = entry_id;
                            } catch (const std::exception& e) {
                                spdlog::error("Discarding malformed verdict message {}: {}", entry_id, e.what());
                            }
                            break;
                        }
                    }

                    if (!request) {
                        // Nothing to process now or later
                        redis->xack(config_.verdict_stream, consumer_group_, entry_id);
                        continue;
                    }
                    // Acknowledged by the worker once handled
                    accepting = callback(*request);
                }
            }

            if (!accepting) {
                spdlog::info("Verdict intake closed; unhandled verdicts remain pending");
                break;
            }
            if (read_from != ">" && delivered == 0) {
                spdlog::info("Replayed pending verdicts for consumer {}", config_.consumer_name);
                read_from = ">";
            }
        } catch (const sw::redis::TimeoutError&) {
            // This is expected, just continue
        } catch (const std::exception& e) {
            if (running_) {
                spdlog::error("Verdict consumer error: {}", e.what());
                group_ready = false;
                std::this_thread::sleep_for(std::chrono::seconds(5));
            }
        }
    }
}

bool VerdictBus::acknowledge(const std::string& entry_id) {
    auto redis = current();
    if (!redis) return false;

    try {
        redis->xack(config_.verdict_stream, consumer_group_, entry_id);
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to acknowledge verdict {}: {}", entry_id, e.what());
        return false;
    }
}

bool VerdictBus::publish_reply(const VerdictReply& reply) {
    if (!ensure_connection()) return false;

    auto redis = current();
    if (!redis) return false;

    try {
        std::unordered_map<std::string, std::string> fields = {{"data", reply.to_json().dump()}};
        redis->xadd(config_.outcome_stream, "*", fields.begin(), fields.end());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish verdict reply {}: {}", reply.corr_id, e.what());
        return false;
    }
}
