#pragma once

#include "broker_channel.hpp"
#include "violation_store.hpp"
#include "verdict_channel.hpp"
#include "util.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Shared, scriptable state behind FakeBrokerConnector and its channels
struct FakeBroker {
    enum class Step { Ack, Nack, Ambiguous, ConnectionError, Unexpected };

    struct Published {
        std::string exchange;
        std::string routing_key;
        std::string body;
        MessageProperties properties;
        bool mandatory = false;
    };

    std::mutex mutex;
    int open_failures = 0;   // upcoming open() calls that are refused
    int opens = 0;
    int confirms_enabled = 0;
    std::vector<std::string> declarations;
    std::deque<Step> steps;  // Ack once exhausted
    std::vector<Published> published;

    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::chrono::milliseconds publish_latency{0};

    void script(std::initializer_list<Step> next) {
        std::lock_guard<std::mutex> lock(mutex);
        steps.insert(steps.end(), next.begin(), next.end());
    }

    std::vector<Published> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return published;
    }
};

class FakeBrokerChannel : public BrokerChannel {
public:
    explicit FakeBrokerChannel(std::shared_ptr<FakeBroker> broker) : broker_(std::move(broker)) {}

    void declare_exchange(const std::string& exchange, const std::string& type, bool durable) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->declarations.push_back(exchange + "|" + type + "|" + (durable ? "durable" : "transient"));
    }

    void enable_confirms() override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        ++broker_->confirms_enabled;
    }

    ConfirmResult publish(const std::string& exchange,
                          const std::string& routing_key,
                          const std::string& body,
                          const MessageProperties& properties,
                          bool mandatory) override {
        int now = ++broker_->in_flight;
        int seen = broker_->max_in_flight.load();
        while (now > seen && !broker_->max_in_flight.compare_exchange_weak(seen, now)) {}
        if (broker_->publish_latency.count() > 0) {
            std::this_thread::sleep_for(broker_->publish_latency);
        }

        FakeBroker::Step step = FakeBroker::Step::Ack;
        {
            std::lock_guard<std::mutex> lock(broker_->mutex);
            if (!broker_->steps.empty()) {
                step = broker_->steps.front();
                broker_->steps.pop_front();
            }
            broker_->published.push_back({exchange, routing_key, body, properties, mandatory});
        }
        --broker_->in_flight;

        switch (step) {
            case FakeBroker::Step::Ack:
                return {ConfirmStatus::Ack, "1-0"};
            case FakeBroker::Step::Nack:
                return {ConfirmStatus::Nack, "NO_ROUTE"};
            case FakeBroker::Step::Ambiguous:
                open_ = false;
                return {ConfirmStatus::Ambiguous, "channel closed before confirm"};
            case FakeBroker::Step::ConnectionError:
                open_ = false;
                throw BrokerConnectionError("socket reset by peer");
            case FakeBroker::Step::Unexpected:
                throw std::logic_error("malformed frame");
        }
        return {ConfirmStatus::Ack, ""};
    }

    bool is_open() const override { return open_; }
    void close() override { open_ = false; }

private:
    std::shared_ptr<FakeBroker> broker_;
    bool open_ = true;
};

class FakeBrokerConnector : public BrokerConnector {
public:
    explicit FakeBrokerConnector(std::shared_ptr<FakeBroker> broker) : broker_(std::move(broker)) {}

    std::unique_ptr<BrokerChannel> open() override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        ++broker_->opens;
        if (broker_->open_failures > 0) {
            --broker_->open_failures;
            throw BrokerConnectionError("connection refused");
        }
        return std::make_unique<FakeBrokerChannel>(broker_);
    }

    std::string endpoint() const override { return "fake:5672"; }

private:
    std::shared_ptr<FakeBroker> broker_;
};

class FakeViolationStore : public ViolationStore {
public:
    ViolationRecord insert(const ViolationRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_insert) {
            throw std::runtime_error("could not connect to server");
        }
        ViolationRecord stored = record;
        stored.id = "rec-" + std::to_string(records.size() + 1);
        stored.created_at = std::chrono::system_clock::now();
        records.push_back(stored);
        return stored;
    }

    int64_t count_for_user(const std::string& user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++count_queries;
        if (fail_count) {
            throw std::runtime_error("canceling statement due to statement timeout");
        }
        auto stored = std::count_if(records.begin(), records.end(),
                                    [&](const ViolationRecord& r) { return r.user_id == user_id; });
        auto prior = prior_counts.find(user_id);
        return stored + (prior == prior_counts.end() ? 0 : prior->second);
    }

    bool check_health() override { return !fail_insert; }

    // Pre-existing violations for a user, not stored as records
    void seed(const std::string& user_id, int64_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        prior_counts[user_id] = count;
    }

    std::vector<ViolationRecord> records;
    std::unordered_map<std::string, int64_t> prior_counts;
    int count_queries = 0;
    bool fail_insert = false;
    bool fail_count = false;

private:
    std::mutex mutex_;
};

// Records replies and acknowledgements in the order they happen
class FakeVerdictChannel : public VerdictChannel {
public:
    void start_consumer(VerdictCallback callback) override { callback_ = std::move(callback); }
    void stop() override { callback_ = nullptr; }

    bool publish_reply(const VerdictReply& reply) override {
        std::lock_guard<std::mutex> lock(mutex_);
        replies.push_back(reply);
        calls.push_back("reply:" + reply.corr_id);
        return !fail_replies;
    }

    bool acknowledge(const std::string& entry_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        acknowledged.push_back(entry_id);
        calls.push_back("ack:" + entry_id);
        return true;
    }

    std::vector<VerdictReply> replies;
    std::vector<std::string> acknowledged;
    std::vector<std::string> calls;
    bool fail_replies = false;

private:
    std::mutex mutex_;
    VerdictCallback callback_;
};

class RecordingSleeper {
public:
    void operator()(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_.push_back(delay);
    }

    std::vector<std::chrono::milliseconds> delays() {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    std::mutex mutex_;
    std::vector<std::chrono::milliseconds> delays_;
};

class TempPath {
public:
    TempPath()
        : path_(std::filesystem::temp_directory_path() / ("moderator_test_" + util::generate_uuid() + ".log")) {}
    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string str() const { return path_.string(); }
    bool exists() const { return std::filesystem::exists(path_); }

    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        std::ifstream in(path_);
        std::string line;
        while (std::getline(in, line)) {
            out.push_back(line);
        }
        return out;
    }

private:
    std::filesystem::path path_;
};
