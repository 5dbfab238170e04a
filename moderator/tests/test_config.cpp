#include <gtest/gtest.h>
#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace {

const char* kManagedVars[] = {
    "SERVICE_NAME", "LOG_LEVEL", "BROKER_HOST", "BROKER_PORT", "BROKER_PASSWORD",
    "BROKER_EXCHANGE", "BROKER_TIMEOUT_MS", "VIOLATION_ROUTING_KEY", "PUBLISH_MAX_RETRIES",
    "PUBLISH_BACKOFF_BASE_MS", "FALLBACK_LOG_PATH", "DATABASE_URL", "BAN_THRESHOLD",
    "VERDICT_STREAM", "OUTCOME_STREAM", "CONSUMER_NAME", "WORKER_THREADS", "VERDICT_QUEUE_CAPACITY",
    "HEALTH_HOST", "HEALTH_PORT"
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kManagedVars) {
            unsetenv(name);
        }
    }
};

} // namespace

TEST_F(ConfigTest, DefaultsMatchTheDocumentedValues) {
    Config config = Config::from_env();

    EXPECT_EQ(config.broker_host, "localhost");
    EXPECT_EQ(config.broker_port, 5672);
    EXPECT_EQ(config.broker_exchange, "social.events");
    EXPECT_EQ(config.violation_routing_key, "violation.events");
    EXPECT_EQ(config.publish_max_retries, 3);
    EXPECT_EQ(config.publish_backoff_base_ms, 1000);
    EXPECT_EQ(config.ban_threshold, 3);
    EXPECT_EQ(config.fallback_log_path, "failed_events.log");
    EXPECT_TRUE(config.db_conn_string.empty());
    EXPECT_EQ(config.verdict_queue_capacity, 64);
    EXPECT_FALSE(config.consumer_name.empty());
}

TEST_F(ConfigTest, ReadsEnvironmentOverrides) {
    setenv("BROKER_HOST", "broker.internal", 1);
    setenv("BROKER_PORT", "6380", 1);
    setenv("BAN_THRESHOLD", "10", 1);
    setenv("DATABASE_URL", "postgresql://mod:secret@db/moderation", 1);

    Config config = Config::from_env();

    EXPECT_EQ(config.broker_host, "broker.internal");
    EXPECT_EQ(config.broker_port, 6380);
    EXPECT_EQ(config.ban_threshold, 10);
    EXPECT_EQ(config.db_conn_string, "postgresql://mod:secret@db/moderation");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, RejectsNonNumericValues) {
    setenv("BROKER_PORT", "amqp", 1);
    EXPECT_THROW(Config::from_env(), std::runtime_error);
}

TEST_F(ConfigTest, ValidationFailures) {
    Config config;
    EXPECT_THROW(config.validate(), std::runtime_error); // no DATABASE_URL

    config.db_conn_string = "postgresql://localhost/moderation";
    EXPECT_NO_THROW(config.validate());

    Config bad_threshold = config;
    bad_threshold.ban_threshold = 0;
    EXPECT_THROW(bad_threshold.validate(), std::runtime_error);

    Config bad_retries = config;
    bad_retries.publish_max_retries = -1;
    EXPECT_THROW(bad_retries.validate(), std::runtime_error);

    Config bad_port = config;
    bad_port.broker_port = 70000;
    EXPECT_THROW(bad_port.validate(), std::runtime_error);

    Config no_workers = config;
    no_workers.worker_threads = 0;
    EXPECT_THROW(no_workers.validate(), std::runtime_error);

    Config no_queue = config;
    no_queue.verdict_queue_capacity = 0;
    EXPECT_THROW(no_queue.validate(), std::runtime_error);
}
