#pragma once
#include "config.hpp"
#include "broker_connection.hpp"
#include "violation_store.hpp"
#include <memory>

class HealthChecker {
public:
    HealthChecker(const Config& config, BrokerConnection& broker, ViolationStore& store);
    ~HealthChecker();

    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
