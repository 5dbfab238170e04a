#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>

// Durable audit trail of violations. Implementations throw on failure.
class ViolationStore {
public:
    virtual ~ViolationStore() = default;

    // Persists the record and returns it with id and created_at assigned
    virtual ViolationRecord insert(const ViolationRecord& record) = 0;

    // All-time number of violations recorded for the user
    virtual int64_t count_for_user(const std::string& user_id) = 0;

    virtual bool check_health() = 0;
};
