#pragma once

#include "config.hpp"
#include "violation_store.hpp"
#include <pqxx/pqxx>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <mutex>

class PgViolationStore : public ViolationStore {
public:
    explicit PgViolationStore(const Config& config);
    ~PgViolationStore() override;

    // Creates the violations table and its index if missing. Throws on failure.
    void initialize_schema();

    ViolationRecord insert(const ViolationRecord& record) override;
    int64_t count_for_user(const std::string& user_id) override;
    bool check_health() override;

    // Base64 image as stored in the BYTEA column. Throws std::invalid_argument on bad input.
    static std::optional<std::basic_string<std::byte>> image_bytes(const std::optional<std::string>& image_content);

private:
    pqxx::connection& connection_locked();
    void disconnect_locked();

    const Config& config_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex conn_mutex_;
};
