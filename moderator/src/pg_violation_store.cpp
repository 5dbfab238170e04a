#include "pg_violation_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <stdexcept>

PgViolationStore::PgViolationStore(const Config& config) : config_(config) {}

PgViolationStore::~PgViolationStore() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    disconnect_locked();
}

pqxx::connection& PgViolationStore::connection_locked() {
    if (!conn_ || !conn_->is_open()) {
        conn_ = std::make_unique<pqxx::connection>(config_.db_conn_string);
        spdlog::info("Connected to violations database");
    }
    return *conn_;
}

void PgViolationStore::disconnect_locked() {
    if (conn_ && conn_->is_open()) {
        conn_->close();
    }
    conn_.reset();
}

void PgViolationStore::initialize_schema() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    pqxx::work txn(connection_locked());

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS violations (
            id UUID PRIMARY KEY DEFAULT gen_random_uuid(),
            user_id TEXT NOT NULL,
            violation_type VARCHAR(100) NOT NULL,
            description TEXT,
            text_content TEXT,
            image_content BYTEA,
            created_at TIMESTAMPTZ NOT NULL DEFAULT clock_timestamp()
        )
    )");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_violations_user_id ON violations(user_id)");

    txn.commit();
    spdlog::info("Violations schema initialized");
}

std::optional<std::basic_string<std::byte>> PgViolationStore::image_bytes(const std::optional<std::string>& image_content) {
    if (!image_content) return std::nullopt;

    auto decoded = util::base64_decode(*image_content);
    if (!decoded) {
        throw std::invalid_argument("image_content is not valid base64");
    }
    return std::basic_string<std::byte>(pqxx::binary_cast(*decoded));
}

ViolationRecord PgViolationStore::insert(const ViolationRecord& record) {
    auto image = image_bytes(record.image_content);

    std::lock_guard<std::mutex> lock(conn_mutex_);
    try {
        pqxx::work txn(connection_locked());
        auto row = txn.exec_params1(
            "INSERT INTO violations (user_id, violation_type, description, text_content, image_content) "
            "VALUES ($1, $2, $3, $4, $5) "
            "RETURNING id::text, extract(epoch FROM created_at)::float8",
            record.user_id,
            record.violation_type,
            record.description,
            record.text_content,
            image
        );
        txn.commit();

        ViolationRecord stored = record;
        stored.id = row[0].as<std::string>();
        stored.created_at = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::duration<double>(row[1].as<double>())));
        return stored;
    } catch (const pqxx::broken_connection&) {
        disconnect_locked();
        throw;
    }
}

int64_t PgViolationStore::count_for_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    try {
        pqxx::read_transaction txn(connection_locked());
        auto row = txn.exec_params1("SELECT COUNT(*) FROM violations WHERE user_id = $1", user_id);
        return row[0].as<int64_t>();
    } catch (const pqxx::broken_connection&) {
        disconnect_locked();
        throw;
    }
}

bool PgViolationStore::check_health() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    try {
        pqxx::nontransaction n(connection_locked());
        n.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Violations database health check failed: {}", e.what());
        disconnect_locked();
        return false;
    }
}
