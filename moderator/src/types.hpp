
#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

struct ViolationRecord {
    std::string id;             // assigned by the store
    std::string user_id;
    std::string violation_type;
    std::string description;
    std::optional<std::string> text_content;
    std::optional<std::string> image_content; // base64, as received
    std::chrono::system_clock::time_point created_at;
};

struct OutboundEvent {
    std::string message_id;
    std::string routing_key;
    nlohmann::json payload;
};

struct PublishResult {
    bool delivered = false;
    std::string detail;
    std::string message_id;

    nlohmann::json to_json() const;
};

// Request data for the content under moderation. Passed explicitly through
// the call chain instead of living in ambient per-request state.
struct RequestContext {
    std::string user_id;
    std::optional<std::string> text_content;
    std::optional<std::string> image_content;

    // Keys: "user_id", "text_content", "image_content". Throws std::invalid_argument otherwise.
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
};

enum class EscalationAction {
    Warning,
    Ban
};

enum class ReportStatus {
    Ok,
    InvalidRequest,
    RecordFailed,
    CountFailed
};

std::string to_string(EscalationAction action);
std::string to_string(ReportStatus status);

struct ViolationReport {
    ReportStatus status = ReportStatus::Ok;
    bool recorded = false;
    std::optional<std::string> record_id;
    std::optional<EscalationAction> action;
    std::optional<int64_t> violation_count;
    std::string detail;
    std::optional<PublishResult> notification;

    nlohmann::json to_json() const;
};

// Classifier verdict handed to the service on the verdict stream
struct VerdictRequest {
    std::string corr_id;
    std::string verdict; // "violation" or "accepted"
    std::string description;
    std::string violation_type;
    RequestContext context;
    std::string entry_id; // stream entry that delivered it, not part of the payload

    bool is_violation() const { return verdict == "violation"; }

    static VerdictRequest from_json(const nlohmann::json& j);
};

struct VerdictReply {
    std::string corr_id;
    bool ok = false;
    std::string verdict;
    std::optional<ViolationReport> report;
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json to_json() const;
};
