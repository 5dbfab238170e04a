#include "escalation_engine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

EscalationEngine::EscalationEngine(ViolationStore& store, EventPublisher& publisher, EscalationPolicy policy)
    : store_(store), publisher_(publisher), policy_(std::move(policy)) {
}

std::string EscalationEngine::derive_violation_type(const RequestContext& context) {
    bool has_text = context.text_content && !context.text_content->empty();
    bool has_image = context.image_content && !context.image_content->empty();
    if (has_text && has_image) return "text_image";
    if (has_image) return "image";
    if (has_text) return "text";
    return "unspecified";
}

nlohmann::json EscalationEngine::build_notification(const std::string& user_id,
                                                    EscalationAction action,
                                                    int64_t violation_count,
                                                    const std::string& description) const {
    nlohmann::json payload = {
        {"user_id", user_id},
        {"violation_count", violation_count}
    };

    if (action == EscalationAction::Ban) {
        payload["event_type"] = "user_banned";
        payload["title_template"] = "Your account has been banned";
        payload["body_template"] = fmt::format(
            "Your account has been banned for reaching the maximum number of violations ({}). "
            "Latest violation: {}", violation_count, description);
    } else {
        payload["event_type"] = "user_warning";
        payload["title_template"] = "Community guidelines warning";
        payload["body_template"] = fmt::format(
            "You have committed a violation: {}. Please adhere to community guidelines. "
            "Violations: {} of {} before your account is banned.",
            description, violation_count, policy_.ban_threshold);
    }
    return payload;
}

ViolationReport EscalationEngine::report_violation(const RequestContext& context,
                                                   const std::string& description,
                                                   const std::string& violation_type) {
    ViolationReport report;

    if (context.user_id.empty() || description.empty()) {
        report.status = ReportStatus::InvalidRequest;
        report.detail = context.user_id.empty() ? "user_id is required" : "description is required";
        spdlog::warn("Rejected violation report: {}", report.detail);
        return report;
    }

    ViolationRecord record;
    record.user_id = context.user_id;
    record.violation_type = violation_type.empty() ? derive_violation_type(context) : violation_type;
    record.description = description;
    record.text_content = context.text_content;
    record.image_content = context.image_content;

    // A failed write leaves the count stale, so nothing is decided
    try {
        auto stored = store_.insert(record);
        report.recorded = true;
        report.record_id = stored.id;
    } catch (const std::exception& e) {
        report.status = ReportStatus::RecordFailed;
        report.detail = fmt::format("Failed to record violation: {}", e.what());
        spdlog::error("Failed to record violation for user {}: {}", context.user_id, e.what());
        return report;
    }

    // A failed count must not fall back to zero and turn a ban into a warning
    int64_t count = 0;
    try {
        count = store_.count_for_user(context.user_id);
    } catch (const std::exception& e) {
        report.status = ReportStatus::CountFailed;
        report.detail = fmt::format("Violation recorded but count query failed: {}", e.what());
        spdlog::error("Failed to count violations for user {}: {}", context.user_id, e.what());
        return report;
    }
    report.violation_count = count;

    auto action = policy_.decide(count);
    report.action = action;
    if (action == EscalationAction::Ban) {
        report.detail = fmt::format("User {} banned: reached maximum number of violations ({} of {})",
                                    context.user_id, count, policy_.ban_threshold);
    } else {
        report.detail = fmt::format("Warning issued to user {}: violation {} of {}",
                                    context.user_id, count, policy_.ban_threshold);
    }
    spdlog::info("Violation by user {} ({}): {} -> {}",
                 context.user_id, record.violation_type, count, to_string(action));

    auto notification = publisher_.publish(policy_.routing_key,
                                           build_notification(context.user_id, action, count, description));
    if (!notification.delivered) {
        spdlog::warn("Notification for user {} not delivered: {}", context.user_id, notification.detail);
    }
    report.notification = notification;

    return report;
}
