
#include "types.hpp"
#include "util.hpp"
#include <stdexcept>

nlohmann::json PublishResult::to_json() const {
    return {
        {"delivered", delivered},
        {"detail", detail},
        {"message_id", message_id}
    };
}

void RequestContext::set(const std::string& key, const std::string& value) {
    if (key == "user_id") {
        user_id = value;
    } else if (key == "text_content") {
        text_content = value;
    } else if (key == "image_content") {
        image_content = value;
    } else {
        throw std::invalid_argument("Unknown request context key: " + key);
    }
}

std::optional<std::string> RequestContext::get(const std::string& key) const {
    if (key == "user_id") {
        if (user_id.empty()) return std::nullopt;
        return user_id;
    }
    if (key == "text_content") return text_content;
    if (key == "image_content") return image_content;
    throw std::invalid_argument("Unknown request context key: " + key);
}

std::string to_string(EscalationAction action) {
    switch (action) {
        case EscalationAction::Warning: return "warning";
        case EscalationAction::Ban: return "ban";
    }
    return "unknown";
}

std::string to_string(ReportStatus status) {
    switch (status) {
        case ReportStatus::Ok: return "ok";
        case ReportStatus::InvalidRequest: return "invalid_request";
        case ReportStatus::RecordFailed: return "record_failed";
        case ReportStatus::CountFailed: return "count_failed";
    }
    return "unknown";
}

nlohmann::json ViolationReport::to_json() const {
    nlohmann::json j = {
        {"status", to_string(status)},
        {"record_status", recorded ? "created" : "error"},
        {"detail", detail}
    };
    if (record_id) {
        j["record_id"] = *record_id;
    }
    if (action) {
        j["action"] = to_string(*action);
    }
    if (violation_count) {
        j["violation_count"] = *violation_count;
    }
    if (notification) {
        j["notification"] = notification->to_json();
    }
    return j;
}

namespace {

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

VerdictRequest VerdictRequest::from_json(const nlohmann::json& j) {
    VerdictRequest req;
    req.corr_id = j.value("corr_id", "");
    req.verdict = j.at("verdict").get<std::string>();
    req.description = j.value("description", "");
    req.violation_type = j.value("violation_type", "");
    req.context.user_id = j.at("user_id").get<std::string>();
    req.context.text_content = optional_string(j, "text_content");
    req.context.image_content = optional_string(j, "image_content");
    return req;
}

nlohmann::json VerdictReply::to_json() const {
    nlohmann::json j = {
        {"corr_id", corr_id},
        {"ok", ok},
        {"verdict", verdict},
        {"ts", util::format_timestamp(timestamp)}
    };
    if (report) {
        j["report"] = report->to_json();
    }
    return j;
}
