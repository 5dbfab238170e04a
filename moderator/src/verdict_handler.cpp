#include "verdict_handler.hpp"
#include <spdlog/spdlog.h>

VerdictHandler::VerdictHandler(EscalationEngine& engine, VerdictChannel& channel)
    : engine_(engine), channel_(channel) {}

VerdictReply VerdictHandler::handle(const VerdictRequest& request) {
    VerdictReply reply;
    reply.corr_id = request.corr_id;
    reply.verdict = request.verdict;

    bool settled = true;
    if (request.is_violation()) {
        auto report = engine_.report_violation(request.context, request.description, request.violation_type);
        reply.ok = report.status == ReportStatus::Ok;
        settled = report.status != ReportStatus::RecordFailed;
        reply.report = std::move(report);
    } else {
        spdlog::debug("Content from user {} accepted ({})", request.context.user_id, request.corr_id);
        reply.ok = true;
    }
    reply.timestamp = std::chrono::system_clock::now();

    if (!channel_.publish_reply(reply)) {
        spdlog::error("Failed to publish outcome for correlation_id {}", reply.corr_id);
    }

    if (request.entry_id.empty()) {
        return reply;
    }
    if (!settled) {
        spdlog::warn("Verdict {} left pending: violation record was not stored", request.entry_id);
    } else if (!channel_.acknowledge(request.entry_id)) {
        spdlog::error("Failed to acknowledge verdict {}", request.entry_id);
    }
    return reply;
}
