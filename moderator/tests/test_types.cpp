#include <gtest/gtest.h>
#include "types.hpp"
#include <stdexcept>

TEST(RequestContextTest, SetAndGet) {
    RequestContext ctx;
    EXPECT_FALSE(ctx.get("user_id").has_value());
    EXPECT_FALSE(ctx.get("text_content").has_value());

    ctx.set("user_id", "u-1");
    ctx.set("text_content", "first");
    ctx.set("text_content", "second");
    ctx.set("image_content", "aW1n");

    EXPECT_EQ(ctx.get("user_id").value_or(""), "u-1");
    EXPECT_EQ(ctx.get("text_content").value_or(""), "second");
    EXPECT_EQ(ctx.get("image_content").value_or(""), "aW1n");
}

TEST(RequestContextTest, UnknownKeysAreRejected) {
    RequestContext ctx;
    EXPECT_THROW(ctx.set("session_id", "s"), std::invalid_argument);
    EXPECT_THROW(ctx.get("session_id"), std::invalid_argument);
}

TEST(VerdictRequestTest, ParsesViolationVerdict) {
    auto j = nlohmann::json::parse(R"({
        "corr_id": "c-1",
        "user_id": "u-1",
        "verdict": "violation",
        "description": "Hate speech",
        "text_content": "text",
        "image_content": null
    })");

    auto req = VerdictRequest::from_json(j);

    EXPECT_EQ(req.corr_id, "c-1");
    EXPECT_TRUE(req.is_violation());
    EXPECT_EQ(req.description, "Hate speech");
    EXPECT_EQ(req.context.user_id, "u-1");
    EXPECT_EQ(req.context.text_content.value_or(""), "text");
    EXPECT_FALSE(req.context.image_content.has_value());
    EXPECT_TRUE(req.violation_type.empty());
}

TEST(VerdictRequestTest, MissingUserIsAnError) {
    auto j = nlohmann::json::parse(R"({"verdict": "accepted"})");
    EXPECT_THROW(VerdictRequest::from_json(j), nlohmann::json::exception);
}

TEST(ViolationReportTest, SerializesOutcome) {
    ViolationReport report;
    report.recorded = true;
    report.record_id = "rec-1";
    report.action = EscalationAction::Warning;
    report.violation_count = 1;
    report.detail = "Warning issued";
    report.notification = PublishResult{true, "Success", "m-1"};

    auto j = report.to_json();

    EXPECT_EQ(j["status"], "ok");
    EXPECT_EQ(j["record_status"], "created");
    EXPECT_EQ(j["action"], "warning");
    EXPECT_EQ(j["violation_count"], 1);
    EXPECT_EQ(j["notification"]["message_id"], "m-1");
}

TEST(ViolationReportTest, FailedRecordHasNoAction) {
    ViolationReport report;
    report.status = ReportStatus::RecordFailed;

    auto j = report.to_json();

    EXPECT_EQ(j["status"], "record_failed");
    EXPECT_EQ(j["record_status"], "error");
    EXPECT_FALSE(j.contains("action"));
    EXPECT_FALSE(j.contains("notification"));
}

TEST(VerdictReplyTest, IncludesReportWhenPresent) {
    VerdictReply reply;
    reply.corr_id = "c-9";
    reply.ok = true;
    reply.verdict = "accepted";
    reply.timestamp = std::chrono::system_clock::now();

    auto j = reply.to_json();
    EXPECT_EQ(j["corr_id"], "c-9");
    EXPECT_FALSE(j.contains("report"));

    reply.report = ViolationReport{};
    EXPECT_TRUE(reply.to_json().contains("report"));
}
