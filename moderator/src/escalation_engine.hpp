#pragma once

#include "event_publisher.hpp"
#include "types.hpp"
#include "violation_store.hpp"
#include <cstdint>
#include <string>

struct EscalationPolicy {
    // Violation count at which a ban replaces a warning. Counts never decay.
    int64_t ban_threshold = 3;
    std::string routing_key = "violation.events";

    EscalationAction decide(int64_t violation_count) const {
        return violation_count >= ban_threshold ? EscalationAction::Ban : EscalationAction::Warning;
    }
};

// Turns one reported violation into one stored record and one user-facing
// action. Holds no state between calls; every call re-reads the count.
//
// Two concurrent reports for the same user may both read the count from
// before either insert, delaying a ban by one violation. A ban is never
// issued early.
class EscalationEngine {
public:
    EscalationEngine(ViolationStore& store, EventPublisher& publisher, EscalationPolicy policy);

    // Never throws. An empty violation_type is derived from the content present.
    ViolationReport report_violation(const RequestContext& context,
                                     const std::string& description,
                                     const std::string& violation_type = "");

    const EscalationPolicy& policy() const { return policy_; }

    static std::string derive_violation_type(const RequestContext& context);

private:
    nlohmann::json build_notification(const std::string& user_id,
                                      EscalationAction action,
                                      int64_t violation_count,
                                      const std::string& description) const;

    ViolationStore& store_;
    EventPublisher& publisher_;
    EscalationPolicy policy_;
};
