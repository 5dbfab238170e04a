#pragma once

#include "escalation_engine.hpp"
#include "verdict_channel.hpp"
#include "types.hpp"

// Turns one classifier verdict into an outcome reply. Violations go through
// the escalation engine; accepted content is answered directly.
//
// The verdict is acknowledged only after it has been handled. A verdict whose
// record could not be stored stays pending so the next start replays it.
class VerdictHandler {
public:
    VerdictHandler(EscalationEngine& engine, VerdictChannel& channel);

    VerdictReply handle(const VerdictRequest& request);

private:
    EscalationEngine& engine_;
    VerdictChannel& channel_;
};
