#pragma once

#include "types.hpp"
#include <functional>
#include <string>

// Transport for classifier verdicts and the replies that carry their outcomes.
// A delivered verdict stays pending until acknowledge() is called with its
// entry id, so anything accepted but not yet handled is redelivered after a
// restart.
class VerdictChannel {
public:
    // Returns false when the verdict was not taken; it is then left pending.
    using VerdictCallback = std::function<bool(const VerdictRequest&)>;

    virtual ~VerdictChannel() = default;

    virtual void start_consumer(VerdictCallback callback) = 0;
    virtual void stop() = 0;

    virtual bool publish_reply(const VerdictReply& reply) = 0;
    virtual bool acknowledge(const std::string& entry_id) = 0;
};
