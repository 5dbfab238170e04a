#pragma once

#include "types.hpp"
#include <mutex>
#include <string>

// Append-only JSON-lines file for events the broker never accepted.
// One line per event: {"time": <unix seconds>, "key": <routing key>, "data": <payload>}
class FallbackLog {
public:
    explicit FallbackLog(std::string path);

    // Never throws. Returns false (and logs) if the line could not be written.
    bool append(const OutboundEvent& event) noexcept;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};
