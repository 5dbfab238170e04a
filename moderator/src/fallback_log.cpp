#include "fallback_log.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

FallbackLog::FallbackLog(std::string path) : path_(std::move(path)) {}

bool FallbackLog::append(const OutboundEvent& event) noexcept {
    try {
        nlohmann::json entry = {
            {"time", util::unix_time_seconds(std::chrono::system_clock::now())},
            {"key", event.routing_key},
            {"data", event.payload}
        };
        std::string line = entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        line.push_back('\n');

        std::lock_guard<std::mutex> lock(mutex_);

        // O_APPEND keeps lines whole across processes; a line that cannot be
        // finished is cut back off so the next append starts on a fresh line
        int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd < 0) {
            spdlog::error("Failed to open fallback log {}: {}", path_, std::strerror(errno));
            return false;
        }

        struct stat st {};
        if (::fstat(fd, &st) != 0) {
            spdlog::error("Failed to stat fallback log {}: {}", path_, std::strerror(errno));
            ::close(fd);
            return false;
        }
        off_t start = st.st_size;

        size_t offset = 0;
        int write_errno = 0;
        while (offset < line.size()) {
            ssize_t written = ::write(fd, line.data() + offset, line.size() - offset);
            if (written < 0) {
                if (errno == EINTR) continue;
                write_errno = errno;
                break;
            }
            if (written == 0) {
                write_errno = EIO;
                break;
            }
            offset += static_cast<size_t>(written);
        }

        if (offset < line.size()) {
            if (offset > 0 && ::ftruncate(fd, start) != 0) {
                spdlog::error("Failed to remove partial line from fallback log {}: {}",
                              path_, std::strerror(errno));
            }
            ::close(fd);
            spdlog::error("Failed to write fallback log {}: {}", path_, std::strerror(write_errno));
            return false;
        }
        ::close(fd);

        spdlog::warn("Event {} for '{}' saved to fallback log {}", event.message_id, event.routing_key, path_);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write fallback log {}: {}", path_, e.what());
        return false;
    }
}
