
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);

// String utilities
std::string trim(const std::string& str);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
double unix_time_seconds(const std::chrono::system_clock::time_point& tp);

// Random version-4 UUID, lowercase hex
std::string generate_uuid();

// Strict RFC 4648 decoding; whitespace is skipped, anything else invalid yields nullopt
std::optional<std::string> base64_decode(const std::string& encoded);

} // namespace util
