#include "util.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <random>
#include <mutex>
#include <iomanip>
#include <charconv>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string str = trim(value);
    int int_val = 0;
    auto result = std::from_chars(str.data(), str.data() + str.size(), int_val);
    if (result.ec != std::errc() || result.ptr != str.data() + str.size()) {
        throw std::runtime_error("Environment variable " + name + " is not an integer: " + str);
    }
    return int_val;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string current_iso8601() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

double unix_time_seconds(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::string generate_uuid() {
    // mt19937 is not thread-safe; publishers call this concurrently
    static std::mutex gen_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);

    std::lock_guard<std::mutex> lock(gen_mutex);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-" << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);

    return ss.str();
}

namespace {

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::optional<std::string> base64_decode(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size() / 4 * 3);

    unsigned int buffer = 0;
    int bits = 0;
    int padding = 0;

    for (char c : encoded) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        // Data after padding
        if (padding > 0) {
            return std::nullopt;
        }
        int value = base64_value(c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<unsigned int>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    // Leftover bits beyond one partial sextet mean a truncated quantum
    if (bits >= 6 || padding > 2) {
        return std::nullopt;
    }

    return out;
}

} // namespace util
