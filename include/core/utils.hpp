#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace dlpscan::utils {

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Random RFC 4122 version 4 UUID, lowercase hex
 */
inline std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
        lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

// ============================================================================
// Time
// ============================================================================

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief ISO 8601 UTC with milliseconds, e.g. 2024-05-01T09:30:00.250Z
 */
inline std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch());
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
    ::gmtime_r(&seconds, &utc);

    char date_time[24];
    std::strftime(date_time, sizeof(date_time), "%Y-%m-%dT%H:%M:%S", &utc);
    return std::format("{}.{:03}Z", date_time, since_epoch.count() % 1000);
}

// ============================================================================
// Strings
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

inline std::string to_lower(std::string_view str) {
    std::string lowered;
    lowered.reserve(str.size());
    for (const unsigned char c : str) {
        lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    return lowered;
}

inline std::string_view trim(std::string_view str) {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto first = str.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    const auto last = str.find_last_not_of(kSpace);
    return str.substr(first, last - first + 1);
}

/**
 * @brief Escape text for a JSON string literal (quotes, backslash, control bytes)
 */
[[nodiscard]] inline std::string escape_json(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (const char c : s) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20) {
            out += std::format("\\u{:04x}", static_cast<unsigned>(byte));
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// ============================================================================
// Timing
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging: one line per message on stderr, filtered by a process-wide level
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {

inline std::atomic<Level> g_threshold{Level::INFO};
inline std::mutex g_stderr_mutex;

inline const char* tag(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO ";
        case Level::WARN:  return "WARN ";
        case Level::ERROR: return "ERROR";
    }
    return "?????";
}

inline void emit(Level level, std::string_view msg) {
    if (level < g_threshold.load(std::memory_order_relaxed)) return;

    std::string line = std::format("{} [{}] {}\n", format_timestamp(now()), tag(level), msg);
    std::lock_guard<std::mutex> lock(g_stderr_mutex);
    std::cerr << line;
}

} // namespace detail

inline void set_level(Level level) {
    detail::g_threshold.store(level, std::memory_order_relaxed);
}

inline std::optional<Level> level_from_string(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(std::string_view msg) { detail::emit(Level::DEBUG, msg); }
inline void info(std::string_view msg) { detail::emit(Level::INFO, msg); }
inline void warn(std::string_view msg) { detail::emit(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::emit(Level::ERROR, msg); }

} // namespace log

} // namespace dlpscan::utils
