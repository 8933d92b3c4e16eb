#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace vaultstream::utils {

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a time point as ISO-8601 UTC with millisecond precision.
 * Example: 2026-10-19T08:15:02.117Z
 */
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time;
    }

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
}

namespace detail {

// Parse exactly `width` digits at `pos`, advancing it
inline bool read_digits(std::string_view s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    const auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + pos + width, out);
    if (ec != std::errc{} || ptr != s.data() + pos + width) return false;
    pos += width;
    return true;
}

inline bool expect(std::string_view s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace detail

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts YYYY-MM-DDTHH:MM:SS with an optional fraction of up to 9 digits
 * and an optional zone designator (Z or +HH:MM / -HH:MM). A timestamp
 * without zone is read as UTC.
 */
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point>
parse_timestamp(std::string_view s) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!detail::read_digits(s, pos, 4, year) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, month) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= s.size() || (s[pos] != 'T' && s[pos] != ' ')) return std::nullopt;
    ++pos;
    if (!detail::read_digits(s, pos, 2, hour) || !detail::expect(s, pos, ':') ||
        !detail::read_digits(s, pos, 2, minute) || !detail::expect(s, pos, ':') ||
        !detail::read_digits(s, pos, 2, second)) {
        return std::nullopt;
    }

    std::chrono::nanoseconds fraction{0};
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int64_t scale = 100'000'000;
        size_t digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 9) {
                fraction += std::chrono::nanoseconds((s[pos] - '0') * scale);
                scale /= 10;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
    }

    std::chrono::minutes offset{0};
    if (pos < s.size()) {
        if (s[pos] == 'Z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            const int sign = (s[pos] == '-') ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!detail::read_digits(s, pos, 2, oh)) return std::nullopt;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (!detail::read_digits(s, pos, 2, om)) return std::nullopt;
            offset = std::chrono::minutes(sign * (oh * 60 + om));
        } else {
            return std::nullopt;
        }
    }
    if (pos != s.size()) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{year},
        std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) return std::nullopt;

    const auto local = std::chrono::sys_days{ymd}
        + std::chrono::hours(hour) + std::chrono::minutes(minute)
        + std::chrono::seconds(second);
    const auto utc = local - offset;
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        utc + fraction);
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

inline bool ends_with(std::string_view str, std::string_view suffix) {
    return str.size() >= suffix.size() &&
           str.substr(str.size() - suffix.size()) == suffix;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& threshold() {
        static std::atomic<int> t{static_cast<int>(Level::INFO)};
        return t;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < threshold().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level get_level() {
    return static_cast<Level>(detail::threshold().load(std::memory_order_relaxed));
}

/// Map "debug" / "info" / "warn" / "error" to a level
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace vaultstream::utils
