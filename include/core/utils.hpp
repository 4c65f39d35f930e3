#pragma once

#include <atomic>
#include <cctype>
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
#include <type_traits>

namespace paydb::utils {

// ============================================================================
// Time Utilities
// ============================================================================

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Current UTC time truncated to microseconds (PostgreSQL precision)
 */
inline Timestamp now_utc() {
    return std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
}

/**
 * @brief Format a time point as a PostgreSQL timestamptz literal in UTC
 *
 * Output: "YYYY-MM-DD HH:MM:SS.ffffff+00"
 */
inline std::string format_timestamp(const Timestamp& tp) {
    using namespace std::chrono;
    const auto us = floor<microseconds>(tp);
    const auto day = floor<days>(us);
    const year_month_day ymd{day};
    const hh_mm_ss hms{us - day};

    return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:06d}+00",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        hms.hours().count(),
        hms.minutes().count(),
        static_cast<long long>(hms.seconds().count()),
        static_cast<long long>(hms.subseconds().count()));
}

namespace detail {

inline bool read_fixed(std::string_view sv, size_t& pos, size_t width, int& out) {
    if (pos + width > sv.size()) return false;
    const auto [ptr, ec] = std::from_chars(sv.data() + pos, sv.data() + pos + width, out);
    if (ec != std::errc{} || ptr != sv.data() + pos + width) return false;
    pos += width;
    return true;
}

inline bool expect(std::string_view sv, size_t& pos, char c) {
    if (pos >= sv.size() || sv[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace detail

/**
 * @brief Parse a PostgreSQL timestamp / timestamptz text value
 *
 * Accepts "YYYY-MM-DD[ T]HH:MM:SS[.f{1,6}][(+|-)HH[:MM]|Z]".
 * Values without an offset are taken as UTC.
 * @return std::nullopt when the text is not a timestamp
 */
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(std::string_view sv) {
    using namespace std::chrono;

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    size_t pos = 0;
    if (!detail::read_fixed(sv, pos, 4, y) || !detail::expect(sv, pos, '-') ||
        !detail::read_fixed(sv, pos, 2, mo) || !detail::expect(sv, pos, '-') ||
        !detail::read_fixed(sv, pos, 2, d)) {
        return std::nullopt;
    }
    if (pos >= sv.size() || (sv[pos] != ' ' && sv[pos] != 'T')) return std::nullopt;
    ++pos;
    if (!detail::read_fixed(sv, pos, 2, h) || !detail::expect(sv, pos, ':') ||
        !detail::read_fixed(sv, pos, 2, mi) || !detail::expect(sv, pos, ':') ||
        !detail::read_fixed(sv, pos, 2, s)) {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (pos < sv.size() && sv[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < sv.size() && sv[pos] >= '0' && sv[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (sv[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }

    minutes offset{0};
    if (pos < sv.size()) {
        if (sv[pos] == 'Z') {
            ++pos;
        } else if (sv[pos] == '+' || sv[pos] == '-') {
            const bool negative = sv[pos] == '-';
            ++pos;
            int oh = 0, om = 0;
            if (!detail::read_fixed(sv, pos, 2, oh)) return std::nullopt;
            if (pos < sv.size() && sv[pos] == ':') ++pos;
            if (pos < sv.size() && !detail::read_fixed(sv, pos, 2, om)) return std::nullopt;
            offset = hours{oh} + minutes{om};
            if (negative) offset = -offset;
        }
    }
    if (pos != sv.size()) return std::nullopt;

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) return std::nullopt;

    const auto local = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + microseconds{micros};
    return time_point_cast<Timestamp::duration>(local - offset);
}

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// Numeric Parsing (std::from_chars, locale independent)
// ============================================================================

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
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

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
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
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const auto lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info")  return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
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

} // namespace paydb::utils
