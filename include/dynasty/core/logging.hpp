#pragma once

/**
 * @file logging.hpp
 * @brief Process-wide diagnostic logging for the engine.
 *
 * One line per event is written to stderr:
 *
 *     [dynasty][WARN][ratchet] message
 *
 * The minimum level defaults to Warn and is seeded once from the
 * DYNASTY_LOG_LEVEL environment variable (debug, info, warn, error, off).
 *
 * SECURITY: private key material, chain keys and message keys must never
 * be passed to these macros. Public keys may be logged through Fingerprint().
 */

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <span>
#include <string>
#include <string_view>

namespace dynasty::e2ee::logging {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

[[nodiscard]] constexpr std::string_view LevelName(const Level level) noexcept {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] inline Level ParseLevel(std::string_view text, const Level fallback) noexcept {
    if (text == "debug" || text == "DEBUG") return Level::Debug;
    if (text == "info" || text == "INFO") return Level::Info;
    if (text == "warn" || text == "WARN") return Level::Warn;
    if (text == "error" || text == "ERROR") return Level::Error;
    if (text == "off" || text == "OFF") return Level::Off;
    return fallback;
}

namespace detail {

inline std::atomic<int>& LevelStorage() {
    static std::atomic<int> level{[] {
        const char* env = std::getenv("DYNASTY_LOG_LEVEL");
        const Level seeded = env != nullptr ? ParseLevel(env, Level::Warn) : Level::Warn;
        return static_cast<int>(seeded);
    }()};
    return level;
}

}

inline void SetLevel(const Level level) noexcept {
    detail::LevelStorage().store(static_cast<int>(level), std::memory_order_relaxed);
}

[[nodiscard]] inline Level GetLevel() noexcept {
    return static_cast<Level>(detail::LevelStorage().load(std::memory_order_relaxed));
}

[[nodiscard]] inline bool IsEnabled(const Level level) noexcept {
    return level != Level::Off &&
           static_cast<int>(level) >= detail::LevelStorage().load(std::memory_order_relaxed);
}

[[nodiscard]] inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

/// Short identifier for a public key: the first four bytes in hex.
[[nodiscard]] inline std::string Fingerprint(std::span<const uint8_t> public_key) {
    constexpr size_t kFingerprintBytes = 4;
    if (public_key.empty()) {
        return "<empty>";
    }
    return ToHex(public_key.first(std::min(public_key.size(), kFingerprintBytes)));
}

template<typename... Args>
void Write(const Level level, std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
    if (!IsEnabled(level)) {
        return;
    }
    const std::string body = fmt::format(format, std::forward<Args>(args)...);
    fmt::print(stderr, "[dynasty][{}][{}] {}\n", LevelName(level), tag, body);
}

}

#define DYNASTY_LOG_DEBUG(tag, ...) \
    ::dynasty::e2ee::logging::Write(::dynasty::e2ee::logging::Level::Debug, tag, __VA_ARGS__)
#define DYNASTY_LOG_INFO(tag, ...) \
    ::dynasty::e2ee::logging::Write(::dynasty::e2ee::logging::Level::Info, tag, __VA_ARGS__)
#define DYNASTY_LOG_WARN(tag, ...) \
    ::dynasty::e2ee::logging::Write(::dynasty::e2ee::logging::Level::Warn, tag, __VA_ARGS__)
#define DYNASTY_LOG_ERROR(tag, ...) \
    ::dynasty::e2ee::logging::Write(::dynasty::e2ee::logging::Level::Error, tag, __VA_ARGS__)
