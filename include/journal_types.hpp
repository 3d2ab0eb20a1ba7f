/**
 * @file journal_types.hpp
 * @brief Core type definitions and constants for the journal client
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <cctype>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace sjournal
{

// Transport configuration
inline constexpr const char *DEFAULT_SOCKET_PATH   = "/run/systemd/journal/socket";
inline constexpr int SOCKET_SEND_BUFFER_SIZE       = 8 * 1024 * 1024; // Best effort, capped by net.core.wmem_max

// Delivery queue configuration
// Capacity counts records waiting in the queue plus the one being written.
inline constexpr size_t DEFAULT_QUEUE_CAPACITY = 100;

// Caller resolution
inline constexpr size_t MAX_CALLER_DEPTH = 32; // Frames collected per stack walk

// Record assembly
// Slack covers the MESSAGE field framing: name, two newlines and the 8 byte length.
inline constexpr size_t MESSAGE_FIELD_SLACK = 20;

// Well-known field names
inline constexpr std::string_view FIELD_PRIORITY  = "PRIORITY";
inline constexpr std::string_view FIELD_MESSAGE   = "MESSAGE";
inline constexpr std::string_view FIELD_CODE_FILE = "CODE_FILE";
inline constexpr std::string_view FIELD_CODE_LINE = "CODE_LINE";
inline constexpr std::string_view FIELD_CODE_FUNC = "CODE_FUNC";

/**
 * @brief syslog severities understood by the journal, most severe first
 *
 * The numeric value is what goes into the PRIORITY field.
 */
enum class priority : uint8_t
{
    emerg   = 0, ///< System is unusable
    alert   = 1, ///< Action must be taken immediately
    crit    = 2, ///< Critical conditions
    err     = 3, ///< Error conditions
    warning = 4, ///< Warning conditions
    notice  = 5, ///< Normal but significant condition
    info    = 6, ///< Informational
    debug   = 7, ///< Debug-level messages
};

inline constexpr size_t PRIORITY_COUNT = 8;

inline constexpr std::array<const char *, PRIORITY_COUNT> priority_names = {
    "emerg", "alert", "crit", "err", "warning", "notice", "info", "debug",
};

namespace detail
{

// std::tolower is undefined for negative char values
inline char to_lower_ascii(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

} // namespace detail

/**
 * @brief Convert string to priority
 * @param str Severity name (case insensitive) or a single decimal digit 0-7
 * @return Corresponding priority, or std::nullopt if not recognized
 *
 * Recognized names: "emerg", "alert", "crit", "critical", "err", "error",
 * "warning", "warn", "notice", "info", "debug"
 */
inline std::optional<priority> priority_from_string(const char *str)
{
    if (!str) return std::nullopt;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), detail::to_lower_ascii);

    if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '7') { return static_cast<priority>(lower[0] - '0'); }

    if (lower == "emerg" || lower == "emergency") return priority::emerg;
    if (lower == "alert") return priority::alert;
    if (lower == "crit" || lower == "critical") return priority::crit;
    if (lower == "err" || lower == "error") return priority::err;
    if (lower == "warning" || lower == "warn") return priority::warning;
    if (lower == "notice") return priority::notice;
    if (lower == "info") return priority::info;
    if (lower == "debug") return priority::debug;

    return std::nullopt;
}

/**
 * @brief Convert priority to its syslog name
 */
inline const char *string_from_priority(priority p)
{
    auto idx = static_cast<size_t>(p);
    return idx < PRIORITY_COUNT ? priority_names[idx] : "unknown";
}

/**
 * @brief Parse a boolean configuration value
 * @param str Value such as "1", "true", "yes", "on" (case insensitive)
 * @return The parsed value, or std::nullopt when @p str is null or unrecognized
 */
inline std::optional<bool> bool_from_string(const char *str)
{
    if (!str) return std::nullopt;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), detail::to_lower_ascii);

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;

    return std::nullopt;
}

} // namespace sjournal
