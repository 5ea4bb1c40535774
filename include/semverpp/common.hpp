#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, UTC timestamps
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace semverpp {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * Error codes
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */
namespace error_code {

inline constexpr std::string_view kNoChangesPending = "NoChangesPending";
inline constexpr std::string_view kMixedChanges = "MixedChanges";
inline constexpr std::string_view kInvalidVersion = "InvalidVersion";
inline constexpr std::string_view kInvalidChangeType = "InvalidChangeType";
inline constexpr std::string_view kInvalidPrerelease = "InvalidPrerelease";
inline constexpr std::string_view kTemplateError = "TemplateError";
inline constexpr std::string_view kTemplateNotFound = "TemplateNotFound";
inline constexpr std::string_view kIoError = "IOError";
inline constexpr std::string_view kFileExists = "FileExists";
inline constexpr std::string_view kParseError = "ParseError";
inline constexpr std::string_view kSchemaValidationFailed = "SchemaValidationFailed";

}  // namespace error_code

/**
 * @brief Broad classification of an Error, used by callers to pick a reaction
 */
enum class ErrorKind : std::uint8_t {
    kUserInput,           ///< Recoverable, caused by what the user asked for
    kFatalIo,             ///< Filesystem failure, propagated unchanged
    kIntegrityViolation,  ///< Stored data is malformed
};

/**
 * Classify an error by its code.
 * Unknown codes are treated as fatal I/O failures.
 */
[[nodiscard]] ErrorKind classify(const Error& error) noexcept;

}  // namespace semverpp

namespace semverpp::common {

// ============================================================================
// UTC Timestamps
// ============================================================================

using SysSeconds = std::chrono::sys_seconds;

/**
 * Format a time point for changeset filenames
 * @return "yyyyMMddHHmmssffffff" in UTC
 */
[[nodiscard]] std::string format_compact_timestamp(std::chrono::system_clock::time_point tp);

/**
 * Format a time point as ISO-8601 UTC with second precision
 * @return "YYYY-MM-DDTHH:MM:SSZ"
 */
[[nodiscard]] std::string format_iso8601(SysSeconds tp);

/**
 * Parse an ISO-8601 date-time
 * - Accepts 'T' or ' ' between date and time
 * - Fractional seconds are truncated
 * - Accepts 'Z', "+HH:MM", "-HH:MM" or no offset (treated as UTC)
 *
 * @param text Input string
 * @return Time point normalized to UTC, or ParseError
 */
[[nodiscard]] semverpp::Result<SysSeconds> parse_iso8601(std::string_view text);

}  // namespace semverpp::common
