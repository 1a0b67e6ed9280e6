/**
 * @file ScratchpadError.hpp
 * @brief Error taxonomy shared by every scratchpad component.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace scratchpad::domain {

/**
 * @enum ErrorKind
 * @brief Classifies why an operation was refused.
 */
enum class ErrorKind {
    None,
    RateLimited,         ///< Admission denied by the rate limiter.
    ValidationError,     ///< A free-text field failed length or pattern checks.
    InvalidEnumValue,    ///< A type/priority value is not a member of its enum.
    PathViolation,       ///< Path escapes the workspace or the allow-list.
    ExtensionNotAllowed, ///< File extension outside {.md, .txt, .markdown}.
    PathTooLong,         ///< Resolved path longer than the configured limit.
    SizeExceeded,        ///< File (or the content about to be written) is over the size ceiling.
    NotFound,            ///< No scratchpad exists at the resolved location.
    AlreadyExists,       ///< Create refused because a scratchpad is already present.
    InvalidFormat,       ///< Existing file is not a parseable scratchpad.
    IOError              ///< Filesystem failure.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::ValidationError: return "ValidationError";
        case ErrorKind::InvalidEnumValue: return "InvalidEnumValue";
        case ErrorKind::PathViolation: return "PathViolation";
        case ErrorKind::ExtensionNotAllowed: return "ExtensionNotAllowed";
        case ErrorKind::PathTooLong: return "PathTooLong";
        case ErrorKind::SizeExceeded: return "SizeExceeded";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::InvalidFormat: return "InvalidFormat";
        case ErrorKind::IOError: return "IOError";
        default: return "Unknown";
    }
}

/**
 * @class ScratchpadError
 * @brief Exception carrying an ErrorKind plus internal diagnostic detail.
 *
 * what() holds the diagnostic text and may mention filesystem paths; it is only
 * ever written to the local diagnostic stream. publicMessage() is what callers see.
 */
class ScratchpadError : public std::runtime_error {
public:
    ScratchpadError(ErrorKind kind, const std::string& detail, std::string field = "")
        : std::runtime_error(detail), m_kind(kind), m_field(std::move(field)) {}

    static ScratchpadError RateLimited(double retryAfterSeconds) {
        ScratchpadError e(ErrorKind::RateLimited, "rate limit exceeded");
        e.m_retryAfterSeconds = retryAfterSeconds;
        return e;
    }

    static ScratchpadError Validation(const std::string& field, const std::string& reason) {
        ScratchpadError e(ErrorKind::ValidationError, field + ": " + reason, field);
        e.m_reason = reason;
        return e;
    }

    static ScratchpadError InvalidEnum(const std::string& field) {
        return ScratchpadError(ErrorKind::InvalidEnumValue, "invalid enum value for " + field, field);
    }

    ErrorKind kind() const { return m_kind; }
    const std::string& field() const { return m_field; }
    const std::string& reason() const { return m_reason; }
    std::optional<double> retryAfterSeconds() const { return m_retryAfterSeconds; }

    /** @brief Generic, caller-safe message. Never contains paths or raw input. */
    std::string publicMessage() const;

private:
    ErrorKind m_kind;
    std::string m_field;
    std::string m_reason;
    std::optional<double> m_retryAfterSeconds;
};

} // namespace scratchpad::domain
