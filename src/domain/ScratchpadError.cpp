/**
 * @file ScratchpadError.cpp
 * @brief Public message mapping for ScratchpadError.
 */
#include "domain/ScratchpadError.hpp"
#include <iomanip>
#include <sstream>

namespace scratchpad::domain {

std::string ScratchpadError::publicMessage() const {
    switch (m_kind) {
        case ErrorKind::RateLimited: {
            std::ostringstream out;
            out << "Rate limit exceeded. Please wait " << std::fixed << std::setprecision(1)
                << m_retryAfterSeconds.value_or(0.0) << " seconds.";
            return out.str();
        }
        case ErrorKind::ValidationError:
            return "Invalid value for '" + m_field + "': " + m_reason;
        case ErrorKind::InvalidEnumValue:
            return "Invalid value for '" + m_field + "'";
        case ErrorKind::PathViolation:
            return "Path validation failed";
        case ErrorKind::ExtensionNotAllowed:
            return "File extension must be one of: .md, .txt, .markdown";
        case ErrorKind::PathTooLong:
            return "Path exceeds maximum length";
        case ErrorKind::SizeExceeded:
            return "File size limit exceeded";
        case ErrorKind::NotFound:
            return "Scratchpad not found. Create one first.";
        case ErrorKind::AlreadyExists:
            return "Scratchpad already exists";
        case ErrorKind::InvalidFormat:
            return "Invalid scratchpad format";
        case ErrorKind::IOError:
            return "File system error";
        default:
            return "An error occurred";
    }
}

} // namespace scratchpad::domain
