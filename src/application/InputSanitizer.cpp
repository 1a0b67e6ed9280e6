/**
 * @file InputSanitizer.cpp
 * @brief Implementation of InputSanitizer.
 */

#include "application/InputSanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "domain/ScratchpadError.hpp"

namespace scratchpad::application {

using domain::ErrorKind;
using domain::ScratchpadError;

namespace {

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Matched anywhere in the value, case-insensitively.
const std::vector<std::string>& BlockedPatterns() {
    static const std::vector<std::string> patterns = {
        "..",
        "`",
        "$",
        "<script",
        "javascript:",
        "file://",
        std::string(1, '\0'),
    };
    return patterns;
}

bool HasControlCharacters(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return (c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7f;
    });
}

} // namespace

std::optional<std::size_t> InputSanitizer::Utf8Length(const std::string& value) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < value.size();) {
        unsigned char c = static_cast<unsigned char>(value[i]);
        std::size_t extra = 0;
        if (c < 0x80) extra = 0;
        else if (c >= 0xC2 && c <= 0xDF) extra = 1;
        else if (c >= 0xE0 && c <= 0xEF) extra = 2;
        else if (c >= 0xF0 && c <= 0xF4) extra = 3;
        else return std::nullopt;

        if (i + extra >= value.size()) {
            return std::nullopt; // truncated sequence
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(value[i + k]) & 0xC0) != 0x80) return std::nullopt;
        }
        if (extra > 0) {
            unsigned char second = static_cast<unsigned char>(value[i + 1]);
            if (c == 0xE0 && second < 0xA0) return std::nullopt; // overlong
            if (c == 0xED && second > 0x9F) return std::nullopt; // UTF-16 surrogate
            if (c == 0xF0 && second < 0x90) return std::nullopt; // overlong
            if (c == 0xF4 && second > 0x8F) return std::nullopt; // above U+10FFFF
        }
        i += extra + 1;
        ++count;
    }
    return count;
}

std::string InputSanitizer::validate(const std::string& field, const std::string& value, FieldKind kind, std::size_t maxLength) const {
    if (Trim(value).empty()) {
        throw ScratchpadError::Validation(field, "is required");
    }

    auto length = Utf8Length(value);
    if (!length) {
        throw ScratchpadError::Validation(field, "is not valid UTF-8");
    }
    if (*length > maxLength) {
        if (kind == FieldKind::Path) {
            throw ScratchpadError(ErrorKind::PathTooLong,
                field + " is " + std::to_string(*length) + " characters, limit " + std::to_string(maxLength), field);
        }
        throw ScratchpadError::Validation(field, "exceeds maximum length of " + std::to_string(maxLength) + " characters");
    }

    const std::string lowered = Normalize(value);
    bool blocked = std::any_of(BlockedPatterns().begin(), BlockedPatterns().end(),
        [&](const std::string& pattern) { return lowered.find(pattern) != std::string::npos; });
    if (kind == FieldKind::Path && lowered.find('~') != std::string::npos) {
        blocked = true;
    }
    if (blocked) {
        if (kind == FieldKind::Path) {
            throw ScratchpadError(ErrorKind::PathViolation, "blocked pattern in path field " + field, field);
        }
        throw ScratchpadError::Validation(field, "contains a blocked pattern");
    }

    if (HasControlCharacters(value)) {
        throw ScratchpadError::Validation(field, "contains control characters");
    }
    return value;
}

domain::ItemType InputSanitizer::validateType(const std::optional<std::string>& raw) const {
    if (!raw) {
        return domain::ItemType::Note;
    }
    auto type = domain::ItemTypeFromString(Normalize(Trim(*raw)));
    if (!type) {
        throw ScratchpadError::InvalidEnum("type");
    }
    return *type;
}

domain::Priority InputSanitizer::validatePriority(const std::optional<std::string>& raw) const {
    if (!raw) {
        return domain::Priority::Medium;
    }
    auto priority = domain::PriorityFromString(Normalize(Trim(*raw)));
    if (!priority) {
        throw ScratchpadError::InvalidEnum("priority");
    }
    return *priority;
}

} // namespace scratchpad::application
