/**
 * @file InputSanitizer.hpp
 * @brief Reject-based validation of free-text and enumerated request fields.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "domain/ScratchpadItem.hpp"

namespace scratchpad::application {

/**
 * @enum FieldKind
 * @brief Selects which rule set applies to a field.
 */
enum class FieldKind {
    Note, ///< Item text (default limit 500).
    Task, ///< Current focus text (default limit 200).
    Path  ///< Storage location; additionally rejects `~`.
};

/**
 * @class InputSanitizer
 * @brief Validates request fields before anything touches storage.
 *
 * Values are never rewritten: a value either passes unchanged or the call throws
 * domain::ScratchpadError (ValidationError, InvalidEnumValue, or for a Path field
 * PathViolation on blocked patterns and PathTooLong on length).
 */
class InputSanitizer {
public:
    /**
     * @brief Checks @p value for emptiness, length (in UTF-8 characters) and blocked patterns.
     * @param field Field name reported in errors.
     * @param value Raw value.
     * @param kind Rule set.
     * @param maxLength Maximum number of characters.
     * @return @p value, unmodified.
     */
    std::string validate(const std::string& field, const std::string& value, FieldKind kind, std::size_t maxLength) const;

    /** @brief Case-normalizes @p raw to an ItemType; absent selects Note. */
    domain::ItemType validateType(const std::optional<std::string>& raw) const;

    /** @brief Case-normalizes @p raw to a Priority; absent selects Medium. */
    domain::Priority validatePriority(const std::optional<std::string>& raw) const;

    /** @brief Number of code points in @p value, or nullopt if it is not valid UTF-8. */
    static std::optional<std::size_t> Utf8Length(const std::string& value);
};

} // namespace scratchpad::application
