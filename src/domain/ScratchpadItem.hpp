/**
 * @file ScratchpadItem.hpp
 * @brief Value objects for a single scratchpad entry: type, priority and the item itself.
 */

#pragma once
#include <cctype>
#include <optional>
#include <string>
#include "domain/Timestamp.hpp"

namespace scratchpad::domain {

/**
 * @enum ItemType
 * @brief Kind of note captured in the scratchpad.
 */
enum class ItemType {
    Idea,
    Bug,
    Feature,
    Question,
    Contact,
    Refactor,
    Task,
    Note
};

/**
 * @enum Priority
 * @brief Urgency attached to an item.
 */
enum class Priority {
    High,
    Medium,
    Low
};

inline std::string ItemTypeToString(ItemType type) {
    switch (type) {
        case ItemType::Idea: return "idea";
        case ItemType::Bug: return "bug";
        case ItemType::Feature: return "feature";
        case ItemType::Question: return "question";
        case ItemType::Contact: return "contact";
        case ItemType::Refactor: return "refactor";
        case ItemType::Task: return "task";
        case ItemType::Note: return "note";
        default: return "note";
    }
}

inline std::string ItemTypeEmoji(ItemType type) {
    switch (type) {
        case ItemType::Idea: return "💡";
        case ItemType::Bug: return "🐛";
        case ItemType::Feature: return "✨";
        case ItemType::Question: return "❓";
        case ItemType::Contact: return "📞";
        case ItemType::Refactor: return "🔧";
        case ItemType::Task: return "📝";
        case ItemType::Note: return "📌";
        default: return "📌";
    }
}

inline std::string PriorityToString(Priority priority) {
    switch (priority) {
        case Priority::High: return "high";
        case Priority::Medium: return "medium";
        case Priority::Low: return "low";
        default: return "medium";
    }
}

inline std::string PriorityEmoji(Priority priority) {
    switch (priority) {
        case Priority::High: return "🔴";
        case Priority::Medium: return "🟡";
        case Priority::Low: return "🟢";
        default: return "🟡";
    }
}

/** @brief "idea" -> "Idea". */
inline std::string Capitalize(std::string value) {
    if (!value.empty()) {
        value[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
    }
    return value;
}

/** @brief Exact lowercase lookup; callers normalize case first. */
inline std::optional<ItemType> ItemTypeFromString(const std::string& value) {
    for (ItemType t : {ItemType::Idea, ItemType::Bug, ItemType::Feature, ItemType::Question,
                       ItemType::Contact, ItemType::Refactor, ItemType::Task, ItemType::Note}) {
        if (ItemTypeToString(t) == value) return t;
    }
    return std::nullopt;
}

inline std::optional<Priority> PriorityFromString(const std::string& value) {
    for (Priority p : {Priority::High, Priority::Medium, Priority::Low}) {
        if (PriorityToString(p) == value) return p;
    }
    return std::nullopt;
}

/**
 * @struct ScratchpadItem
 * @brief One note entry. Identity within a section is its exact text.
 */
struct ScratchpadItem {
    std::string text;                       ///< Note content (at most 500 characters).
    ItemType type = ItemType::Note;         ///< Category.
    Priority priority = Priority::Medium;   ///< Urgency.
    Timestamp createdAt;                    ///< When the item was first logged.
    std::optional<Timestamp> completedAt;   ///< Set once moved to Completed Today.
    std::optional<Timestamp> archivedAt;    ///< Set once moved to Archived / Dismissed.

    bool operator==(const ScratchpadItem& other) const {
        return text == other.text &&
               type == other.type &&
               priority == other.priority &&
               createdAt == other.createdAt &&
               completedAt == other.completedAt &&
               archivedAt == other.archivedAt;
    }

    bool operator!=(const ScratchpadItem& other) const { return !(*this == other); }
};

} // namespace scratchpad::domain
