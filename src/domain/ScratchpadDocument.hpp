/**
 * @file ScratchpadDocument.hpp
 * @brief Aggregate root for the sectioned scratchpad document.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/ScratchpadItem.hpp"

namespace scratchpad::domain {

/**
 * @struct CurrentFocus
 * @brief The single free-text task the user is working on.
 */
struct CurrentFocus {
    std::string task;                     ///< Empty when no task is active.
    std::optional<Timestamp> startedAt;   ///< When the focus was last replaced.

    bool operator==(const CurrentFocus& other) const {
        return task == other.task && startedAt == other.startedAt;
    }
};

/**
 * @struct Statistics
 * @brief Counters derived from the item sections. Never stored independently.
 */
struct Statistics {
    std::size_t totalLogged = 0;     ///< Items across all four item sections.
    std::size_t totalCompleted = 0;  ///< Size of Completed Today.
    std::size_t totalArchived = 0;   ///< Size of Archived / Dismissed.
};

/**
 * @enum ItemOrigin
 * @brief Where markCompleted/archiveItem found the item it moved.
 */
enum class ItemOrigin {
    Interruptions,
    ReviewLater,
    Direct ///< No match; a fresh record was authored in the destination.
};

/**
 * @class ScratchpadDocument
 * @brief Holds the fixed set of sections and enforces the single-location rule for items.
 *
 * Every item lives in exactly one of Interruptions, To Review Later, Completed Today
 * or Archived / Dismissed. Lists are kept in append order (oldest first).
 */
class ScratchpadDocument {
public:
    static constexpr int kFormatVersion = 1;

    ScratchpadDocument() = default;

    /** @brief New document with empty sections, stamped as last updated at @p now. */
    static ScratchpadDocument CreateEmpty(Timestamp now);

    // --- Accessors ---
    int getFormatVersion() const { return m_formatVersion; }
    const CurrentFocus& getFocus() const { return m_focus; }
    const std::vector<ScratchpadItem>& getInterruptions() const { return m_interruptions; }
    const std::vector<ScratchpadItem>& getReviewLater() const { return m_reviewLater; }
    const std::vector<ScratchpadItem>& getCompleted() const { return m_completed; }
    const std::vector<ScratchpadItem>& getArchived() const { return m_archived; }
    const std::optional<Timestamp>& getLastUpdated() const { return m_lastUpdated; }
    Statistics statistics() const;

    // --- Commands ---
    void logInterruption(ScratchpadItem item);

    /** @brief Replaces Current Focus wholesale. */
    void updateFocus(const std::string& task, Timestamp now);

    void addToReviewLater(ScratchpadItem item);

    /**
     * @brief Moves the first item whose text equals @p text (Interruptions first, then
     *        To Review Later) to Completed Today, stamping completedAt.
     * @return Origin of the moved item; Direct when no match existed and a new
     *         completed record was appended instead.
     */
    ItemOrigin markCompleted(const std::string& text, Timestamp now);

    /** @brief Same as markCompleted, targeting Archived / Dismissed and archivedAt. */
    ItemOrigin archiveItem(const std::string& text, Timestamp now);

    void touch(Timestamp now) { m_lastUpdated = now; }

    // --- Rehydration (used by the markdown codec) ---
    void setFormatVersion(int version) { m_formatVersion = version; }
    void setFocus(CurrentFocus focus) { m_focus = std::move(focus); }
    void setLastUpdated(std::optional<Timestamp> ts) { m_lastUpdated = ts; }
    void restoreInterruption(ScratchpadItem item) { m_interruptions.push_back(std::move(item)); }
    void restoreReviewLater(ScratchpadItem item) { m_reviewLater.push_back(std::move(item)); }
    void restoreCompleted(ScratchpadItem item) { m_completed.push_back(std::move(item)); }
    void restoreArchived(ScratchpadItem item) { m_archived.push_back(std::move(item)); }

    bool operator==(const ScratchpadDocument& other) const;
    bool operator!=(const ScratchpadDocument& other) const { return !(*this == other); }

private:
    enum class Destination { Completed, Archived };

    ItemOrigin transferItem(const std::string& text, Destination destination, Timestamp now);

    int m_formatVersion = kFormatVersion;
    CurrentFocus m_focus;
    std::vector<ScratchpadItem> m_interruptions;
    std::vector<ScratchpadItem> m_reviewLater;
    std::vector<ScratchpadItem> m_completed;
    std::vector<ScratchpadItem> m_archived;
    std::optional<Timestamp> m_lastUpdated;
};

} // namespace scratchpad::domain
