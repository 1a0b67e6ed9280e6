/**
 * @file ScratchpadDocument.cpp
 * @brief Implementation of the ScratchpadDocument aggregate.
 */
#include "domain/ScratchpadDocument.hpp"
#include <algorithm>

namespace scratchpad::domain {

namespace {

std::optional<ScratchpadItem> TakeFirst(std::vector<ScratchpadItem>& items, const std::string& text) {
    auto it = std::find_if(items.begin(), items.end(),
        [&](const ScratchpadItem& item) { return item.text == text; });
    if (it == items.end()) {
        return std::nullopt;
    }
    ScratchpadItem found = std::move(*it);
    items.erase(it);
    return found;
}

} // namespace

ScratchpadDocument ScratchpadDocument::CreateEmpty(Timestamp now) {
    ScratchpadDocument doc;
    doc.m_lastUpdated = now;
    return doc;
}

Statistics ScratchpadDocument::statistics() const {
    Statistics stats;
    stats.totalCompleted = m_completed.size();
    stats.totalArchived = m_archived.size();
    stats.totalLogged = m_interruptions.size() + m_reviewLater.size() + m_completed.size() + m_archived.size();
    return stats;
}

void ScratchpadDocument::logInterruption(ScratchpadItem item) {
    item.completedAt.reset();
    item.archivedAt.reset();
    m_interruptions.push_back(std::move(item));
}

void ScratchpadDocument::updateFocus(const std::string& task, Timestamp now) {
    m_focus.task = task;
    m_focus.startedAt = now;
}

void ScratchpadDocument::addToReviewLater(ScratchpadItem item) {
    item.completedAt.reset();
    item.archivedAt.reset();
    m_reviewLater.push_back(std::move(item));
}

ItemOrigin ScratchpadDocument::markCompleted(const std::string& text, Timestamp now) {
    return transferItem(text, Destination::Completed, now);
}

ItemOrigin ScratchpadDocument::archiveItem(const std::string& text, Timestamp now) {
    return transferItem(text, Destination::Archived, now);
}

ItemOrigin ScratchpadDocument::transferItem(const std::string& text, Destination destination, Timestamp now) {
    ItemOrigin origin = ItemOrigin::Interruptions;
    std::optional<ScratchpadItem> item = TakeFirst(m_interruptions, text);
    if (!item) {
        origin = ItemOrigin::ReviewLater;
        item = TakeFirst(m_reviewLater, text);
    }
    if (!item) {
        // Completing or dismissing something never logged is allowed.
        origin = ItemOrigin::Direct;
        ScratchpadItem fresh;
        fresh.text = text;
        fresh.createdAt = now;
        item = std::move(fresh);
    }

    if (destination == Destination::Completed) {
        item->completedAt = now;
        m_completed.push_back(std::move(*item));
    } else {
        item->archivedAt = now;
        m_archived.push_back(std::move(*item));
    }
    return origin;
}

bool ScratchpadDocument::operator==(const ScratchpadDocument& other) const {
    return m_formatVersion == other.m_formatVersion &&
           m_focus == other.m_focus &&
           m_interruptions == other.m_interruptions &&
           m_reviewLater == other.m_reviewLater &&
           m_completed == other.m_completed &&
           m_archived == other.m_archived &&
           m_lastUpdated == other.m_lastUpdated;
}

} // namespace scratchpad::domain
