/**
 * @file ScratchpadService.cpp
 * @brief Implementation of ScratchpadService.
 */

#include "application/ScratchpadService.hpp"
#include <iostream>
#include <vector>
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/MarkdownCodec.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace scratchpad::application {

using domain::ErrorKind;
using domain::ItemOrigin;
using domain::ScratchpadDocument;
using domain::ScratchpadError;
using domain::ScratchpadItem;
using domain::Timestamp;
using infrastructure::ConfinedPath;
using infrastructure::MarkdownCodec;

namespace {

infrastructure::PathPolicy MakePolicy(const ScratchpadConfig& config) {
    infrastructure::PathPolicy policy;
    policy.workspaceRoot = config.root;
    policy.allowedDirectories = config.allowedDirs;
    policy.maxPathLength = config.maxPathLen;
    policy.maxFileSize = config.maxFileSize;
    policy.globalLocation = config.globalLocation;
    return policy;
}

std::string OriginToString(ItemOrigin origin) {
    switch (origin) {
        case ItemOrigin::Interruptions: return "moved from Interruptions";
        case ItemOrigin::ReviewLater: return "moved from To Review Later";
        case ItemOrigin::Direct: return "recorded directly";
        default: return "recorded";
    }
}

} // namespace

ScratchpadService::ScratchpadService(ScratchpadConfig config,
                                     std::unique_ptr<domain::ScratchpadRepository> repository,
                                     RateLimiter::TimeSource clock)
    : m_config(std::move(config)),
      m_resolver(MakePolicy(m_config)),
      m_rateLimiter(m_config.maxRequestsPerWindow, m_config.rateWindow, std::move(clock)),
      m_repository(std::move(repository)) {
    if (!m_repository) {
        m_repository = std::make_unique<infrastructure::FileRepository>(
            std::make_shared<infrastructure::PersistenceService>());
    }
    std::cerr << "[ScratchpadService] Initialized for workspace " << m_resolver.root().string() << std::endl;
}

OperationResult ScratchpadService::guarded(const char* operation, const std::function<OperationResult()>& body) {
    auto admission = m_rateLimiter.admit();
    if (!admission.allowed) {
        std::cerr << "[ScratchpadService] " << operation << " rate limited (retry in "
                  << admission.retryAfterSeconds << "s)" << std::endl;
        return OperationResult::Failure(ScratchpadError::RateLimited(admission.retryAfterSeconds));
    }

    try {
        return body();
    } catch (const ScratchpadError& e) {
        m_rateLimiter.refund();
        std::cerr << "[ScratchpadService] " << operation << " failed with "
                  << domain::ErrorKindToString(e.kind()) << ": " << e.what() << std::endl;
        return OperationResult::Failure(e);
    } catch (const std::exception& e) {
        m_rateLimiter.refund();
        std::cerr << "[ScratchpadService] " << operation << " failed unexpectedly: " << e.what() << std::endl;
        return OperationResult::Failure(ScratchpadError(ErrorKind::IOError, e.what()));
    }
}

std::optional<ConfinedPath> ScratchpadService::locate() {
    // The cache only picks the first candidate; it is re-confined on every call.
    std::optional<ScratchpadError> cachedFailure;
    if (m_activePath) {
        const std::string cached = m_activePath->display().string();
        try {
            ConfinedPath path = m_resolver.resolve(cached);
            if (m_repository->exists(path.path())) {
                m_activePath = path;
                return m_activePath;
            }
            m_activePath.reset();
        } catch (const ScratchpadError& e) {
            std::cerr << "[ScratchpadService] Cached location '" << cached << "' rejected: " << e.what() << std::endl;
            cachedFailure = e;
        }
    }

    std::vector<std::string> candidates = m_config.searchLocations;
    if (m_config.globalLocation) {
        candidates = {""};
    }

    for (const auto& candidate : candidates) {
        try {
            ConfinedPath path = m_resolver.resolve(candidate);
            if (m_repository->exists(path.path())) {
                m_activePath = path;
                return m_activePath;
            }
        } catch (const ScratchpadError& e) {
            std::cerr << "[ScratchpadService] Skipping search location '" << candidate << "': " << e.what() << std::endl;
        }
    }
    if (cachedFailure) {
        throw *cachedFailure;
    }
    return std::nullopt;
}

OperationResult ScratchpadService::create(const std::optional<std::string>& location, std::optional<bool> overwrite) {
    return guarded("create", [&]() {
        std::string requested = m_config.globalLocation ? std::string() : m_config.defaultLocation;
        if (location) {
            requested = m_sanitizer.validate("location", *location, FieldKind::Path, m_config.maxPathLen);
        }
        ConfinedPath path = m_resolver.resolve(requested);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_repository->exists(path.path()) && !overwrite.value_or(m_config.overwriteOnCreate)) {
            throw ScratchpadError(ErrorKind::AlreadyExists, "scratchpad already exists at " + path.path().string());
        }

        const std::string text = MarkdownCodec::Serialize(ScratchpadDocument::CreateEmpty(domain::Now()));
        m_resolver.checkWritable(path, text.size());
        m_repository->writeText(path.path(), text);
        m_activePath = path;

        std::cerr << "[ScratchpadService] Created scratchpad: " << path.path().string() << std::endl;
        OperationResult result = OperationResult::Success("Scratchpad created at: " + path.display().string());
        result.path = path.display().string();
        result.exists = true;
        return result;
    });
}

OperationResult ScratchpadService::find() {
    return guarded("find", [&]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto path = locate();
        if (!path) {
            OperationResult result = OperationResult::Success("No scratchpad found. Create one first.");
            result.path = m_config.globalLocation ? m_config.globalLocation->string() : m_config.defaultLocation;
            result.exists = false;
            return result;
        }
        OperationResult result = OperationResult::Success("Scratchpad found at: " + path->display().string());
        result.path = path->display().string();
        result.exists = true;
        return result;
    });
}

OperationResult ScratchpadService::read() {
    return guarded("read", [&]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto path = locate();
        if (!path) {
            throw ScratchpadError(ErrorKind::NotFound, "no scratchpad in any search location");
        }
        m_resolver.checkReadable(*path);
        std::string content = m_repository->readText(path->path());
        if (!InputSanitizer::Utf8Length(content)) {
            throw ScratchpadError(ErrorKind::InvalidFormat, "file contains invalid UTF-8: " + path->path().string());
        }

        OperationResult result = OperationResult::Success("Scratchpad read");
        result.path = path->display().string();
        result.exists = true;
        result.content = std::move(content);
        return result;
    });
}

OperationResult ScratchpadService::applyToDocument(const Mutation& mutation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto path = locate();
    if (!path) {
        throw ScratchpadError(ErrorKind::NotFound, "no scratchpad in any search location");
    }
    m_resolver.checkReadable(*path);

    // Work on a parsed copy; the file is only replaced once everything succeeded.
    ScratchpadDocument doc = MarkdownCodec::Parse(m_repository->readText(path->path()));
    const Timestamp now = domain::Now();
    OperationResult result = mutation(doc, now);
    doc.touch(now);

    const std::string text = MarkdownCodec::Serialize(doc);
    m_resolver.checkWritable(*path, text.size());
    m_repository->writeText(path->path(), text);

    result.path = path->display().string();
    result.exists = true;
    return result;
}

OperationResult ScratchpadService::logInterruption(const std::string& note,
                                                   const std::optional<std::string>& type,
                                                   const std::optional<std::string>& priority) {
    return guarded("log_interruption", [&]() {
        const std::string text = m_sanitizer.validate("note", note, FieldKind::Note, m_config.maxNoteLen);
        const domain::ItemType itemType = m_sanitizer.validateType(type);
        const domain::Priority itemPriority = m_sanitizer.validatePriority(priority);

        return applyToDocument([&](ScratchpadDocument& doc, Timestamp now) {
            ScratchpadItem item;
            item.text = text;
            item.type = itemType;
            item.priority = itemPriority;
            item.createdAt = now;
            doc.logInterruption(item);

            std::cerr << "[ScratchpadService] Logged " << domain::ItemTypeToString(itemType)
                      << " (" << domain::PriorityToString(itemPriority) << ")" << std::endl;
            OperationResult result = OperationResult::Success("Logged to scratchpad at " + domain::FormatTimestamp(now));
            result.item = item;
            return result;
        });
    });
}

OperationResult ScratchpadService::updateFocus(const std::string& task) {
    return guarded("update_focus", [&]() {
        const std::string text = m_sanitizer.validate("task", task, FieldKind::Task, m_config.maxTaskLen);

        return applyToDocument([&](ScratchpadDocument& doc, Timestamp now) {
            doc.updateFocus(text, now);
            std::cerr << "[ScratchpadService] Focus updated" << std::endl;
            return OperationResult::Success("Current focus updated at " + domain::FormatTimestamp(now));
        });
    });
}

OperationResult ScratchpadService::addToReviewLater(const std::string& note) {
    return guarded("add_to_review_later", [&]() {
        const std::string text = m_sanitizer.validate("note", note, FieldKind::Note, m_config.maxNoteLen);

        return applyToDocument([&](ScratchpadDocument& doc, Timestamp now) {
            ScratchpadItem item;
            item.text = text;
            item.createdAt = now;
            doc.addToReviewLater(item);

            std::cerr << "[ScratchpadService] Added item to review later" << std::endl;
            OperationResult result = OperationResult::Success("Added to review later at " + domain::FormatTimestamp(now));
            result.item = item;
            return result;
        });
    });
}

OperationResult ScratchpadService::markCompleted(const std::string& note) {
    return transfer("mark_completed", note, false);
}

OperationResult ScratchpadService::archiveItem(const std::string& note) {
    return transfer("archive_item", note, true);
}

OperationResult ScratchpadService::transfer(const char* operation, const std::string& note, bool archive) {
    return guarded(operation, [&]() {
        const std::string text = m_sanitizer.validate("note", note, FieldKind::Note, m_config.maxNoteLen);

        return applyToDocument([&](ScratchpadDocument& doc, Timestamp now) {
            ItemOrigin origin = archive ? doc.archiveItem(text, now) : doc.markCompleted(text, now);
            const ScratchpadItem& moved = archive ? doc.getArchived().back() : doc.getCompleted().back();

            std::cerr << "[ScratchpadService] " << operation << ": " << OriginToString(origin) << std::endl;
            OperationResult result = OperationResult::Success(
                std::string(archive ? "Archived" : "Marked as completed") + " (" + OriginToString(origin) + ")");
            result.item = moved;
            result.origin = origin;
            return result;
        });
    });
}

} // namespace scratchpad::application
