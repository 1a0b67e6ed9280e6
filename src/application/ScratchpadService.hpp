/**
 * @file ScratchpadService.hpp
 * @brief Application service orchestrating admission, validation, confinement and persistence.
 */

#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/InputSanitizer.hpp"
#include "application/OperationResult.hpp"
#include "application/RateLimiter.hpp"
#include "application/ScratchpadConfig.hpp"
#include "domain/ScratchpadDocument.hpp"
#include "domain/ScratchpadRepository.hpp"
#include "infrastructure/PathResolver.hpp"

namespace scratchpad::application {

/**
 * @class ScratchpadService
 * @brief Single entry point for every scratchpad operation.
 *
 * Each call runs: rate limiter -> input sanitizer -> path resolver -> load/mutate/save.
 * Errors never escape as exceptions; they come back as OperationResult failures and
 * the full diagnostic goes to stderr. A failed call leaves the document and the
 * rate bucket as they were.
 */
class ScratchpadService {
public:
    /**
     * @brief Constructor for ScratchpadService.
     * @param config Explicit limits and locations.
     * @param repository Storage backend; a FileRepository is created when null.
     * @param clock Time source for the rate limiter; steady_clock when null.
     * @throws std::runtime_error if the workspace root is not a directory.
     */
    explicit ScratchpadService(ScratchpadConfig config,
                               std::unique_ptr<domain::ScratchpadRepository> repository = nullptr,
                               RateLimiter::TimeSource clock = nullptr);

    /**
     * @brief Writes a new empty scratchpad.
     * @param location Requested path; the configured default when absent.
     * @param overwrite Replace an existing file; config.overwriteOnCreate when absent.
     */
    OperationResult create(const std::optional<std::string>& location = std::nullopt,
                           std::optional<bool> overwrite = std::nullopt);

    /** @brief Reports the scratchpad location and whether it exists. */
    OperationResult find();

    /** @brief Returns the full markdown content. */
    OperationResult read();

    OperationResult logInterruption(const std::string& note,
                                    const std::optional<std::string>& type = std::nullopt,
                                    const std::optional<std::string>& priority = std::nullopt);

    OperationResult updateFocus(const std::string& task);

    OperationResult addToReviewLater(const std::string& note);

    /** @brief Moves a matching open item to Completed Today, or records it directly. */
    OperationResult markCompleted(const std::string& note);

    /** @brief Moves a matching open item to Archived / Dismissed, or records it directly. */
    OperationResult archiveItem(const std::string& note);

    const ScratchpadConfig& config() const { return m_config; }

private:
    using Mutation = std::function<OperationResult(domain::ScratchpadDocument&, domain::Timestamp)>;

    OperationResult guarded(const char* operation, const std::function<OperationResult()>& body);
    OperationResult applyToDocument(const Mutation& mutation);
    OperationResult transfer(const char* operation, const std::string& note, bool archive);

    /**
     * @brief Re-resolved cached location, else the first existing search location.
     * Caller holds m_mutex. Throws the cached location's error when it no longer
     * resolves and no other candidate exists.
     */
    std::optional<infrastructure::ConfinedPath> locate();

    ScratchpadConfig m_config;
    infrastructure::PathResolver m_resolver;
    InputSanitizer m_sanitizer;
    RateLimiter m_rateLimiter;
    std::unique_ptr<domain::ScratchpadRepository> m_repository;

    std::mutex m_mutex; ///< Serializes load-mutate-save on the document.
    std::optional<infrastructure::ConfinedPath> m_activePath;
};

} // namespace scratchpad::application
