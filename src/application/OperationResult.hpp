/**
 * @file OperationResult.hpp
 * @brief Typed result returned by every ScratchpadService operation.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/ScratchpadDocument.hpp"
#include "domain/ScratchpadError.hpp"

namespace scratchpad::application {

/**
 * @struct OperationResult
 * @brief Success payload or a failure kind with a caller-safe message.
 *
 * Messages never carry internal exception text or absolute filesystem layout.
 */
struct OperationResult {
    bool success = false;
    domain::ErrorKind error = domain::ErrorKind::None;
    std::string message;                     ///< Confirmation or sanitized error text.
    std::optional<double> retryAfterSeconds; ///< Set for RateLimited.

    std::string path;   ///< Scratchpad location (workspace-relative when possible).
    bool exists = false; ///< find(): whether a scratchpad is present.
    std::string content; ///< read(): full serialized document.
    std::optional<domain::ScratchpadItem> item; ///< Item written by an item operation.
    std::optional<domain::ItemOrigin> origin;   ///< markCompleted/archiveItem: where the item came from.

    static OperationResult Success(std::string message) {
        OperationResult result;
        result.success = true;
        result.message = std::move(message);
        return result;
    }

    static OperationResult Failure(const domain::ScratchpadError& error) {
        OperationResult result;
        result.success = false;
        result.error = error.kind();
        result.message = error.publicMessage();
        result.retryAfterSeconds = error.retryAfterSeconds();
        return result;
    }
};

} // namespace scratchpad::application
