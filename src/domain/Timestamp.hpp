/**
 * @file Timestamp.hpp
 * @brief Second-precision UTC timestamps used for item stamps.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace scratchpad::domain {

/** Item stamps are truncated to whole seconds so they survive the markdown encoding. */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/** @brief Current wall-clock time truncated to seconds. */
Timestamp Now();

/** @brief Formats as ISO-8601 UTC, e.g. "2026-10-18T14:03:27Z". */
std::string FormatTimestamp(Timestamp ts);

/** @brief Parses the FormatTimestamp() form; nullopt if malformed. */
std::optional<Timestamp> ParseTimestamp(const std::string& text);

} // namespace scratchpad::domain
