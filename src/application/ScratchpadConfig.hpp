/**
 * @file ScratchpadConfig.hpp
 * @brief Explicit configuration handed to ScratchpadService at construction.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace scratchpad::application {

/**
 * @struct ScratchpadConfig
 * @brief Every limit and location the service relies on. No global state is consulted.
 */
struct ScratchpadConfig {
    std::filesystem::path root; ///< Workspace root all paths are confined to.
    std::set<std::string> allowedDirs{".idea", ".vscode", ".dart_tool", ".cache", "docs", ".scratchpad"};
    std::size_t maxNoteLen = 500;
    std::size_t maxTaskLen = 200;
    std::size_t maxPathLen = 256;
    std::uintmax_t maxFileSize = 1024 * 1024;

    std::size_t maxRequestsPerWindow = 60;
    std::chrono::seconds rateWindow{60};

    /** When set, only this file may be used and the directory allow-list is skipped. */
    std::optional<std::filesystem::path> globalLocation;

    std::string defaultLocation = ".idea/scratchpad.md";
    std::vector<std::string> searchLocations{
        ".idea/scratchpad.md",
        ".vscode/scratchpad.md",
        ".dart_tool/scratchpad.md",
        ".cache/scratchpad.md",
        ".scratchpad/scratchpad.md",
    };

    bool overwriteOnCreate = false; ///< Default policy for create() when a file exists.
};

} // namespace scratchpad::application
