/**
 * @file ScratchpadRepository.hpp
 * @brief Interface for raw storage of the serialized scratchpad.
 */

#pragma once
#include <filesystem>
#include <string>

namespace scratchpad::domain {

/**
 * @class ScratchpadRepository
 * @brief Abstract storage for the scratchpad file.
 *
 * Paths passed in have already been confined by the path resolver.
 * Implementations throw ScratchpadError(IOError) on filesystem failures.
 */
class ScratchpadRepository {
public:
    virtual ~ScratchpadRepository() = default;

    /** @brief True if a regular file exists at @p path. */
    virtual bool exists(const std::filesystem::path& path) = 0;

    /** @brief Reads the whole file as UTF-8 text. */
    virtual std::string readText(const std::filesystem::path& path) = 0;

    /**
     * @brief Replaces the file content in one step (temp file + rename).
     * Either the new content is fully in place afterwards or the old file is untouched.
     * Parent directories are created as needed.
     */
    virtual void writeText(const std::filesystem::path& path, const std::string& content) = 0;
};

} // namespace scratchpad::domain
