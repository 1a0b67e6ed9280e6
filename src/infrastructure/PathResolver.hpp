/**
 * @file PathResolver.hpp
 * @brief Confines requested scratchpad locations to the approved workspace.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace scratchpad::infrastructure {

/**
 * @struct PathPolicy
 * @brief Limits applied by the PathResolver.
 */
struct PathPolicy {
    std::filesystem::path workspaceRoot;                 ///< Approved base directory.
    std::set<std::string> allowedDirectories;            ///< Allowed top-level directories under the root.
    std::set<std::string> allowedExtensions{".md", ".txt", ".markdown"};
    std::size_t maxPathLength = 256;                     ///< Limit on the resolved path string.
    std::uintmax_t maxFileSize = 1024 * 1024;            ///< Read and write ceiling in bytes.
    std::optional<std::filesystem::path> globalLocation; ///< Single fixed file; disables the allow-list.
};

/**
 * @class ConfinedPath
 * @brief A canonical absolute path that passed every PathResolver check.
 *
 * Only PathResolver can construct one, so holding a ConfinedPath means the path was validated.
 */
class ConfinedPath {
public:
    const std::filesystem::path& path() const { return m_path; }

    /** @brief Location relative to the workspace root, or the absolute path in global mode. */
    const std::filesystem::path& display() const { return m_display; }

    bool operator==(const ConfinedPath& other) const { return m_path == other.m_path; }

private:
    friend class PathResolver;
    ConfinedPath(std::filesystem::path path, std::filesystem::path display)
        : m_path(std::move(path)), m_display(std::move(display)) {}

    std::filesystem::path m_path;
    std::filesystem::path m_display;
};

/**
 * @class PathResolver
 * @brief Pure validation of storage locations; performs no writes.
 *
 * Failures throw ScratchpadError with PathViolation, ExtensionNotAllowed,
 * PathTooLong or SizeExceeded.
 */
class PathResolver {
public:
    /** @throws std::runtime_error if the workspace root does not exist or is not a directory. */
    explicit PathResolver(PathPolicy policy);

    /**
     * @brief Resolves @p requested (relative to the root, or absolute) to a confined path.
     *
     * `..` segments and symbolic links are resolved before the containment check.
     * An empty request selects the global location when one is configured.
     */
    ConfinedPath resolve(const std::string& requested) const;

    /** @brief Rejects an existing file larger than the size ceiling. */
    void checkReadable(const ConfinedPath& path) const;

    /** @brief Rejects content of @p newSize bytes that would exceed the size ceiling. */
    void checkWritable(const ConfinedPath& path, std::uintmax_t newSize) const;

    const PathPolicy& policy() const { return m_policy; }
    const std::filesystem::path& root() const { return m_canonicalRoot; }

private:
    void checkExtensionAndLength(const std::filesystem::path& resolved) const;

    PathPolicy m_policy;
    std::filesystem::path m_canonicalRoot;
};

} // namespace scratchpad::infrastructure
