/**
 * @file PathResolver.cpp
 * @brief Implementation of PathResolver.
 */
#include "infrastructure/PathResolver.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include "domain/ScratchpadError.hpp"

namespace scratchpad::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::ScratchpadError;

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Component-wise containment; "/ws-other" is not inside "/ws".
bool IsStrictlyWithin(const fs::path& root, const fs::path& candidate) {
    auto candIt = candidate.begin();
    for (auto rootIt = root.begin(); rootIt != root.end(); ++rootIt, ++candIt) {
        if (candIt == candidate.end() || *candIt != *rootIt) {
            return false;
        }
    }
    return candIt != candidate.end();
}

fs::path Canonicalize(const fs::path& target) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(target, ec);
    if (ec == std::errc::filename_too_long) {
        throw ScratchpadError(ErrorKind::PathTooLong, "cannot canonicalize " + target.string() + ": " + ec.message());
    }
    if (ec) {
        throw ScratchpadError(ErrorKind::PathViolation, "cannot canonicalize " + target.string() + ": " + ec.message());
    }
    return resolved;
}

} // namespace

PathResolver::PathResolver(PathPolicy policy) : m_policy(std::move(policy)) {
    std::error_code ec;
    if (!fs::is_directory(m_policy.workspaceRoot, ec)) {
        throw std::runtime_error("Workspace path is not a directory: " + m_policy.workspaceRoot.string());
    }
    m_canonicalRoot = fs::canonical(m_policy.workspaceRoot, ec);
    if (ec) {
        throw std::runtime_error("Cannot resolve workspace path: " + ec.message());
    }
}

ConfinedPath PathResolver::resolve(const std::string& requested) const {
    if (requested.find('\0') != std::string::npos) {
        throw ScratchpadError(ErrorKind::PathViolation, "embedded null byte in path");
    }

    fs::path candidate(requested);
    if (!requested.empty() && !candidate.is_absolute()) {
        candidate = m_canonicalRoot / candidate;
    }

    if (m_policy.globalLocation) {
        fs::path global = Canonicalize(*m_policy.globalLocation);
        fs::path resolved = requested.empty() ? global : Canonicalize(candidate);
        if (resolved != global) {
            throw ScratchpadError(ErrorKind::PathViolation,
                "only the global location " + global.string() + " is permitted, got " + resolved.string());
        }
        checkExtensionAndLength(resolved);
        return ConfinedPath(resolved, resolved);
    }

    if (requested.empty()) {
        throw ScratchpadError(ErrorKind::PathViolation, "empty path");
    }

    fs::path resolved = Canonicalize(candidate);
    if (!IsStrictlyWithin(m_canonicalRoot, resolved)) {
        throw ScratchpadError(ErrorKind::PathViolation,
            "path " + resolved.string() + " escapes workspace " + m_canonicalRoot.string());
    }

    fs::path relative = resolved.lexically_relative(m_canonicalRoot);
    auto first = relative.begin();
    if (first == relative.end() || std::next(first) == relative.end()) {
        throw ScratchpadError(ErrorKind::PathViolation, "path must live inside an allowed directory: " + relative.string());
    }
    if (m_policy.allowedDirectories.count(first->string()) == 0) {
        throw ScratchpadError(ErrorKind::PathViolation, "directory not in allow-list: " + first->string());
    }

    checkExtensionAndLength(resolved);
    return ConfinedPath(resolved, relative);
}

void PathResolver::checkExtensionAndLength(const fs::path& resolved) const {
    std::string ext = ToLower(resolved.extension().string());
    if (m_policy.allowedExtensions.count(ext) == 0) {
        throw ScratchpadError(ErrorKind::ExtensionNotAllowed, "extension not allowed: '" + ext + "'");
    }
    if (resolved.string().size() > m_policy.maxPathLength) {
        throw ScratchpadError(ErrorKind::PathTooLong,
            "resolved path is " + std::to_string(resolved.string().size()) + " characters");
    }
}

void PathResolver::checkReadable(const ConfinedPath& path) const {
    std::error_code ec;
    if (!fs::exists(path.path(), ec)) {
        return;
    }
    if (!fs::is_regular_file(path.path(), ec)) {
        throw ScratchpadError(ErrorKind::IOError, "not a regular file: " + path.path().string());
    }
    std::uintmax_t size = fs::file_size(path.path(), ec);
    if (ec) {
        throw ScratchpadError(ErrorKind::IOError, "cannot stat " + path.path().string() + ": " + ec.message());
    }
    if (size > m_policy.maxFileSize) {
        throw ScratchpadError(ErrorKind::SizeExceeded,
            "file size (" + std::to_string(size) + " bytes) exceeds maximum (" +
            std::to_string(m_policy.maxFileSize) + " bytes)");
    }
}

void PathResolver::checkWritable(const ConfinedPath& path, std::uintmax_t newSize) const {
    if (newSize > m_policy.maxFileSize) {
        throw ScratchpadError(ErrorKind::SizeExceeded,
            "content size (" + std::to_string(newSize) + " bytes) for " + path.path().string() +
            " exceeds maximum (" + std::to_string(m_policy.maxFileSize) + " bytes)");
    }
}

} // namespace scratchpad::infrastructure
