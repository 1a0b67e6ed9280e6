/**
 * @file FileRepository.cpp
 * @brief Implementation of the FileRepository class.
 */
#include "infrastructure/FileRepository.hpp"
#include <fstream>
#include <sstream>
#include "domain/ScratchpadError.hpp"

namespace fs = std::filesystem;

namespace scratchpad::infrastructure {

using domain::ErrorKind;
using domain::ScratchpadError;

FileRepository::FileRepository(std::shared_ptr<PersistenceService> persistence)
    : m_persistence(std::move(persistence)) {}

bool FileRepository::exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string FileRepository::readText(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ScratchpadError(ErrorKind::IOError, "failed to open for reading: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ScratchpadError(ErrorKind::IOError, "read failed: " + path.string());
    }
    return buffer.str();
}

void FileRepository::writeText(const fs::path& path, const std::string& content) {
    m_persistence->saveText(path.string(), content);
}

} // namespace scratchpad::infrastructure
