/**
 * @file FileRepository.hpp
 * @brief Filesystem-based implementation of the ScratchpadRepository.
 */

#pragma once
#include <memory>
#include "domain/ScratchpadRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace scratchpad::infrastructure {

/**
 * @class FileRepository
 * @brief Reads the scratchpad directly and routes writes through the PersistenceService.
 */
class FileRepository : public domain::ScratchpadRepository {
public:
    explicit FileRepository(std::shared_ptr<PersistenceService> persistence);

    /** @see domain::ScratchpadRepository::exists */
    bool exists(const std::filesystem::path& path) override;

    /** @see domain::ScratchpadRepository::readText */
    std::string readText(const std::filesystem::path& path) override;

    /** @see domain::ScratchpadRepository::writeText */
    void writeText(const std::filesystem::path& path, const std::string& content) override;

private:
    std::shared_ptr<PersistenceService> m_persistence; ///< Serialized atomic writer.
};

} // namespace scratchpad::infrastructure
