/**
 * @file FileStore.hpp
 * @brief Interface for the filesystem operations used by a delivery run.
 */

#pragma once
#include <string>
#include <vector>

namespace kindlesender::domain {

/**
 * @class FileStore
 * @brief Lists pending e-books and relocates sent ones.
 */
class FileStore {
public:
    virtual ~FileStore() = default;

    /**
     * @brief Lists regular files directly inside directory (non-recursive).
     * @return Full paths, sorted by filename.
     * @throws std::runtime_error if the directory cannot be read.
     */
    virtual std::vector<std::string> listFiles(const std::string& directory) = 0;

    /**
     * @brief Moves filePath into directory, keeping its filename.
     *
     * Creates directory if needed. Never overwrites an existing file.
     * @throws std::runtime_error on failure.
     */
    virtual void moveToDirectory(const std::string& filePath, const std::string& directory) = 0;
};

} // namespace kindlesender::domain
