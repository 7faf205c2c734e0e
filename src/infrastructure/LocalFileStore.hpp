/**
 * @file LocalFileStore.hpp
 * @brief Filesystem-based implementation of domain::FileStore.
 */

#pragma once
#include "domain/FileStore.hpp"

namespace kindlesender::infrastructure {

/**
 * @class LocalFileStore
 * @brief Lists and moves e-books on the local filesystem.
 */
class LocalFileStore : public domain::FileStore {
public:
    /** @brief Regular files only, sorted by filename. @see domain::FileStore::listFiles */
    std::vector<std::string> listFiles(const std::string& directory) override;

    /** @brief Rename, or copy and remove across devices. @see domain::FileStore::moveToDirectory */
    void moveToDirectory(const std::string& filePath, const std::string& directory) override;
};

} // namespace kindlesender::infrastructure
