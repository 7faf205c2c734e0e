/**
 * @file FileTokenStore.hpp
 * @brief JSON-file implementation of domain::TokenStore.
 */

#pragma once
#include <filesystem>
#include "domain/TokenStore.hpp"

namespace kindlesender::infrastructure {

/**
 * @class FileTokenStore
 * @brief Keeps the credential as a single JSON object on disk.
 *
 * Writes go to a temp file that is renamed over the target, so a reader never
 * sees a half-written record. The file is readable by its owner only.
 */
class FileTokenStore : public domain::TokenStore {
public:
    /** @param path Credential file, usually PathUtils::GetCredentialPath(). */
    explicit FileTokenStore(std::filesystem::path path);

    /** @brief Missing, unreadable or malformed files all yield nullopt. */
    std::optional<domain::Credential> load() override;

    /** @brief Atomic overwrite. @throws std::runtime_error on I/O failure. */
    void save(const domain::Credential& credential) override;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path; ///< Target credential file.
};

} // namespace kindlesender::infrastructure
