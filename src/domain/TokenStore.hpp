/**
 * @file TokenStore.hpp
 * @brief Interface for persisting the current credential.
 */

#pragma once
#include <optional>
#include "Credential.hpp"

namespace kindlesender::domain {

/**
 * @class TokenStore
 * @brief Loads and overwrites a single persisted Credential. No business logic.
 */
class TokenStore {
public:
    virtual ~TokenStore() = default;

    /** @brief Returns the stored credential, or nullopt if none is usable. */
    virtual std::optional<Credential> load() = 0;

    /**
     * @brief Replaces the stored credential wholesale.
     * @throws std::runtime_error if the record could not be written.
     */
    virtual void save(const Credential& credential) = 0;
};

} // namespace kindlesender::domain
