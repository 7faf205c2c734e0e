/**
 * @file CredentialJson.hpp
 * @brief Mapping between domain::Credential and its JSON wire/disk form.
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/Credential.hpp"

namespace kindlesender::infrastructure {

class CredentialJson {
public:
    /**
     * @brief Reads a token-endpoint response or a stored credential record.
     *
     * Requires access_token, token_type and expires_in; expires_in may be a number
     * or a numeric string. expires_at is read only if present.
     * @throws std::invalid_argument if the object does not have the Credential shape.
     */
    static domain::Credential FromJson(const nlohmann::json& j);

    /** @brief Serializes every field; absent optionals are written as null. */
    static nlohmann::json ToJson(const domain::Credential& credential);
};

} // namespace kindlesender::infrastructure
