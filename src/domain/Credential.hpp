/**
 * @file Credential.hpp
 * @brief OAuth2 access credential as issued by the identity provider.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace kindlesender::domain {

/**
 * @struct Credential
 * @brief Access/refresh token bundle with a locally computed expiry.
 *
 * expiresAt is stamped once, when the credential is acquired, and is never
 * derived from expiresIn afterwards. A credential without expiresAt is never valid.
 */
struct Credential {
    /** @brief Upper bound applied to expiresIn when stamping (ten years). */
    static constexpr std::int64_t kMaxLifetimeSeconds = 10LL * 365 * 24 * 60 * 60;

    std::string accessToken;                 ///< Bearer token for the mail gateway.
    std::optional<std::string> refreshToken; ///< Used to obtain a new credential without user interaction.
    std::optional<std::string> idToken;      ///< OIDC identity token, stored but unused.
    std::string tokenType;                   ///< Usually "Bearer".
    std::int64_t expiresIn = 0;              ///< Lifetime in seconds as reported by the provider.
    std::optional<std::int64_t> expiresAt;   ///< Unix time after which the token is stale.

    /** @brief True if expiresAt is set and lies strictly after nowEpoch. */
    bool isValidAt(std::int64_t nowEpoch) const {
        return expiresAt.has_value() && nowEpoch < *expiresAt;
    }

    /** @brief Sets expiresAt to acquiredAtEpoch + expiresIn, with expiresIn clamped to [0, kMaxLifetimeSeconds]. */
    void stampExpiry(std::int64_t acquiredAtEpoch) {
        std::int64_t lifetime = expiresIn < 0 ? 0 : (expiresIn > kMaxLifetimeSeconds ? kMaxLifetimeSeconds : expiresIn);
        expiresAt = acquiredAtEpoch + lifetime;
    }
};

} // namespace kindlesender::domain
