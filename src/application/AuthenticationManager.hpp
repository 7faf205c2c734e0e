/**
 * @file AuthenticationManager.hpp
 * @brief Resolves an access token from cache, refresh or interactive login.
 */

#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "domain/AccessTokenProvider.hpp"
#include "domain/AuthorizationCodeSource.hpp"
#include "domain/DeliverySettings.hpp"
#include "domain/IdentityService.hpp"
#include "domain/TokenStore.hpp"

namespace kindlesender::application {

/**
 * @enum ResolutionStage
 * @brief Stages of token resolution, tried in this order and never revisited.
 */
enum class ResolutionStage {
    None,        ///< obtainAccessToken() has not produced a token yet.
    Cached,      ///< Stored credential was still valid.
    Refreshed,   ///< Stored refresh token was redeemed.
    Interactive  ///< User logged in through the browser.
};

/**
 * @class AuthenticationManager
 * @brief Composes TokenStore, IdentityService and an AuthorizationCodeSource into one token lookup.
 *
 * Writes the credential store at most once per call and only after a fully
 * parsed token response. The code source is created lazily, so no local port
 * is bound unless the interactive stage is reached.
 */
class AuthenticationManager : public domain::AccessTokenProvider {
public:
    using CodeSourceFactory = std::function<std::unique_ptr<domain::AuthorizationCodeSource>()>;
    using PromptCallback = std::function<void(const std::string&)>;
    using Clock = std::function<std::int64_t()>;

    static constexpr const char* kAuthorizationScopes = "offline_access Mail.Send";

    /**
     * @param settings Client registration and redirect URI.
     * @param store Persisted credential.
     * @param identity Token endpoint.
     * @param codeSourceFactory Creates the redirect listener for the interactive stage.
     * @param prompt Receives the authorization URL; defaults to printing it.
     * @param clock Unix time source; defaults to the system clock.
     */
    AuthenticationManager(const domain::DeliverySettings& settings,
                          std::shared_ptr<domain::TokenStore> store,
                          std::shared_ptr<domain::IdentityService> identity,
                          CodeSourceFactory codeSourceFactory,
                          PromptCallback prompt = nullptr,
                          Clock clock = nullptr);

    /**
     * @brief Tries the cached credential, then a refresh, then an interactive login.
     * @throws domain::AuthError if the interactive stage fails or the credential cannot be stored.
     */
    std::string obtainAccessToken() override;

    /** @brief Stage that produced the last token. */
    ResolutionStage lastStage() const { return m_lastStage; }

    /** @brief Browser URL for the authorization-code flow. */
    std::string buildAuthorizationUrl() const;

    static std::int64_t SystemNow();

private:
    std::optional<std::string> tryCached(const std::optional<domain::Credential>& stored) const;
    std::optional<std::string> tryRefresh(const std::optional<domain::Credential>& stored);
    std::string runInteractive();
    std::string persist(domain::Credential credential);

    domain::AzureSettings m_azure;
    std::string m_authorityUrl;
    std::string m_redirectUri;
    std::shared_ptr<domain::TokenStore> m_store;
    std::shared_ptr<domain::IdentityService> m_identity;
    CodeSourceFactory m_codeSourceFactory;
    PromptCallback m_prompt;
    Clock m_clock;
    ResolutionStage m_lastStage = ResolutionStage::None;
};

} // namespace kindlesender::application
