/**
 * @file AuthenticationManager.cpp
 * @brief Implementation of the AuthenticationManager class.
 */
#include "application/AuthenticationManager.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <chrono>
#include <iostream>
#include <utility>

namespace kindlesender::application {

using domain::AuthError;
using infrastructure::UrlUtils;

AuthenticationManager::AuthenticationManager(const domain::DeliverySettings& settings,
                                             std::shared_ptr<domain::TokenStore> store,
                                             std::shared_ptr<domain::IdentityService> identity,
                                             CodeSourceFactory codeSourceFactory,
                                             PromptCallback prompt,
                                             Clock clock)
    : m_azure(settings.azure),
      m_authorityUrl(settings.authorityUrl),
      m_redirectUri(settings.callbackUri),
      m_store(std::move(store)),
      m_identity(std::move(identity)),
      m_codeSourceFactory(std::move(codeSourceFactory)),
      m_prompt(std::move(prompt)),
      m_clock(std::move(clock)) {
    if (!m_prompt) {
        m_prompt = [](const std::string& url) {
            std::cout << "[AuthenticationManager] Please open the following URL in your browser:\n"
                      << url << std::endl;
        };
    }
    if (!m_clock) {
        m_clock = &AuthenticationManager::SystemNow;
    }
}

std::int64_t AuthenticationManager::SystemNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string AuthenticationManager::obtainAccessToken() {
    std::cout << "[AuthenticationManager] Authenticating with Azure..." << std::endl;
    m_lastStage = ResolutionStage::None;

    const auto stored = m_store->load();

    if (auto token = tryCached(stored)) {
        m_lastStage = ResolutionStage::Cached;
        return *token;
    }
    if (auto token = tryRefresh(stored)) {
        m_lastStage = ResolutionStage::Refreshed;
        return *token;
    }
    std::string token = runInteractive();
    m_lastStage = ResolutionStage::Interactive;
    return token;
}

std::optional<std::string> AuthenticationManager::tryCached(const std::optional<domain::Credential>& stored) const {
    if (stored && stored->isValidAt(m_clock())) {
        std::cout << "[AuthenticationManager] Using cached access token." << std::endl;
        return stored->accessToken;
    }
    return std::nullopt;
}

std::optional<std::string> AuthenticationManager::tryRefresh(const std::optional<domain::Credential>& stored) {
    if (!stored || !stored->refreshToken || stored->refreshToken->empty()) {
        return std::nullopt;
    }

    domain::Credential fresh;
    try {
        fresh = m_identity->refresh(*stored->refreshToken);
    } catch (const AuthError& e) {
        std::cerr << "[AuthenticationManager] Refresh failed, falling back to interactive login: " << e.what() << std::endl;
        return std::nullopt;
    }

    fresh.stampExpiry(m_clock());
    std::cout << "[AuthenticationManager] Access token refreshed." << std::endl;
    return persist(std::move(fresh));
}

std::string AuthenticationManager::runInteractive() {
    std::string code;
    {
        std::unique_ptr<domain::AuthorizationCodeSource> source = m_codeSourceFactory();
        if (!source) {
            throw AuthError("No authorization code source available");
        }
        m_prompt(buildAuthorizationUrl());
        code = source->awaitAuthorizationCode();
    }

    domain::Credential credential = m_identity->exchange(code, m_redirectUri);
    credential.stampExpiry(m_clock());
    return persist(std::move(credential));
}

std::string AuthenticationManager::persist(domain::Credential credential) {
    try {
        m_store->save(credential);
    } catch (const std::exception& e) {
        throw AuthError(std::string("Error writing token to file: ") + e.what());
    }
    return credential.accessToken;
}

std::string AuthenticationManager::buildAuthorizationUrl() const {
    std::string base = m_authorityUrl;
    while (!base.empty() && base.back() == '/') base.pop_back();

    return base + "/" + UrlUtils::PercentEncode(m_azure.tenantId) + "/oauth2/v2.0/authorize"
        + "?client_id=" + UrlUtils::PercentEncode(m_azure.clientId)
        + "&response_type=code"
        + "&redirect_uri=" + UrlUtils::PercentEncode(m_redirectUri)
        + "&response_mode=query"
        + "&scope=" + UrlUtils::PercentEncode(kAuthorizationScopes);
}

} // namespace kindlesender::application
