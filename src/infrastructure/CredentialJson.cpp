/**
 * @file CredentialJson.cpp
 * @brief Implementation of CredentialJson.
 */
#include "infrastructure/CredentialJson.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace kindlesender::infrastructure {

namespace {

std::string RequireString(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw std::invalid_argument(std::string("missing or non-string field '") + key + "'");
    }
    return j[key].get<std::string>();
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) {
        throw std::invalid_argument(std::string("non-string field '") + key + "'");
    }
    return j[key].get<std::string>();
}

std::int64_t ReadInteger(const json& value, const char* key) {
    std::int64_t parsed = 0;
    bool ok = false;
    if (value.is_number_unsigned()) {
        std::uint64_t u = value.get<std::uint64_t>();
        ok = u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (ok) parsed = static_cast<std::int64_t>(u);
    } else if (value.is_number_integer()) {
        parsed = value.get<std::int64_t>();
        ok = true;
    } else if (value.is_number_float()) {
        double d = value.get<double>();
        // 2^63 is exactly representable; anything at or above it does not fit.
        ok = std::isfinite(d) && d >= 0.0 && d < 9223372036854775808.0;
        if (ok) parsed = static_cast<std::int64_t>(d);
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        try {
            size_t used = 0;
            parsed = std::stoll(text, &used);
            ok = !text.empty() && used == text.size();
        } catch (const std::invalid_argument&) {
            ok = false;
        } catch (const std::out_of_range&) {
            ok = false;
        }
    }
    if (!ok || parsed < 0) {
        throw std::invalid_argument(std::string("field '") + key + "' is not a non-negative integer in range");
    }
    return parsed;
}

} // namespace

domain::Credential CredentialJson::FromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("credential is not a JSON object");
    }

    domain::Credential c;
    c.accessToken = RequireString(j, "access_token");
    c.tokenType = RequireString(j, "token_type");
    c.refreshToken = OptionalString(j, "refresh_token");
    c.idToken = OptionalString(j, "id_token");

    if (!j.contains("expires_in")) {
        throw std::invalid_argument("missing field 'expires_in'");
    }
    c.expiresIn = ReadInteger(j["expires_in"], "expires_in");

    if (j.contains("expires_at") && !j["expires_at"].is_null()) {
        c.expiresAt = ReadInteger(j["expires_at"], "expires_at");
    }
    return c;
}

json CredentialJson::ToJson(const domain::Credential& c) {
    json j = {
        {"access_token", c.accessToken},
        {"refresh_token", nullptr},
        {"id_token", nullptr},
        {"expires_in", c.expiresIn},
        {"token_type", c.tokenType},
        {"expires_at", nullptr}
    };
    if (c.refreshToken) j["refresh_token"] = *c.refreshToken;
    if (c.idToken) j["id_token"] = *c.idToken;
    if (c.expiresAt) j["expires_at"] = *c.expiresAt;
    return j;
}

} // namespace kindlesender::infrastructure
