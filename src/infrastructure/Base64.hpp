/**
 * @file Base64.hpp
 * @brief Standard base64 (RFC 4648, padded) backed by OpenSSL's EVP block codec.
 */

#pragma once
#include <optional>
#include <string>

namespace kindlesender::infrastructure {

class Base64 {
public:
    /** @brief Encodes arbitrary bytes without line breaks. */
    static std::string Encode(const std::string& bytes);

    /** @brief Decodes padded base64. @return nullopt on malformed input. */
    static std::optional<std::string> Decode(const std::string& text);
};

} // namespace kindlesender::infrastructure
