/**
 * @file Base64.cpp
 * @brief Implementation of Base64.
 */
#include "infrastructure/Base64.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <vector>

namespace kindlesender::infrastructure {

namespace {
// EVP_EncodeBlock/EVP_DecodeBlock take int lengths; work in chunks that keep
// whole 3-byte (encode) and 4-char (decode) groups together.
constexpr size_t kEncodeChunk = 3 * 16384;
constexpr size_t kDecodeChunk = 4 * 16384;
}

std::string Base64::Encode(const std::string& bytes) {
    std::string out;
    out.reserve(4 * ((bytes.size() + 2) / 3));

    std::vector<unsigned char> buffer(4 * (kEncodeChunk / 3) + 1);
    for (size_t offset = 0; offset < bytes.size(); offset += kEncodeChunk) {
        size_t len = std::min(kEncodeChunk, bytes.size() - offset);
        int written = EVP_EncodeBlock(buffer.data(),
                                      reinterpret_cast<const unsigned char*>(bytes.data() + offset),
                                      static_cast<int>(len));
        out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written));
    }
    return out;
}

std::optional<std::string> Base64::Decode(const std::string& text) {
    if (text.size() % 4 != 0) return std::nullopt;

    std::string out;
    out.reserve(3 * (text.size() / 4));

    std::vector<unsigned char> buffer(3 * (kDecodeChunk / 4) + 1);
    for (size_t offset = 0; offset < text.size(); offset += kDecodeChunk) {
        size_t len = std::min(kDecodeChunk, text.size() - offset);
        int written = EVP_DecodeBlock(buffer.data(),
                                      reinterpret_cast<const unsigned char*>(text.data() + offset),
                                      static_cast<int>(len));
        if (written < 0) return std::nullopt;

        // EVP_DecodeBlock counts padding as zero bytes; only the final group may carry it.
        size_t padding = 0;
        if (offset + len == text.size()) {
            if (len >= 1 && text[offset + len - 1] == '=') ++padding;
            if (len >= 2 && text[offset + len - 2] == '=') ++padding;
        }
        out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written) - padding);
    }
    return out;
}

} // namespace kindlesender::infrastructure
