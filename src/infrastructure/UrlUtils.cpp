/**
 * @file UrlUtils.cpp
 * @brief Implementation of UrlUtils.
 */
#include "infrastructure/UrlUtils.hpp"
#include <algorithm>
#include <cctype>

namespace kindlesender::infrastructure {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

bool IsUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

std::string UrlUtils::Endpoint::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string UrlUtils::Endpoint::join(const std::string& suffix) const {
    if (path == "/") {
        return (!suffix.empty() && suffix.front() == '/') ? suffix : "/" + suffix;
    }
    if (!suffix.empty() && suffix.front() == '/') {
        return path + suffix;
    }
    return path + "/" + suffix;
}

std::optional<UrlUtils::Endpoint> UrlUtils::ParseHttpUrl(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) return std::nullopt;

    Endpoint ep;
    ep.scheme = ToLower(url.substr(0, schemeEnd));
    if (ep.scheme == "http") {
        ep.port = 80;
    } else if (ep.scheme == "https") {
        ep.port = 443;
    } else {
        return std::nullopt;
    }

    std::string rest = url.substr(schemeEnd + 3);
    size_t cut = rest.find_first_of("?#");
    if (cut != std::string::npos) rest = rest.substr(0, cut);

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    ep.path = (slash == std::string::npos) ? "/" : rest.substr(slash);
    while (ep.path.size() > 1 && ep.path.back() == '/') ep.path.pop_back();

    // Bracketed IPv6 literals are not supported; the callback binds to a named host or IPv4.
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (portText.empty() || portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(), [](unsigned char c){ return std::isdigit(c); })) {
            return std::nullopt;
        }
        ep.port = std::stoi(portText);
        if (ep.port <= 0 || ep.port > 65535) return std::nullopt;
    }
    if (authority.empty()) return std::nullopt;
    ep.host = authority;
    return ep;
}

std::string UrlUtils::PercentEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (IsUnreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace kindlesender::infrastructure
