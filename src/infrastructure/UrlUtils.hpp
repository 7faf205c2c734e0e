/**
 * @file UrlUtils.hpp
 * @brief Small helpers for splitting and encoding HTTP URLs.
 */

#pragma once
#include <optional>
#include <string>

namespace kindlesender::infrastructure {

class UrlUtils {
public:
    /**
     * @struct Endpoint
     * @brief An http(s) URL split into the parts cpp-httplib wants separately.
     */
    struct Endpoint {
        std::string scheme; ///< "http" or "https".
        std::string host;
        int port = 0;       ///< Explicit port, or the scheme default.
        std::string path;   ///< Always starts with '/', never ends with one unless it is just "/".

        /** @brief "scheme://host:port", suitable for httplib::Client. */
        std::string origin() const;

        /** @brief path joined with suffix without doubling the slash. */
        std::string join(const std::string& suffix) const;
    };

    /**
     * @brief Parses an absolute http/https URL. Query strings and fragments are dropped.
     * @return nullopt if the scheme is not http(s), the host is empty, or the port is invalid.
     */
    static std::optional<Endpoint> ParseHttpUrl(const std::string& url);

    /** @brief RFC 3986 percent-encoding of everything but unreserved characters. */
    static std::string PercentEncode(const std::string& value);
};

} // namespace kindlesender::infrastructure
