#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace stash::network {

class ByteSource;

/**
 * @brief HTTP request methods used by the upload client
 */
enum class HttpMethod {
    POST,
    PUT,
    UNKNOWN
};

using HeaderMap = std::unordered_map<std::string, std::string>;

namespace detail {

// HTTP headers are case-insensitive per RFC 7230; we store them as-is
inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline const std::string* find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return &value;
        }
    }
    return nullptr;
}

} // namespace detail

/**
 * @brief Outgoing HTTP request
 *
 * The body is either the in-memory `body` bytes or, when `body_stream` is
 * set, exactly `body_stream->size()` bytes pulled from the stream. The
 * stream is not owned; the caller keeps it alive until send() returns.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HeaderMap headers;
    std::vector<std::uint8_t> body;
    ByteSource* body_stream = nullptr;

    /**
     * @brief Get a header value (case-insensitive lookup)
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        const auto* value = detail::find_header(headers, name);
        return value ? *value : std::string{};
    }

    bool has_header(const std::string& name) const {
        return detail::find_header(headers, name) != nullptr;
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    /**
     * @brief Get the body as a string (for text content)
     *
     * Only meaningful for in-memory bodies.
     */
    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Response as seen by the client after redirects were followed
 */
struct HttpResponse {
    int status_code = 0;
    HeaderMap headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        const auto* value = detail::find_header(headers, name);
        return value ? *value : std::string{};
    }

    bool has_header(const std::string& name) const {
        return detail::find_header(headers, name) != nullptr;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            default: return "UNKNOWN";
        }
    }
};

} // namespace stash::network
