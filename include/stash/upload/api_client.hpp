#pragma once

#include "stash/config/config.hpp"
#include "stash/core/result.hpp"
#include "stash/network/transport.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace stash::upload {

namespace endpoints {
inline constexpr const char* kUploadRequest = "/upload/request";
inline constexpr const char* kPartRequest = "/upload/request/multipart";
inline constexpr const char* kExpansionPartRequest = "/upload/request/multipart/expansion";
inline constexpr const char* kUploadVerify = "/upload/verify";
} // namespace endpoints

/**
 * ApiClient
 *
 * Authenticated JSON calls against the artifact API. Every call carries the
 * bearer token; presigned storage PUTs do not go through this class.
 *
 * A returned response is always HTTP 200 with a JSON content type:
 * - non-200             -> ErrorKind::Protocol (status and raw body kept)
 * - non-JSON content    -> ErrorKind::UnexpectedContentType, checked before
 *                          anything tries to parse the body
 */
class ApiClient {
public:
    ApiClient(network::Transport& transport, config::ApiConfig config);

    /**
     * @brief POST `body` to base_url + endpoint
     * @param action Used in error messages ("Failed to <action>: ...")
     */
    Result<network::HttpResponse> post_json(const std::string& endpoint,
                                            const nlohmann::json& body,
                                            const std::string& action);

    std::string url_for(const std::string& endpoint) const;

    const config::ApiConfig& config() const noexcept { return config_; }

private:
    network::Transport& transport_;
    config::ApiConfig config_;
};

} // namespace stash::upload
