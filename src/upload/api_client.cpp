#include "stash/upload/api_client.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stash::upload {

ApiClient::ApiClient(network::Transport& transport, config::ApiConfig config)
    : transport_(transport),
      config_(std::move(config)) {}

std::string ApiClient::url_for(const std::string& endpoint) const {
    std::string base = config_.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (!endpoint.empty() && endpoint.front() != '/') {
        base.push_back('/');
    }
    return base + endpoint;
}

Result<network::HttpResponse> ApiClient::post_json(const std::string& endpoint,
                                                   const nlohmann::json& body,
                                                   const std::string& action) {
    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = url_for(endpoint);
    request.set_header("Authorization", "Bearer " + config_.api_key);
    request.set_header("Content-Type", "application/json");
    request.set_header("Accept", "application/json");
    request.set_body(body.dump());

    auto sent = transport_.send(request);
    if (sent.is_error()) {
        return sent;
    }
    auto& response = sent.value();

    if (response.status_code != 200) {
        const auto response_body = response.body_as_string();
        spdlog::error("Failed to {}: {} - {}", action, response.status_code, response_body);
        return Err<network::HttpResponse>(Error::protocol(
            "Failed to " + action + ": " + std::to_string(response.status_code) + " - " + response_body,
            response.status_code, response_body));
    }

    std::string content_type = response.get_header("Content-Type");
    if (content_type.empty()) {
        content_type = "unknown";
    }
    if (content_type.find("json") == std::string::npos) {
        const auto response_body = response.body_as_string();
        spdlog::error("Failed to {}: expected JSON but got {}", action, content_type);
        return Err<network::HttpResponse>(Error::unexpected_content_type(
            "Failed to " + action + ": server returned " + content_type +
                " instead of JSON. This usually indicates an authentication error "
                "or the API endpoint is incorrect",
            response.status_code, response_body));
    }

    return sent;
}

} // namespace stash::upload
