#pragma once

#include "stash/network/byte_source.hpp"
#include "stash/network/transport.hpp"

#include <array>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace stash::testing {

/**
 * @brief What the transport saw for one request (stream bodies are drained)
 */
struct RecordedRequest {
    network::HttpMethod method = network::HttpMethod::UNKNOWN;
    std::string url;
    network::HeaderMap headers;
    std::string body;
    bool streamed = false;
    std::uint64_t declared_length = 0;

    bool has_header(const std::string& name) const {
        return network::detail::find_header(headers, name) != nullptr;
    }

    std::string header(const std::string& name) const {
        const auto* value = network::detail::find_header(headers, name);
        return value ? *value : std::string{};
    }
};

/**
 * @brief Recording Transport that answers through a scripted handler
 */
class MockTransport : public network::Transport {
public:
    using Handler = std::function<Result<network::HttpResponse>(const RecordedRequest&)>;

    explicit MockTransport(Handler handler) : handler_(std::move(handler)) {}

    Result<network::HttpResponse> send(const network::HttpRequest& request) override {
        RecordedRequest recorded;
        recorded.method = request.method;
        recorded.url = request.url;
        recorded.headers = request.headers;

        if (request.body_stream != nullptr) {
            recorded.streamed = true;
            recorded.declared_length = request.body_stream->size();
            std::array<std::uint8_t, 64 * 1024> buffer{};
            while (true) {
                auto read = request.body_stream->read(buffer.data(), buffer.size());
                if (read.is_error()) {
                    return Err<network::HttpResponse>(read.error());
                }
                if (read.value() == 0) {
                    break;
                }
                recorded.body.append(reinterpret_cast<const char*>(buffer.data()), read.value());
            }
        } else {
            recorded.body = request.body_as_string();
            recorded.declared_length = request.body.size();
        }

        {
            std::lock_guard lock(mutex_);
            requests_.push_back(recorded);
        }
        return handler_(recorded);
    }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
};

inline network::HttpResponse make_response(int status, const std::string& body,
                                           const std::string& content_type = "application/json") {
    network::HttpResponse response;
    response.status_code = status;
    if (!content_type.empty()) {
        response.headers["Content-Type"] = content_type;
    }
    response.body.assign(body.begin(), body.end());
    return response;
}

inline Result<network::HttpResponse> respond(int status, const std::string& body,
                                             const std::string& content_type = "application/json") {
    return Ok(make_response(status, body, content_type));
}

inline bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace stash::testing
