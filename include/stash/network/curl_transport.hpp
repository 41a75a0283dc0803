#pragma once

#include "stash/network/transport.hpp"

#include <string>

namespace stash::network {

/**
 * CurlTransport
 *
 * Transport backed by libcurl. Every send() uses its own easy handle, so one
 * instance can be shared by concurrent upload invocations without locking.
 *
 * Features:
 * - JSON POST and raw PUT (in-memory or streamed body with fixed length)
 * - Redirects followed transparently
 * - Response headers captured from the final response only
 */
class CurlTransport : public Transport {
public:
    struct Options {
        long timeout_seconds = 0;          // 0 = no overall limit
        long connect_timeout_seconds = 30;
        std::string user_agent = "stash-uploader/1.0";
    };

    CurlTransport();
    explicit CurlTransport(Options options);

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

} // namespace stash::network
