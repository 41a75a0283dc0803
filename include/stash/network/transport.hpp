#pragma once

#include "stash/core/result.hpp"
#include "stash/network/http_types.hpp"

namespace stash::network {

/**
 * @brief The single point of network I/O
 *
 * send() never interprets the status code; any completed exchange is a
 * success at this level. Connection failures, timeouts, redirect failures
 * and malformed responses come back as ErrorKind::Transport. No retries.
 *
 * Implementations shared between upload invocations must be safe for
 * concurrent send() calls.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace stash::network
