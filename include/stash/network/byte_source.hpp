#pragma once

#include "stash/core/result.hpp"

#include <cstddef>
#include <cstdint>

namespace stash::network {

/**
 * @brief Pull-based body for streamed requests
 *
 * size() is the exact number of bytes the source will yield. read() returns
 * 0 only once all size() bytes were produced; a source that cannot deliver
 * its declared size returns an error instead of a short stream.
 *
 * rewind() restarts the source at its first byte so the transport can
 * replay the body, e.g. when a PUT is redirected.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual Result<std::size_t> read(std::uint8_t* buffer, std::size_t max_bytes) = 0;

    virtual Result<void> rewind() = 0;

    virtual std::uint64_t size() const noexcept = 0;
};

} // namespace stash::network
