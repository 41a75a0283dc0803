#pragma once

#include "stash/core/result.hpp"
#include "stash/network/byte_source.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace stash::upload {

/**
 * @brief Stream over [start, start + length) of a file
 *
 * Yields exactly size() bytes and then end-of-data, even when the file
 * continues past the range. The file handle is closed when the stream is
 * destroyed, whether or not it was drained.
 */
class BoundedFileStream : public network::ByteSource {
public:
    BoundedFileStream(std::ifstream input, std::filesystem::path path,
                      std::uint64_t start, std::uint64_t length);

    BoundedFileStream(const BoundedFileStream&) = delete;
    BoundedFileStream& operator=(const BoundedFileStream&) = delete;

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t max_bytes) override;

    /**
     * @brief Seek back to `start` with the whole range unread
     *
     * Reopens the file when a fully drained stream already closed it.
     */
    Result<void> rewind() override;

    std::uint64_t size() const noexcept override { return length_; }
    std::uint64_t remaining() const noexcept { return remaining_; }
    std::uint64_t start() const noexcept { return start_; }

private:
    std::ifstream input_;
    std::filesystem::path path_;
    std::uint64_t start_ = 0;
    std::uint64_t length_ = 0;
    std::uint64_t remaining_ = 0;
};

class ByteRangeReader {
public:
    /**
     * @brief Open a bounded stream positioned at `start`
     *
     * Fails with ErrorKind::Integrity when the file cannot be opened, is
     * shorter than start + length, or the seek does not land on `start`.
     */
    static Result<std::unique_ptr<BoundedFileStream>> open_range(const std::filesystem::path& path,
                                                                 std::uint64_t start,
                                                                 std::uint64_t length);

    /**
     * @brief Read a whole file, checking the byte count against its reported size
     */
    static Result<std::vector<std::uint8_t>> read_all(const std::filesystem::path& path);

    static Result<std::uint64_t> file_size(const std::filesystem::path& path);
};

} // namespace stash::upload
