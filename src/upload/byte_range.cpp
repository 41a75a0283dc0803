#include "stash/upload/byte_range.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <system_error>

namespace stash::upload {
namespace fs = std::filesystem;

BoundedFileStream::BoundedFileStream(std::ifstream input, fs::path path,
                                     std::uint64_t start, std::uint64_t length)
    : input_(std::move(input)),
      path_(std::move(path)),
      start_(start),
      length_(length),
      remaining_(length) {}

Result<std::size_t> BoundedFileStream::read(std::uint8_t* buffer, std::size_t max_bytes) {
    if (remaining_ == 0 || max_bytes == 0) {
        return Ok(std::size_t{0});
    }

    const auto to_read = static_cast<std::size_t>(
        std::min<std::uint64_t>(remaining_, static_cast<std::uint64_t>(max_bytes)));

    input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(to_read));
    const auto count = static_cast<std::size_t>(input_.gcount());

    if (count == 0) {
        const auto offset = start_ + (length_ - remaining_);
        return Err<std::size_t>(Error::integrity(
            "Unexpected end of " + path_.string() + " at offset " + std::to_string(offset) +
            ", " + std::to_string(remaining_) + " bytes of the range unread"));
    }

    remaining_ -= count;
    if (remaining_ == 0) {
        input_.close();
    }
    return Ok(count);
}

Result<void> BoundedFileStream::rewind() {
    if (!input_.is_open()) {
        input_.open(path_, std::ios::binary);
        if (!input_) {
            return Err<void>(Error::integrity("Failed to reopen " + path_.string()));
        }
    }

    input_.clear();
    input_.seekg(static_cast<std::streamoff>(start_), std::ios::beg);
    if (!input_ || static_cast<std::uint64_t>(input_.tellg()) != start_) {
        return Err<void>(Error::integrity(
            "Failed to rewind to position " + std::to_string(start_) + " in " + path_.string()));
    }

    remaining_ = length_;
    return Ok();
}

Result<std::unique_ptr<BoundedFileStream>> ByteRangeReader::open_range(const fs::path& path,
                                                                      std::uint64_t start,
                                                                      std::uint64_t length) {
    auto size_result = file_size(path);
    if (size_result.is_error()) {
        return Err<std::unique_ptr<BoundedFileStream>>(size_result.error());
    }
    const auto available = size_result.value();

    if (start > available) {
        return Err<std::unique_ptr<BoundedFileStream>>(Error::integrity(
            "Failed to skip to position " + std::to_string(start) + " in " + path.string() +
            ", only " + std::to_string(available) + " bytes available"));
    }
    if (length > available - start) {
        return Err<std::unique_ptr<BoundedFileStream>>(Error::integrity(
            "Range [" + std::to_string(start) + ", " + std::to_string(start + length) +
            ") exceeds size of " + path.string() + " (" + std::to_string(available) + " bytes)"));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::unique_ptr<BoundedFileStream>>(
            Error::integrity("Failed to open " + path.string()));
    }

    if (start > static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max())) {
        return Err<std::unique_ptr<BoundedFileStream>>(
            Error::integrity("Offset " + std::to_string(start) + " is not addressable"));
    }

    input.seekg(static_cast<std::streamoff>(start), std::ios::beg);
    if (!input || static_cast<std::uint64_t>(input.tellg()) != start) {
        return Err<std::unique_ptr<BoundedFileStream>>(Error::integrity(
            "Failed to skip to position " + std::to_string(start) + " in " + path.string()));
    }

    return Ok(std::make_unique<BoundedFileStream>(std::move(input), path, start, length));
}

Result<std::vector<std::uint8_t>> ByteRangeReader::read_all(const fs::path& path) {
    auto size_result = file_size(path);
    if (size_result.is_error()) {
        return Err<std::vector<std::uint8_t>>(size_result.error());
    }
    const auto expected = size_result.value();

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(Error::integrity("Failed to open " + path.string()));
    }

    std::vector<std::uint8_t> data(static_cast<std::size_t>(expected));
    if (expected > 0) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(expected));
    }
    const auto count = static_cast<std::uint64_t>(input.gcount());

    // A file that grew after stat() is a mismatch too
    const bool has_more = input.peek() != std::ifstream::traits_type::eof();

    if (count != expected || has_more) {
        return Err<std::vector<std::uint8_t>>(Error::integrity(
            "File read mismatch for " + path.string() + ": expected " + std::to_string(expected) +
            " bytes, but read " + std::to_string(has_more ? count + 1 : count) +
            (has_more ? " or more" : "") + " bytes"));
    }

    return Ok(std::move(data));
}

Result<std::uint64_t> ByteRangeReader::file_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::uint64_t>(Error::integrity("Not a regular file: " + path.string()));
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::uint64_t>(Error::integrity(
            "Failed to stat " + path.string() + ": " + ec.message()));
    }
    return Ok(static_cast<std::uint64_t>(size));
}

} // namespace stash::upload
