#pragma once

#include <cstdint>
#include <string>

namespace stash {

/**
 * @brief Failure categories surfaced by the upload engine
 *
 * Every kind is fatal to the current upload invocation. Nothing is retried
 * inside the engine.
 */
enum class ErrorKind {
    Validation,            ///< Required metadata missing or blank (before any network call)
    Transport,             ///< Connection, timeout, redirect or malformed-response failure
    Protocol,              ///< Non-200 or unparseable response from the artifact API
    UnexpectedContentType, ///< Artifact API answered with something other than JSON
    Integrity,             ///< Byte count or byte-range position does not match the file
    StorageTransfer        ///< Non-200 from a presigned storage PUT
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Error value carried through stash::Result
 *
 * status_code, body and part_number are zero/empty when they do not apply.
 * The body is kept verbatim so operators can read server-side rejections.
 */
struct Error {
    ErrorKind kind = ErrorKind::Protocol;
    std::string message;
    int status_code = 0;
    std::string body;
    std::uint32_t part_number = 0;

    /**
     * @brief Single-line rendering: "<kind>: <message> (status=..., part=...) body=..."
     */
    std::string describe() const;

    static Error validation(std::string message);
    static Error transport(std::string message);
    static Error protocol(std::string message, int status_code = 0, std::string body = {});
    static Error unexpected_content_type(std::string message, int status_code, std::string body);
    static Error integrity(std::string message);
    static Error storage_transfer(std::string message, int status_code, std::string body,
                                  std::uint32_t part_number = 0);
};

} // namespace stash
