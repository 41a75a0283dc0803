#include "stash/core/error.hpp"

#include <sstream>
#include <utility>

namespace stash {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::UnexpectedContentType: return "UnexpectedContentTypeError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::StorageTransfer: return "StorageTransferError";
    }
    return "UnknownError";
}

std::string Error::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message;

    if (status_code != 0 || part_number != 0) {
        oss << " (";
        if (status_code != 0) {
            oss << "status=" << status_code;
        }
        if (part_number != 0) {
            oss << (status_code != 0 ? ", " : "") << "part=" << part_number;
        }
        oss << ")";
    }

    if (!body.empty()) {
        oss << " body=" << body;
    }
    return oss.str();
}

Error Error::validation(std::string message) {
    Error error;
    error.kind = ErrorKind::Validation;
    error.message = std::move(message);
    return error;
}

Error Error::transport(std::string message) {
    Error error;
    error.kind = ErrorKind::Transport;
    error.message = std::move(message);
    return error;
}

Error Error::protocol(std::string message, int status_code, std::string body) {
    Error error;
    error.kind = ErrorKind::Protocol;
    error.message = std::move(message);
    error.status_code = status_code;
    error.body = std::move(body);
    return error;
}

Error Error::unexpected_content_type(std::string message, int status_code, std::string body) {
    Error error;
    error.kind = ErrorKind::UnexpectedContentType;
    error.message = std::move(message);
    error.status_code = status_code;
    error.body = std::move(body);
    return error;
}

Error Error::integrity(std::string message) {
    Error error;
    error.kind = ErrorKind::Integrity;
    error.message = std::move(message);
    return error;
}

Error Error::storage_transfer(std::string message, int status_code, std::string body,
                              std::uint32_t part_number) {
    Error error;
    error.kind = ErrorKind::StorageTransfer;
    error.message = std::move(message);
    error.status_code = status_code;
    error.body = std::move(body);
    error.part_number = part_number;
    return error;
}

} // namespace stash
