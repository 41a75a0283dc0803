#include "stash/upload/types.hpp"

namespace stash::upload {

const char* to_string(FileRole role) noexcept {
    switch (role) {
        case FileRole::Primary: return "primary";
        case FileRole::Expansion: return "expansion";
    }
    return "unknown";
}

const char* to_string(TransferMode mode) noexcept {
    switch (mode) {
        case TransferMode::Direct: return "direct";
        case TransferMode::Chunked: return "chunked";
    }
    return "unknown";
}

const char* to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Planning: return "Planning";
        case UploadState::TransferringPrimary: return "TransferringPrimary";
        case UploadState::TransferringExpansion: return "TransferringExpansion";
        case UploadState::Verifying: return "Verifying";
        case UploadState::Done: return "Done";
        case UploadState::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace stash::upload
