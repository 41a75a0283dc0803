#pragma once

#include "stash/core/result.hpp"
#include "stash/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stash::upload {

struct UploadSessionInfo {
    UploadState state = UploadState::Planning;
    std::string pending_upload_id;
    std::string primary_file;
    std::uint32_t files_transferred = 0;
    std::uint64_t bytes_transferred = 0;
    std::optional<Error> last_error;
    std::chrono::system_clock::time_point started_at{};
};

/**
 * UploadSession
 *
 * State of one upload invocation:
 *
 *   Planning -> TransferringPrimary -> [TransferringExpansion] -> Verifying -> Done
 *
 * Failed is reachable from every non-terminal state. Done and Failed are
 * terminal; a new attempt needs a new session.
 */
class UploadSession {
public:
    explicit UploadSession(std::string primary_file);

    [[nodiscard]] UploadState state() const noexcept { return info_.state; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return info_.state == UploadState::Done || info_.state == UploadState::Failed;
    }

    stash::Result<void> transition_to(UploadState next_state);
    stash::Result<void> mark_failed(Error error);

    void set_pending_upload_id(std::string pending_upload_id);
    void record_transfer(const FileTransferOutcome& outcome);

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(UploadState target) const noexcept;

    UploadSessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace stash::upload
