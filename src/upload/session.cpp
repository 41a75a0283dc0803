#include "stash/upload/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace stash::upload {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Planning, {UploadState::TransferringPrimary}},
        {UploadState::TransferringPrimary, {UploadState::TransferringExpansion, UploadState::Verifying}},
        {UploadState::TransferringExpansion, {UploadState::Verifying}},
        {UploadState::Verifying, {UploadState::Done}},
    };

    if (target == UploadState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

UploadSession::UploadSession(std::string primary_file) {
    info_.primary_file = std::move(primary_file);
    info_.state = UploadState::Planning;
    info_.started_at = std::chrono::system_clock::now();
    last_transition_ = info_.started_at;
}

stash::Result<void> UploadSession::transition_to(UploadState next_state) {
    if (info_.state == next_state) {
        return stash::Ok();
    }

    if (!can_transition(next_state)) {
        return stash::Err<void>(Error::protocol(
            std::string("Illegal upload state transition: ") + to_string(info_.state) +
            " -> " + to_string(next_state)));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    return stash::Ok();
}

stash::Result<void> UploadSession::mark_failed(Error error) {
    if (is_terminal() && info_.state != UploadState::Failed) {
        return stash::Err<void>(Error::protocol("Cannot fail an upload that already finished"));
    }
    info_.last_error = std::move(error);
    return transition_to(UploadState::Failed);
}

void UploadSession::set_pending_upload_id(std::string pending_upload_id) {
    info_.pending_upload_id = std::move(pending_upload_id);
}

void UploadSession::record_transfer(const FileTransferOutcome& outcome) {
    info_.files_transferred++;
    info_.bytes_transferred += outcome.bytes_transferred;
}

bool UploadSession::can_transition(UploadState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace stash::upload
