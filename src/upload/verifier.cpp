#include "stash/upload/verifier.hpp"

#include "stash/upload/wire.hpp"

#include <spdlog/spdlog.h>

namespace stash::upload {

UploadVerifier::UploadVerifier(ApiClient& api) : api_(api) {}

Result<ArtifactRecord> UploadVerifier::verify(const std::string& pending_upload_id,
                                              const std::vector<FinishedPartReceipt>& primary_receipts,
                                              const std::vector<FinishedPartReceipt>& expansion_receipts) {
    const bool with_receipts = api_.config().send_part_receipts;
    const auto body = with_receipts
        ? wire::verify_request(pending_upload_id, &primary_receipts, &expansion_receipts)
        : wire::verify_request(pending_upload_id);

    spdlog::debug("Verifying upload {} ({} primary / {} expansion receipts{})",
                  pending_upload_id, primary_receipts.size(), expansion_receipts.size(),
                  with_receipts ? "" : ", not sent");

    auto response = api_.post_json(endpoints::kUploadVerify, body, "verify upload");
    if (response.is_error()) {
        return Err<ArtifactRecord>(response.error());
    }

    return wire::parse_artifact_record(response.value().body_as_string());
}

} // namespace stash::upload
