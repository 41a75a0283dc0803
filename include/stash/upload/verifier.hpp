#pragma once

#include "stash/core/result.hpp"
#include "stash/upload/api_client.hpp"
#include "stash/upload/types.hpp"

#include <string>
#include <vector>

namespace stash::upload {

/**
 * UploadVerifier
 *
 * Final step of an upload: tells the API that every byte is in storage and
 * returns the ArtifactRecord it created. Part receipts are attached only
 * when ApiConfig::send_part_receipts is set.
 */
class UploadVerifier {
public:
    explicit UploadVerifier(ApiClient& api);

    Result<ArtifactRecord> verify(const std::string& pending_upload_id,
                                  const std::vector<FinishedPartReceipt>& primary_receipts = {},
                                  const std::vector<FinishedPartReceipt>& expansion_receipts = {});

private:
    ApiClient& api_;
};

} // namespace stash::upload
