#pragma once

#include "stash/core/result.hpp"
#include "stash/upload/api_client.hpp"
#include "stash/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace stash::upload {

/**
 * @brief Name (last path component) and on-disk size of a file to upload
 *
 * A missing or non-regular file is ErrorKind::Validation: nothing has been
 * sent yet, so it is a problem with the caller's input.
 */
Result<FileDescriptor> describe_file(const std::filesystem::path& path);

/**
 * @brief A validated plan request, ready to send
 */
struct PreparedPlanRequest {
    FileDescriptor primary;
    std::optional<FileDescriptor> expansion;
    nlohmann::json body;
};

/**
 * PlanRequester
 *
 * Obtains the UploadPlan for an upload and, for chunked files, one
 * PartTransferTicket per part right before that part is sent.
 */
class PlanRequester {
public:
    explicit PlanRequester(ApiClient& api);

    /**
     * @brief Validate the API key and metadata and describe the files
     *
     * Makes no network call. Every ErrorKind::Validation failure of an
     * upload comes from here.
     */
    Result<PreparedPlanRequest> prepare_plan(const UploadMetadata& metadata) const;

    // POST /upload/request with a prepared body
    Result<UploadPlan> send_plan(const PreparedPlanRequest& request);

    /**
     * @brief prepare_plan() followed by send_plan()
     */
    Result<UploadPlan> request_plan(const UploadMetadata& metadata);

    /**
     * @brief POST the multipart endpoint for `role` and return the part URL
     */
    Result<PartTransferTicket> request_part_ticket(FileRole role,
                                                   const std::string& pending_upload_id,
                                                   std::uint32_t part_number,
                                                   std::uint64_t content_length);

private:
    ApiClient& api_;
};

} // namespace stash::upload
