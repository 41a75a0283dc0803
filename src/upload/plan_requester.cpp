#include "stash/upload/plan_requester.hpp"

#include "stash/upload/metadata.hpp"
#include "stash/upload/wire.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace stash::upload {
namespace fs = std::filesystem;

Result<FileDescriptor> describe_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Err<FileDescriptor>(Error::validation("File not found: " + path.string()));
    }
    if (!fs::is_regular_file(path, ec)) {
        return Err<FileDescriptor>(Error::validation("Not a regular file: " + path.string()));
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<FileDescriptor>(Error::validation(
            "Cannot read size of " + path.string() + ": " + ec.message()));
    }

    FileDescriptor descriptor;
    descriptor.filename = path.filename().string();
    descriptor.size_bytes = static_cast<std::uint64_t>(size);
    return Ok(std::move(descriptor));
}

PlanRequester::PlanRequester(ApiClient& api) : api_(api) {}

Result<PreparedPlanRequest> PlanRequester::prepare_plan(const UploadMetadata& metadata) const {
    auto key_check = validate_api_key(api_.config().api_key);
    if (key_check.is_error()) {
        return Err<PreparedPlanRequest>(key_check.error());
    }
    auto metadata_check = validate_metadata(metadata);
    if (metadata_check.is_error()) {
        return Err<PreparedPlanRequest>(metadata_check.error());
    }

    auto primary = describe_file(metadata.primary_file_path);
    if (primary.is_error()) {
        return Err<PreparedPlanRequest>(primary.error());
    }

    PreparedPlanRequest prepared;
    prepared.primary = std::move(primary.value());
    if (metadata.expansion_file_path) {
        auto described = describe_file(*metadata.expansion_file_path);
        if (described.is_error()) {
            return Err<PreparedPlanRequest>(described.error());
        }
        prepared.expansion = std::move(described.value());
    }

    prepared.body = wire::plan_request(metadata, prepared.primary, prepared.expansion);
    return Ok(std::move(prepared));
}

Result<UploadPlan> PlanRequester::send_plan(const PreparedPlanRequest& request) {
    spdlog::debug("Requesting upload plan for {} ({} bytes)",
                  request.primary.filename, request.primary.size_bytes);

    auto response = api_.post_json(endpoints::kUploadRequest, request.body, "request upload");
    if (response.is_error()) {
        return Err<UploadPlan>(response.error());
    }

    return wire::parse_upload_plan(response.value().body_as_string());
}

Result<UploadPlan> PlanRequester::request_plan(const UploadMetadata& metadata) {
    auto prepared = prepare_plan(metadata);
    if (prepared.is_error()) {
        return Err<UploadPlan>(prepared.error());
    }
    return send_plan(prepared.value());
}

Result<PartTransferTicket> PlanRequester::request_part_ticket(FileRole role,
                                                              const std::string& pending_upload_id,
                                                              std::uint32_t part_number,
                                                              std::uint64_t content_length) {
    const char* endpoint = role == FileRole::Expansion ? endpoints::kExpansionPartRequest
                                                       : endpoints::kPartRequest;

    auto response = api_.post_json(endpoint,
                                   wire::part_ticket_request(pending_upload_id, part_number, content_length),
                                   "get presigned URL for part " + std::to_string(part_number));
    if (response.is_error()) {
        auto error = response.error();
        error.part_number = part_number;
        return Err<PartTransferTicket>(std::move(error));
    }

    auto url = wire::parse_part_ticket_url(response.value().body_as_string());
    if (url.is_error()) {
        auto error = url.error();
        error.part_number = part_number;
        return Err<PartTransferTicket>(std::move(error));
    }

    PartTransferTicket ticket;
    ticket.part_number = part_number;
    ticket.content_length = content_length;
    ticket.url = std::move(url.value());
    return Ok(std::move(ticket));
}

} // namespace stash::upload
