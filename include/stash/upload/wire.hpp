#pragma once

#include "stash/core/result.hpp"
#include "stash/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/*
  JSON shapes exchanged with the artifact API.

  Requests are built as nlohmann::json values; responses are parsed from the
  raw body. Parse failures and missing required fields come back as
  ErrorKind::Protocol with the raw body attached.
*/
namespace stash::upload::wire {

nlohmann::json plan_request(const UploadMetadata& metadata,
                            const FileDescriptor& primary,
                            const std::optional<FileDescriptor>& expansion);

Result<UploadPlan> parse_upload_plan(const std::string& body);

nlohmann::json part_ticket_request(const std::string& pending_upload_id,
                                   std::uint32_t part_number,
                                   std::uint64_t content_length);

Result<std::string> parse_part_ticket_url(const std::string& body);

nlohmann::json verify_request(const std::string& pending_upload_id,
                              const std::vector<FinishedPartReceipt>* primary_parts = nullptr,
                              const std::vector<FinishedPartReceipt>* expansion_parts = nullptr);

Result<ArtifactRecord> parse_artifact_record(const std::string& body);

nlohmann::json artifact_record_to_json(const ArtifactRecord& record);

} // namespace stash::upload::wire
