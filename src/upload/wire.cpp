#include "stash/upload/wire.hpp"

#include <filesystem>
#include <limits>

namespace stash::upload::wire {
using json = nlohmann::json;

namespace {

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

void put_optional(json& j, const char* key, const std::optional<std::vector<std::string>>& value) {
    if (value) {
        j[key] = *value;
    }
}

json file_descriptor_to_json(const FileDescriptor& file) {
    return json{{"filename", file.filename}, {"size_bytes", file.size_bytes}};
}

// Scalars are accepted in string or numeric form; null and missing are absent
std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number() || it->is_boolean()) {
        return it->dump();
    }
    throw json::type_error::create(302, std::string("field '") + key + "' must be a string", &j);
}

bool optional_bool(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<bool>();
}

std::uint32_t positive_count(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        throw json::type_error::create(302, std::string("field '") + key + "' must be an integer", &j);
    }
    const auto value = it->get<std::int64_t>();
    if (value <= 0 || value > std::numeric_limits<std::uint32_t>::max()) {
        throw json::out_of_range::create(406, std::string("field '") + key + "' out of range", &j);
    }
    return static_cast<std::uint32_t>(value);
}

network::HeaderMap parse_headers(const json& j) {
    network::HeaderMap headers;
    if (!j.is_object()) {
        return headers;
    }
    for (const auto& [name, value] : j.items()) {
        if (value.is_string()) {
            headers[name] = value.get<std::string>();
        } else if (value.is_array() && !value.empty() && value.front().is_string()) {
            headers[name] = value.front().get<std::string>();
        } else if (value.is_number() || value.is_boolean()) {
            headers[name] = value.dump();
        }
    }
    return headers;
}

FileTransferPlan parse_file_plan(const json& j) {
    if (!j.is_object()) {
        throw json::type_error::create(302, "file plan must be an object", &j);
    }

    FileTransferPlan plan;
    plan.chunked = j.contains("chunked_upload") ? optional_bool(j, "chunked_upload", false)
                                                : optional_bool(j, "chunked", false);

    if (plan.chunked) {
        plan.part_size_mb = positive_count(j, "chunked_part_size_mb");
        plan.part_count = positive_count(j, "chunked_number_parts");
        return plan;
    }

    auto presigned = j.find("presigned_data");
    if (presigned != j.end() && presigned->is_object()) {
        plan.presigned.url = optional_string(*presigned, "url").value_or("");
        if (auto headers = presigned->find("headers"); headers != presigned->end()) {
            plan.presigned.headers = parse_headers(*headers);
        }
    }
    return plan;
}

template<typename T>
Result<T> parse_failure(const std::string& what, const std::string& body) {
    return Err<T>(Error::protocol("Failed to parse JSON response: " + what, 200, body));
}

} // namespace

json plan_request(const UploadMetadata& metadata,
                  const FileDescriptor& primary,
                  const std::optional<FileDescriptor>& expansion) {
    json j;
    j["structure"] = metadata.structure.empty() ? std::string(kDefaultStructure) : metadata.structure;
    j["primary_file"] = file_descriptor_to_json(primary);
    if (expansion) {
        j["expansion_files"] = json::array({file_descriptor_to_json(*expansion)});
    }

    j["version_component_1_major"] = metadata.version_major;
    j["version_component_2_minor"] = metadata.version_minor;
    j["version_component_3_patch"] = metadata.version_patch;
    put_optional(j, "version_component_extra", metadata.version_extra);
    put_optional(j, "version_component_meta", metadata.version_meta);
    put_optional(j, "custom_build_number", metadata.custom_build_number);

    j["platform"] = metadata.platform;
    j["stream"] = metadata.stream;
    put_optional(j, "notes", metadata.notes);
    put_optional(j, "labels", metadata.labels);
    put_optional(j, "architectures", metadata.architectures);

    put_optional(j, "source", metadata.source);
    put_optional(j, "ci_pipeline", metadata.ci_pipeline);
    put_optional(j, "ci_run_id", metadata.ci_run_id);
    put_optional(j, "ci_run_url", metadata.ci_run_url);
    put_optional(j, "ci_pipeline_url", metadata.ci_pipeline_url);
    put_optional(j, "ci_build_duration", metadata.ci_build_duration);

    put_optional(j, "vc_host_type", metadata.vc_host_type);
    put_optional(j, "vc_host", metadata.vc_host);
    put_optional(j, "vc_repo_name", metadata.vc_repo_name);
    put_optional(j, "vc_repo_url", metadata.vc_repo_url);
    put_optional(j, "vc_branch", metadata.vc_branch);
    put_optional(j, "vc_commit_sha", metadata.vc_commit_sha);
    put_optional(j, "vc_commit_url", metadata.vc_commit_url);
    return j;
}

Result<UploadPlan> parse_upload_plan(const std::string& body) {
    auto payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return parse_failure<UploadPlan>("upload plan is not a JSON object", body);
    }

    try {
        UploadPlan plan;
        plan.pending_upload_id = optional_string(payload, "pending_upload_id").value_or("");
        if (plan.pending_upload_id.empty()) {
            return parse_failure<UploadPlan>("missing pending_upload_id", body);
        }

        auto primary = payload.find("primary_file");
        if (primary == payload.end()) {
            return parse_failure<UploadPlan>("missing primary_file", body);
        }
        plan.primary = parse_file_plan(*primary);

        auto expansion = payload.find("expansion_files");
        if (expansion != payload.end() && expansion->is_array() && !expansion->empty()) {
            plan.expansion = parse_file_plan(expansion->front());
        }
        return Ok(std::move(plan));
    } catch (const json::exception& e) {
        return parse_failure<UploadPlan>(e.what(), body);
    }
}

json part_ticket_request(const std::string& pending_upload_id,
                         std::uint32_t part_number,
                         std::uint64_t content_length) {
    return json{
        {"pending_upload_id", pending_upload_id},
        {"part_number", part_number},
        {"content_length", content_length}
    };
}

Result<std::string> parse_part_ticket_url(const std::string& body) {
    auto payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return parse_failure<std::string>("part ticket is not a JSON object", body);
    }

    try {
        auto url = optional_string(payload, "part_presigned_url").value_or("");
        if (url.empty()) {
            return parse_failure<std::string>("missing part_presigned_url", body);
        }
        return Ok(std::move(url));
    } catch (const json::exception& e) {
        return parse_failure<std::string>(e.what(), body);
    }
}

json verify_request(const std::string& pending_upload_id,
                    const std::vector<FinishedPartReceipt>* primary_parts,
                    const std::vector<FinishedPartReceipt>* expansion_parts) {
    json j{{"pending_upload_id", pending_upload_id}};

    auto parts_to_json = [](const std::vector<FinishedPartReceipt>& parts) {
        json arr = json::array();
        for (const auto& part : parts) {
            arr.push_back(json{{"part_number", part.part_number}, {"etag", part.etag}});
        }
        return arr;
    };

    if (primary_parts != nullptr && !primary_parts->empty()) {
        j["primary_file_parts"] = parts_to_json(*primary_parts);
    }
    if (expansion_parts != nullptr && !expansion_parts->empty()) {
        j["expansion_file_parts"] = parts_to_json(*expansion_parts);
    }
    return j;
}

Result<ArtifactRecord> parse_artifact_record(const std::string& body) {
    auto payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return parse_failure<ArtifactRecord>("verify response is not a JSON object", body);
    }

    try {
        ArtifactRecord record;
        record.message = optional_string(payload, "message").value_or("");
        record.build_id = optional_string(payload, "build_id").value_or("");
        record.pending_processing = optional_bool(payload, "pending_processing", false);
        record.build_info_url = optional_string(payload, "build_info_url").value_or("");
        record.download_url = optional_string(payload, "download_url").value_or("");

        auto build = payload.find("build");
        if (build != payload.end() && build->is_object()) {
            auto platform = build->find("platform");
            if (platform != build->end() && platform->is_object()) {
                record.platform_short_name = optional_string(*platform, "short_name");
            }
        }
        return Ok(std::move(record));
    } catch (const json::exception& e) {
        return parse_failure<ArtifactRecord>(e.what(), body);
    }
}

json artifact_record_to_json(const ArtifactRecord& record) {
    json j;
    j["message"] = record.message;
    j["build_id"] = record.build_id;
    j["pending_processing"] = record.pending_processing;
    j["build_info_url"] = record.build_info_url;
    j["download_url"] = record.download_url;
    if (record.platform_short_name) {
        j["platform_short_name"] = *record.platform_short_name;
    } else {
        j["platform_short_name"] = nullptr;
    }
    return j;
}

} // namespace stash::upload::wire
