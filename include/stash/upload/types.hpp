#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stash/network/http_types.hpp"

namespace stash::upload {

inline constexpr const char* kDefaultStructure = "file";

/**
 * @brief Which file of an upload a transfer belongs to
 *
 * Expansion parts are tracked by a separate multipart endpoint on the server.
 */
enum class FileRole {
    Primary,
    Expansion
};

enum class TransferMode {
    Direct,
    Chunked
};

enum class UploadState {
    Planning,
    TransferringPrimary,
    TransferringExpansion,
    Verifying,
    Done,
    Failed
};

const char* to_string(FileRole role) noexcept;
const char* to_string(TransferMode mode) noexcept;
const char* to_string(UploadState state) noexcept;

/**
 * @brief Everything the service needs to know about one artifact upload
 *
 * Built once per attempt by the caller. Optional values that are absent are
 * omitted from the wire request; the engine never fills them in.
 */
struct UploadMetadata {
    std::string structure = kDefaultStructure;
    std::string primary_file_path;
    std::optional<std::string> expansion_file_path;

    std::string version_major;
    std::string version_minor;
    std::string version_patch;
    std::optional<std::string> version_extra;
    std::optional<std::string> version_meta;
    std::optional<std::string> custom_build_number;

    std::string platform;
    std::string stream;
    std::optional<std::string> notes;
    std::optional<std::vector<std::string>> labels;
    std::optional<std::vector<std::string>> architectures;

    // CI attribution
    std::optional<std::string> source;
    std::optional<std::string> ci_pipeline;
    std::optional<std::string> ci_run_id;
    std::optional<std::string> ci_run_url;
    std::optional<std::string> ci_pipeline_url;
    std::optional<std::string> ci_build_duration; ///< HH:MM:SS

    // Version-control attribution
    std::optional<std::string> vc_host_type;
    std::optional<std::string> vc_host;
    std::optional<std::string> vc_repo_name;
    std::optional<std::string> vc_repo_url;
    std::optional<std::string> vc_branch;
    std::optional<std::string> vc_commit_sha;
    std::optional<std::string> vc_commit_url;
};

/**
 * @brief Name and size of a file as announced in the plan request
 */
struct FileDescriptor {
    std::string filename;
    std::uint64_t size_bytes = 0;
};

/**
 * @brief Presigned destination for a direct transfer
 *
 * headers holds exactly what the server sent; nothing is added locally.
 */
struct PresignedData {
    std::string url;
    network::HeaderMap headers;
};

struct FileTransferPlan {
    bool chunked = false;
    PresignedData presigned;          ///< Direct transfers only
    std::uint32_t part_size_mb = 0;   ///< Chunked transfers only
    std::uint32_t part_count = 0;     ///< Chunked transfers only

    std::uint64_t part_size_bytes() const noexcept {
        return static_cast<std::uint64_t>(part_size_mb) * 1024u * 1024u;
    }
};

struct UploadPlan {
    std::string pending_upload_id;
    FileTransferPlan primary;
    std::optional<FileTransferPlan> expansion;
};

/**
 * @brief Single-use destination for one chunk; requested right before its PUT
 */
struct PartTransferTicket {
    std::uint32_t part_number = 0;
    std::uint64_t content_length = 0;
    std::string url;
};

/**
 * @brief Proof that a chunk reached storage (ETag of the part PUT, may be empty)
 */
struct FinishedPartReceipt {
    std::uint32_t part_number = 0;
    std::string etag;
};

/**
 * @brief Result of transferring one file
 */
struct FileTransferOutcome {
    FileRole role = FileRole::Primary;
    TransferMode mode = TransferMode::Direct;
    std::uint64_t bytes_transferred = 0;
    std::vector<FinishedPartReceipt> receipts; ///< Chunked only, in part order
};

/**
 * @brief Terminal record returned by the verify call
 */
struct ArtifactRecord {
    std::string message;
    std::string build_id;
    bool pending_processing = false;
    std::string build_info_url;
    std::string download_url;
    std::optional<std::string> platform_short_name;
};

} // namespace stash::upload
