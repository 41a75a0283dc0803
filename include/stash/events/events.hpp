/**
 * @file events.hpp
 * @brief Progress events emitted during one artifact upload
 *
 * NAMING CONVENTION:
 * Events are past tense (PartTransferredEvent) except the *StartedEvent
 * family, which announces work about to begin.
 *
 * All events carry the pending upload id once the plan is known; before
 * that it is empty.
 */

#pragma once

#include "stash/core/error.hpp"
#include "stash/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stash::events {

// ════════════════════════════════════════════════════════
// Planning
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted right before the plan request is sent
 *
 * WHO EMITS: UploadOrchestrator
 */
struct UploadPlanRequestedEvent {
    std::string primary_file;
    std::uint64_t primary_bytes;
    std::optional<std::string> expansion_file;
    std::chrono::system_clock::time_point timestamp;

    UploadPlanRequestedEvent(
        std::string primary,
        std::uint64_t bytes,
        std::optional<std::string> expansion = std::nullopt
    ) : primary_file(std::move(primary)),
        primary_bytes(bytes),
        expansion_file(std::move(expansion)),
        timestamp(std::chrono::system_clock::now())
    {}
};

struct UploadPlanReceivedEvent {
    std::string pending_upload_id;
    upload::TransferMode primary_mode;
    std::uint32_t primary_parts;
    bool has_expansion_plan;
    std::chrono::system_clock::time_point timestamp;

    UploadPlanReceivedEvent(
        std::string id,
        upload::TransferMode mode,
        std::uint32_t parts,
        bool expansion
    ) : pending_upload_id(std::move(id)),
        primary_mode(mode),
        primary_parts(parts),
        has_expansion_plan(expansion),
        timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Transfer
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per file before its first byte is sent
 *
 * part_count is 1 for direct transfers.
 */
struct FileTransferStartedEvent {
    std::string pending_upload_id;
    upload::FileRole role;
    upload::TransferMode mode;
    std::string file_path;
    std::uint64_t total_bytes;
    std::uint32_t part_count;
    std::chrono::system_clock::time_point timestamp;

    FileTransferStartedEvent(
        std::string id,
        upload::FileRole r,
        upload::TransferMode m,
        std::string path,
        std::uint64_t bytes,
        std::uint32_t parts
    ) : pending_upload_id(std::move(id)),
        role(r),
        mode(m),
        file_path(std::move(path)),
        total_bytes(bytes),
        part_count(parts),
        timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted before each chunk PUT, after its ticket was issued
 */
struct PartTransferStartedEvent {
    std::string pending_upload_id;
    upload::FileRole role;
    std::uint32_t part_number;
    std::uint32_t part_count;
    std::uint64_t start;
    std::uint64_t length;
};

struct PartTransferredEvent {
    std::string pending_upload_id;
    upload::FileRole role;
    std::uint32_t part_number;
    std::uint32_t part_count;
    std::uint64_t bytes;
    std::string etag;
};

struct FileTransferCompletedEvent {
    std::string pending_upload_id;
    upload::FileRole role;
    upload::TransferMode mode;
    std::string file_path;
    std::uint64_t total_bytes;
    std::chrono::milliseconds duration;
    std::chrono::system_clock::time_point timestamp;

    FileTransferCompletedEvent(
        std::string id,
        upload::FileRole r,
        upload::TransferMode m,
        std::string path,
        std::uint64_t bytes,
        std::chrono::milliseconds dur
    ) : pending_upload_id(std::move(id)),
        role(r),
        mode(m),
        file_path(std::move(path)),
        total_bytes(bytes),
        duration(dur),
        timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Outcome
// ════════════════════════════════════════════════════════

struct UploadVerifiedEvent {
    std::string pending_upload_id;
    upload::ArtifactRecord record;
    std::chrono::milliseconds duration;
};

/**
 * @brief Emitted exactly once when an upload invocation ends in Failed
 *
 * state is the state the upload was in when the error occurred.
 */
struct UploadFailedEvent {
    std::string pending_upload_id;
    upload::UploadState state;
    Error error;
};

} // namespace stash::events
