#pragma once

#include "stash/core/result.hpp"
#include "stash/events/event_bus.hpp"
#include "stash/network/transport.hpp"
#include "stash/upload/plan_requester.hpp"
#include "stash/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace stash::upload {

/**
 * @brief Byte range [start, start + length) of one chunked part
 */
struct PartRange {
    std::uint32_t part_number = 0;
    std::uint64_t start = 0;
    std::uint64_t length = 0;
};

/**
 * @brief Range of part `part_number` (1-based) for a file of `file_size` bytes
 *
 * start = (n-1) * part_size, end = min(n * part_size - 1, file_size - 1).
 * Callers validate the plan with check_chunk_plan() first.
 */
PartRange part_range(std::uint32_t part_number, std::uint64_t part_size, std::uint64_t file_size);

/**
 * @brief Reject plans that cannot cover the file or contain an empty part
 *
 * ErrorKind::Protocol, since the plan came from the server.
 */
Result<void> check_chunk_plan(const FileTransferPlan& plan, std::uint64_t file_size);

/**
 * FileTransferExecutor
 *
 * Moves the bytes of one file to storage according to its FileTransferPlan.
 *
 * Direct: whole file in one PUT to the presigned URL, carrying only the
 * Content-Type, Content-Disposition and x-amz-acl headers the server supplied.
 *
 * Chunked: parts 1..N strictly in order, one at a time. Each part gets a fresh
 * ticket, then its byte range is streamed as application/octet-stream. The
 * first failed part aborts the file; earlier parts are not rolled back.
 */
class FileTransferExecutor {
public:
    FileTransferExecutor(network::Transport& transport, PlanRequester& requester,
                         events::EventBus& bus);

    Result<FileTransferOutcome> transfer(const std::filesystem::path& path,
                                         const FileTransferPlan& plan,
                                         const std::string& pending_upload_id,
                                         FileRole role);

private:
    Result<FileTransferOutcome> transfer_direct(const std::filesystem::path& path,
                                                const FileTransferPlan& plan,
                                                const std::string& pending_upload_id,
                                                FileRole role);

    Result<FileTransferOutcome> transfer_chunked(const std::filesystem::path& path,
                                                 const FileTransferPlan& plan,
                                                 const std::string& pending_upload_id,
                                                 FileRole role);

    Result<FinishedPartReceipt> transfer_part(const std::filesystem::path& path,
                                              const PartRange& range,
                                              std::uint32_t part_count,
                                              const std::string& pending_upload_id,
                                              FileRole role);

    network::Transport& transport_;
    PlanRequester& requester_;
    events::EventBus& bus_;
};

} // namespace stash::upload
