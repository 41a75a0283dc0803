#include "stash/upload/file_transfer.hpp"

#include "stash/events/events.hpp"
#include "stash/upload/byte_range.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>

namespace stash::upload {
namespace fs = std::filesystem;

namespace {

// The only presigned headers forwarded on a direct PUT
constexpr std::array<const char*, 3> kForwardedHeaders = {
    "Content-Type",
    "Content-Disposition",
    "x-amz-acl",
};

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

PartRange part_range(std::uint32_t part_number, std::uint64_t part_size, std::uint64_t file_size) {
    PartRange range;
    range.part_number = part_number;
    range.start = static_cast<std::uint64_t>(part_number - 1) * part_size;
    const std::uint64_t end = std::min(range.start + part_size - 1, file_size - 1);
    range.length = end - range.start + 1;
    return range;
}

Result<void> check_chunk_plan(const FileTransferPlan& plan, std::uint64_t file_size) {
    const std::uint64_t part_size = plan.part_size_bytes();
    if (part_size == 0 || plan.part_count == 0) {
        return Err<void>(Error::protocol("Chunked plan has no parts or a zero part size"));
    }
    if (file_size == 0) {
        return Err<void>(Error::protocol("Chunked plan for an empty file"));
    }

    const std::uint64_t needed = file_size / part_size + (file_size % part_size != 0 ? 1 : 0);
    if (plan.part_count < needed) {
        return Err<void>(Error::protocol(
            "Chunked plan covers " + std::to_string(plan.part_count) + " part(s) of " +
            std::to_string(plan.part_size_mb) + " MB but the file needs " + std::to_string(needed)));
    }
    if (plan.part_count > needed) {
        return Err<void>(Error::protocol(
            "Chunked plan has " + std::to_string(plan.part_count) + " parts; part " +
            std::to_string(needed + 1) + " would be empty"));
    }
    return Ok();
}

FileTransferExecutor::FileTransferExecutor(network::Transport& transport,
                                           PlanRequester& requester,
                                           events::EventBus& bus)
    : transport_(transport),
      requester_(requester),
      bus_(bus) {}

Result<FileTransferOutcome> FileTransferExecutor::transfer(const fs::path& path,
                                                           const FileTransferPlan& plan,
                                                           const std::string& pending_upload_id,
                                                           FileRole role) {
    if (plan.chunked) {
        return transfer_chunked(path, plan, pending_upload_id, role);
    }
    return transfer_direct(path, plan, pending_upload_id, role);
}

Result<FileTransferOutcome> FileTransferExecutor::transfer_direct(const fs::path& path,
                                                                  const FileTransferPlan& plan,
                                                                  const std::string& pending_upload_id,
                                                                  FileRole role) {
    if (plan.presigned.url.empty()) {
        return Err<FileTransferOutcome>(Error::protocol(
            "Presigned URL is missing from the upload plan for the " +
            std::string(to_string(role)) + " file"));
    }

    auto data = ByteRangeReader::read_all(path);
    if (data.is_error()) {
        return Err<FileTransferOutcome>(data.error());
    }
    const auto total_bytes = static_cast<std::uint64_t>(data.value().size());

    bus_.emit(events::FileTransferStartedEvent{
        pending_upload_id, role, TransferMode::Direct, path.string(), total_bytes, 1});
    const auto started = std::chrono::steady_clock::now();

    network::HttpRequest request;
    request.method = network::HttpMethod::PUT;
    request.url = plan.presigned.url;
    for (const char* name : kForwardedHeaders) {
        const auto* value = network::detail::find_header(plan.presigned.headers, name);
        if (value != nullptr) {
            request.set_header(name, *value);
        }
    }
    request.body = std::move(data.value());

    auto sent = transport_.send(request);
    if (sent.is_error()) {
        return Err<FileTransferOutcome>(sent.error());
    }

    const auto& response = sent.value();
    if (response.status_code != 200) {
        const auto body = response.body_as_string();
        spdlog::error("Direct upload of {} failed: {} - {}", path.string(), response.status_code, body);
        return Err<FileTransferOutcome>(Error::storage_transfer(
            "Failed to upload " + std::string(to_string(role)) + " file: " +
                std::to_string(response.status_code) + " - " + body,
            response.status_code, body));
    }

    bus_.emit(events::FileTransferCompletedEvent{
        pending_upload_id, role, TransferMode::Direct, path.string(), total_bytes,
        elapsed_since(started)});

    FileTransferOutcome outcome;
    outcome.role = role;
    outcome.mode = TransferMode::Direct;
    outcome.bytes_transferred = total_bytes;
    return Ok(std::move(outcome));
}

Result<FileTransferOutcome> FileTransferExecutor::transfer_chunked(const fs::path& path,
                                                                   const FileTransferPlan& plan,
                                                                   const std::string& pending_upload_id,
                                                                   FileRole role) {
    auto size = ByteRangeReader::file_size(path);
    if (size.is_error()) {
        return Err<FileTransferOutcome>(size.error());
    }
    const std::uint64_t file_size = size.value();

    auto plan_check = check_chunk_plan(plan, file_size);
    if (plan_check.is_error()) {
        spdlog::error("Rejecting chunk plan for {}: {}", path.string(), plan_check.error().message);
        return Err<FileTransferOutcome>(plan_check.error());
    }

    bus_.emit(events::FileTransferStartedEvent{
        pending_upload_id, role, TransferMode::Chunked, path.string(), file_size, plan.part_count});
    const auto started = std::chrono::steady_clock::now();

    FileTransferOutcome outcome;
    outcome.role = role;
    outcome.mode = TransferMode::Chunked;
    outcome.receipts.reserve(plan.part_count);

    for (std::uint32_t part_number = 1; part_number <= plan.part_count; ++part_number) {
        const auto range = part_range(part_number, plan.part_size_bytes(), file_size);

        auto receipt = transfer_part(path, range, plan.part_count, pending_upload_id, role);
        if (receipt.is_error()) {
            return Err<FileTransferOutcome>(receipt.error());
        }
        outcome.bytes_transferred += range.length;
        outcome.receipts.push_back(std::move(receipt.value()));
    }

    bus_.emit(events::FileTransferCompletedEvent{
        pending_upload_id, role, TransferMode::Chunked, path.string(), outcome.bytes_transferred,
        elapsed_since(started)});

    return Ok(std::move(outcome));
}

Result<FinishedPartReceipt> FileTransferExecutor::transfer_part(const fs::path& path,
                                                                const PartRange& range,
                                                                std::uint32_t part_count,
                                                                const std::string& pending_upload_id,
                                                                FileRole role) {
    auto ticket = requester_.request_part_ticket(role, pending_upload_id, range.part_number, range.length);
    if (ticket.is_error()) {
        return Err<FinishedPartReceipt>(ticket.error());
    }

    bus_.emit(events::PartTransferStartedEvent{
        pending_upload_id, role, range.part_number, part_count, range.start, range.length});

    // Scoped to this part: the file handle closes on every path out
    auto stream = ByteRangeReader::open_range(path, range.start, range.length);
    if (stream.is_error()) {
        auto error = stream.error();
        error.part_number = range.part_number;
        return Err<FinishedPartReceipt>(std::move(error));
    }

    network::HttpRequest request;
    request.method = network::HttpMethod::PUT;
    request.url = ticket.value().url;
    request.set_header("Content-Type", "application/octet-stream");
    request.body_stream = stream.value().get();

    auto sent = transport_.send(request);
    if (sent.is_error()) {
        auto error = sent.error();
        error.part_number = range.part_number;
        return Err<FinishedPartReceipt>(std::move(error));
    }

    const auto& response = sent.value();
    if (response.status_code != 200) {
        const auto body = response.body_as_string();
        spdlog::error("Part {} of {} failed: {} - {}", range.part_number, part_count,
                      response.status_code, body);
        return Err<FinishedPartReceipt>(Error::storage_transfer(
            "Failed to upload part " + std::to_string(range.part_number) + ": " +
                std::to_string(response.status_code) + " - " + body,
            response.status_code, body, range.part_number));
    }

    FinishedPartReceipt receipt;
    receipt.part_number = range.part_number;
    receipt.etag = response.get_header("ETag");

    bus_.emit(events::PartTransferredEvent{
        pending_upload_id, role, range.part_number, part_count, range.length, receipt.etag});

    return Ok(std::move(receipt));
}

} // namespace stash::upload
