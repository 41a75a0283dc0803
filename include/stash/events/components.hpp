/**
 * @file components.hpp
 * @brief Observers that render and count upload progress
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * orchestrator.upload(metadata);   // components react to the events
 */

#pragma once

#include "stash/events/event_bus.hpp"
#include "stash/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace stash::events {

/**
 * @brief Logger component - human-readable progress through spdlog
 *
 * Part progress is logged as "Uploading part N of M" so an operator
 * watching a long chunked upload can see how far it got.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadPlanRequestedEvent>([this](const UploadPlanRequestedEvent& e) {
            on_plan_requested(e);
        });

        bus_.subscribe<UploadPlanReceivedEvent>([this](const UploadPlanReceivedEvent& e) {
            on_plan_received(e);
        });

        bus_.subscribe<FileTransferStartedEvent>([this](const FileTransferStartedEvent& e) {
            on_file_started(e);
        });

        bus_.subscribe<PartTransferStartedEvent>([this](const PartTransferStartedEvent& e) {
            on_part_started(e);
        });

        bus_.subscribe<PartTransferredEvent>([this](const PartTransferredEvent& e) {
            on_part_transferred(e);
        });

        bus_.subscribe<FileTransferCompletedEvent>([this](const FileTransferCompletedEvent& e) {
            on_file_completed(e);
        });

        bus_.subscribe<UploadVerifiedEvent>([this](const UploadVerifiedEvent& e) {
            on_verified(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_failed(e);
        });
    }

private:
    void on_plan_requested(const UploadPlanRequestedEvent& e) {
        if (e.expansion_file) {
            spdlog::info("Requesting upload for {} ({} bytes) with expansion {}",
                         e.primary_file, e.primary_bytes, *e.expansion_file);
        } else {
            spdlog::info("Requesting upload for {} ({} bytes)", e.primary_file, e.primary_bytes);
        }
    }

    void on_plan_received(const UploadPlanReceivedEvent& e) {
        spdlog::info("Pending upload {}: primary {} ({} part(s)){}",
                     e.pending_upload_id, upload::to_string(e.primary_mode), e.primary_parts,
                     e.has_expansion_plan ? ", expansion planned" : "");
    }

    void on_file_started(const FileTransferStartedEvent& e) {
        spdlog::info("Uploading {} file {} ({} bytes, {})",
                     upload::to_string(e.role), e.file_path, e.total_bytes,
                     upload::to_string(e.mode));
    }

    void on_part_started(const PartTransferStartedEvent& e) {
        spdlog::info("Uploading part {} of {}", e.part_number, e.part_count);
        spdlog::debug("  bytes [{}, {}) of {} file", e.start, e.start + e.length,
                      upload::to_string(e.role));
    }

    void on_part_transferred(const PartTransferredEvent& e) {
        spdlog::debug("Part {} of {} stored ({} bytes, etag={})",
                      e.part_number, e.part_count, e.bytes, e.etag.empty() ? "-" : e.etag);
    }

    void on_file_completed(const FileTransferCompletedEvent& e) {
        spdlog::info("Uploaded {} file {} ({} bytes in {}ms)",
                     upload::to_string(e.role), e.file_path, e.total_bytes, e.duration.count());
    }

    void on_verified(const UploadVerifiedEvent& e) {
        spdlog::info("Upload {} verified: build {}{}",
                     e.pending_upload_id, e.record.build_id,
                     e.record.pending_processing ? " (pending processing)" : "");
    }

    void on_failed(const UploadFailedEvent& e) {
        spdlog::error("Upload {} failed while {}: {}",
                      e.pending_upload_id.empty() ? "-" : e.pending_upload_id,
                      upload::to_string(e.state), e.error.describe());
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - counters for one process lifetime
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> plans_requested{0};
        std::atomic<std::uint64_t> files_transferred{0};
        std::atomic<std::uint64_t> direct_files{0};
        std::atomic<std::uint64_t> chunked_files{0};
        std::atomic<std::uint64_t> parts_transferred{0};
        std::atomic<std::uint64_t> bytes_transferred{0};
        std::atomic<std::uint64_t> uploads_verified{0};
        std::atomic<std::uint64_t> uploads_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadPlanRequestedEvent>([this](const UploadPlanRequestedEvent&) {
            stats_.plans_requested++;
        });

        bus_.subscribe<PartTransferredEvent>([this](const PartTransferredEvent&) {
            stats_.parts_transferred++;
        });

        bus_.subscribe<FileTransferCompletedEvent>([this](const FileTransferCompletedEvent& e) {
            on_file_completed(e);
        });

        bus_.subscribe<UploadVerifiedEvent>([this](const UploadVerifiedEvent&) {
            stats_.uploads_verified++;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Plans requested:   {}", stats_.plans_requested.load());
        spdlog::info("  Files transferred: {} ({} direct, {} chunked)",
                     stats_.files_transferred.load(), stats_.direct_files.load(),
                     stats_.chunked_files.load());
        spdlog::info("  Parts transferred: {}", stats_.parts_transferred.load());
        spdlog::info("  Bytes transferred: {}", stats_.bytes_transferred.load());
        spdlog::info("  Uploads verified:  {}", stats_.uploads_verified.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_file_completed(const FileTransferCompletedEvent& e) {
        stats_.files_transferred++;
        stats_.bytes_transferred += e.total_bytes;
        if (e.mode == upload::TransferMode::Chunked) {
            stats_.chunked_files++;
        } else {
            stats_.direct_files++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace stash::events
