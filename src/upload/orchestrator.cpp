#include "stash/upload/orchestrator.hpp"

#include "stash/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace stash::upload {

UploadOrchestrator::UploadOrchestrator(network::Transport& transport, config::ApiConfig config,
                                       events::EventBus& bus)
    : bus_(bus),
      api_(transport, std::move(config)),
      requester_(api_),
      executor_(transport, requester_, bus),
      verifier_(api_) {}

Result<ArtifactRecord> UploadOrchestrator::upload(const UploadMetadata& metadata) {
    UploadSession session(metadata.primary_file_path);
    auto result = run(session, metadata);
    last_session_ = session.info();
    return result;
}

Result<ArtifactRecord> UploadOrchestrator::run(UploadSession& session, const UploadMetadata& metadata) {
    const auto started = std::chrono::steady_clock::now();

    auto prepared = requester_.prepare_plan(metadata);
    if (prepared.is_error()) {
        return fail(session, prepared.error());
    }

    bus_.emit(events::UploadPlanRequestedEvent{
        metadata.primary_file_path,
        prepared.value().primary.size_bytes,
        metadata.expansion_file_path});

    auto plan_result = requester_.send_plan(prepared.value());
    if (plan_result.is_error()) {
        return fail(session, plan_result.error());
    }
    const UploadPlan& plan = plan_result.value();
    session.set_pending_upload_id(plan.pending_upload_id);

    bus_.emit(events::UploadPlanReceivedEvent{
        plan.pending_upload_id,
        plan.primary.chunked ? TransferMode::Chunked : TransferMode::Direct,
        plan.primary.chunked ? plan.primary.part_count : 1u,
        plan.expansion.has_value()});

    if (auto moved = session.transition_to(UploadState::TransferringPrimary); moved.is_error()) {
        return fail(session, moved.error());
    }
    auto primary = executor_.transfer(metadata.primary_file_path, plan.primary,
                                      plan.pending_upload_id, FileRole::Primary);
    if (primary.is_error()) {
        return fail(session, primary.error());
    }
    session.record_transfer(primary.value());

    std::vector<FinishedPartReceipt> expansion_receipts;
    if (metadata.expansion_file_path && plan.expansion) {
        if (auto moved = session.transition_to(UploadState::TransferringExpansion); moved.is_error()) {
            return fail(session, moved.error());
        }
        auto expansion = executor_.transfer(*metadata.expansion_file_path, *plan.expansion,
                                            plan.pending_upload_id, FileRole::Expansion);
        if (expansion.is_error()) {
            return fail(session, expansion.error());
        }
        session.record_transfer(expansion.value());
        expansion_receipts = std::move(expansion.value().receipts);
    } else if (metadata.expansion_file_path) {
        spdlog::warn("Upload plan {} has no expansion file; {} was not uploaded",
                     plan.pending_upload_id, *metadata.expansion_file_path);
    }

    if (auto moved = session.transition_to(UploadState::Verifying); moved.is_error()) {
        return fail(session, moved.error());
    }
    auto record = verifier_.verify(plan.pending_upload_id, primary.value().receipts, expansion_receipts);
    if (record.is_error()) {
        return fail(session, record.error());
    }

    if (auto moved = session.transition_to(UploadState::Done); moved.is_error()) {
        return fail(session, moved.error());
    }

    bus_.emit(events::UploadVerifiedEvent{
        plan.pending_upload_id,
        record.value(),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)});

    return record;
}

Result<ArtifactRecord> UploadOrchestrator::fail(UploadSession& session, Error error) {
    const auto state_at_failure = session.state();
    auto marked = session.mark_failed(error);
    if (marked.is_error()) {
        spdlog::error("Could not record failure: {}", marked.error().message);
    }

    bus_.emit(events::UploadFailedEvent{session.info().pending_upload_id, state_at_failure, error});
    return Err<ArtifactRecord>(std::move(error));
}

} // namespace stash::upload
