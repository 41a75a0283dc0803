#pragma once

#include "stash/config/config.hpp"
#include "stash/core/result.hpp"
#include "stash/events/event_bus.hpp"
#include "stash/network/transport.hpp"
#include "stash/upload/api_client.hpp"
#include "stash/upload/file_transfer.hpp"
#include "stash/upload/plan_requester.hpp"
#include "stash/upload/session.hpp"
#include "stash/upload/types.hpp"
#include "stash/upload/verifier.hpp"

#include <optional>

namespace stash::upload {

/**
 * UploadOrchestrator
 *
 * Runs one upload end to end: plan, primary transfer, expansion transfer
 * (when the metadata names an expansion file and the plan has one), verify.
 *
 * Each upload() call builds its own UploadSession, so one orchestrator can
 * serve successive uploads. The transport and bus must outlive it.
 * Nothing is retried; the first error ends the invocation.
 */
class UploadOrchestrator {
public:
    UploadOrchestrator(network::Transport& transport, config::ApiConfig config,
                       events::EventBus& bus);

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    Result<ArtifactRecord> upload(const UploadMetadata& metadata);

    /**
     * @brief Session of the most recent upload() call, if any
     */
    const std::optional<UploadSessionInfo>& last_session() const noexcept { return last_session_; }

private:
    Result<ArtifactRecord> run(UploadSession& session, const UploadMetadata& metadata);
    Result<ArtifactRecord> fail(UploadSession& session, Error error);

    events::EventBus& bus_;
    ApiClient api_;
    PlanRequester requester_;
    FileTransferExecutor executor_;
    UploadVerifier verifier_;
    std::optional<UploadSessionInfo> last_session_;
};

} // namespace stash::upload
