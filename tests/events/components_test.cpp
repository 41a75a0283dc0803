#include "stash/events/event_bus.hpp"
#include "stash/events/components.hpp"
#include "stash/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using stash::Error;
using stash::events::EventBus;
using stash::events::FileTransferCompletedEvent;
using stash::events::LoggerComponent;
using stash::events::MetricsComponent;
using stash::events::PartTransferStartedEvent;
using stash::events::PartTransferredEvent;
using stash::events::UploadFailedEvent;
using stash::events::UploadPlanReceivedEvent;
using stash::events::UploadPlanRequestedEvent;
using stash::events::UploadVerifiedEvent;
using stash::upload::ArtifactRecord;
using stash::upload::FileRole;
using stash::upload::TransferMode;
using stash::upload::UploadState;

TEST(MetricsComponentTest, TracksTransferCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadPlanRequestedEvent{"app.apk", 3000, std::string("main.obb")});
    bus.emit(PartTransferredEvent{"pu_1", FileRole::Primary, 1, 2, 2000, "\"a\""});
    bus.emit(PartTransferredEvent{"pu_1", FileRole::Primary, 2, 2, 1000, "\"b\""});
    bus.emit(FileTransferCompletedEvent{"pu_1", FileRole::Primary, TransferMode::Chunked,
                                        "app.apk", 3000, std::chrono::milliseconds{120}});
    bus.emit(FileTransferCompletedEvent{"pu_1", FileRole::Expansion, TransferMode::Direct,
                                        "main.obb", 500, std::chrono::milliseconds{20}});
    bus.emit(UploadVerifiedEvent{"pu_1", ArtifactRecord{}, std::chrono::milliseconds{300}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.plans_requested.load(), 1u);
    EXPECT_EQ(stats.parts_transferred.load(), 2u);
    EXPECT_EQ(stats.files_transferred.load(), 2u);
    EXPECT_EQ(stats.chunked_files.load(), 1u);
    EXPECT_EQ(stats.direct_files.load(), 1u);
    EXPECT_EQ(stats.bytes_transferred.load(), 3500u);
    EXPECT_EQ(stats.uploads_verified.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 0u);
}

TEST(MetricsComponentTest, CountsFailures) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadFailedEvent{"pu_1", UploadState::TransferringPrimary,
                               Error::storage_transfer("Failed to upload part 2: 500", 500, "", 2)});

    EXPECT_EQ(metrics.get_stats().uploads_failed.load(), 1u);
    EXPECT_EQ(metrics.get_stats().uploads_verified.load(), 0u);
}

TEST(LoggerComponentTest, HandlesEveryEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_NO_THROW({
        bus.emit(UploadPlanRequestedEvent{"app.apk", 10});
        bus.emit(UploadPlanReceivedEvent{"pu_1", TransferMode::Chunked, 3, false});
        bus.emit(PartTransferStartedEvent{"pu_1", FileRole::Primary, 1, 3, 0, 4});
        bus.emit(PartTransferredEvent{"pu_1", FileRole::Primary, 1, 3, 4, "\"e\""});
        bus.emit(UploadFailedEvent{"pu_1", UploadState::Verifying, Error::protocol("rejected", 400, "{}")});
    });
}
