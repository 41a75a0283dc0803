#include "stash/upload/session.hpp"

#include <gtest/gtest.h>

using stash::upload::FileTransferOutcome;
using stash::upload::UploadSession;
using stash::upload::UploadState;

TEST(UploadSessionTest, StartsInPlanning) {
    UploadSession session{"/builds/app.apk"};

    EXPECT_EQ(session.state(), UploadState::Planning);
    EXPECT_EQ(session.info().primary_file, "/builds/app.apk");
    EXPECT_TRUE(session.info().pending_upload_id.empty());
    EXPECT_FALSE(session.is_terminal());
}

TEST(UploadSessionTest, EnforcesTransitionOrder) {
    UploadSession session{"app.apk"};

    EXPECT_TRUE(session.transition_to(UploadState::TransferringPrimary).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::TransferringExpansion).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Verifying).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Done).is_ok());
    EXPECT_TRUE(session.is_terminal());

    auto illegal = session.transition_to(UploadState::TransferringPrimary);
    EXPECT_TRUE(illegal.is_error());
}

TEST(UploadSessionTest, ExpansionIsOptional) {
    UploadSession session{"app.apk"};

    ASSERT_TRUE(session.transition_to(UploadState::TransferringPrimary).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Verifying).is_ok());
}

TEST(UploadSessionTest, CannotSkipPlanningOrTransfer) {
    UploadSession session{"app.apk"};

    EXPECT_TRUE(session.transition_to(UploadState::Verifying).is_error());
    EXPECT_TRUE(session.transition_to(UploadState::TransferringExpansion).is_error());
    EXPECT_EQ(session.state(), UploadState::Planning);
}

TEST(UploadSessionTest, AllowsFailureFromAnyNonTerminalState) {
    UploadSession session{"app.apk"};
    ASSERT_TRUE(session.transition_to(UploadState::TransferringPrimary).is_ok());

    auto failed = session.mark_failed(stash::Error::transport("Network error"));
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(session.state(), UploadState::Failed);
    ASSERT_TRUE(session.info().last_error.has_value());
    EXPECT_EQ(session.info().last_error->message, "Network error");

    // Only re-applying Failed is accepted afterwards
    EXPECT_TRUE(session.transition_to(UploadState::Failed).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Verifying).is_error());
}

TEST(UploadSessionTest, DoneCannotBeFailed) {
    UploadSession session{"app.apk"};
    ASSERT_TRUE(session.transition_to(UploadState::TransferringPrimary).is_ok());
    ASSERT_TRUE(session.transition_to(UploadState::Verifying).is_ok());
    ASSERT_TRUE(session.transition_to(UploadState::Done).is_ok());

    EXPECT_TRUE(session.mark_failed(stash::Error::protocol("late")).is_error());
    EXPECT_EQ(session.state(), UploadState::Done);
}

TEST(UploadSessionTest, RecordsTransfers) {
    UploadSession session{"app.apk"};
    session.set_pending_upload_id("pu_1");

    FileTransferOutcome outcome;
    outcome.bytes_transferred = 100;
    session.record_transfer(outcome);
    outcome.bytes_transferred = 50;
    session.record_transfer(outcome);

    EXPECT_EQ(session.info().pending_upload_id, "pu_1");
    EXPECT_EQ(session.info().files_transferred, 2u);
    EXPECT_EQ(session.info().bytes_transferred, 150u);
}
