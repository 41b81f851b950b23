#include <gtest/gtest.h>
#include "sendme/session/receiver_controller.hpp"
#include "sendme/session/status.hpp"
#include "support/fakes.hpp"

using namespace sendme;
using namespace sendme::session;
using namespace std::chrono_literals;
namespace names = sendme::events::names;

class ReceiverControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        receiver_ = std::make_unique<ReceiverController>(h_.services(), "/home/user/Downloads");
        receiver_->attach(h_.bus);
    }

    void start_receive() {
        ASSERT_TRUE(receiver_->receive("blobticket-abc123", "/home/user/Downloads").is_ok());
        h_.emit(names::kReceiveStarted);
    }

    fakes::SessionHarness h_;
    std::unique_ptr<ReceiverController> receiver_;
};

TEST_F(ReceiverControllerTest, FullReceiveLifecycle) {
    ASSERT_TRUE(receiver_->receive("  blobticket-abc123\n", "/home/user/Downloads").is_ok());
    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Connecting);
    ASSERT_EQ(h_.engine.receives.size(), 1u);
    EXPECT_EQ(h_.engine.receives[0].first, "blobticket-abc123");
    EXPECT_EQ(h_.engine.receives[0].second, "/home/user/Downloads");

    h_.emit(names::kReceiveStarted);
    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Transporting);

    h_.emit(names::kReceiveFileNames, R"(["shared/x.txt","shared/y.txt"])");
    h_.emit(names::kReceiveProgress, "500:1000:250000");
    ASSERT_TRUE(receiver_->state().transfer_progress());
    EXPECT_DOUBLE_EQ(receiver_->state().transfer_progress()->percentage, 50.0);

    h_.emit(names::kReceiveProgress, "1000:1000:250000");
    h_.emit(names::kExportStarted, "2");
    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Exporting);
    EXPECT_FALSE(receiver_->state().transfer_progress());
    EXPECT_EQ(receiver_status_text(receiver_->state()), "Saving files...");

    h_.emit(names::kExportProgress, "1:2:50");
    ASSERT_TRUE(receiver_->state().export_progress());
    EXPECT_DOUBLE_EQ(receiver_->state().export_progress()->percentage, 50.0);

    h_.emit(names::kExportCompleted);
    h_.scheduler.advance(3s);
    h_.emit(names::kReceiveCompleted);

    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Completed);
    const auto& metadata = receiver_->state().metadata();
    ASSERT_TRUE(metadata);
    EXPECT_EQ(metadata->file_name, "shared");
    EXPECT_EQ(metadata->file_size, 1000u);
    EXPECT_EQ(metadata->duration, 3000ms);
    EXPECT_EQ(metadata->download_path, "/home/user/Downloads");
    EXPECT_EQ(h_.analytics.sizes, (std::vector<std::uint64_t>{1000}));
}

TEST_F(ReceiverControllerTest, EmptyTicketIsRejected) {
    receiver_->set_ticket("   ");
    auto result = receiver_->receive();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidInput);
    EXPECT_TRUE(h_.engine.receives.empty());
    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Idle);
}

TEST_F(ReceiverControllerTest, ReceiveWhileActiveIsBusy) {
    start_receive();

    auto result = receiver_->receive();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Busy);
    EXPECT_EQ(h_.engine.receives.size(), 1u);
    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Transporting);
}

TEST_F(ReceiverControllerTest, ReceiveAfterCompletionStartsFresh) {
    start_receive();
    h_.emit(names::kReceiveFileNames, R"(["first.iso"])");
    h_.emit(names::kReceiveProgress, "10:10:0");
    h_.emit(names::kReceiveCompleted);
    ASSERT_EQ(receiver_->phase(), ReceiverPhase::Completed);

    ASSERT_TRUE(receiver_->receive().is_ok());

    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Connecting);
    EXPECT_FALSE(receiver_->state().metadata());
    EXPECT_TRUE(receiver_->state().file_names().empty());
    EXPECT_EQ(h_.engine.receives.size(), 2u);

    h_.emit(names::kReceiveStarted);
    h_.emit(names::kReceiveCompleted);
    ASSERT_TRUE(receiver_->state().metadata());
    EXPECT_EQ(receiver_->state().metadata()->file_name, "Downloaded File");
}

TEST_F(ReceiverControllerTest, ReceiveFailureRaisesAlertAndReturnsToIdle) {
    h_.engine.receive_error = "invalid ticket";

    auto result = receiver_->receive("bogus", "/tmp");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::CommandFailure);
    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Idle);
    EXPECT_TRUE(h_.alerts.is_open());
    EXPECT_EQ(h_.alerts.current().title, "Receive Failed");
    EXPECT_EQ(h_.alerts.current().description, "Failed to receive file: invalid ticket");
    EXPECT_EQ(receiver_->state().ticket(), "bogus");
}

TEST_F(ReceiverControllerTest, ResumeNoticeVisibleForFiveSeconds) {
    start_receive();
    h_.emit(names::kReceiveResumed, "500000");

    ASSERT_TRUE(receiver_->state().resumed_from());
    EXPECT_EQ(resume_notice(*receiver_->state().resumed_from()),
              "Resuming download from 488.28 KB");

    h_.scheduler.advance(4999ms);
    EXPECT_TRUE(receiver_->state().resumed_from());

    h_.scheduler.advance(2ms);
    EXPECT_FALSE(receiver_->state().resumed_from());
}

TEST_F(ReceiverControllerTest, SecondResumeRestartsWindow) {
    start_receive();
    h_.emit(names::kReceiveResumed, "100");
    h_.scheduler.advance(4000ms);
    h_.emit(names::kReceiveResumed, "200");
    h_.scheduler.advance(4000ms);

    EXPECT_EQ(receiver_->state().resumed_from(), 200);

    h_.scheduler.advance(1001ms);
    EXPECT_FALSE(receiver_->state().resumed_from());
}

TEST_F(ReceiverControllerTest, MalformedFileNamesAreDropped) {
    start_receive();
    h_.emit(names::kReceiveFileNames, "not json");
    h_.emit(names::kReceiveCompleted);

    ASSERT_TRUE(receiver_->state().metadata());
    EXPECT_EQ(receiver_->state().metadata()->file_name, "Downloaded File");
}

TEST_F(ReceiverControllerTest, MalformedCountsAreDropped) {
    start_receive();
    h_.emit(names::kExportStarted, "three");
    h_.emit(names::kReceiveResumed, "");

    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Transporting);
    EXPECT_FALSE(receiver_->state().resumed_from());
}

TEST_F(ReceiverControllerTest, ResetCancelsResumeWindow) {
    start_receive();
    h_.emit(names::kReceiveResumed, "100");

    receiver_->reset_for_new_transfer();

    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Idle);
    EXPECT_TRUE(receiver_->state().ticket().empty());
    EXPECT_EQ(h_.scheduler.pending(), 0u);
}

TEST_F(ReceiverControllerTest, CompletionUsesCurrentSavePath) {
    start_receive();
    receiver_->set_save_path("/mnt/usb");
    h_.emit(names::kReceiveCompleted);

    ASSERT_TRUE(receiver_->state().metadata());
    EXPECT_EQ(receiver_->state().metadata()->download_path, "/mnt/usb");
}

TEST_F(ReceiverControllerTest, BrowseForFolderUpdatesSavePath) {
    h_.dialogs.pick = "/data/incoming";
    ASSERT_TRUE(receiver_->browse_for_folder().is_ok());
    EXPECT_EQ(receiver_->save_path(), "/data/incoming");
}

TEST_F(ReceiverControllerTest, BrowseForFolderCancelKeepsSavePath) {
    ASSERT_TRUE(receiver_->browse_for_folder().is_ok());
    EXPECT_EQ(receiver_->save_path(), "/home/user/Downloads");
}

TEST_F(ReceiverControllerTest, BrowseForFolderFailureRaisesAlert) {
    h_.dialogs.error = "portal unavailable";
    auto result = receiver_->browse_for_folder();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ResourceFailure);
    EXPECT_EQ(h_.alerts.current().title, "Folder Dialog Failed");
    EXPECT_EQ(receiver_->save_path(), "/home/user/Downloads");
}

TEST_F(ReceiverControllerTest, DetachStopsEventDelivery) {
    ASSERT_TRUE(receiver_->receive("t", "/tmp").is_ok());
    receiver_->detach();

    h_.emit(names::kReceiveStarted);

    EXPECT_EQ(receiver_->phase(), ReceiverPhase::Connecting);
    EXPECT_EQ(h_.bus.subscriber_count(names::kReceiveCompleted), 0u);
}
