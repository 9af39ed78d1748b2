#include "test_base.hpp"
#include "fake_messaging_gateway.hpp"
#include "fake_process_runner.hpp"
#include "core/bot_messages.hpp"
#include "core/update_dispatcher.hpp"
#include <memory>

class UpdateDispatcherTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        temp_files_ = std::make_unique<TempFileStore>(pathFor("work"));
        engine_ = std::make_unique<TranscodeEngine>(std::make_shared<FakeProcessRunner>());
        transcode_pool_ = std::make_unique<WorkerPool>("transcode", 1);
        event_pool_ = std::make_unique<WorkerPool>("events", 2);
        controller_ = std::make_unique<MediaSessionController>(gateway_, sessions_, *temp_files_, *engine_,
                                                               *transcode_pool_, 1024 * 1024);
        dispatcher_ = std::make_unique<UpdateDispatcher>(gateway_, *controller_, *event_pool_);
    }

    void TearDown() override
    {
        event_pool_->shutdown();
        transcode_pool_->shutdown();
        TestBase::TearDown();
    }

    static ParsedUpdate command(const std::string &name)
    {
        ParsedUpdate update;
        update.type = ParsedUpdate::Type::Command;
        update.update_id = 1;
        update.command.chat_id = 9;
        update.command.user_id = 9;
        update.command.command = name;
        return update;
    }

    FakeMessagingGateway gateway_;
    SessionStore sessions_;
    std::unique_ptr<TempFileStore> temp_files_;
    std::unique_ptr<TranscodeEngine> engine_;
    std::unique_ptr<WorkerPool> transcode_pool_;
    std::unique_ptr<WorkerPool> event_pool_;
    std::unique_ptr<MediaSessionController> controller_;
    std::unique_ptr<UpdateDispatcher> dispatcher_;
};

TEST_F(UpdateDispatcherTest, StartAndHelpAreAnswered)
{
    dispatcher_->dispatch(command("start")).get();
    dispatcher_->dispatch(command("help")).get();

    ASSERT_EQ(gateway_.texts.size(), 2u);
    EXPECT_EQ(gateway_.texts[0].chat, 9);
    EXPECT_EQ(gateway_.texts[0].text, BotMessages::START);
    EXPECT_EQ(gateway_.texts[1].text, BotMessages::HELP);
}

TEST_F(UpdateDispatcherTest, UnknownCommandsAreIgnored)
{
    dispatcher_->dispatch(command("settings")).get();
    EXPECT_TRUE(gateway_.texts.empty());
}

TEST_F(UpdateDispatcherTest, CommandReplyFailureDoesNotPropagate)
{
    gateway_.fail_sends = true;
    EXPECT_NO_THROW(dispatcher_->dispatch(command("start")).get());
}

TEST_F(UpdateDispatcherTest, IgnoredUpdateCompletesImmediately)
{
    ParsedUpdate update;
    update.update_id = 3;
    auto done = dispatcher_->dispatch(update);
    EXPECT_EQ(done.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_TRUE(gateway_.texts.empty());
}

TEST_F(UpdateDispatcherTest, UploadThenDecisionReachController)
{
    gateway_.addFile("f1", "bytes");

    ParsedUpdate upload;
    upload.type = ParsedUpdate::Type::Upload;
    upload.update_id = 10;
    upload.upload.sequence = 10;
    upload.upload.user_id = 5;
    upload.upload.chat_id = 5;
    upload.upload.file_id = "f1";
    upload.upload.kind = MediaKind::Video;
    upload.upload.attachment_type = "video";
    dispatcher_->dispatch(upload).get();

    ASSERT_EQ(gateway_.prompts.size(), 1u);

    ParsedUpdate decision;
    decision.type = ParsedUpdate::Type::Decision;
    decision.update_id = 11;
    decision.decision.sequence = 11;
    decision.decision.user_id = 5;
    decision.decision.chat_id = 5;
    decision.decision.message_id = 1;
    decision.decision.token = gateway_.prompts[0].buttons[0].token;
    dispatcher_->dispatch(decision).get();

    ASSERT_EQ(gateway_.documents.size(), 1u);
    EXPECT_EQ(gateway_.documents[0].filename, "video.mp4");
    EXPECT_EQ(gateway_.documents[0].content, "bytes");
}
