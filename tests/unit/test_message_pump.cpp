#include <gtest/gtest.h>

#include <rayshell/error.hpp>
#include <rayshell/messages.hpp>
#include <vector>

#include "program/message_pump.hpp"
#include "util/log_capture.hpp"

using namespace rayshell;

namespace
{

struct RecordingHandler
{
    std::vector<std::string> seen;
    PumpResult               reply = PumpResult::Continue;

    MessageHandler handler()
    {
        return [this](const ThreadMessage& message)
        {
            seen.push_back(to_string(message));
            return reply;
        };
    }
};

}   // namespace

TEST(MessagePump, EmptyQueueContinues)
{
    auto [tx, rx] = make_message_channel(8);
    RecordingHandler h;
    EXPECT_EQ(drain_messages(rx, Addressee::Engine, h.handler()), PumpResult::Continue);
    EXPECT_TRUE(h.seen.empty());
}

TEST(MessagePump, MessagesForOtherThreadsAreIgnored)
{
    test::LogCapture capture;
    auto [tx, rx] = make_message_channel(8);
    send(messages::exit_ui_thread(), tx);
    send(messages::quit_app_no_error(QuitAppNoErrorReason::QuitInteractionByUser), tx);

    RecordingHandler h;
    h.reply = PumpResult::Exit;
    EXPECT_EQ(drain_messages(rx, Addressee::Engine, h.handler()), PumpResult::Continue);
    EXPECT_TRUE(h.seen.empty());
    EXPECT_EQ(rx.pending(), 0u);
    EXPECT_EQ(capture.count(LogLevel::Trace, "rayshell::thread_trace_message_ignored"), 2u);
}

TEST(MessagePump, ExitStopsBeforeLaterMessages)
{
    struct Case
    {
        Addressee     self;
        ThreadMessage exit_message;
    };
    const std::vector<Case> cases = {
        {Addressee::Engine, messages::exit_engine_thread()},
        {Addressee::Ui, messages::exit_ui_thread()},
        {Addressee::Program,
         messages::quit_app_error(share(ErrorReport("failure")))},
    };

    for (const auto& c : cases)
    {
        auto [tx, rx] = make_message_channel(8);
        send(c.exit_message, tx);
        send(c.exit_message, tx);

        RecordingHandler h;
        h.reply = PumpResult::Exit;
        EXPECT_EQ(drain_messages(rx, c.self, h.handler()), PumpResult::Exit) << to_string(c.self);
        EXPECT_EQ(h.seen.size(), 1u) << to_string(c.self);
        EXPECT_EQ(rx.pending(), 1u) << to_string(c.self);
    }
}

TEST(MessagePump, ContinueKeepsDraining)
{
    test::LogCapture capture;
    auto [tx, rx] = make_message_channel(8);
    send(messages::quit_app_no_error(QuitAppNoErrorReason::QuitInteractionByUser), tx);
    send(messages::exit_engine_thread(), tx);
    send(messages::quit_app_no_error(QuitAppNoErrorReason::QuitInteractionByUser), tx);

    RecordingHandler h;
    EXPECT_EQ(drain_messages(rx, Addressee::Program, h.handler()), PumpResult::Continue);
    ASSERT_EQ(h.seen.size(), 2u);
    EXPECT_EQ(h.seen[0], "Program(QuitAppNoError(QuitInteractionByUser))");
    EXPECT_EQ(rx.pending(), 0u);
    EXPECT_EQ(capture.count(LogLevel::Debug, "rayshell::thread_debug_message_received"), 2u);
}

TEST(MessagePump, DisconnectedChannelThrows)
{
    auto [tx, rx] = make_message_channel(8);
    tx.unsubscribe();

    RecordingHandler h;
    try
    {
        drain_messages(rx, Addressee::Ui, h.handler());
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.report().message(), "ui thread could not drain its messages");
        EXPECT_EQ(e.report().chain().back(), "all senders disconnected");
    }
}

TEST(MessagePump, QueuedMessagesAreDeliveredBeforeDisconnect)
{
    auto [tx, rx] = make_message_channel(8);
    send(messages::exit_ui_thread(), tx);
    tx.unsubscribe();

    RecordingHandler h;
    h.reply = PumpResult::Exit;
    EXPECT_EQ(drain_messages(rx, Addressee::Ui, h.handler()), PumpResult::Exit);
    EXPECT_EQ(h.seen.size(), 1u);
}
