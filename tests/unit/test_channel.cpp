#include <gtest/gtest.h>

#include <rayshell/error.hpp>
#include <rayshell/messages.hpp>

#include "program/channel.hpp"
#include "util/log_capture.hpp"

using namespace rayshell;

static bool notes_contain(const ErrorReport& report, const std::string& text)
{
    for (const auto& n : report.notes())
    {
        if (n.find(text) != std::string::npos)
            return true;
    }
    return false;
}

// ─── receive ─────────────────────────────────────────────────────────────────

TEST(ChannelReceive, EmptyChannelIsNoMessage)
{
    auto [tx, rx] = make_message_channel(8);
    auto outcome  = receive(rx);
    EXPECT_EQ(outcome.status, ReceiveStatus::NoMessage);
    EXPECT_FALSE(outcome.message.has_value());
    EXPECT_FALSE(outcome.error);
}

TEST(ChannelReceive, QueuedMessageIsReturned)
{
    auto [tx, rx] = make_message_channel(8);
    ASSERT_TRUE(send(messages::exit_ui_thread(), tx).ok());

    auto outcome = receive(rx);
    ASSERT_EQ(outcome.status, ReceiveStatus::Message);
    ASSERT_TRUE(outcome.message.has_value());
    EXPECT_TRUE(is_addressed_to(*outcome.message, Addressee::Ui));
}

TEST(ChannelReceive, AllSendersGoneIsFatalDisconnected)
{
    test::LogCapture capture;
    auto [tx, rx] = make_message_channel(8);
    tx.unsubscribe();

    auto outcome = receive(rx);
    EXPECT_EQ(outcome.status, ReceiveStatus::FatalDisconnected);
    ASSERT_TRUE(outcome.error);
    EXPECT_EQ(outcome.error->chain().back(), "all senders disconnected");
    EXPECT_EQ(capture.count(LogLevel::Error, "rayshell::really_bad_unreachable"), 1u);
}

TEST(ChannelReceive, ReceiveOrThrowThrowsOnDisconnect)
{
    auto [tx, rx] = make_message_channel(8);
    tx.unsubscribe();
    EXPECT_THROW(receive_or_throw(rx), Error);
}

TEST(ChannelReceive, ReceiveOrThrowReturnsNulloptWhenEmpty)
{
    auto [tx, rx] = make_message_channel(8);
    EXPECT_FALSE(receive_or_throw(rx).has_value());
}

// ─── send ────────────────────────────────────────────────────────────────────

TEST(ChannelSend, Ok)
{
    auto [tx, rx] = make_message_channel(8);
    auto outcome  = send(messages::exit_engine_thread(), tx);
    EXPECT_EQ(outcome.status, SendStatus::Ok);
    EXPECT_FALSE(outcome.error);
}

TEST(ChannelSend, NoReceiversIsFatalDisconnected)
{
    auto [tx, rx] = make_message_channel(8);
    rx.unsubscribe();

    auto outcome = send(messages::exit_engine_thread(), tx);
    EXPECT_EQ(outcome.status, SendStatus::FatalDisconnected);
    ASSERT_TRUE(outcome.error);
    EXPECT_TRUE(notes_contain(*outcome.error, "Engine(ExitEngineThread)"));
}

TEST(ChannelSend, FullQueueIsFatalQueueFull)
{
    auto [tx, rx] = make_message_channel(1);
    ASSERT_TRUE(send(messages::exit_ui_thread(), tx).ok());

    auto outcome = send(messages::exit_ui_thread(), tx);
    EXPECT_EQ(outcome.status, SendStatus::FatalQueueFull);
    ASSERT_TRUE(outcome.error);
    EXPECT_TRUE(notes_contain(*outcome.error, "Ui(ExitUiThread)"));
}

TEST(ChannelSend, FullThenReceiversGoneIsDisconnectedNotFull)
{
    auto [tx, rx] = make_message_channel(1);
    ASSERT_TRUE(send(messages::exit_ui_thread(), tx).ok());
    rx.unsubscribe();

    EXPECT_EQ(send(messages::exit_ui_thread(), tx).status, SendStatus::FatalDisconnected);
}

TEST(ChannelSend, FullQueueDoesNotDropQueuedMessage)
{
    auto [tx, rx] = make_message_channel(1);
    send(messages::exit_ui_thread(), tx);
    send(messages::exit_engine_thread(), tx);

    auto first = receive(rx);
    ASSERT_EQ(first.status, ReceiveStatus::Message);
    EXPECT_TRUE(is_addressed_to(*first.message, Addressee::Ui));
    EXPECT_EQ(receive(rx).status, ReceiveStatus::NoMessage);
}

TEST(ChannelSend, SendOrThrowThrowsOnFull)
{
    auto [tx, rx] = make_message_channel(1);
    send_or_throw(messages::exit_ui_thread(), tx);
    try
    {
        send_or_throw(messages::exit_ui_thread(), tx);
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.report().message(), "could not send message to channel");
        EXPECT_EQ(e.report().chain().back(), "channel queue is full");
    }
}

TEST(ChannelSend, StatusNames)
{
    EXPECT_STREQ(to_string(SendStatus::FatalQueueFull), "FatalQueueFull");
    EXPECT_STREQ(to_string(ReceiveStatus::FatalDisconnected), "FatalDisconnected");
}
