#pragma once

#include <optional>
#include <rayshell/error.hpp>
#include <rayshell/messages.hpp>

#include "broadcast_channel.hpp"

namespace rayshell
{

using MessageSender   = BroadcastSender<ThreadMessage>;
using MessageReceiver = BroadcastReceiver<ThreadMessage>;

// Creates the one channel every thread talks over.
std::pair<MessageSender, MessageReceiver> make_message_channel(size_t capacity);

enum class ReceiveStatus
{
    NoMessage,           // nothing queued, go back to work
    Message,             // `message` holds the dequeued value
    FatalDisconnected,   // every sender is gone
};

struct ReceiveOutcome
{
    ReceiveStatus                status = ReceiveStatus::NoMessage;
    std::optional<ThreadMessage> message;
    SharedReport                 error;   // set for fatal outcomes
};

enum class SendStatus
{
    Ok,
    FatalDisconnected,   // every receiver is gone
    FatalQueueFull,      // some receiver stopped reading
};

struct SendOutcome
{
    SendStatus   status = SendStatus::Ok;
    SharedReport error;   // set for fatal outcomes

    bool ok() const { return status == SendStatus::Ok; }
};

// Non-blocking receive. Never throws.
ReceiveOutcome receive(MessageReceiver& receiver);

// Non-blocking send. Never retries and never drops silently.
SendOutcome send(const ThreadMessage& message, MessageSender& sender);

// Same as receive() but fatal outcomes throw Error. nullopt means no message.
std::optional<ThreadMessage> receive_or_throw(MessageReceiver& receiver);

// Same as send() but fatal outcomes throw Error.
void send_or_throw(const ThreadMessage& message, MessageSender& sender);

const char* to_string(ReceiveStatus status);
const char* to_string(SendStatus status);

}   // namespace rayshell
