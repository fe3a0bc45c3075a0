#include "channel.hpp"

#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>

namespace rayshell
{

std::pair<MessageSender, MessageReceiver> make_message_channel(size_t capacity)
{
    return make_broadcast_channel<ThreadMessage>(capacity);
}

ReceiveOutcome receive(MessageReceiver& receiver)
{
    ReceiveOutcome outcome;
    ThreadMessage  message;
    switch (receiver.try_recv(message))
    {
        case TryRecvResult::Ok:
            outcome.status  = ReceiveStatus::Message;
            outcome.message = std::move(message);
            return outcome;

        case TryRecvResult::Empty:
            outcome.status = ReceiveStatus::NoMessage;
            return outcome;

        case TryRecvResult::Disconnected:
        {
            ErrorReport report("all senders disconnected");
            report.wrap("could not receive message from channel");
            report.note("senders are only dropped during coordinated shutdown, after which "
                        "nobody polls; this is a thread lifecycle bug");
            outcome.status = ReceiveStatus::FatalDisconnected;
            outcome.error  = share(std::move(report));
            RAYSHELL_LOG_ERROR(targets::REALLY_BAD_UNREACHABLE,
                               "receive on a channel with no senders left");
            return outcome;
        }
    }
    outcome.status = ReceiveStatus::NoMessage;
    return outcome;
}

SendOutcome send(const ThreadMessage& message, MessageSender& sender)
{
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_MESSAGE_SEND, "sending {}", to_string(message));

    SendOutcome outcome;
    switch (sender.try_send(message))
    {
        case TrySendResult::Ok:
            return outcome;

        case TrySendResult::Disconnected:
        {
            ErrorReport report("all receivers disconnected");
            report.wrap("could not send message to channel");
            report.note("message: " + to_string(message));
            report.note("receivers are only unsubscribed by exiting threads; this is a thread "
                        "lifecycle bug");
            outcome.status = SendStatus::FatalDisconnected;
            outcome.error  = share(std::move(report));
            break;
        }

        case TrySendResult::Full:
        {
            ErrorReport report("channel queue is full");
            report.wrap("could not send message to channel");
            report.note("message: " + to_string(message));
            report.note("some thread stopped draining its receiver without unsubscribing it");
            outcome.status = SendStatus::FatalQueueFull;
            outcome.error  = share(std::move(report));
            break;
        }
    }

    RAYSHELL_LOG_ERROR(targets::REALLY_BAD_UNREACHABLE,
                       "send failed ({}): {}",
                       to_string(outcome.status),
                       to_string(message));
    return outcome;
}

std::optional<ThreadMessage> receive_or_throw(MessageReceiver& receiver)
{
    auto outcome = receive(receiver);
    if (outcome.status == ReceiveStatus::FatalDisconnected)
        throw Error(outcome.error);
    return std::move(outcome.message);
}

void send_or_throw(const ThreadMessage& message, MessageSender& sender)
{
    auto outcome = send(message, sender);
    if (!outcome.ok())
        throw Error(outcome.error);
}

const char* to_string(ReceiveStatus status)
{
    switch (status)
    {
        case ReceiveStatus::NoMessage:
            return "NoMessage";
        case ReceiveStatus::Message:
            return "Message";
        case ReceiveStatus::FatalDisconnected:
            return "FatalDisconnected";
    }
    return "Unknown";
}

const char* to_string(SendStatus status)
{
    switch (status)
    {
        case SendStatus::Ok:
            return "Ok";
        case SendStatus::FatalDisconnected:
            return "FatalDisconnected";
        case SendStatus::FatalQueueFull:
            return "FatalQueueFull";
    }
    return "Unknown";
}

}   // namespace rayshell
