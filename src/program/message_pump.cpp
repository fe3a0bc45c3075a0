#include "message_pump.hpp"

#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>

namespace rayshell
{

PumpResult drain_messages(MessageReceiver&      receiver,
                          Addressee             self,
                          const MessageHandler& handler)
{
    RAYSHELL_LOG_TRACE(targets::THREAD_TRACE_MESSAGE_LOOP, "draining {} messages", to_string(self));
    for (;;)
    {
        auto outcome = receive(receiver);
        switch (outcome.status)
        {
            case ReceiveStatus::NoMessage:
                return PumpResult::Continue;

            case ReceiveStatus::FatalDisconnected:
            {
                ErrorReport report = *outcome.error;
                report.wrap(std::string(to_string(self)) + " thread could not drain its messages");
                throw Error(std::move(report));
            }

            case ReceiveStatus::Message:
                break;
        }

        const ThreadMessage& message = *outcome.message;
        if (!is_addressed_to(message, self))
        {
            log_ignored(message, self);
            continue;
        }

        log_received(message);
        if (handler(message) == PumpResult::Exit)
            return PumpResult::Exit;
    }
}

void wait_at_startup_barrier(ThreadContext& ctx, Addressee self)
{
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL,
                       "{} thread waiting at startup barrier",
                       to_string(self));
    ctx.barrier->arrive_and_wait();
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL,
                       "{} thread passed startup barrier",
                       to_string(self));
    if (ctx.hooks.on_barrier_passed)
        ctx.hooks.on_barrier_passed();
}

void close_endpoints(ThreadContext& ctx, Addressee self)
{
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_MESSENGER_LIFETIME,
                       "{} thread unsubscribing receiver",
                       to_string(self));
    ctx.receiver.unsubscribe();
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_MESSENGER_LIFETIME,
                       "{} thread unsubscribing sender",
                       to_string(self));
    ctx.sender.unsubscribe();
}

}   // namespace rayshell
