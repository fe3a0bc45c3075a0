#pragma once

#include <functional>
#include <rayshell/messages.hpp>

#include "thread_context.hpp"

namespace rayshell
{

enum class PumpResult
{
    Continue,   // queue drained, go back to work
    Exit,       // the thread was told to stop
};

// Called for messages addressed to the draining thread.
using MessageHandler = std::function<PumpResult(const ThreadMessage&)>;

// Receive until the queue is empty. Messages for other threads are logged
// and dropped without reaching `handler`. Returns Exit as soon as `handler`
// does, leaving anything queued behind it unread. A disconnected channel
// throws Error.
PumpResult drain_messages(MessageReceiver&      receiver,
                          Addressee             self,
                          const MessageHandler& handler);

// Blocks on the startup barrier, then runs the barrier hook.
void wait_at_startup_barrier(ThreadContext& ctx, Addressee self);

// Unsubscribe both endpoints of a thread that is about to return.
void close_endpoints(ThreadContext& ctx, Addressee self);

}   // namespace rayshell
