#pragma once

#include <barrier>
#include <functional>
#include <memory>
#include <rayshell/config.hpp>
#include <rayshell/messages.hpp>
#include <rayshell/program_data.hpp>

#include "channel.hpp"

namespace rayshell
{

// One-shot startup rendezvous for the program thread and every worker.
using StartupBarrier = std::barrier<>;

// Observation points for tests. Empty hooks are skipped.
struct ThreadHooks
{
    std::function<void()>                     on_barrier_passed;
    std::function<void(const ThreadMessage&)> on_message_handled;
};

// Everything a worker thread is handed when it is spawned. The channel
// endpoints belong to the thread from then on.
struct ThreadContext
{
    std::shared_ptr<StartupBarrier> barrier;
    SharedProgramState              state;
    MessageSender                   sender;
    MessageReceiver                 receiver;
    ThreadTimingConfig              timing;
    ThreadHooks                     hooks;
};

}   // namespace rayshell
