#pragma once

#include <rayshell/error.hpp>
#include <string>
#include <variant>

namespace rayshell
{

// Which thread a message is meant for.
enum class Addressee
{
    Engine,
    Program,
    Ui,
};

// ─── Engine thread ───────────────────────────────────────────────────────────

enum class EngineThreadMessage
{
    ExitEngineThread,
};

// ─── Program thread ──────────────────────────────────────────────────────────

// Reasons for a clean quit (not caused by an error).
enum class QuitAppNoErrorReason
{
    QuitInteractionByUser,
};

// The app should quit gently, e.g. the user closed the window.
struct QuitAppNoError
{
    QuitAppNoErrorReason reason = QuitAppNoErrorReason::QuitInteractionByUser;
};

// The app should quit because an error happened. The report is shared
// read-only since every receiver of a broadcast holds a copy of the message.
struct QuitAppError
{
    SharedReport error;
};

using ProgramThreadMessage = std::variant<QuitAppNoError, QuitAppError>;

// ─── UI thread ───────────────────────────────────────────────────────────────

enum class UiThreadMessage
{
    ExitUiThread,
};

// ─── Envelope ────────────────────────────────────────────────────────────────
// The outer alternative is the addressee.

struct EngineMessage
{
    EngineThreadMessage message;
};

struct ProgramMessage
{
    ProgramThreadMessage message;
};

struct UiMessage
{
    UiThreadMessage message;
};

using ThreadMessage = std::variant<EngineMessage, ProgramMessage, UiMessage>;

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

namespace messages
{
ThreadMessage exit_engine_thread();
ThreadMessage exit_ui_thread();
ThreadMessage quit_app_no_error(QuitAppNoErrorReason reason);
ThreadMessage quit_app_error(SharedReport error);
}   // namespace messages

Addressee   addressee(const ThreadMessage& message);
bool        is_addressed_to(const ThreadMessage& message, Addressee who);
const char* to_string(Addressee who);
const char* to_string(QuitAppNoErrorReason reason);

// Debug rendering of a message, e.g. `Program(QuitAppError("..."))`.
std::string to_string(const ThreadMessage& message);

// Logs that `receiver` dropped a message addressed to another thread.
void log_ignored(const ThreadMessage& message, Addressee receiver);
// Logs that a message reached its addressee.
void log_received(const ThreadMessage& message);

}   // namespace rayshell
