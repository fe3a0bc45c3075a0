#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <rayshell/messages.hpp>

namespace rayshell
{

namespace messages
{

ThreadMessage exit_engine_thread()
{
    return EngineMessage{EngineThreadMessage::ExitEngineThread};
}

ThreadMessage exit_ui_thread()
{
    return UiMessage{UiThreadMessage::ExitUiThread};
}

ThreadMessage quit_app_no_error(QuitAppNoErrorReason reason)
{
    return ProgramMessage{QuitAppNoError{reason}};
}

ThreadMessage quit_app_error(SharedReport error)
{
    return ProgramMessage{QuitAppError{std::move(error)}};
}

}   // namespace messages

Addressee addressee(const ThreadMessage& message)
{
    return std::visit(overloaded{
                          [](const EngineMessage&) { return Addressee::Engine; },
                          [](const ProgramMessage&) { return Addressee::Program; },
                          [](const UiMessage&) { return Addressee::Ui; },
                      },
                      message);
}

bool is_addressed_to(const ThreadMessage& message, Addressee who)
{
    return addressee(message) == who;
}

const char* to_string(Addressee who)
{
    switch (who)
    {
        case Addressee::Engine:
            return "engine";
        case Addressee::Program:
            return "program";
        case Addressee::Ui:
            return "ui";
    }
    return "unknown";
}

const char* to_string(QuitAppNoErrorReason reason)
{
    switch (reason)
    {
        case QuitAppNoErrorReason::QuitInteractionByUser:
            return "QuitInteractionByUser";
    }
    return "Unknown";
}

std::string to_string(const ThreadMessage& message)
{
    return std::visit(
        overloaded{
            [](const EngineMessage& m) -> std::string
            {
                switch (m.message)
                {
                    case EngineThreadMessage::ExitEngineThread:
                        return "Engine(ExitEngineThread)";
                }
                return "Engine(?)";
            },
            [](const ProgramMessage& m) -> std::string
            {
                return std::visit(
                    overloaded{
                        [](const QuitAppNoError& q) -> std::string
                        { return std::string("Program(QuitAppNoError(") + to_string(q.reason) + "))"; },
                        [](const QuitAppError& q) -> std::string
                        {
                            std::string text = q.error
                                                   ? format_report(*q.error, ErrorLogStyle::ShortWithCause)
                                                   : std::string("<null report>");
                            return "Program(QuitAppError(\"" + text + "\"))";
                        },
                    },
                    m.message);
            },
            [](const UiMessage& m) -> std::string
            {
                switch (m.message)
                {
                    case UiThreadMessage::ExitUiThread:
                        return "Ui(ExitUiThread)";
                }
                return "Ui(?)";
            },
        },
        message);
}

void log_ignored(const ThreadMessage& message, Addressee receiver)
{
    RAYSHELL_LOG_TRACE(targets::THREAD_TRACE_MESSAGE_IGNORED,
                       "{} thread ignoring message for {}: {}",
                       to_string(receiver),
                       to_string(addressee(message)),
                       to_string(message));
}

void log_received(const ThreadMessage& message)
{
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_MESSAGE_RECEIVED,
                       "got {} message: {}",
                       to_string(addressee(message)),
                       to_string(message));
}

}   // namespace rayshell
