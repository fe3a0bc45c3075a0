#pragma once

// Log categories. Each names the subsystem an entry comes from and how noisy
// it is expected to be, so whole groups can be switched off by prefix.

namespace rayshell::targets
{

// ─── Threads ─────────────────────────────────────────────────────────────────
inline constexpr const char* THREAD_DEBUG_GENERAL           = "rayshell::thread_debug_general";
inline constexpr const char* THREAD_DEBUG_MESSENGER_LIFETIME = "rayshell::thread_debug_messenger_lifetime";
inline constexpr const char* THREAD_DEBUG_MESSAGE_RECEIVED  = "rayshell::thread_debug_message_received";
inline constexpr const char* THREAD_DEBUG_MESSAGE_SEND      = "rayshell::thread_debug_message_send";
inline constexpr const char* THREAD_TRACE_MESSAGE_LOOP      = "rayshell::thread_trace_message_loop";
inline constexpr const char* THREAD_TRACE_MESSAGE_IGNORED   = "rayshell::thread_trace_message_ignored";
inline constexpr const char* THREAD_TRACE_MUTEX_SYNC        = "rayshell::thread_trace_mutex_sync";

// ─── Program / engine loops ──────────────────────────────────────────────────
inline constexpr const char* PROGRAM_DEBUG_GENERAL            = "rayshell::program_debug_general";
inline constexpr const char* PROGRAM_TRACE_GLOBAL_LOOP        = "rayshell::program_trace_global_loop";
inline constexpr const char* PROGRAM_TRACE_THREAD_STATUS_POLL = "rayshell::program_trace_thread_status_poll";
inline constexpr const char* ENGINE_TRACE_GLOBAL_LOOP         = "rayshell::engine_trace_global_loop";

// ─── UI ──────────────────────────────────────────────────────────────────────
inline constexpr const char* UI_DEBUG_GENERAL          = "rayshell::ui_debug_general";
inline constexpr const char* UI_DEBUG_USER_INTERACTION = "rayshell::ui_debug_user_interaction";
inline constexpr const char* UI_TRACE_EVENT_LOOP       = "rayshell::ui_trace_event_loop";
inline constexpr const char* UI_TRACE_BUILD_INTERFACE  = "rayshell::ui_trace_build_interface";
inline constexpr const char* UI_TRACE_RENDER           = "rayshell::ui_trace_render";

// ─── Resources ───────────────────────────────────────────────────────────────
inline constexpr const char* RESOURCES_DEBUG_LOAD          = "rayshell::resources_debug_load";
inline constexpr const char* FONT_MANAGER_TRACE_FONT_LOAD  = "rayshell::font_manager_trace_font_load";
inline constexpr const char* CONFIG_DEBUG_GENERAL          = "rayshell::config_debug_general";
inline constexpr const char* DATA_DEBUG_DUMP_OBJECT        = "rayshell::data_debug_dump_object";

// ─── Problems ────────────────────────────────────────────────────────────────
inline constexpr const char* GENERAL_WARNING_NON_FATAL = "rayshell::general_warning_non_fatal";
inline constexpr const char* GENERAL_ERROR_FATAL       = "rayshell::general_error_fatal";
inline constexpr const char* DOMINO_EFFECT_FAILURE     = "rayshell::domino_effect_failure";
inline constexpr const char* REALLY_BAD_UNREACHABLE    = "rayshell::really_bad_unreachable";

}   // namespace rayshell::targets
