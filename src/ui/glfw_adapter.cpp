#ifdef RAYSHELL_USE_GLFW

    #include "glfw_adapter.hpp"

    #include <GLFW/glfw3.h>
    #include <rayshell/log_targets.hpp>
    #include <rayshell/logger.hpp>

namespace rayshell
{

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

void GlfwAdapter::error_callback(int code, const char* description)
{
    RAYSHELL_LOG_ERROR(targets::UI_DEBUG_GENERAL, "GLFW error {}: {}", code, description);
}

bool GlfwAdapter::init(const UiInitConfig& config)
{
    glfwSetErrorCallback(error_callback);
    if (!glfwInit())
    {
        RAYSHELL_LOG_ERROR(targets::UI_DEBUG_GENERAL, "Failed to initialize GLFW");
        return false;
    }
    initialized_ = true;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    glfwWindowHint(GLFW_MAXIMIZED, config.start_maximised ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_SAMPLES, config.multisampling);
    if (config.hardware_acceleration && !*config.hardware_acceleration)
    {
        // GLFW has no switch for software rendering; the driver decides.
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "software rendering was requested but cannot be forced");
    }

    window_ = glfwCreateWindow(static_cast<int>(config.window_width),
                               static_cast<int>(config.window_height),
                               config.window_title.c_str(),
                               nullptr,
                               nullptr);
    if (!window_)
    {
        RAYSHELL_LOG_ERROR(targets::UI_DEBUG_GENERAL, "Failed to create GLFW window");
        shutdown();
        return false;
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(config.vsync ? 1 : 0);
    return true;
}

void GlfwAdapter::shutdown()
{
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (initialized_)
    {
        glfwTerminate();
        initialized_ = false;
    }
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

void GlfwAdapter::swap_buffers()
{
    if (window_)
        glfwSwapBuffers(window_);
}

bool GlfwAdapter::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void GlfwAdapter::request_close()
{
    if (window_)
        glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    if (window_)
    {
        int w = 0, h = 0;
        glfwGetFramebufferSize(window_, &w, &h);
        width  = static_cast<uint32_t>(w);
        height = static_cast<uint32_t>(h);
    }
    else
    {
        width  = 0;
        height = 0;
    }
}

}   // namespace rayshell

#endif   // RAYSHELL_USE_GLFW
