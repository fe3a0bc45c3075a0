#pragma once

#ifdef RAYSHELL_USE_GLFW

    #include <cstdint>
    #include <rayshell/config.hpp>
    #include <string>

struct GLFWwindow;

namespace rayshell
{

class GlfwAdapter
{
   public:
    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    // Initialize GLFW and create a window with a current OpenGL 3.3 context.
    // Returns false and logs the reason on failure.
    bool init(const UiInitConfig& config);

    // Destroy the window and terminate GLFW
    void shutdown();

    // Poll events (call once per frame)
    void poll_events();

    void swap_buffers();

    bool should_close() const;
    void request_close();

    GLFWwindow* native_window() const { return window_; }

    // Get current framebuffer size
    void framebuffer_size(uint32_t& width, uint32_t& height) const;

   private:
    static void error_callback(int code, const char* description);

    GLFWwindow* window_      = nullptr;
    bool        initialized_ = false;
};

}   // namespace rayshell

#endif   // RAYSHELL_USE_GLFW
