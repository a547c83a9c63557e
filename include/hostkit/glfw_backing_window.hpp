#pragma once

#ifdef HOSTKIT_USE_GLFW

    #include <hostkit/backing_window.hpp>
    #include <hostkit/ui_scheduler.hpp>
    #include <string>

struct GLFWwindow;

namespace hostkit
{

// Owns the GLFW library for the lifetime of the process' windows.
// Create one, on the UI thread, before any GlfwBackingWindow.
class GlfwPlatform
{
   public:
    // Throws std::runtime_error if GLFW cannot be initialized.
    GlfwPlatform();
    ~GlfwPlatform();

    GlfwPlatform(const GlfwPlatform&)            = delete;
    GlfwPlatform& operator=(const GlfwPlatform&) = delete;

    // Processes pending native events, then destroys windows closed from
    // within a GLFW callback.
    void poll_events();

    // Same as poll_events, blocking for up to `timeout_s` when idle.
    void wait_events_timeout(double timeout_s);

    // Work area of the primary monitor, empty if there is none.
    Rect primary_work_area() const;
};

// BackingWindow implemented with GLFW. Created hidden, with no client API:
// the client renders through its own surface, created from native_window().
//
// GLFW reports no show/hide notifications; hosts pick those up by polling.
class GlfwBackingWindow : public BackingWindow
{
   public:
    struct CreateInfo
    {
        int         width     = 800;
        int         height    = 600;
        std::string title     = "hostkit";
        bool        decorated = true;
        bool        resizable = true;
    };

    // Throws std::runtime_error if the window cannot be created.
    explicit GlfwBackingWindow(const CreateInfo& info);
    ~GlfwBackingWindow() override;

    GlfwBackingWindow(const GlfwBackingWindow&)            = delete;
    GlfwBackingWindow& operator=(const GlfwBackingWindow&) = delete;

    // nullptr once closed.
    GLFWwindow* native_window() const { return window_; }

    // Receives exceptions thrown by the sink from within GLFW callbacks,
    // which must not unwind through GLFW. Defaults to logging.
    void set_exception_handler(ExceptionHandler handler) { handler_ = std::move(handler); }

    void set_event_sink(BackingEventSink* sink) override { sink_ = sink; }

    bool is_showing() const override;
    bool is_focused() const override;
    bool is_iconified() const override;
    bool is_maximized() const override;

    Rect insets() const override;
    Rect client_bounds() const override;
    Rect window_bounds() const override;

    bool does_iconify_work() const override { return true; }
    bool does_maximize_work() const override { return true; }

    void show() override;
    void hide() override;
    void request_focus_gain() override;
    void set_iconified(bool iconified) override;
    void set_maximized(bool maximized) override;
    void set_client_bounds(const Rect& r) override;
    void set_window_bounds(const Rect& r) override;
    void close() override;

    // Destroys windows closed while one of their callbacks was running.
    static void destroy_deferred_windows();

   private:
    bool attrib(int attribute) const;

    template <typename Fn>
    static void dispatch(GLFWwindow* window, Fn&& fn);

    // Static callback trampolines (GLFW uses C callbacks)
    static void pos_callback(GLFWwindow* window, int x, int y);
    static void size_callback(GLFWwindow* window, int width, int height);
    static void close_callback(GLFWwindow* window);
    static void focus_callback(GLFWwindow* window, int focused);
    static void iconify_callback(GLFWwindow* window, int iconified);
    static void maximize_callback(GLFWwindow* window, int maximized);
    static void refresh_callback(GLFWwindow* window);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void cursor_pos_callback(GLFWwindow* window, double x, double y);

    GLFWwindow*       window_ = nullptr;
    BackingEventSink* sink_   = nullptr;
    ExceptionHandler  handler_;
};

}   // namespace hostkit

#endif   // HOSTKIT_USE_GLFW
