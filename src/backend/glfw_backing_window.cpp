#ifdef HOSTKIT_USE_GLFW

    #include <hostkit/glfw_backing_window.hpp>
    #include <hostkit/logger.hpp>

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <stdexcept>
    #include <vector>

namespace hostkit
{

namespace
{

// GLFW forbids destroying any window while a callback runs.
int g_callback_depth = 0;

struct CallbackDepthGuard
{
    CallbackDepthGuard() { ++g_callback_depth; }
    ~CallbackDepthGuard() { --g_callback_depth; }

    CallbackDepthGuard(const CallbackDepthGuard&)            = delete;
    CallbackDepthGuard& operator=(const CallbackDepthGuard&) = delete;
};

std::vector<GLFWwindow*>& deferred_destroys()
{
    static std::vector<GLFWwindow*> windows;
    return windows;
}

void error_callback(int code, const char* description)
{
    HOSTKIT_LOG_ERROR("glfw", "GLFW error {}: {}", code, description);
}

}   // namespace

// ─── GlfwPlatform ────────────────────────────────────────────────────────────

GlfwPlatform::GlfwPlatform()
{
    glfwSetErrorCallback(error_callback);
    if (!glfwInit())
        throw std::runtime_error("GlfwPlatform: failed to initialize GLFW");
    HOSTKIT_LOG_INFO("glfw", "GLFW {} initialized", glfwGetVersionString());
}

GlfwPlatform::~GlfwPlatform()
{
    GlfwBackingWindow::destroy_deferred_windows();
    glfwTerminate();
}

void GlfwPlatform::poll_events()
{
    glfwPollEvents();
    GlfwBackingWindow::destroy_deferred_windows();
}

void GlfwPlatform::wait_events_timeout(double timeout_s)
{
    if (timeout_s > 0.0)
        glfwWaitEventsTimeout(timeout_s);
    else
        glfwPollEvents();
    GlfwBackingWindow::destroy_deferred_windows();
}

Rect GlfwPlatform::primary_work_area() const
{
    GLFWmonitor* monitor = glfwGetPrimaryMonitor();
    if (!monitor)
        return Rect::empty_rect();
    Rect r;
    glfwGetMonitorWorkarea(monitor, &r.x, &r.y, &r.w, &r.h);
    return r;
}

// ─── GlfwBackingWindow ───────────────────────────────────────────────────────

GlfwBackingWindow::GlfwBackingWindow(const CreateInfo& info)
{
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_DECORATED, info.decorated ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, info.resizable ? GLFW_TRUE : GLFW_FALSE);

    window_ = glfwCreateWindow(info.width, info.height, info.title.c_str(), nullptr, nullptr);
    if (!window_)
        throw std::runtime_error("GlfwBackingWindow: failed to create window \"" + info.title + "\"");

    // Store this pointer for static callbacks
    glfwSetWindowUserPointer(window_, this);

    glfwSetWindowPosCallback(window_, pos_callback);
    glfwSetWindowSizeCallback(window_, size_callback);
    glfwSetWindowCloseCallback(window_, close_callback);
    glfwSetWindowFocusCallback(window_, focus_callback);
    glfwSetWindowIconifyCallback(window_, iconify_callback);
    glfwSetWindowMaximizeCallback(window_, maximize_callback);
    glfwSetWindowRefreshCallback(window_, refresh_callback);
    glfwSetMouseButtonCallback(window_, mouse_button_callback);
    glfwSetCursorPosCallback(window_, cursor_pos_callback);

    HOSTKIT_LOG_DEBUG("glfw", "Created window \"{}\" {}x{}", info.title, info.width, info.height);
}

GlfwBackingWindow::~GlfwBackingWindow()
{
    close();
}

bool GlfwBackingWindow::attrib(int attribute) const
{
    return window_ && glfwGetWindowAttrib(window_, attribute) == GLFW_TRUE;
}

bool GlfwBackingWindow::is_showing() const
{
    return attrib(GLFW_VISIBLE);
}

bool GlfwBackingWindow::is_focused() const
{
    return attrib(GLFW_FOCUSED);
}

bool GlfwBackingWindow::is_iconified() const
{
    return attrib(GLFW_ICONIFIED);
}

bool GlfwBackingWindow::is_maximized() const
{
    return attrib(GLFW_MAXIMIZED);
}

Rect GlfwBackingWindow::insets() const
{
    if (!window_)
        return Rect::empty_rect();
    Rect r;
    glfwGetWindowFrameSize(window_, &r.x, &r.y, &r.w, &r.h);
    return r;
}

// GLFW positions and sizes refer to the client area.
Rect GlfwBackingWindow::client_bounds() const
{
    if (!window_)
        return Rect::empty_rect();
    Rect r;
    glfwGetWindowPos(window_, &r.x, &r.y);
    glfwGetWindowSize(window_, &r.w, &r.h);
    return r;
}

Rect GlfwBackingWindow::window_bounds() const
{
    if (!window_)
        return Rect::empty_rect();
    return window_from_client(insets(), client_bounds());
}

void GlfwBackingWindow::show()
{
    if (window_)
        glfwShowWindow(window_);
}

void GlfwBackingWindow::hide()
{
    if (window_)
        glfwHideWindow(window_);
}

void GlfwBackingWindow::request_focus_gain()
{
    if (window_)
        glfwFocusWindow(window_);
}

void GlfwBackingWindow::set_iconified(bool iconified)
{
    if (!window_)
        return;
    if (iconified)
        glfwIconifyWindow(window_);
    else
        glfwRestoreWindow(window_);
}

void GlfwBackingWindow::set_maximized(bool maximized)
{
    if (!window_)
        return;
    if (maximized)
        glfwMaximizeWindow(window_);
    else
        glfwRestoreWindow(window_);
}

void GlfwBackingWindow::set_client_bounds(const Rect& r)
{
    if (!window_)
        return;
    glfwSetWindowPos(window_, r.x, r.y);
    glfwSetWindowSize(window_, r.w, r.h);
}

void GlfwBackingWindow::set_window_bounds(const Rect& r)
{
    if (!window_)
        return;
    const Rect client = client_from_window(insets(), r);
    set_client_bounds(client.with_spans(std::max(1, client.w), std::max(1, client.h)));
}

// A window cannot be destroyed while a GLFW callback runs; it is hidden
// right away and destroyed after the current event processing.
void GlfwBackingWindow::close()
{
    if (!window_)
        return;

    GLFWwindow* window = window_;
    window_            = nullptr;
    glfwSetWindowUserPointer(window, nullptr);

    if (g_callback_depth > 0)
    {
        glfwHideWindow(window);
        deferred_destroys().push_back(window);
        return;
    }
    glfwDestroyWindow(window);
}

void GlfwBackingWindow::destroy_deferred_windows()
{
    auto& windows = deferred_destroys();
    for (GLFWwindow* window : windows)
        glfwDestroyWindow(window);
    windows.clear();
}

// ─── Static callback trampolines ────────────────────────────────────────────

template <typename Fn>
void GlfwBackingWindow::dispatch(GLFWwindow* window, Fn&& fn)
{
    auto* self = static_cast<GlfwBackingWindow*>(glfwGetWindowUserPointer(window));
    if (!self || !self->sink_)
        return;

    const CallbackDepthGuard depth;
    try
    {
        fn(*self->sink_);
    }
    catch (const std::exception& e)
    {
        HOSTKIT_LOG_ERROR("glfw", "Window callback failed: {}", e.what());
        if (self->handler_)
            self->handler_(std::current_exception());
    }
}

void GlfwBackingWindow::pos_callback(GLFWwindow* window, int /*x*/, int /*y*/)
{
    dispatch(window, [](BackingEventSink& sink) { sink.on_backing_moved(); });
}

void GlfwBackingWindow::size_callback(GLFWwindow* window, int /*width*/, int /*height*/)
{
    dispatch(window, [](BackingEventSink& sink) { sink.on_backing_resized(); });
}

void GlfwBackingWindow::close_callback(GLFWwindow* window)
{
    // The host decides; the window stays open until it is closed through it.
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    dispatch(window, [](BackingEventSink& sink) { sink.on_backing_closing(); });
}

void GlfwBackingWindow::focus_callback(GLFWwindow* window, int focused)
{
    dispatch(window,
             [focused](BackingEventSink& sink)
             {
                 if (focused)
                     sink.on_backing_focus_gained();
                 else
                     sink.on_backing_focus_lost();
             });
}

void GlfwBackingWindow::iconify_callback(GLFWwindow* window, int iconified)
{
    dispatch(window,
             [iconified](BackingEventSink& sink)
             {
                 if (iconified)
                     sink.on_backing_iconified();
                 else
                     sink.on_backing_deiconified();
             });
}

void GlfwBackingWindow::maximize_callback(GLFWwindow* window, int maximized)
{
    dispatch(window,
             [maximized](BackingEventSink& sink)
             {
                 if (maximized)
                     sink.on_backing_maximized();
                 else
                     sink.on_backing_demaximized();
             });
}

void GlfwBackingWindow::refresh_callback(GLFWwindow* window)
{
    dispatch(window, [](BackingEventSink& sink) { sink.on_backing_invalidated(Rect::huge()); });
}

void GlfwBackingWindow::mouse_button_callback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    double x = 0.0, y = 0.0;
    glfwGetCursorPos(window, &x, &y);
    const MouseEvent event{
        .x                = x,
        .y                = y,
        .button           = button,
        .is_drag_button   = button == GLFW_MOUSE_BUTTON_LEFT,
        .drag_button_down = glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS,
    };
    dispatch(window,
             [&event, action](BackingEventSink& sink)
             {
                 if (action == GLFW_PRESS)
                     sink.on_backing_mouse_pressed(event);
                 else if (action == GLFW_RELEASE)
                     sink.on_backing_mouse_released(event);
             });
}

void GlfwBackingWindow::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    const MouseEvent event{
        .x                = x,
        .y                = y,
        .button           = GLFW_MOUSE_BUTTON_LEFT,
        .is_drag_button   = false,
        .drag_button_down = glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS,
    };
    dispatch(window, [&event](BackingEventSink& sink) { sink.on_backing_mouse_moved(event); });
}

}   // namespace hostkit

#endif   // HOSTKIT_USE_GLFW
