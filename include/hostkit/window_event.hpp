#pragma once

#include <cstdint>
#include <hostkit/rect.hpp>
#include <string_view>

namespace hostkit
{

class Host;

enum class WindowEventType : uint8_t
{
    Shown,
    Hidden,
    FocusGained,
    FocusLost,
    Iconified,
    Deiconified,
    Maximized,
    Demaximized,
    Moved,
    Resized,
    Closed,
};

inline constexpr int kWindowEventTypeCount = 11;

// Shown <-> Hidden, FocusGained <-> FocusLost, and so on.
// Moved, Resized and Closed have no opposite and map to themselves.
constexpr WindowEventType opposite(WindowEventType type)
{
    switch (type)
    {
        case WindowEventType::Shown:
            return WindowEventType::Hidden;
        case WindowEventType::Hidden:
            return WindowEventType::Shown;
        case WindowEventType::FocusGained:
            return WindowEventType::FocusLost;
        case WindowEventType::FocusLost:
            return WindowEventType::FocusGained;
        case WindowEventType::Iconified:
            return WindowEventType::Deiconified;
        case WindowEventType::Deiconified:
            return WindowEventType::Iconified;
        case WindowEventType::Maximized:
            return WindowEventType::Demaximized;
        case WindowEventType::Demaximized:
            return WindowEventType::Maximized;
        case WindowEventType::Moved:
        case WindowEventType::Resized:
        case WindowEventType::Closed:
            break;
    }
    return type;
}

std::string_view to_string(WindowEventType type);

struct WindowEvent
{
    Host*           host = nullptr;
    WindowEventType type = WindowEventType::Shown;
};

// What a host's client has been told so far.
struct ClientState
{
    bool showing        = false;
    bool focused        = false;
    bool iconified      = false;
    bool maximized      = false;
    bool move_pending   = false;
    bool resize_pending = false;
    bool closed         = false;

    bool is_showing_deico() const { return showing && !iconified; }
};

// Mouse input forwarded by a backing window. Only what drag tracking needs.
struct MouseEvent
{
    double x                 = 0.0;
    double y                 = 0.0;
    int    button            = 0;
    bool   is_drag_button    = false;   // press/release concern the drag button
    bool   drag_button_down  = false;   // state of the drag button during a move
};

// Receives the canonical event stream of one host, on the UI thread,
// one event at a time. Exceptions thrown from callbacks propagate to the
// code that triggered the dispatch.
class HostClient
{
   public:
    virtual ~HostClient() = default;

    virtual void on_shown(const WindowEvent&) {}
    virtual void on_hidden(const WindowEvent&) {}
    virtual void on_focus_gained(const WindowEvent&) {}
    virtual void on_focus_lost(const WindowEvent&) {}
    virtual void on_iconified(const WindowEvent&) {}
    virtual void on_deiconified(const WindowEvent&) {}
    virtual void on_maximized(const WindowEvent&) {}
    virtual void on_demaximized(const WindowEvent&) {}
    virtual void on_moved(const WindowEvent&) {}
    virtual void on_resized(const WindowEvent&) {}
    virtual void on_closed(const WindowEvent&) {}

    virtual void on_mouse_pressed(const MouseEvent&) {}
    virtual void on_mouse_released(const MouseEvent&) {}
    virtual void on_mouse_moved(const MouseEvent&) {}
    virtual void on_mouse_dragged(const MouseEvent&) {}

    // Paint the given dirty area of the client. Called only while showing
    // and not iconified.
    virtual void paint_client(const Rect& dirty) { (void)dirty; }
};

// Calls the HostClient method matching event.type.
void deliver(HostClient& client, const WindowEvent& event);

}   // namespace hostkit
