#pragma once

#include <hostkit/rect.hpp>
#include <hostkit/window_event.hpp>

namespace hostkit
{

// Entry points a backing window calls when the native backend reports
// something. Implemented by Host.
//
// Moved, resized and closing are mandatory: bounds are never polled, so a
// backend that does not report them leaves the client with stale bounds.
// The state notifications are latency hints only; hosts also poll.
// Every entry point must be called on the UI thread, except
// on_backing_invalidated which may be called from any thread.
class BackingEventSink
{
   public:
    virtual ~BackingEventSink() = default;

    virtual void on_backing_moved()   = 0;
    virtual void on_backing_resized() = 0;
    virtual void on_backing_closing() = 0;

    virtual void on_backing_shown()       = 0;
    virtual void on_backing_hidden()      = 0;
    virtual void on_backing_focus_gained() = 0;
    virtual void on_backing_focus_lost()  = 0;
    virtual void on_backing_iconified()   = 0;
    virtual void on_backing_deiconified() = 0;
    virtual void on_backing_maximized()   = 0;
    virtual void on_backing_demaximized() = 0;
    virtual void on_backing_any_event()   = 0;

    virtual void on_backing_mouse_pressed(const MouseEvent& event)  = 0;
    virtual void on_backing_mouse_released(const MouseEvent& event) = 0;
    virtual void on_backing_mouse_moved(const MouseEvent& event)    = 0;

    virtual void on_backing_invalidated(const Rect& dirty) = 0;
};

// Contract a native backend implements once, injected into each Host.
//
// Queries are best effort. is_focused, is_iconified and is_maximized are
// undefined unless is_showing is true; is_maximized is also undefined while
// iconified. Bounds are in the coordinate space the host works in; use
// ScaledBackingWindow to convert from OS pixels.
class BackingWindow
{
   public:
    virtual ~BackingWindow() = default;

    // Called once by the owning host before any other call.
    virtual void set_event_sink(BackingEventSink* sink) = 0;

    // ─── Queries ─────────────────────────────────────────────────────────────

    virtual bool is_showing() const   = 0;
    virtual bool is_focused() const   = 0;
    virtual bool is_iconified() const = 0;
    virtual bool is_maximized() const = 0;

    // Border thickness as (left, top, right, bottom) stored in (x, y, w, h).
    virtual Rect insets() const        = 0;
    virtual Rect client_bounds() const = 0;
    virtual Rect window_bounds() const = 0;

    // ─── Capabilities ────────────────────────────────────────────────────────

    virtual bool does_iconify_work() const  = 0;
    virtual bool does_maximize_work() const = 0;

    // True to ignore a drag move right now, for backends that emit false
    // drag starts after a bounds change.
    virtual bool must_block_drag_move_detection() const { return false; }

    // ─── Mutators ────────────────────────────────────────────────────────────

    virtual void show()                            = 0;
    virtual void hide()                            = 0;
    virtual void request_focus_gain()              = 0;
    virtual void set_iconified(bool iconified)     = 0;
    virtual void set_maximized(bool maximized)     = 0;
    virtual void set_client_bounds(const Rect& r)  = 0;
    virtual void set_window_bounds(const Rect& r)  = 0;
    virtual void close()                           = 0;

    // Present whatever the client painted into `dirty`. Called right after
    // HostClient::paint_client.
    virtual void present(const Rect& dirty) { (void)dirty; }
};

}   // namespace hostkit
