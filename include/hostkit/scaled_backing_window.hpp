#pragma once

#include <hostkit/backing_window.hpp>
#include <memory>

namespace hostkit
{

// Integer pixel scale between OS pixels and device (host) pixels.
// One device pixel covers scale x scale OS pixels.
class PixelScale
{
   public:
    // Throws std::invalid_argument if scale < 1.
    explicit PixelScale(int scale = 1);

    int scale() const { return scale_; }

    // Device pixel containing the OS pixel at `os_pos`.
    int pos_os_to_device(int os_pos) const { return floor_div(os_pos); }
    int pos_device_to_os(int device_pos) const { return device_pos * scale_; }

    int span_os_to_device_ceil(int os_span) const { return floor_div(os_span + scale_ - 1); }
    int span_device_to_os(int device_span) const { return device_span * scale_; }

    // Smallest device rectangle covering every OS pixel of `os_rect`.
    Rect rect_os_to_device(const Rect& os_rect) const;

    // OS rectangle covering exactly the device pixels of `device_rect`.
    Rect rect_device_to_os(const Rect& device_rect) const;

    // Insets (left, top, right, bottom) rounded up, so that the scaled client
    // area never leaks out of the OS client area.
    Rect insets_os_to_device(const Rect& os_insets) const;

   private:
    int floor_div(int value) const;

    int scale_;
};

// Decorator presenting a backing window that works in OS pixels as one that
// works in device pixels. Bounds, insets, mouse positions and invalidated
// areas are converted both ways; everything else is forwarded as is.
class ScaledBackingWindow : public BackingWindow, private BackingEventSink
{
   public:
    // Throws std::invalid_argument on a null inner window or scale < 1.
    ScaledBackingWindow(std::unique_ptr<BackingWindow> inner, int scale);
    ~ScaledBackingWindow() override;

    const PixelScale& pixel_scale() const { return scale_; }
    BackingWindow&    inner() const { return *inner_; }

    void set_event_sink(BackingEventSink* sink) override;

    bool is_showing() const override { return inner_->is_showing(); }
    bool is_focused() const override { return inner_->is_focused(); }
    bool is_iconified() const override { return inner_->is_iconified(); }
    bool is_maximized() const override { return inner_->is_maximized(); }

    Rect insets() const override;
    Rect client_bounds() const override;
    Rect window_bounds() const override;

    bool does_iconify_work() const override { return inner_->does_iconify_work(); }
    bool does_maximize_work() const override { return inner_->does_maximize_work(); }
    bool must_block_drag_move_detection() const override
    {
        return inner_->must_block_drag_move_detection();
    }

    void show() override { inner_->show(); }
    void hide() override { inner_->hide(); }
    void request_focus_gain() override { inner_->request_focus_gain(); }
    void set_iconified(bool iconified) override { inner_->set_iconified(iconified); }
    void set_maximized(bool maximized) override { inner_->set_maximized(maximized); }
    void set_client_bounds(const Rect& r) override;
    void set_window_bounds(const Rect& r) override;
    void close() override { inner_->close(); }

    void present(const Rect& dirty) override;

   private:
    // Notifications from the inner window, converted and forwarded.
    void on_backing_moved() override;
    void on_backing_resized() override;
    void on_backing_closing() override;
    void on_backing_shown() override;
    void on_backing_hidden() override;
    void on_backing_focus_gained() override;
    void on_backing_focus_lost() override;
    void on_backing_iconified() override;
    void on_backing_deiconified() override;
    void on_backing_maximized() override;
    void on_backing_demaximized() override;
    void on_backing_any_event() override;
    void on_backing_mouse_pressed(const MouseEvent& event) override;
    void on_backing_mouse_released(const MouseEvent& event) override;
    void on_backing_mouse_moved(const MouseEvent& event) override;
    void on_backing_invalidated(const Rect& dirty) override;

    MouseEvent to_device(const MouseEvent& event) const;

    std::unique_ptr<BackingWindow> inner_;
    PixelScale                     scale_;
    BackingEventSink*              sink_ = nullptr;
};

}   // namespace hostkit
