#include <cmath>
#include <hostkit/scaled_backing_window.hpp>
#include <stdexcept>

namespace hostkit
{

// ─── PixelScale ──────────────────────────────────────────────────────────────

PixelScale::PixelScale(int scale) : scale_(scale)
{
    if (scale < 1)
        throw std::invalid_argument("PixelScale: scale must be >= 1");
}

int PixelScale::floor_div(int value) const
{
    const int q = value / scale_;
    return (value % scale_ != 0 && value < 0) ? q - 1 : q;
}

Rect PixelScale::rect_os_to_device(const Rect& os_rect) const
{
    if (scale_ == 1 || os_rect == Rect::empty_rect())
        return os_rect;
    const int x     = pos_os_to_device(os_rect.x);
    const int y     = pos_os_to_device(os_rect.y);
    const int x_max = pos_os_to_device(os_rect.x_max());
    const int y_max = pos_os_to_device(os_rect.y_max());
    return {x, y, x_max - x + 1, y_max - y + 1};
}

Rect PixelScale::rect_device_to_os(const Rect& device_rect) const
{
    if (scale_ == 1 || device_rect == Rect::empty_rect())
        return device_rect;
    return {pos_device_to_os(device_rect.x),
            pos_device_to_os(device_rect.y),
            span_device_to_os(device_rect.w),
            span_device_to_os(device_rect.h)};
}

Rect PixelScale::insets_os_to_device(const Rect& os_insets) const
{
    if (scale_ == 1 || os_insets == Rect::empty_rect())
        return os_insets;
    return {span_os_to_device_ceil(os_insets.x),
            span_os_to_device_ceil(os_insets.y),
            span_os_to_device_ceil(os_insets.w),
            span_os_to_device_ceil(os_insets.h)};
}

// ─── ScaledBackingWindow ─────────────────────────────────────────────────────

ScaledBackingWindow::ScaledBackingWindow(std::unique_ptr<BackingWindow> inner, int scale)
    : inner_(std::move(inner)), scale_(scale)
{
    if (!inner_)
        throw std::invalid_argument("ScaledBackingWindow: inner window must not be null");
}

ScaledBackingWindow::~ScaledBackingWindow()
{
    inner_->set_event_sink(nullptr);
}

void ScaledBackingWindow::set_event_sink(BackingEventSink* sink)
{
    sink_ = sink;
    inner_->set_event_sink(sink ? static_cast<BackingEventSink*>(this) : nullptr);
}

Rect ScaledBackingWindow::insets() const
{
    return scale_.insets_os_to_device(inner_->insets());
}

Rect ScaledBackingWindow::client_bounds() const
{
    return scale_.rect_os_to_device(inner_->client_bounds());
}

Rect ScaledBackingWindow::window_bounds() const
{
    return scale_.rect_os_to_device(inner_->window_bounds());
}

void ScaledBackingWindow::set_client_bounds(const Rect& r)
{
    inner_->set_client_bounds(scale_.rect_device_to_os(r));
}

void ScaledBackingWindow::set_window_bounds(const Rect& r)
{
    inner_->set_window_bounds(scale_.rect_device_to_os(r));
}

void ScaledBackingWindow::present(const Rect& dirty)
{
    inner_->present(scale_.rect_device_to_os(dirty));
}

MouseEvent ScaledBackingWindow::to_device(const MouseEvent& event) const
{
    MouseEvent result = event;
    result.x          = std::floor(event.x / scale_.scale());
    result.y          = std::floor(event.y / scale_.scale());
    return result;
}

// ─── Forwarded notifications ─────────────────────────────────────────────────

void ScaledBackingWindow::on_backing_moved()
{
    if (sink_)
        sink_->on_backing_moved();
}

void ScaledBackingWindow::on_backing_resized()
{
    if (sink_)
        sink_->on_backing_resized();
}

void ScaledBackingWindow::on_backing_closing()
{
    if (sink_)
        sink_->on_backing_closing();
}

void ScaledBackingWindow::on_backing_shown()
{
    if (sink_)
        sink_->on_backing_shown();
}

void ScaledBackingWindow::on_backing_hidden()
{
    if (sink_)
        sink_->on_backing_hidden();
}

void ScaledBackingWindow::on_backing_focus_gained()
{
    if (sink_)
        sink_->on_backing_focus_gained();
}

void ScaledBackingWindow::on_backing_focus_lost()
{
    if (sink_)
        sink_->on_backing_focus_lost();
}

void ScaledBackingWindow::on_backing_iconified()
{
    if (sink_)
        sink_->on_backing_iconified();
}

void ScaledBackingWindow::on_backing_deiconified()
{
    if (sink_)
        sink_->on_backing_deiconified();
}

void ScaledBackingWindow::on_backing_maximized()
{
    if (sink_)
        sink_->on_backing_maximized();
}

void ScaledBackingWindow::on_backing_demaximized()
{
    if (sink_)
        sink_->on_backing_demaximized();
}

void ScaledBackingWindow::on_backing_any_event()
{
    if (sink_)
        sink_->on_backing_any_event();
}

void ScaledBackingWindow::on_backing_mouse_pressed(const MouseEvent& event)
{
    if (sink_)
        sink_->on_backing_mouse_pressed(to_device(event));
}

void ScaledBackingWindow::on_backing_mouse_released(const MouseEvent& event)
{
    if (sink_)
        sink_->on_backing_mouse_released(to_device(event));
}

void ScaledBackingWindow::on_backing_mouse_moved(const MouseEvent& event)
{
    if (sink_)
        sink_->on_backing_mouse_moved(to_device(event));
}

void ScaledBackingWindow::on_backing_invalidated(const Rect& dirty)
{
    if (sink_)
        sink_->on_backing_invalidated(scale_.rect_os_to_device(dirty));
}

}   // namespace hostkit
