#pragma once

#include <hostkit/rect.hpp>
#include <optional>

namespace hostkit
{

enum class BoundsSpace
{
    Client,
    Window,
};

// Target bounds, expressed either for the client area or for the whole window.
struct BoundsTarget
{
    Rect        rect;
    BoundsSpace space = BoundsSpace::Client;

    bool operator==(const BoundsTarget&) const = default;
};

// Freezes the bounds reported to the client while the user drags the window,
// and defers bounds writes requested during the drag to its end.
//
// A session starts on drag button press, becomes a "drag move" on the first
// unblocked move with the button down, and ends on release or cancellation.
class DragStabilizer
{
   public:
    // Records the bounds at press time.
    void on_press(const Rect& client_bounds, const Rect& window_bounds);

    // Move with the drag button down. `blocked` ignores this move for
    // detection purposes. No effect without a press.
    void on_drag_move(bool blocked);

    // Discards the session and any queued target. Never throws.
    void cancel() noexcept;

    // Ends the session. Returns the queued target if a drag move was
    // detected; the caller applies it.
    std::optional<BoundsTarget> end();

    // Replaces any previously queued target.
    void queue_target(const BoundsTarget& target);

    bool is_press_detected() const { return session_.has_value(); }
    bool is_move_detected() const { return session_ && session_->move_detected; }

    // Bounds captured at press time. Only meaningful while a session exists.
    Rect client_bounds_at_press() const { return session_ ? session_->client_bounds : Rect{}; }
    Rect window_bounds_at_press() const { return session_ ? session_->window_bounds : Rect{}; }

    const std::optional<BoundsTarget>& queued_target() const;

   private:
    struct Session
    {
        Rect                        client_bounds;
        Rect                        window_bounds;
        bool                        move_detected = false;
        std::optional<BoundsTarget> target;
    };

    std::optional<Session> session_;
};

}   // namespace hostkit
