#include "drag_stabilizer.hpp"

#include <hostkit/logger.hpp>

namespace hostkit
{

void DragStabilizer::on_press(const Rect& client_bounds, const Rect& window_bounds)
{
    session_ = Session{client_bounds, window_bounds, false, std::nullopt};
    HOSTKIT_LOG_TRACE("drag", "Drag press, client bounds {}", client_bounds);
}

void DragStabilizer::on_drag_move(bool blocked)
{
    if (!session_ || session_->move_detected)
        return;
    if (blocked)
    {
        HOSTKIT_LOG_TRACE("drag", "Drag move detection blocked");
        return;
    }
    session_->move_detected = true;
    HOSTKIT_LOG_TRACE("drag", "Drag move detected");
}

void DragStabilizer::cancel() noexcept
{
    session_.reset();
}

std::optional<BoundsTarget> DragStabilizer::end()
{
    if (!session_)
        return std::nullopt;
    Session session = std::move(*session_);
    session_.reset();
    if (!session.move_detected)
        return std::nullopt;
    return session.target;
}

void DragStabilizer::queue_target(const BoundsTarget& target)
{
    if (!session_)
        return;
    session_->target = target;
}

const std::optional<BoundsTarget>& DragStabilizer::queued_target() const
{
    static const std::optional<BoundsTarget> kNone;
    return session_ ? session_->target : kNone;
}

}   // namespace hostkit
