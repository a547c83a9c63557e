#include "stability_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <hostkit/logger.hpp>
#include <stdexcept>
#include <string>

namespace hostkit
{

WindowEventType event_for(StateAxis axis, bool on)
{
    switch (axis)
    {
        case StateAxis::Showing:
            return on ? WindowEventType::Shown : WindowEventType::Hidden;
        case StateAxis::Iconified:
            return on ? WindowEventType::Iconified : WindowEventType::Deiconified;
        case StateAxis::Maximized:
            return on ? WindowEventType::Maximized : WindowEventType::Demaximized;
        case StateAxis::Focused:
            return on ? WindowEventType::FocusGained : WindowEventType::FocusLost;
    }
    throw std::invalid_argument("event_for: unknown axis");
}

bool axis_of(WindowEventType type, StateAxis& axis, bool& on)
{
    switch (type)
    {
        case WindowEventType::Shown:
        case WindowEventType::Hidden:
            axis = StateAxis::Showing;
            on   = type == WindowEventType::Shown;
            return true;
        case WindowEventType::Iconified:
        case WindowEventType::Deiconified:
            axis = StateAxis::Iconified;
            on   = type == WindowEventType::Iconified;
            return true;
        case WindowEventType::Maximized:
        case WindowEventType::Demaximized:
            axis = StateAxis::Maximized;
            on   = type == WindowEventType::Maximized;
            return true;
        case WindowEventType::FocusGained:
        case WindowEventType::FocusLost:
            axis = StateAxis::Focused;
            on   = type == WindowEventType::FocusGained;
            return true;
        case WindowEventType::Moved:
        case WindowEventType::Resized:
        case WindowEventType::Closed:
            break;
    }
    return false;
}

StabilityTracker::AxisRecord& StabilityTracker::record(StateAxis axis)
{
    return records_[static_cast<size_t>(axis)];
}

const StabilityTracker::AxisRecord& StabilityTracker::record(StateAxis axis) const
{
    return records_[static_cast<size_t>(axis)];
}

StabilityTracker::Direction& StabilityTracker::direction(WindowEventType type)
{
    StateAxis axis;
    bool      on;
    if (!axis_of(type, axis, on))
        throw std::invalid_argument("StabilityTracker: no state axis for " + std::string(to_string(type)));
    return record(axis).side(on);
}

const StabilityTracker::Direction& StabilityTracker::direction(WindowEventType type) const
{
    return const_cast<StabilityTracker*>(this)->direction(type);
}

void StabilityTracker::on_loop_call(bool   periodic,
                                    double now_s,
                                    double period_s,
                                    double stability_delay_s)
{
    const double previous = last_periodic_call_s_;
    if (periodic)
        last_periodic_call_s_ = now_s;

    if (std::isinf(previous) || std::isinf(newest_unstability_s_))
        return;

    const double lateness  = (now_s - previous) - period_s;
    const double threshold = period_s + 0.1 * stability_delay_s;
    if (lateness > threshold)
    {
        const double old       = newest_unstability_s_;
        newest_unstability_s_  = std::min(now_s, old + lateness);
        HOSTKIT_LOG_DEBUG("reconciler",
                          "Stall detected (lateness {} s), unstability {} -> {}",
                          lateness,
                          old,
                          newest_unstability_s_);
    }
}

void StabilityTracker::before_programmatic(WindowEventType type, double now_s)
{
    newest_unstability_s_ = now_s;
    direction(type).programmatic_pending           = true;
    direction(opposite(type)).programmatic_pending = false;
}

bool StabilityTracker::is_programmatic_pending(WindowEventType type) const
{
    return direction(type).programmatic_pending;
}

void StabilityTracker::on_fired(WindowEventType type)
{
    StateAxis axis;
    bool      on;
    if (!axis_of(type, axis, on))
        return;
    Direction& d           = record(axis).side(on);
    d.detected_not_fired   = false;
    d.programmatic_pending = false;
}

void StabilityTracker::on_axis_agreed(StateAxis axis)
{
    AxisRecord& r             = record(axis);
    r.on.detected_not_fired   = false;
    r.off.detected_not_fired  = false;
}

GateDecision StabilityTracker::gate(WindowEventType type, double now_s, const GateParams& params)
{
    Direction& self = direction(type);
    Direction& opp  = direction(opposite(type));

    if (params.block_flicker)
    {
        if (opp.detected_not_fired)
            return GateDecision::Hold;
        if (now_s - opp.detection_time_s < params.anti_flicker_delay_s)
            return GateDecision::Hold;
    }
    else
    {
        opp.detected_not_fired = false;
    }

    bool just_detected = false;
    if (!self.detected_not_fired)
    {
        self.detected_not_fired = true;
        self.detection_time_s   = now_s;
        newest_unstability_s_   = now_s;
        just_detected           = true;
    }

    if (!(params.stability_delay_s > 0.0))
        return GateDecision::Pass;

    if (self.programmatic_pending)
        return GateDecision::Pass;

    if (just_detected)
        return GateDecision::Hold;
    if (now_s - self.detection_time_s < params.stability_delay_s)
        return GateDecision::Hold;
    if (now_s - newest_unstability_s_ < params.stability_delay_s)
        return GateDecision::Hold;

    // A programmatic (de)iconification in flight makes every other reading
    // of the window state unreliable.
    switch (type)
    {
        case WindowEventType::Maximized:
        case WindowEventType::Demaximized:
            if (is_programmatic_pending(WindowEventType::Iconified)
                || is_programmatic_pending(WindowEventType::Deiconified))
                return GateDecision::Hold;
            break;
        case WindowEventType::Iconified:
            if (is_programmatic_pending(WindowEventType::Deiconified))
                return GateDecision::Hold;
            break;
        case WindowEventType::Deiconified:
            if (is_programmatic_pending(WindowEventType::Iconified))
                return GateDecision::Hold;
            break;
        default:
            break;
    }
    return GateDecision::Pass;
}

}   // namespace hostkit
