#include "reconciler.hpp"

#include <array>
#include <hostkit/logger.hpp>

namespace hostkit
{

GateParams gate_params_for(WindowEventType type, const HostConfig& config)
{
    switch (type)
    {
        case WindowEventType::Shown:
            return {false, 0.0, 0.0};
        case WindowEventType::Hidden:
            return {false, config.hidden_stability_delay_s, 0.0};
        case WindowEventType::Iconified:
        case WindowEventType::Deiconified:
        case WindowEventType::Maximized:
        case WindowEventType::Demaximized:
            return {true, config.state_stability_delay_s, config.anti_flicker_delay_s};
        default:
            return {};
    }
}

namespace
{

RuleResult gated(ReconcileView& view, WindowEventType type)
{
    if (view.stability.gate(type, view.now_s, gate_params_for(type, view.config))
        == GateDecision::Hold)
    {
        HOSTKIT_LOG_TRACE("reconciler", "{} detected, waiting for stability", to_string(type));
        return RuleResult::hold();
    }
    return RuleResult::fire(type);
}

// FocusLost must reach the client before a state that implies losing focus.
// Holds while the backing window still claims focus.
RuleResult drain_focus_then(ReconcileView& view, WindowEventType then)
{
    if (view.client.focused)
    {
        if (view.backing.is_focused())
            return RuleResult::hold();
        return RuleResult::fire(WindowEventType::FocusLost);
    }
    return RuleResult::fire(then);
}

}   // namespace

namespace rules
{

RuleResult client_closed(ReconcileView& view)
{
    return view.client.closed ? RuleResult::hold() : RuleResult::skip();
}

// Bounds are only known through backend notifications, flushed even while
// closing as long as Closed has not been fired.
RuleResult flush_bounds_events(ReconcileView& view)
{
    if (!view.client.is_showing_deico())
        return RuleResult::skip();
    if (view.client.move_pending)
        return RuleResult::fire(WindowEventType::Moved);
    if (view.client.resize_pending)
        return RuleResult::fire(WindowEventType::Resized);
    return RuleResult::skip();
}

RuleResult closing_sequence(ReconcileView& view)
{
    if (!view.host_closed)
        return RuleResult::skip();
    if (view.client.focused)
    {
        if (view.backing.is_focused())
            return RuleResult::hold();
        return RuleResult::fire(WindowEventType::FocusLost);
    }
    if (view.client.showing)
    {
        if (view.backing.is_showing())
            return RuleResult::hold();
        return RuleResult::fire(WindowEventType::Hidden);
    }
    return RuleResult::fire(WindowEventType::Closed);
}

RuleResult showing_diff(ReconcileView& view)
{
    const bool backing_showing = view.backing.is_showing();
    if (backing_showing == view.client.showing)
    {
        view.stability.on_axis_agreed(StateAxis::Showing);
        return RuleResult::skip();
    }
    if (backing_showing)
        return gated(view, WindowEventType::Shown);

    const RuleResult result = gated(view, WindowEventType::Hidden);
    if (result.kind != RuleResult::Kind::Fire)
        return result;
    return drain_focus_then(view, WindowEventType::Hidden);
}

RuleResult iconified_diff(ReconcileView& view)
{
    if (!view.backing.is_showing())
        return RuleResult::skip();

    const bool backing_iconified = view.backing.is_iconified();
    if (backing_iconified == view.client.iconified)
    {
        view.stability.on_axis_agreed(StateAxis::Iconified);
        return RuleResult::skip();
    }
    if (!backing_iconified)
        return gated(view, WindowEventType::Deiconified);

    const RuleResult result = gated(view, WindowEventType::Iconified);
    if (result.kind != RuleResult::Kind::Fire)
        return result;
    return drain_focus_then(view, WindowEventType::Iconified);
}

RuleResult maximized_diff(ReconcileView& view)
{
    if (!view.backing.is_showing() || view.backing.is_iconified())
        return RuleResult::skip();

    const bool backing_maximized = view.backing.is_maximized();
    if (backing_maximized == view.client.maximized)
    {
        view.stability.on_axis_agreed(StateAxis::Maximized);
        return RuleResult::skip();
    }

    // The host is about to be put back into the client's state.
    if (view.restore_max_pending)
        return RuleResult::hold();

    return gated(view,
                 backing_maximized ? WindowEventType::Maximized : WindowEventType::Demaximized);
}

RuleResult focus_diff(ReconcileView& view)
{
    if (!view.backing.is_showing() || view.backing.is_iconified())
        return RuleResult::skip();

    const bool backing_focused = view.backing.is_focused();
    if (backing_focused == view.client.focused)
        return RuleResult::skip();

    if (!backing_focused)
        return RuleResult::fire(WindowEventType::FocusLost);

    if (view.other_host_has_client_focus)
    {
        HOSTKIT_LOG_TRACE("reconciler", "Another host still has a focused client");
        return RuleResult::hold();
    }
    return RuleResult::fire(WindowEventType::FocusGained);
}

}   // namespace rules

std::span<const ReconcileRule> reconcile_rules()
{
    static constexpr std::array<ReconcileRule, 7> kRules = {{
        {"client_closed", &rules::client_closed},
        {"flush_bounds_events", &rules::flush_bounds_events},
        {"closing_sequence", &rules::closing_sequence},
        {"showing_diff", &rules::showing_diff},
        {"iconified_diff", &rules::iconified_diff},
        {"maximized_diff", &rules::maximized_diff},
        {"focus_diff", &rules::focus_diff},
    }};
    return kRules;
}

RuleResult reconcile_once(ReconcileView& view, std::string_view* matched)
{
    for (const auto& rule : reconcile_rules())
    {
        const RuleResult result = rule.evaluate(view);
        if (result.kind == RuleResult::Kind::Skip)
            continue;
        if (matched)
            *matched = rule.name;
        return result;
    }
    if (matched)
        *matched = {};
    return RuleResult::skip();
}

}   // namespace hostkit
