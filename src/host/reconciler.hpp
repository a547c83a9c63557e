#pragma once

#include "event_dispatcher.hpp"
#include "stability_tracker.hpp"

#include <hostkit/backing_window.hpp>
#include <hostkit/host_config.hpp>
#include <span>
#include <string_view>

namespace hostkit
{

// Everything one reconciliation pass reads. Backing state is queried live
// through `backing`, never cached.
struct ReconcileView
{
    const BackingWindow& backing;
    const ClientState&   client;
    StabilityTracker&    stability;
    const HostConfig&    config;
    double               now_s                       = 0.0;
    bool                 host_closed                 = false;
    bool                 restore_max_pending         = false;
    bool                 other_host_has_client_focus = false;
};

struct RuleResult
{
    enum class Kind
    {
        Skip,   // rule does not apply, try the next one
        Hold,   // a difference exists but must not be fired yet; pass ends
        Fire,   // fire `event`; pass ends
    };

    Kind            kind  = Kind::Skip;
    WindowEventType event = WindowEventType::Shown;

    static RuleResult skip() { return {}; }
    static RuleResult hold() { return {Kind::Hold, WindowEventType::Shown}; }
    static RuleResult fire(WindowEventType type) { return {Kind::Fire, type}; }

    bool operator==(const RuleResult&) const = default;
};

struct ReconcileRule
{
    std::string_view name;
    RuleResult (*evaluate)(ReconcileView& view);
};

namespace rules
{
RuleResult client_closed(ReconcileView& view);
RuleResult flush_bounds_events(ReconcileView& view);
RuleResult closing_sequence(ReconcileView& view);
RuleResult showing_diff(ReconcileView& view);
RuleResult iconified_diff(ReconcileView& view);
RuleResult maximized_diff(ReconcileView& view);
RuleResult focus_diff(ReconcileView& view);
}   // namespace rules

// The rules in evaluation order. The first rule not returning Skip decides.
std::span<const ReconcileRule> reconcile_rules();

// Runs the rules once. `matched`, if given, receives the deciding rule's name.
RuleResult reconcile_once(ReconcileView& view, std::string_view* matched = nullptr);

// Gate parameters for a state event under `config`.
GateParams gate_params_for(WindowEventType type, const HostConfig& config);

}   // namespace hostkit
