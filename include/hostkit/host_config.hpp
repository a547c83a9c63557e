#pragma once

#include <string>

namespace hostkit
{

// Delays and policies consumed by hosts. All delays are in seconds.
// One instance is shared by every host of a HostManager.
struct HostConfig
{
    // ─── Scheduling ──────────────────────────────────────────────────────────

    // Period of the event-logic poll run on every host.
    double event_logic_period_s = 0.01;

    // Minimum interval between two paints of the same host.
    double client_painting_delay_s = 1.0 / 60.0;

    // Quiet time after the last move/resize notification before painting,
    // when not painting during the operation.
    double host_bounds_check_delay_s = 1.0 / 20.0;

    // ─── Stability ───────────────────────────────────────────────────────────

    // Minimum dwell time before a detected iconified/maximized change is trusted.
    double state_stability_delay_s = 0.1;

    // Same as above, for the hidden state. Shown is always trusted immediately.
    double hidden_stability_delay_s = 0.0;

    // Minimum time since the opposite state was detected before accepting a
    // new iconified/maximized state.
    double anti_flicker_delay_s = 0.0;

    // Drag move detection is ignored for this long after a programmatic bounds set.
    double drag_move_blocking_delay_s = 0.0;

    // ─── Painting ────────────────────────────────────────────────────────────

    bool paint_during_move         = true;
    bool paint_during_resize       = true;
    bool make_all_dirty_each_paint = false;

    // ─── Visibility and focus policies ───────────────────────────────────────

    bool deiconify_on_show                 = true;
    bool request_focus_on_show             = true;
    bool request_focus_on_deiconified      = true;
    bool request_focus_on_deiconify        = true;
    bool request_focus_on_maximize         = true;
    bool request_focus_on_demaximize       = true;
    bool restore_maximized_across_iconify  = true;

    // ─── Bounds policies ─────────────────────────────────────────────────────

    // Re-apply the bounds requested during a drag at drag end, instead of
    // applying them right away.
    bool fix_bounds_during_drag                  = false;
    bool restore_bounds_on_demaximize            = false;
    bool enforce_bounds_on_maximize              = false;
    bool set_demax_bounds_while_hidden_or_iconified = true;

    // ─── Errors ──────────────────────────────────────────────────────────────

    // Route client listener exceptions to the manager's exception handler
    // instead of letting them propagate.
    bool use_exception_handler_for_client = false;

    // Throws std::invalid_argument on a negative or non-finite delay,
    // or a non-positive event logic period.
    void validate() const;

    // Flat JSON object, version 1. Unknown keys are ignored on load.
    std::string serialize() const;

    // Returns false on empty input or a future version. Missing keys keep
    // their current value.
    bool deserialize(const std::string& json);

    // Save to a JSON file. Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file. Returns true on success.
    bool load(const std::string& path);

    // $HOSTKIT_CONFIG, else ~/.config/hostkit/host.json.
    static std::string default_path();
};

}   // namespace hostkit
