#pragma once

#include "drag_stabilizer.hpp"

#include <functional>
#include <hostkit/host_config.hpp>
#include <optional>

namespace hostkit
{

// Composite state seen by the enforcer on each event-logic pass. "Agreed"
// means both the backing window and the client report it.
struct EnforcementState
{
    bool   agreed_showing_deico_max   = false;
    bool   agreed_showing_deico_demax = false;
    double now_s                      = 0.0;
    double newest_unstability_s       = 0.0;
};

// Deferred bounds application for backends that reject bounds changes while
// hidden, iconified or maximized. Decides what to apply and when; the host
// performs the backend calls.
class BoundsEnforcer
{
   public:
    explicit BoundsEnforcer(const HostConfig& config);

    // Arms enforcement on max if enforce_bounds_on_maximize is set.
    void arm_max_if_configured();
    void clear_max();

    // Arms enforcement on demax if restore_bounds_on_demaximize is set and
    // a target is stored.
    void arm_demax_if_configured_and_any();

    // Stores `target` and arms enforcement on demax.
    void set_demax_target(const BoundsTarget& target);

    // Clears the flag and the stored target.
    void clear_demax();

    bool is_max_pending() const { return max_pending_; }
    bool is_demax_pending() const { return demax_pending_; }

    const std::optional<BoundsTarget>& demax_target() const { return demax_target_; }

    // Window bounds to apply now, read from `screen_bounds`, or nullopt.
    // Clears the max flag when returning bounds.
    std::optional<Rect> poll_max(const EnforcementState& state, const std::function<Rect()>& screen_bounds);

    // Target to apply now, or nullopt. Clears the demax request when returning
    // a target. Otherwise, with restore_bounds_on_demaximize and a fully
    // settled state, records `current_client_bounds()` for later restoration.
    std::optional<BoundsTarget> poll_demax(const EnforcementState&    state,
                                           const std::function<Rect()>& current_client_bounds);

   private:
    double half_stability_delay_s() const { return config_.state_stability_delay_s * 0.5; }

    const HostConfig&           config_;
    bool                        max_pending_   = false;
    bool                        demax_pending_ = false;
    std::optional<BoundsTarget> demax_target_;
};

}   // namespace hostkit
