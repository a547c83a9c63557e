#include "bounds_enforcer.hpp"

#include <hostkit/logger.hpp>

namespace hostkit
{

namespace
{

// "<" so that a zero delay never counts as too early.
bool is_too_early(double now_s, double time_s, double min_delay_s)
{
    return (now_s - time_s) < min_delay_s;
}

}   // namespace

BoundsEnforcer::BoundsEnforcer(const HostConfig& config) : config_(config) {}

void BoundsEnforcer::arm_max_if_configured()
{
    if (config_.enforce_bounds_on_maximize)
        max_pending_ = true;
}

void BoundsEnforcer::clear_max()
{
    max_pending_ = false;
}

void BoundsEnforcer::arm_demax_if_configured_and_any()
{
    if (config_.restore_bounds_on_demaximize && demax_target_)
        demax_pending_ = true;
}

void BoundsEnforcer::set_demax_target(const BoundsTarget& target)
{
    demax_target_  = target;
    demax_pending_ = true;
    HOSTKIT_LOG_DEBUG("bounds", "Bounds {} queued until showing and demaximized", target.rect);
}

void BoundsEnforcer::clear_demax()
{
    demax_pending_ = false;
    demax_target_.reset();
}

std::optional<Rect> BoundsEnforcer::poll_max(const EnforcementState&      state,
                                             const std::function<Rect()>& screen_bounds)
{
    if (!max_pending_ || !state.agreed_showing_deico_max)
        return std::nullopt;
    if (is_too_early(state.now_s, state.newest_unstability_s, half_stability_delay_s()))
        return std::nullopt;

    max_pending_ = false;
    return screen_bounds();
}

std::optional<BoundsTarget> BoundsEnforcer::poll_demax(const EnforcementState&      state,
                                                       const std::function<Rect()>& current_client_bounds)
{
    const bool must_record = config_.restore_bounds_on_demaximize;
    if (!demax_pending_ && !must_record)
        return std::nullopt;
    if (!state.agreed_showing_deico_demax)
        return std::nullopt;
    if (is_too_early(state.now_s, state.newest_unstability_s, half_stability_delay_s()))
        return std::nullopt;

    if (demax_pending_)
    {
        auto target = demax_target_;
        clear_demax();
        if (!target)
        {
            HOSTKIT_LOG_WARN("bounds", "Demax enforcement armed without bounds");
        }
        return target;
    }

    if (is_too_early(state.now_s, state.newest_unstability_s, config_.state_stability_delay_s))
        return std::nullopt;

    const Rect current = current_client_bounds();
    if (!current.is_empty()
        && !(demax_target_ && demax_target_->space == BoundsSpace::Client
             && demax_target_->rect == current))
    {
        demax_target_ = BoundsTarget{current, BoundsSpace::Client};
    }
    return std::nullopt;
}

}   // namespace hostkit
