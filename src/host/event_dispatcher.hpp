#pragma once

#include "bounds_enforcer.hpp"
#include "drag_stabilizer.hpp"
#include "paint_scheduler.hpp"
#include "stability_tracker.hpp"

#include <exception>
#include <hostkit/host_config.hpp>
#include <hostkit/window_event.hpp>
#include <memory>

namespace hostkit
{

// Host-level services the dispatcher's bookkeeping needs.
class DispatchContext
{
   public:
    virtual ~DispatchContext() = default;

    virtual Host* dispatch_host()                      = 0;
    virtual bool  is_host_closed() const               = 0;
    virtual void  set_restore_max_intent(bool value)   = 0;
    virtual void  request_focus_gain_async()           = 0;
    virtual void  on_client_focus_gained()             = 0;
    virtual void  on_client_focus_lost()               = 0;
    virtual void  on_closed_event_firing()             = 0;
    virtual void  handle_exception(std::exception_ptr) = 0;
    virtual double now_s() const                       = 0;
};

// The only writer of ClientState. For each event: bookkeeping side effects,
// then the state change, then the client listener.
class EventDispatcher
{
   public:
    struct Parts
    {
        StabilityTracker& stability;
        DragStabilizer&   drag;
        BoundsEnforcer&   bounds;
        PaintScheduler&   paint;
    };

    EventDispatcher(std::shared_ptr<HostClient> client,
                    const HostConfig&           config,
                    DispatchContext&            context,
                    Parts                       parts);

    const ClientState& state() const { return state_; }
    HostClient&        client() const { return *client_; }

    // Backend bounds notifications. Flushed as Moved/Resized by the reconciler.
    void set_move_pending() { state_.move_pending = true; }
    void set_resize_pending() { state_.resize_pending = true; }

    // Listener exceptions propagate, unless use_exception_handler_for_client
    // is set. State and bookkeeping are complete before the listener runs.
    void fire(WindowEventType type);

    uint64_t fired_count() const { return fired_count_; }

   private:
    void run_bookkeeping(WindowEventType type);
    void apply_state(WindowEventType type);

    std::shared_ptr<HostClient> client_;
    const HostConfig&           config_;
    DispatchContext&            context_;
    Parts                       parts_;
    ClientState                 state_;
    uint64_t                    fired_count_ = 0;
};

}   // namespace hostkit
