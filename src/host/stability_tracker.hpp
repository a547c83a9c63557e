#pragma once

#include <array>
#include <cstdint>
#include <hostkit/window_event.hpp>
#include <limits>

namespace hostkit
{

// The four boolean states a host reconciles with its backing window.
enum class StateAxis : uint8_t
{
    Showing,
    Iconified,
    Maximized,
    Focused,
};

// Shown for (Showing, true), Hidden for (Showing, false), and so on.
WindowEventType event_for(StateAxis axis, bool on);

// Inverse of event_for. Returns false for Moved, Resized and Closed.
bool axis_of(WindowEventType type, StateAxis& axis, bool& on);

struct GateParams
{
    bool   block_flicker        = false;
    double stability_delay_s    = 0.0;
    double anti_flicker_delay_s = 0.0;
};

enum class GateDecision
{
    Pass,
    Hold,
};

// Detection bookkeeping used to decide when a backing state change can be
// trusted, plus the "newest possible unstability" time shared by all axes.
class StabilityTracker
{
   public:
    struct Direction
    {
        bool   detected_not_fired   = false;
        double detection_time_s     = -std::numeric_limits<double>::infinity();
        bool   programmatic_pending = false;
    };

    struct AxisRecord
    {
        Direction on;
        Direction off;

        Direction&       side(bool value) { return value ? on : off; }
        const Direction& side(bool value) const { return value ? on : off; }
    };

    AxisRecord&       record(StateAxis axis);
    const AxisRecord& record(StateAxis axis) const;

    Direction&       direction(WindowEventType type);
    const Direction& direction(WindowEventType type) const;

    double newest_unstability_s() const { return newest_unstability_s_; }
    void   set_unstability(double now_s) { newest_unstability_s_ = now_s; }

    // Stall detection. Periodic calls past the expected period by more than
    // `period + stability_delay / 10` push the unstability time forward by
    // the lateness, capped at now.
    void on_loop_call(bool periodic, double now_s, double period_s, double stability_delay_s);

    // Called before asking the backing window for `type`.
    void before_programmatic(WindowEventType type, double now_s);
    bool is_programmatic_pending(WindowEventType type) const;

    // Called when `type` is fired to the client.
    void on_fired(WindowEventType type);

    // Called when backing and client states agree on `axis`.
    void on_axis_agreed(StateAxis axis);

    // Decides whether a detected change toward `type` can be fired now.
    GateDecision gate(WindowEventType type, double now_s, const GateParams& params);

   private:
    std::array<AxisRecord, 4> records_{};
    double newest_unstability_s_   = -std::numeric_limits<double>::infinity();
    double last_periodic_call_s_   = -std::numeric_limits<double>::infinity();
};

}   // namespace hostkit
