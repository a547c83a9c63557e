#pragma once

#include <cstdint>
#include <hostkit/backing_window.hpp>
#include <hostkit/host_config.hpp>
#include <hostkit/rect.hpp>
#include <hostkit/window_event.hpp>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace hostkit
{

class HostManager;
struct BoundsTarget;
enum class BoundsSpace;

// One top-level window or dialog. Reconciles what its backing window reports
// with what its client has been told, and turns the difference into the
// canonical event stream.
//
// Created by HostManager. Every method must be called on the manager's UI
// thread (std::logic_error otherwise), except make_dirty/make_all_dirty.
// State-changing calls are no-ops when already in the target state or when
// closed.
class Host : public BackingEventSink, public std::enable_shared_from_this<Host>
{
   public:
    struct Options
    {
        std::string title;
        bool        decorated = true;
        bool        modal     = false;
    };

    // Only HostManager can make one, so hosts are created through it.
    class ConstructionKey
    {
       private:
        friend class HostManager;
        ConstructionKey() = default;
    };

    Host(ConstructionKey,
         HostManager&                   manager,
         Host*                          owner,
         uint32_t                       id,
         Options                        options,
         std::unique_ptr<BackingWindow> backing,
         std::shared_ptr<HostClient>    client);
    ~Host() override;

    Host(const Host&)            = delete;
    Host& operator=(const Host&) = delete;

    uint32_t           id() const { return id_; }
    const std::string& title() const { return options_.title; }
    bool               is_decorated() const { return options_.decorated; }
    bool               is_modal() const { return options_.modal; }
    Host*              owner() const { return owner_; }
    HostManager&       manager() const { return manager_; }
    BackingWindow&     backing_window() const { return *backing_; }
    HostClient&        client() const;

    // Dialogs created from this host and not yet closed.
    std::vector<Host*> dialogs() const;

    // ─── Visibility and focus ────────────────────────────────────────────────

    // Backing window state, as far as it can be trusted.
    bool is_showing() const;
    bool is_focused() const;
    bool is_iconified() const;
    bool is_maximized() const;
    bool is_closed() const { return closed_; }

    // What the client has been told.
    const ClientState& client_state() const;

    void show();
    void hide();
    void request_focus_gain();
    void iconify();
    void deiconify();
    void maximize();
    void demaximize();

    // ─── Bounds ──────────────────────────────────────────────────────────────

    // Empty unless showing and deiconified. While the user drags the window,
    // the bounds captured when the drag started.
    Rect insets() const;
    Rect client_bounds() const;
    Rect window_bounds() const;

    // Negative spans are trimmed, then zero spans become 1. Applied right
    // away when showing, deiconified and demaximized; otherwise applied once
    // the host gets back to that state.
    void set_client_bounds(const Rect& target);
    void set_window_bounds(const Rect& target);

    // Sets then re-reads the bounds, and optionally corrects them: shifts
    // the result to keep the previous right (bottom) edge, or restores the
    // previous bounds if the target was not hit exactly. Only works when
    // showing, deiconified and demaximized. Returns whether bounds changed.
    bool set_client_bounds_smart(const Rect& target,
                                 bool        fix_right             = false,
                                 bool        fix_bottom            = false,
                                 bool        restore_if_not_exact  = false);
    bool set_window_bounds_smart(const Rect& target,
                                 bool        fix_right             = false,
                                 bool        fix_bottom            = false,
                                 bool        restore_if_not_exact  = false);

    // ─── Painting ────────────────────────────────────────────────────────────

    // Thread-safe.
    void make_dirty(const Rect& rect);
    void make_all_dirty();

    void ensure_pending_painting();
    void make_dirty_and_ensure_pending_painting(const Rect& rect);
    void make_all_dirty_and_ensure_pending_painting();

    // ─── Lifecycle ───────────────────────────────────────────────────────────

    // Closes dialogs (depth first), then the backing window, then emits
    // FocusLost, Hidden and Closed as needed. Every step runs even if an
    // earlier one threw; the first exception is rethrown at the end.
    // Idempotent.
    void close();

    // Periodic poll, called by the manager.
    void run_event_logic_on_period();

    // Time from which the backing state is considered possibly unstable.
    double newest_unstability_s() const;

    // One-line dump of host, client and pending state, for logs.
    std::string describe_state() const;

    // ─── BackingEventSink ────────────────────────────────────────────────────

    void on_backing_moved() override;
    void on_backing_resized() override;
    void on_backing_closing() override;

    void on_backing_shown() override { on_backing_any_event(); }
    void on_backing_hidden() override { on_backing_any_event(); }
    void on_backing_focus_gained() override { on_backing_any_event(); }
    void on_backing_focus_lost() override { on_backing_any_event(); }
    void on_backing_iconified() override { on_backing_any_event(); }
    void on_backing_deiconified() override { on_backing_any_event(); }
    void on_backing_maximized() override { on_backing_any_event(); }
    void on_backing_demaximized() override { on_backing_any_event(); }
    void on_backing_any_event() override;

    void on_backing_mouse_pressed(const MouseEvent& event) override;
    void on_backing_mouse_released(const MouseEvent& event) override;
    void on_backing_mouse_moved(const MouseEvent& event) override;

    void on_backing_invalidated(const Rect& dirty) override { make_dirty(dirty); }

   private:
    friend class HostManager;

    struct Internals;
    class Context;

    void check_ui_thread(const char* operation) const;

    // Forwards client focus and Closed bookkeeping to the manager.
    void notify_manager(WindowEventType type);

    bool is_host_showing_deico() const;
    bool is_host_showing_deico_demax() const;
    bool are_host_and_client_showing_deico() const;
    bool are_host_and_client_showing_deico_focused() const;

    void before_programmatic(WindowEventType type);
    void after_programmatic();

    void run_event_logic_on_event();
    void run_event_logic_loop(bool periodic, double now_s);
    void restore_client_max_state_if_needed(double now_s);
    void end_drag_if_needed();
    void enforce_bounds_if_needed(double now_s);

    enum class AsyncStep
    {
        DeiconifyIfIconified,
        RequestFocusIfNotFocused,
    };
    void call_async(std::vector<AsyncStep> steps);

    void set_bounds(const BoundsTarget& target);
    void set_backing_bounds(const BoundsTarget& target);
    bool set_bounds_smart(BoundsSpace space,
                          const Rect& target,
                          bool        fix_right,
                          bool        fix_bottom,
                          bool        restore_if_not_exact);

    void paint_client(const Rect& dirty);

    // Runs a backing window mutator; failures go to the manager's handler.
    template <typename Fn>
    void guarded_backing_call(const char* what, Fn&& fn);

    void add_dialog(std::shared_ptr<Host> dialog);
    void remove_dialog(const Host* dialog);

    HostManager&                       manager_;
    Host*                              owner_;
    uint32_t                           id_;
    Options                            options_;
    std::unique_ptr<BackingWindow>     backing_;
    std::vector<std::shared_ptr<Host>> dialogs_;
    bool                               closed_              = false;
    bool                               restore_max_intent_  = false;
    double                             last_bounds_set_s_   = -std::numeric_limits<double>::infinity();
    std::unique_ptr<Internals>         in_;
};

}   // namespace hostkit
