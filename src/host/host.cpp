#include <hostkit/host.hpp>
#include <hostkit/host_manager.hpp>
#include <hostkit/logger.hpp>

#include "bounds_enforcer.hpp"
#include "drag_stabilizer.hpp"
#include "event_dispatcher.hpp"
#include "paint_scheduler.hpp"
#include "reconciler.hpp"
#include "stability_tracker.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace hostkit
{

namespace
{

// Negative spans trimmed, then zero spans forced to 1.
Rect sanitized(const Rect& rect)
{
    const Rect t = rect.trimmed();
    return t.with_spans(std::max(1, t.w), std::max(1, t.h));
}

}   // namespace

// ─── Internals ───────────────────────────────────────────────────────────────

class Host::Context : public DispatchContext
{
   public:
    explicit Context(Host& host) : host_(host) {}

    Host* dispatch_host() override { return &host_; }
    bool  is_host_closed() const override { return host_.closed_; }

    void set_restore_max_intent(bool value) override { host_.restore_max_intent_ = value; }

    void request_focus_gain_async() override
    {
        host_.call_async({AsyncStep::RequestFocusIfNotFocused});
    }

    void on_client_focus_gained() override { host_.notify_manager(WindowEventType::FocusGained); }
    void on_client_focus_lost() override { host_.notify_manager(WindowEventType::FocusLost); }
    void on_closed_event_firing() override { host_.notify_manager(WindowEventType::Closed); }

    void handle_exception(std::exception_ptr error) override
    {
        host_.manager_.handle_exception(error);
    }

    double now_s() const override { return host_.manager_.scheduler().now_s(); }

   private:
    Host& host_;
};

struct Host::Internals
{
    Internals(Host& host, std::shared_ptr<HostClient> client)
        : bounds(host.manager_.config()),
          paint(host.manager_.scheduler(),
                host.manager_.config(),
                PaintScheduler::Hooks{
                    .is_showing    = [&host] { return host.is_showing(); },
                    .can_paint_now = [&host] { return host.is_showing() && !host.is_iconified(); },
                    .paint         = [&host](const Rect& dirty) { host.paint_client(dirty); },
                }),
          context(host),
          dispatcher(std::move(client),
                     host.manager_.config(),
                     context,
                     EventDispatcher::Parts{stability, drag, bounds, paint})
    {
    }

    StabilityTracker stability;
    DragStabilizer   drag;
    BoundsEnforcer   bounds;
    PaintScheduler   paint;
    Context          context;
    EventDispatcher  dispatcher;
};

// ─── Construction ────────────────────────────────────────────────────────────

Host::Host(ConstructionKey,
           HostManager&                   manager,
           Host*                          owner,
           uint32_t                       id,
           Options                        options,
           std::unique_ptr<BackingWindow> backing,
           std::shared_ptr<HostClient>    client)
    : manager_(manager),
      owner_(owner),
      id_(id),
      options_(std::move(options)),
      backing_(std::move(backing))
{
    if (!backing_)
        throw std::invalid_argument("Host: backing window must not be null");
    if (!client)
        throw std::invalid_argument("Host: client must not be null");

    in_ = std::make_unique<Internals>(*this, std::move(client));
    backing_->set_event_sink(this);
}

Host::~Host()
{
    in_->paint.stop_all();
    backing_->set_event_sink(nullptr);
}

HostClient& Host::client() const
{
    return in_->dispatcher.client();
}

std::vector<Host*> Host::dialogs() const
{
    std::vector<Host*> result;
    result.reserve(dialogs_.size());
    for (const auto& d : dialogs_)
        result.push_back(d.get());
    return result;
}

void Host::add_dialog(std::shared_ptr<Host> dialog)
{
    dialogs_.push_back(std::move(dialog));
}

void Host::remove_dialog(const Host* dialog)
{
    std::erase_if(dialogs_, [dialog](const auto& d) { return d.get() == dialog; });
}

void Host::notify_manager(WindowEventType type)
{
    switch (type)
    {
        case WindowEventType::FocusGained:
            manager_.on_client_focus_gained(*this);
            break;
        case WindowEventType::FocusLost:
            manager_.on_client_focus_lost(*this);
            break;
        case WindowEventType::Closed:
            manager_.on_host_closed_event_firing(*this);
            break;
        default:
            break;
    }
}

void Host::check_ui_thread(const char* operation) const
{
    manager_.scheduler().check_is_ui_thread(operation);
}

// ─── State queries ───────────────────────────────────────────────────────────

bool Host::is_showing() const
{
    return !closed_ && backing_->is_showing();
}

bool Host::is_iconified() const
{
    return is_showing() && backing_->is_iconified();
}

bool Host::is_focused() const
{
    return is_host_showing_deico() && backing_->is_focused();
}

bool Host::is_maximized() const
{
    return is_host_showing_deico() && backing_->is_maximized();
}

const ClientState& Host::client_state() const
{
    return in_->dispatcher.state();
}

double Host::newest_unstability_s() const
{
    return in_->stability.newest_unstability_s();
}

bool Host::is_host_showing_deico() const
{
    return is_showing() && !backing_->is_iconified();
}

bool Host::is_host_showing_deico_demax() const
{
    return is_host_showing_deico() && !backing_->is_maximized();
}

bool Host::are_host_and_client_showing_deico() const
{
    return is_host_showing_deico() && client_state().is_showing_deico();
}

bool Host::are_host_and_client_showing_deico_focused() const
{
    return are_host_and_client_showing_deico() && backing_->is_focused()
           && client_state().focused;
}

std::string Host::describe_state() const
{
    const ClientState& c = client_state();
    std::ostringstream os;
    os << "host " << id_ << " closed=" << closed_;
    if (!closed_)
    {
        os << " backing[showing=" << backing_->is_showing()
           << " focused=" << backing_->is_focused()
           << " iconified=" << backing_->is_iconified()
           << " maximized=" << backing_->is_maximized() << "]";
    }
    os << " client[showing=" << c.showing << " focused=" << c.focused
       << " iconified=" << c.iconified << " maximized=" << c.maximized
       << " move=" << c.move_pending << " resize=" << c.resize_pending
       << " closed=" << c.closed << "]"
       << " restore_max=" << restore_max_intent_
       << " drag=" << in_->drag.is_press_detected() << "/" << in_->drag.is_move_detected()
       << " max_enf=" << in_->bounds.is_max_pending()
       << " demax_enf=" << in_->bounds.is_demax_pending();
    return os.str();
}

// ─── Programmatic modifications ──────────────────────────────────────────────

template <typename Fn>
void Host::guarded_backing_call(const char* what, Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const std::exception& e)
    {
        HOSTKIT_LOG_ERROR("host", "Host {}: backing window {} failed: {}", id_, what, e.what());
        manager_.handle_exception(std::current_exception());
    }
}

void Host::before_programmatic(WindowEventType type)
{
    const ClientState& c = client_state();
    if (restore_max_intent_
        && ((c.maximized && type == WindowEventType::Demaximized)
            || (!c.maximized && type == WindowEventType::Maximized)))
    {
        // Explicit request toward the other state wins over restoration.
        restore_max_intent_ = false;
    }
    in_->stability.before_programmatic(type, manager_.scheduler().now_s());
}

void Host::after_programmatic()
{
    run_event_logic_on_event();
}

void Host::show()
{
    check_ui_thread("Host::show");
    if (closed_)
        return;

    std::vector<AsyncStep> steps;
    if (manager_.config().deiconify_on_show)
        steps.push_back(AsyncStep::DeiconifyIfIconified);
    if (manager_.config().request_focus_on_show)
        steps.push_back(AsyncStep::RequestFocusIfNotFocused);
    call_async(std::move(steps));

    if (backing_->is_showing())
        return;

    HOSTKIT_LOG_DEBUG("host", "Host {}: show", id_);
    before_programmatic(WindowEventType::Shown);
    guarded_backing_call("show", [this] { backing_->show(); });
    after_programmatic();
}

void Host::hide()
{
    check_ui_thread("Host::hide");
    if (closed_ || !backing_->is_showing())
        return;

    HOSTKIT_LOG_DEBUG("host", "Host {}: hide", id_);
    before_programmatic(WindowEventType::Hidden);
    guarded_backing_call("hide", [this] { backing_->hide(); });
    after_programmatic();
}

void Host::request_focus_gain()
{
    check_ui_thread("Host::request_focus_gain");
    if (!is_host_showing_deico() || backing_->is_focused())
        return;

    HOSTKIT_LOG_DEBUG("host", "Host {}: request focus gain", id_);
    before_programmatic(WindowEventType::FocusGained);
    guarded_backing_call("request_focus_gain", [this] { backing_->request_focus_gain(); });
    after_programmatic();
}

void Host::iconify()
{
    check_ui_thread("Host::iconify");
    if (!is_showing() || !backing_->does_iconify_work() || backing_->is_iconified())
        return;

    HOSTKIT_LOG_DEBUG("host", "Host {}: iconify", id_);
    before_programmatic(WindowEventType::Iconified);
    guarded_backing_call("set_iconified", [this] { backing_->set_iconified(true); });
    after_programmatic();
}

void Host::deiconify()
{
    check_ui_thread("Host::deiconify");
    if (!is_showing())
        return;

    if (manager_.config().request_focus_on_deiconify)
        call_async({AsyncStep::RequestFocusIfNotFocused});

    if (!backing_->does_iconify_work() || !backing_->is_iconified())
        return;

    HOSTKIT_LOG_DEBUG("host", "Host {}: deiconify", id_);
    before_programmatic(WindowEventType::Deiconified);
    guarded_backing_call("set_iconified", [this] { backing_->set_iconified(false); });
    after_programmatic();
}

void Host::maximize()
{
    check_ui_thread("Host::maximize");
    if (!is_host_showing_deico())
        return;

    if (manager_.config().request_focus_on_maximize)
        call_async({AsyncStep::RequestFocusIfNotFocused});

    if (!backing_->does_maximize_work() || backing_->is_maximized())
        return;

    HOSTKIT_LOG_DEBUG("host", "Host {}: maximize", id_);
    before_programmatic(WindowEventType::Maximized);
    guarded_backing_call("set_maximized", [this] { backing_->set_maximized(true); });
    after_programmatic();
}

void Host::demaximize()
{
    check_ui_thread("Host::demaximize");
    if (!is_host_showing_deico())
        return;

    if (manager_.config().request_focus_on_demaximize)
        call_async({AsyncStep::RequestFocusIfNotFocused});

    if (!backing_->does_maximize_work() || !backing_->is_maximized())
        return;

    HOSTKIT_LOG_DEBUG("host", "Host {}: demaximize", id_);
    before_programmatic(WindowEventType::Demaximized);
    guarded_backing_call("set_maximized", [this] { backing_->set_maximized(false); });
    after_programmatic();
}

// Each step runs in its own task, queued after the previous one ran.
void Host::call_async(std::vector<AsyncStep> steps)
{
    if (steps.empty())
        return;

    std::weak_ptr<Host> weak = weak_from_this();
    manager_.scheduler().execute(
        [weak, steps = std::move(steps)]() mutable
        {
            const auto self = weak.lock();
            if (!self || self->closed_)
                return;
            try
            {
                switch (steps.front())
                {
                    case AsyncStep::DeiconifyIfIconified:
                        if (self->is_iconified())
                            self->deiconify();
                        break;
                    case AsyncStep::RequestFocusIfNotFocused:
                        if (!self->is_focused())
                            self->request_focus_gain();
                        break;
                }
            }
            catch (const std::exception& e)
            {
                HOSTKIT_LOG_ERROR("host", "Host {}: async step failed: {}", self->id_, e.what());
                self->manager_.handle_exception(std::current_exception());
            }
            steps.erase(steps.begin());
            self->call_async(std::move(steps));
        });
}

// ─── Bounds ──────────────────────────────────────────────────────────────────

Rect Host::insets() const
{
    if (!is_host_showing_deico())
        return Rect::empty_rect();
    return backing_->insets();
}

Rect Host::client_bounds() const
{
    if (!is_host_showing_deico())
        return Rect::empty_rect();
    if (manager_.config().fix_bounds_during_drag && in_->drag.is_move_detected())
        return in_->drag.client_bounds_at_press();
    return backing_->client_bounds();
}

Rect Host::window_bounds() const
{
    if (!is_host_showing_deico())
        return Rect::empty_rect();
    if (manager_.config().fix_bounds_during_drag && in_->drag.is_move_detected())
        return in_->drag.window_bounds_at_press();
    return backing_->window_bounds();
}

void Host::set_client_bounds(const Rect& target)
{
    check_ui_thread("Host::set_client_bounds");
    set_bounds(BoundsTarget{target, BoundsSpace::Client});
}

void Host::set_window_bounds(const Rect& target)
{
    check_ui_thread("Host::set_window_bounds");
    set_bounds(BoundsTarget{target, BoundsSpace::Window});
}

void Host::set_bounds(const BoundsTarget& requested)
{
    if (closed_)
        return;

    const BoundsTarget target{sanitized(requested.rect), requested.space};

    if (is_host_showing_deico() && !backing_->is_maximized())
    {
        in_->bounds.clear_demax();
        if (manager_.config().fix_bounds_during_drag && in_->drag.is_move_detected())
        {
            HOSTKIT_LOG_DEBUG("drag", "Host {}: bounds {} deferred to drag end", id_, target.rect);
            in_->drag.queue_target(target);
        }
        else
        {
            set_backing_bounds(target);
        }
        return;
    }

    in_->bounds.set_demax_target(target);
    if (manager_.config().set_demax_bounds_while_hidden_or_iconified && !is_host_showing_deico()
        && !client_state().maximized)
    {
        set_backing_bounds(target);
    }
}

void Host::set_backing_bounds(const BoundsTarget& target)
{
    last_bounds_set_s_ = manager_.scheduler().now_s();
    if (target.space == BoundsSpace::Client)
        guarded_backing_call("set_client_bounds", [&] { backing_->set_client_bounds(target.rect); });
    else
        guarded_backing_call("set_window_bounds", [&] { backing_->set_window_bounds(target.rect); });
}

bool Host::set_client_bounds_smart(const Rect& target,
                                   bool        fix_right,
                                   bool        fix_bottom,
                                   bool        restore_if_not_exact)
{
    check_ui_thread("Host::set_client_bounds_smart");
    return set_bounds_smart(BoundsSpace::Client, target, fix_right, fix_bottom, restore_if_not_exact);
}

bool Host::set_window_bounds_smart(const Rect& target,
                                   bool        fix_right,
                                   bool        fix_bottom,
                                   bool        restore_if_not_exact)
{
    check_ui_thread("Host::set_window_bounds_smart");
    return set_bounds_smart(BoundsSpace::Window, target, fix_right, fix_bottom, restore_if_not_exact);
}

bool Host::set_bounds_smart(BoundsSpace space,
                            const Rect& requested,
                            bool        fix_right,
                            bool        fix_bottom,
                            bool        restore_if_not_exact)
{
    const Rect target = sanitized(requested);
    if (closed_ || !is_host_showing_deico_demax())
        return false;

    const auto read = [this, space]
    { return space == BoundsSpace::Client ? client_bounds() : window_bounds(); };

    const Rect old_bounds = read();
    if (old_bounds == target)
        return false;

    set_bounds(BoundsTarget{target, space});
    Rect new_bounds = read();

    bool reworked = false;
    if (fix_right && new_bounds.x_max() != old_bounds.x_max())
    {
        new_bounds = new_bounds.with_pos_deltas(-(new_bounds.x_max() - old_bounds.x_max()), 0);
        reworked   = true;
    }
    if (fix_bottom && new_bounds.y_max() != old_bounds.y_max())
    {
        new_bounds = new_bounds.with_pos_deltas(0, -(new_bounds.y_max() - old_bounds.y_max()));
        reworked   = true;
    }
    if (restore_if_not_exact && new_bounds != target)
    {
        HOSTKIT_LOG_DEBUG("bounds", "Host {}: got {} instead of {}, restoring {}",
                          id_, new_bounds, target, old_bounds);
        new_bounds = old_bounds;
        reworked   = true;
    }
    if (reworked)
        set_bounds(BoundsTarget{new_bounds, space});

    return new_bounds != old_bounds;
}

// ─── Painting ────────────────────────────────────────────────────────────────

void Host::make_dirty(const Rect& rect)
{
    in_->paint.make_dirty(rect);
}

void Host::make_all_dirty()
{
    in_->paint.make_all_dirty();
}

void Host::ensure_pending_painting()
{
    check_ui_thread("Host::ensure_pending_painting");
    if (closed_)
        return;
    in_->paint.ensure_pending_painting();
}

void Host::make_dirty_and_ensure_pending_painting(const Rect& rect)
{
    make_dirty(rect);
    ensure_pending_painting();
}

void Host::make_all_dirty_and_ensure_pending_painting()
{
    make_all_dirty();
    ensure_pending_painting();
}

void Host::paint_client(const Rect& dirty)
{
    try
    {
        in_->dispatcher.client().paint_client(dirty);
        backing_->present(dirty);
    }
    catch (const std::exception& e)
    {
        HOSTKIT_LOG_ERROR("paint", "Host {}: painting {} failed: {}", id_, dirty, e.what());
        manager_.handle_exception(std::current_exception());
    }
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

void Host::close()
{
    check_ui_thread("Host::close");
    if (closed_)
        return;
    closed_ = true;

    // The manager may release its reference while Closed fires.
    const auto self = shared_from_this();

    HOSTKIT_LOG_DEBUG("host", "Host {}: close", id_);

    std::exception_ptr first;
    const auto attempt = [&](const char* step, auto&& fn)
    {
        try
        {
            fn();
        }
        catch (const std::exception& e)
        {
            HOSTKIT_LOG_ERROR("host", "Host {}: {} failed: {}", id_, step, e.what());
            if (!first)
                first = std::current_exception();
        }
    };

    in_->paint.stop_all();

    const auto dialogs = dialogs_;
    for (const auto& dialog : dialogs)
        attempt("closing dialog", [&] { dialog->close(); });

    attempt("closing backing window", [this] { backing_->close(); });
    attempt("closing notification", [this] { manager_.on_host_closing(*this); });
    attempt("closing event logic", [this] { run_event_logic_on_event(); });

    if (first)
        std::rethrow_exception(first);
}

// ─── Event logic ─────────────────────────────────────────────────────────────

void Host::run_event_logic_on_period()
{
    check_ui_thread("Host::run_event_logic_on_period");
    run_event_logic_loop(true, manager_.scheduler().now_s());
}

void Host::run_event_logic_on_event()
{
    const double now_s = manager_.scheduler().now_s();
    // An event may not be an unstability itself, but often comes with one.
    in_->stability.set_unstability(now_s);
    run_event_logic_loop(false, now_s);
}

void Host::run_event_logic_loop(bool periodic, double now_s)
{
    const HostConfig& config = manager_.config();
    in_->stability.on_loop_call(periodic, now_s, config.event_logic_period_s,
                                config.state_stability_delay_s);

    while (true)
    {
        const Host* focused_holder = manager_.host_of_focused_client();
        ReconcileView view{
            .backing                     = *backing_,
            .client                      = in_->dispatcher.state(),
            .stability                   = in_->stability,
            .config                      = config,
            .now_s                       = now_s,
            .host_closed                 = closed_,
            .restore_max_pending         = restore_max_intent_,
            .other_host_has_client_focus = focused_holder != nullptr && focused_holder != this,
        };

        std::string_view rule;
        const RuleResult result = reconcile_once(view, &rule);
        if (result.kind != RuleResult::Kind::Fire)
            break;

        HOSTKIT_LOG_TRACE("reconciler", "Host {}: {} fires {}", id_, rule, to_string(result.event));
        in_->dispatcher.fire(result.event);
    }

    restore_client_max_state_if_needed(now_s);
    end_drag_if_needed();
    enforce_bounds_if_needed(now_s);
}

void Host::restore_client_max_state_if_needed(double now_s)
{
    if (!restore_max_intent_)
        return;

    if (!are_host_and_client_showing_deico() || !backing_->does_maximize_work())
    {
        restore_max_intent_ = false;
        return;
    }

    const double half_stab = manager_.config().state_stability_delay_s * 0.5;
    if (now_s - in_->stability.newest_unstability_s() < half_stab)
        return;

    const bool client_maximized = client_state().maximized;
    if (backing_->is_maximized() == client_maximized)
    {
        restore_max_intent_ = false;
        return;
    }

    HOSTKIT_LOG_DEBUG("host", "Host {}: restoring {} state", id_,
                      client_maximized ? "maximized" : "demaximized");
    if (client_maximized)
        maximize();
    else
        demaximize();
}

void Host::end_drag_if_needed()
{
    if (in_->drag.is_press_detected() && !are_host_and_client_showing_deico_focused())
        in_->drag.cancel();
}

void Host::enforce_bounds_if_needed(double now_s)
{
    const ClientState& c          = client_state();
    const bool         both_shown = are_host_and_client_showing_deico();
    const bool         backing_max = both_shown && backing_->is_maximized();

    const EnforcementState state{
        .agreed_showing_deico_max   = both_shown && backing_max && c.maximized,
        .agreed_showing_deico_demax = both_shown && !backing_max && !c.maximized,
        .now_s                      = now_s,
        .newest_unstability_s       = in_->stability.newest_unstability_s(),
    };

    if (auto target = in_->bounds.poll_demax(state, [this] { return backing_->client_bounds(); }))
    {
        HOSTKIT_LOG_DEBUG("bounds", "Host {}: applying demax bounds {}", id_, target->rect);
        set_backing_bounds(*target);
    }

    if (auto screen = in_->bounds.poll_max(state, [this] { return manager_.screen_bounds(); }))
    {
        if (screen->is_empty())
            return;
        HOSTKIT_LOG_DEBUG("bounds", "Host {}: applying max bounds {}", id_, *screen);
        set_backing_bounds(BoundsTarget{*screen, BoundsSpace::Window});
    }
}

// ─── Backing window notifications ────────────────────────────────────────────

void Host::on_backing_moved()
{
    check_ui_thread("Host::on_backing_moved");
    if (closed_)
        return;
    in_->paint.on_moved();
    in_->dispatcher.set_move_pending();
    on_backing_any_event();
}

void Host::on_backing_resized()
{
    check_ui_thread("Host::on_backing_resized");
    if (closed_)
        return;
    in_->paint.on_resized();
    in_->dispatcher.set_resize_pending();
    on_backing_any_event();
}

void Host::on_backing_closing()
{
    close();
}

void Host::on_backing_any_event()
{
    check_ui_thread("Host::on_backing_any_event");
    if (client_state().closed)
        return;
    run_event_logic_on_event();
}

void Host::on_backing_mouse_pressed(const MouseEvent& event)
{
    check_ui_thread("Host::on_backing_mouse_pressed");
    if (closed_)
        return;
    if (manager_.config().fix_bounds_during_drag && event.is_drag_button
        && are_host_and_client_showing_deico_focused())
    {
        in_->drag.on_press(client_bounds(), window_bounds());
    }
    client().on_mouse_pressed(event);
}

void Host::on_backing_mouse_released(const MouseEvent& event)
{
    check_ui_thread("Host::on_backing_mouse_released");
    if (closed_)
        return;

    std::optional<BoundsTarget> target;
    if (event.is_drag_button && in_->drag.is_press_detected())
        target = in_->drag.end();

    if (target)
    {
        HOSTKIT_LOG_DEBUG("drag", "Host {}: applying bounds {} deferred during drag", id_, target->rect);
        set_bounds(*target);
    }
    client().on_mouse_released(event);
}

void Host::on_backing_mouse_moved(const MouseEvent& event)
{
    check_ui_thread("Host::on_backing_mouse_moved");
    if (closed_)
        return;

    if (event.drag_button_down)
    {
        if (in_->drag.is_press_detected())
        {
            const double now_s   = manager_.scheduler().now_s();
            const bool   blocked = backing_->must_block_drag_move_detection()
                                 || now_s - last_bounds_set_s_
                                        < manager_.config().drag_move_blocking_delay_s;
            in_->drag.on_drag_move(blocked);
        }
        client().on_mouse_dragged(event);
        return;
    }

    if (in_->drag.is_press_detected())
        in_->drag.cancel();
    client().on_mouse_moved(event);
}

}   // namespace hostkit
