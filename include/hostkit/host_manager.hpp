#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <hostkit/backing_window.hpp>
#include <hostkit/host.hpp>
#include <hostkit/host_config.hpp>
#include <hostkit/rect.hpp>
#include <hostkit/ui_scheduler.hpp>
#include <memory>
#include <vector>

namespace hostkit
{

// Optional observer of host creation and teardown. Called on the UI thread.
class HostLifecycleListener
{
   public:
    virtual ~HostLifecycleListener() = default;

    virtual void on_host_created(Host&) {}
    // From close(), after the backing window was closed.
    virtual void on_host_closing(Host&) {}
    // Right before the client receives Closed.
    virtual void on_host_closed_event_firing(Host&) {}
};

// Owns every host of one UI thread and drives their periodic event logic.
//
// Usage:
//   LoopScheduler scheduler;
//   HostManager manager(scheduler, config);
//   Host* host = manager.create_host(std::move(backing), client, {"Main"});
//   manager.start();
//   host->show();
//   ...  // pump scheduler.run_due_tasks() and the native event queue
//   manager.shutdown();
class HostManager
{
   public:
    using ScreenBoundsProvider = std::function<Rect()>;

    // Throws std::invalid_argument if `config` does not validate.
    explicit HostManager(UiScheduler& scheduler, HostConfig config = {});
    ~HostManager();

    HostManager(const HostManager&)            = delete;
    HostManager& operator=(const HostManager&) = delete;

    UiScheduler&      scheduler() const { return scheduler_; }
    const HostConfig& config() const { return config_; }

    // Throws std::invalid_argument on a null backing window or client, and
    // std::logic_error once shut down.
    Host* create_host(std::unique_ptr<BackingWindow> backing,
                      std::shared_ptr<HostClient>    client,
                      Host::Options                  options = {});

    // Same as create_host, for a dialog closed along with `owner`.
    // Throws std::logic_error if `owner` is closed.
    Host* create_dialog(Host&                          owner,
                        std::unique_ptr<BackingWindow> backing,
                        std::shared_ptr<HostClient>    client,
                        Host::Options                  options = {});

    // Starts the periodic event logic of every host.
    void start();
    void stop();
    bool is_running() const;

    // Closes every host and stops the periodic process. Failures go to the
    // exception handler. Idempotent.
    void shutdown();
    bool is_shut_down() const { return shut_down_; }

    // Hosts whose Closed event has not fired yet, in creation order.
    std::vector<Host*> hosts() const;
    Host*              find_host(uint32_t id) const;
    size_t             host_count() const { return hosts_.size(); }
    bool               any_host_open() const;

    // Host whose client was last told FocusGained and not FocusLost yet.
    Host* host_of_focused_client() const { return focused_client_host_; }

    // Bounds used to enforce maximized window bounds. Empty without a
    // provider, in which case max enforcement does nothing.
    Rect screen_bounds() const;
    void set_screen_bounds_provider(ScreenBoundsProvider provider);

    // Receives failures caught at loop boundaries. Defaults to logging.
    void set_exception_handler(ExceptionHandler handler);
    void handle_exception(std::exception_ptr error);

    // Not owned; nullptr to remove.
    void set_lifecycle_listener(HostLifecycleListener* listener) { listener_ = listener; }

   private:
    friend class Host;

    class EventLogicProcess;

    Host* add_host(Host*                          owner,
                   std::unique_ptr<BackingWindow> backing,
                   std::shared_ptr<HostClient>    client,
                   Host::Options                  options);

    void check_not_shut_down(const char* operation) const;

    void run_event_logic_on_period();

    void on_client_focus_gained(Host& host);
    void on_client_focus_lost(Host& host);
    void on_host_closing(Host& host);
    void on_host_closed_event_firing(Host& host);

    UiScheduler&                       scheduler_;
    HostConfig                         config_;
    std::vector<std::shared_ptr<Host>> hosts_;
    std::vector<std::shared_ptr<Host>> released_;
    std::unique_ptr<EventLogicProcess> event_logic_;
    ScreenBoundsProvider               screen_bounds_provider_;
    ExceptionHandler                   exception_handler_;
    HostLifecycleListener*             listener_            = nullptr;
    Host*                              focused_client_host_ = nullptr;
    uint32_t                           next_id_             = 1;
    bool                               shut_down_           = false;
};

}   // namespace hostkit
