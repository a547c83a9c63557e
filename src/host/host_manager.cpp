#include <hostkit/host_manager.hpp>
#include <hostkit/logger.hpp>

#include "sched/process.hpp"

#include <algorithm>
#include <stdexcept>

namespace hostkit
{

// Runs every host's event logic, each host in its own scheduler task so that
// one failing host does not hold back the others.
class HostManager::EventLogicProcess : public Process
{
   public:
    EventLogicProcess(UiScheduler& scheduler, HostManager& manager)
        : Process(scheduler), manager_(manager)
    {
    }

   protected:
    double process(double theoretical_time_s, double /*actual_time_s*/) override
    {
        manager_.run_event_logic_on_period();
        return theoretical_time_s + manager_.config_.event_logic_period_s;
    }

   private:
    HostManager& manager_;
};

HostManager::HostManager(UiScheduler& scheduler, HostConfig config)
    : scheduler_(scheduler), config_(std::move(config))
{
    config_.validate();
    event_logic_ = std::make_unique<EventLogicProcess>(scheduler_, *this);
}

HostManager::~HostManager()
{
    try
    {
        shutdown();
    }
    catch (const std::exception& e)
    {
        HOSTKIT_LOG_ERROR("manager", "Shutdown failed: {}", e.what());
    }
}

void HostManager::check_not_shut_down(const char* operation) const
{
    if (shut_down_)
        throw std::logic_error(std::string(operation) + ": host manager is shut down");
}

// ─── Creation ────────────────────────────────────────────────────────────────

Host* HostManager::create_host(std::unique_ptr<BackingWindow> backing,
                               std::shared_ptr<HostClient>    client,
                               Host::Options                  options)
{
    scheduler_.check_is_ui_thread("HostManager::create_host");
    check_not_shut_down("HostManager::create_host");
    return add_host(nullptr, std::move(backing), std::move(client), std::move(options));
}

Host* HostManager::create_dialog(Host&                          owner,
                                 std::unique_ptr<BackingWindow> backing,
                                 std::shared_ptr<HostClient>    client,
                                 Host::Options                  options)
{
    scheduler_.check_is_ui_thread("HostManager::create_dialog");
    check_not_shut_down("HostManager::create_dialog");
    if (&owner.manager() != this)
        throw std::invalid_argument("HostManager::create_dialog: owner belongs to another manager");
    if (owner.is_closed())
        throw std::logic_error("HostManager::create_dialog: owner is closed");
    return add_host(&owner, std::move(backing), std::move(client), std::move(options));
}

Host* HostManager::add_host(Host*                          owner,
                            std::unique_ptr<BackingWindow> backing,
                            std::shared_ptr<HostClient>    client,
                            Host::Options                  options)
{
    const uint32_t id = next_id_;
    auto host = std::make_shared<Host>(Host::ConstructionKey{}, *this, owner, id, std::move(options),
                                       std::move(backing), std::move(client));
    ++next_id_;

    hosts_.push_back(host);
    if (owner)
        owner->add_dialog(host);

    HOSTKIT_LOG_INFO("manager", "Created {} {} \"{}\"", owner ? "dialog" : "host", id, host->title());

    if (listener_)
        listener_->on_host_created(*host);
    return host.get();
}

// ─── Periodic event logic ────────────────────────────────────────────────────

void HostManager::start()
{
    scheduler_.check_is_ui_thread("HostManager::start");
    check_not_shut_down("HostManager::start");
    if (event_logic_->is_running())
        return;
    HOSTKIT_LOG_DEBUG("manager", "Starting event logic every {} s", config_.event_logic_period_s);
    event_logic_->start();
}

void HostManager::stop()
{
    event_logic_->stop();
}

bool HostManager::is_running() const
{
    return event_logic_->is_running();
}

void HostManager::run_event_logic_on_period()
{
    released_.clear();

    for (const auto& host : hosts_)
    {
        std::weak_ptr<Host> weak = host;
        scheduler_.execute(
            [this, weak]
            {
                const auto h = weak.lock();
                if (!h || h->client_state().closed)
                    return;
                try
                {
                    h->run_event_logic_on_period();
                }
                catch (const std::exception& e)
                {
                    HOSTKIT_LOG_ERROR("manager", "Host {}: event logic failed: {}", h->id(), e.what());
                    handle_exception(std::current_exception());
                }
            });
    }
}

void HostManager::shutdown()
{
    if (shut_down_)
        return;
    scheduler_.check_is_ui_thread("HostManager::shutdown");
    shut_down_ = true;

    HOSTKIT_LOG_INFO("manager", "Shutting down {} host(s)", hosts_.size());
    event_logic_->stop();

    // Dialogs are closed by their owner.
    std::vector<std::shared_ptr<Host>> top_level;
    for (const auto& host : hosts_)
    {
        if (!host->owner())
            top_level.push_back(host);
    }
    for (const auto& host : top_level)
    {
        try
        {
            host->close();
        }
        catch (const std::exception& e)
        {
            HOSTKIT_LOG_ERROR("manager", "Host {}: close failed: {}", host->id(), e.what());
            handle_exception(std::current_exception());
        }
    }

    focused_client_host_ = nullptr;
    released_.clear();
    hosts_.clear();
}

// ─── Registry ────────────────────────────────────────────────────────────────

std::vector<Host*> HostManager::hosts() const
{
    std::vector<Host*> result;
    result.reserve(hosts_.size());
    for (const auto& host : hosts_)
        result.push_back(host.get());
    return result;
}

Host* HostManager::find_host(uint32_t id) const
{
    auto it = std::find_if(hosts_.begin(), hosts_.end(),
                           [id](const auto& h) { return h->id() == id; });
    return it != hosts_.end() ? it->get() : nullptr;
}

bool HostManager::any_host_open() const
{
    return std::any_of(hosts_.begin(), hosts_.end(),
                       [](const auto& h) { return !h->is_closed(); });
}

Rect HostManager::screen_bounds() const
{
    if (!screen_bounds_provider_)
        return Rect::empty_rect();
    return screen_bounds_provider_();
}

void HostManager::set_screen_bounds_provider(ScreenBoundsProvider provider)
{
    screen_bounds_provider_ = std::move(provider);
}

// ─── Errors ──────────────────────────────────────────────────────────────────

void HostManager::set_exception_handler(ExceptionHandler handler)
{
    exception_handler_ = std::move(handler);
}

void HostManager::handle_exception(std::exception_ptr error)
{
    if (exception_handler_)
        exception_handler_(error);
    else
        log_exception(error, "manager");
}

// ─── Host notifications ──────────────────────────────────────────────────────

void HostManager::on_client_focus_gained(Host& host)
{
    focused_client_host_ = &host;
}

void HostManager::on_client_focus_lost(Host& host)
{
    if (focused_client_host_ == &host)
        focused_client_host_ = nullptr;
}

void HostManager::on_host_closing(Host& host)
{
    if (Host* owner = host.owner())
        owner->remove_dialog(&host);
    if (listener_)
        listener_->on_host_closing(host);
}

void HostManager::on_host_closed_event_firing(Host& host)
{
    if (focused_client_host_ == &host)
        focused_client_host_ = nullptr;

    auto it = std::find_if(hosts_.begin(), hosts_.end(),
                           [&host](const auto& h) { return h.get() == &host; });
    if (it != hosts_.end())
    {
        // Kept alive until the next periodic run: Closed is being fired.
        released_.push_back(std::move(*it));
        hosts_.erase(it);
    }
    HOSTKIT_LOG_INFO("manager", "Host {} closed", host.id());

    if (listener_)
        listener_->on_host_closed_event_firing(host);
}

}   // namespace hostkit
