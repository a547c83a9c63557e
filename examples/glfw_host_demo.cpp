// GLFW host demo
// Opens a main window and a dialog, and prints the canonical event stream
// of both while you play with them: move, resize, minimize, maximize,
// focus, drag. Closing the main window closes the dialog first.
//
// Keys are not wired; everything is driven by the window manager.
// Set HOSTKIT_LOG_LEVEL=trace to watch the reconciler decide.

#include <cstdio>
#include <hostkit/glfw_backing_window.hpp>
#include <hostkit/hostkit.hpp>
#include <memory>
#include <string>

using namespace hostkit;

class PrintingClient : public HostClient
{
   public:
    explicit PrintingClient(std::string name) : name_(std::move(name)) {}

    void on_shown(const WindowEvent& e) override { print(e); }
    void on_hidden(const WindowEvent& e) override { print(e); }
    void on_focus_gained(const WindowEvent& e) override { print(e); }
    void on_focus_lost(const WindowEvent& e) override { print(e); }
    void on_iconified(const WindowEvent& e) override { print(e); }
    void on_deiconified(const WindowEvent& e) override { print(e); }
    void on_maximized(const WindowEvent& e) override { print(e); }
    void on_demaximized(const WindowEvent& e) override { print(e); }
    void on_moved(const WindowEvent& e) override { print(e); }
    void on_resized(const WindowEvent& e) override { print(e); }
    void on_closed(const WindowEvent& e) override { print(e); }

    void paint_client(const Rect& dirty) override { ++paints_; (void)dirty; }

   private:
    void print(const WindowEvent& e) const
    {
        std::printf("[%s] %-12s client=%s paints=%d\n",
                    name_.c_str(),
                    std::string(to_string(e.type)).c_str(),
                    e.host->client_bounds().to_string().c_str(),
                    paints_);
    }

    std::string name_;
    int         paints_ = 0;
};

int main()
{
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().set_level_from_env();

    HostConfig config;
    if (!config.load(HostConfig::default_path()))
        HOSTKIT_LOG_INFO("example", "No config at {}, using defaults", HostConfig::default_path());
    config.fix_bounds_during_drag       = true;
    config.restore_bounds_on_demaximize = true;

    GlfwPlatform  platform;
    LoopScheduler scheduler;
    HostManager   manager(scheduler, config);
    manager.set_screen_bounds_provider([&platform] { return platform.primary_work_area(); });

    Host* main_host = manager.create_host(
        std::make_unique<GlfwBackingWindow>(GlfwBackingWindow::CreateInfo{.title = "hostkit main"}),
        std::make_shared<PrintingClient>("main"),
        {.title = "hostkit main"});

    Host* dialog = manager.create_dialog(
        *main_host,
        std::make_unique<GlfwBackingWindow>(
            GlfwBackingWindow::CreateInfo{.width = 320, .height = 200, .title = "hostkit dialog"}),
        std::make_shared<PrintingClient>("dialog"),
        {.title = "hostkit dialog", .modal = false});

    manager.start();
    main_host->set_client_bounds({100, 100, 800, 600});
    main_host->show();
    dialog->set_client_bounds({960, 100, 320, 200});
    dialog->show();

    while (manager.any_host_open())
    {
        platform.wait_events_timeout(scheduler.time_until_next_task_s(0.05));
        scheduler.run_due_tasks();
    }

    manager.shutdown();
    HOSTKIT_LOG_INFO("example", "All windows closed");
    return 0;
}
