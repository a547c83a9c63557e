#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hostkit
{

using ExceptionHandler = std::function<void(std::exception_ptr)>;

// Logs the exception at error level under `category`.
void log_exception(std::exception_ptr error, const char* category);

// Single-threaded cooperative scheduler. Every host operation runs on its
// UI thread; waiting is always expressed as "run this task at time T".
class UiScheduler
{
   public:
    using Task = std::function<void()>;

    UiScheduler();
    virtual ~UiScheduler() = default;

    UiScheduler(const UiScheduler&)            = delete;
    UiScheduler& operator=(const UiScheduler&) = delete;

    // Current time in seconds on this scheduler's clock.
    virtual double now_s() const = 0;

    // Run `task` as soon as possible, after already queued tasks.
    virtual void execute(Task task) = 0;

    // Run `task` at `time_s` on this scheduler's clock, or as soon as
    // possible if that time has already passed.
    virtual void execute_at(double time_s, Task task) = 0;

    void execute_after(double delay_s, Task task) { execute_at(now_s() + delay_s, std::move(task)); }

    virtual bool is_ui_thread() const = 0;

    // Throws std::logic_error when called from another thread.
    void check_is_ui_thread(const char* operation) const;

    // Receives std::exception failures thrown by tasks. Defaults to logging.
    void             set_exception_handler(ExceptionHandler handler);
    ExceptionHandler exception_handler() const { return handler_; }

   protected:
    // Runs a task and routes std::exception failures to the handler.
    void run_task(const Task& task);

   private:
    ExceptionHandler handler_;
};

// ─── ManualScheduler ─────────────────────────────────────────────────────────

// Virtual clock scheduler: time only moves when advance_to/advance_by is
// called. Tasks run in (time, submission) order. Bound to the thread that
// constructs it.
class ManualScheduler : public UiScheduler
{
   public:
    explicit ManualScheduler(double start_time_s = 0.0);

    double now_s() const override { return now_s_; }
    void   execute(Task task) override;
    void   execute_at(double time_s, Task task) override;
    bool   is_ui_thread() const override;

    // Runs every task due at the current time, including tasks they post
    // for the current time. Returns the number of tasks run.
    size_t run_pending();

    // Moves the clock to `time_s`, running due tasks in order; the clock
    // reads each task's time while it runs.
    size_t advance_to(double time_s);
    size_t advance_by(double delay_s) { return advance_to(now_s_ + delay_s); }

    size_t pending_count() const { return queue_.size(); }

    // Time of the earliest queued task, or +infinity when idle.
    double next_task_time_s() const;

   private:
    struct Entry
    {
        double   time_s;
        uint64_t seq;
        Task     task;
    };
    struct Later
    {
        bool operator()(const Entry& a, const Entry& b) const
        {
            return a.time_s != b.time_s ? a.time_s > b.time_s : a.seq > b.seq;
        }
    };

    size_t run_until(double time_s);

    double                                          now_s_;
    uint64_t                                        next_seq_ = 0;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    std::thread::id                                 ui_thread_;
};

// ─── LoopScheduler ───────────────────────────────────────────────────────────

// Steady clock scheduler pumped by the UI thread's event loop. Tasks may be
// posted from any thread.
class LoopScheduler : public UiScheduler
{
   public:
    LoopScheduler();

    double now_s() const override;
    void   execute(Task task) override;
    void   execute_at(double time_s, Task task) override;
    bool   is_ui_thread() const override;

    // Makes the calling thread the UI thread.
    void bind_to_current_thread();

    // Runs due tasks. UI thread only. Returns the number of tasks run.
    size_t run_due_tasks();

    // Seconds until the next queued task (0 if due), or `max_wait_s` if idle.
    double time_until_next_task_s(double max_wait_s) const;

    void shutdown();
    bool is_shutdown() const { return shutdown_.load(); }

    // Blocks a non-UI thread until shutdown() was called, sleeping in short
    // steps. Throws std::logic_error when called on the UI thread.
    void await_shutdown(double poll_interval_s = 0.001) const;

   private:
    struct Entry
    {
        double   time_s;
        uint64_t seq;
        Task     task;
    };
    struct Later
    {
        bool operator()(const Entry& a, const Entry& b) const
        {
            return a.time_s != b.time_s ? a.time_s > b.time_s : a.seq > b.seq;
        }
    };

    using Clock = std::chrono::steady_clock;

    Clock::time_point                                     origin_;
    mutable std::mutex                                    mutex_;
    uint64_t                                              next_seq_ = 0;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    std::atomic<std::thread::id>                          ui_thread_;
    std::atomic<bool>                                     shutdown_{false};
};

}   // namespace hostkit
