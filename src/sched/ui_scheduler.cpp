#include <hostkit/logger.hpp>
#include <hostkit/ui_scheduler.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace hostkit
{

namespace
{

// Upper bound on tasks run by one ManualScheduler call, to turn a task that
// keeps reposting itself for the current time into an error instead of a hang.
constexpr size_t kMaxTasksPerRun = 1'000'000;

}   // namespace

void log_exception(std::exception_ptr error, const char* category)
{
    if (!error)
        return;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        HOSTKIT_LOG_ERROR(category, "Uncaught exception: {}", e.what());
    }
}

// ─── UiScheduler ─────────────────────────────────────────────────────────────

UiScheduler::UiScheduler()
    : handler_([](std::exception_ptr e) { log_exception(e, "scheduler"); })
{
}

void UiScheduler::check_is_ui_thread(const char* operation) const
{
    if (!is_ui_thread())
    {
        throw std::logic_error(std::string(operation) + " must be called on the UI thread");
    }
}

void UiScheduler::set_exception_handler(ExceptionHandler handler)
{
    if (handler)
        handler_ = std::move(handler);
    else
        handler_ = [](std::exception_ptr e) { log_exception(e, "scheduler"); };
}

void UiScheduler::run_task(const Task& task)
{
    try
    {
        task();
    }
    catch (const std::exception&)
    {
        handler_(std::current_exception());
    }
}

// ─── ManualScheduler ─────────────────────────────────────────────────────────

ManualScheduler::ManualScheduler(double start_time_s)
    : now_s_(start_time_s), ui_thread_(std::this_thread::get_id())
{
}

void ManualScheduler::execute(Task task)
{
    execute_at(now_s_, std::move(task));
}

void ManualScheduler::execute_at(double time_s, Task task)
{
    queue_.push(Entry{std::max(time_s, now_s_), next_seq_++, std::move(task)});
}

bool ManualScheduler::is_ui_thread() const
{
    return std::this_thread::get_id() == ui_thread_;
}

size_t ManualScheduler::run_pending()
{
    return run_until(now_s_);
}

size_t ManualScheduler::advance_to(double time_s)
{
    size_t count = run_until(time_s);
    now_s_       = std::max(now_s_, time_s);
    return count;
}

double ManualScheduler::next_task_time_s() const
{
    if (queue_.empty())
        return std::numeric_limits<double>::infinity();
    return queue_.top().time_s;
}

size_t ManualScheduler::run_until(double time_s)
{
    size_t count = 0;
    while (!queue_.empty() && queue_.top().time_s <= time_s)
    {
        // priority_queue::top() is const; the entry is popped right after.
        Entry entry = std::move(const_cast<Entry&>(queue_.top()));
        queue_.pop();
        now_s_ = std::max(now_s_, entry.time_s);
        run_task(entry.task);
        if (++count >= kMaxTasksPerRun)
        {
            throw std::runtime_error("ManualScheduler: too many tasks at t="
                                     + std::to_string(now_s_));
        }
    }
    return count;
}

// ─── LoopScheduler ───────────────────────────────────────────────────────────

LoopScheduler::LoopScheduler() : origin_(Clock::now()), ui_thread_(std::this_thread::get_id()) {}

double LoopScheduler::now_s() const
{
    return std::chrono::duration<double>(Clock::now() - origin_).count();
}

void LoopScheduler::execute(Task task)
{
    execute_at(now_s(), std::move(task));
}

void LoopScheduler::execute_at(double time_s, Task task)
{
    if (shutdown_.load())
    {
        HOSTKIT_LOG_DEBUG("scheduler", "Dropping task posted after shutdown");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(Entry{time_s, next_seq_++, std::move(task)});
}

bool LoopScheduler::is_ui_thread() const
{
    return std::this_thread::get_id() == ui_thread_.load();
}

void LoopScheduler::bind_to_current_thread()
{
    ui_thread_.store(std::this_thread::get_id());
}

size_t LoopScheduler::run_due_tasks()
{
    check_is_ui_thread("LoopScheduler::run_due_tasks");

    const double now = now_s();
    uint64_t     seq_limit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq_limit = next_seq_;
    }

    size_t count = 0;
    while (!shutdown_.load())
    {
        Entry entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty())
                break;
            const Entry& top = queue_.top();
            if (top.time_s > now || top.seq >= seq_limit)
                break;
            entry = std::move(const_cast<Entry&>(top));
            queue_.pop();
        }
        run_task(entry.task);
        ++count;
    }
    return count;
}

double LoopScheduler::time_until_next_task_s(double max_wait_s) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
        return max_wait_s;
    return std::clamp(queue_.top().time_s - now_s(), 0.0, max_wait_s);
}

void LoopScheduler::shutdown()
{
    shutdown_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    queue_ = {};
}

void LoopScheduler::await_shutdown(double poll_interval_s) const
{
    if (is_ui_thread())
    {
        throw std::logic_error("LoopScheduler::await_shutdown would block the UI thread");
    }
    const auto step = std::chrono::duration<double>(poll_interval_s);
    while (!shutdown_.load())
    {
        std::this_thread::sleep_for(step);
    }
}

}   // namespace hostkit
