#pragma once

#include <cstdint>
#include <hostkit/ui_scheduler.hpp>
#include <memory>

namespace hostkit
{

// A unit of work that reschedules itself on a UiScheduler until stopped.
//
// start() while a start is already pending does nothing; start() while
// running restarts (on_begin runs again). Tasks left in the scheduler by a
// stopped, restarted or destroyed process are dropped when they run.
class Process
{
   public:
    explicit Process(UiScheduler& scheduler);
    virtual ~Process() = default;

    Process(const Process&)            = delete;
    Process& operator=(const Process&) = delete;

    void start();
    void start_after(double delay_s);
    void stop();

    bool is_running() const { return running_; }

    UiScheduler& scheduler() const { return scheduler_; }

   protected:
    virtual void on_begin() {}
    virtual void on_end() {}

    // Returns the theoretical time of the next call. Calling stop() from here
    // ends the process and the returned value is ignored.
    virtual double process(double theoretical_time_s, double actual_time_s) = 0;

   private:
    void start_at(double time_s);
    void schedule(uint64_t generation, double time_s);
    void run(uint64_t generation, double theoretical_time_s);

    UiScheduler&              scheduler_;
    std::shared_ptr<uint64_t> generation_ = std::make_shared<uint64_t>(0);
    bool                      running_       = false;
    bool                      start_pending_ = false;
};

}   // namespace hostkit
