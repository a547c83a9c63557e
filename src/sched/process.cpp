#include "process.hpp"

namespace hostkit
{

Process::Process(UiScheduler& scheduler) : scheduler_(scheduler) {}

void Process::start()
{
    start_at(scheduler_.now_s());
}

void Process::start_after(double delay_s)
{
    start_at(scheduler_.now_s() + delay_s);
}

void Process::stop()
{
    if (!running_)
        return;
    ++*generation_;
    running_       = false;
    start_pending_ = false;
    on_end();
}

void Process::start_at(double time_s)
{
    if (start_pending_)
        return;
    const uint64_t generation = ++*generation_;
    running_                  = true;
    start_pending_            = true;
    schedule(generation, time_s);
}

void Process::schedule(uint64_t generation, double time_s)
{
    std::weak_ptr<uint64_t> token = generation_;
    scheduler_.execute_at(time_s,
                          [this, token, generation, time_s]()
                          {
                              auto current = token.lock();
                              if (!current || *current != generation)
                                  return;
                              run(generation, time_s);
                          });
}

void Process::run(uint64_t generation, double theoretical_time_s)
{
    if (start_pending_)
    {
        start_pending_ = false;
        on_begin();
        if (*generation_ != generation)
            return;
    }

    const double next = process(theoretical_time_s, scheduler_.now_s());
    if (*generation_ != generation || !running_)
        return;
    schedule(generation, next);
}

}   // namespace hostkit
