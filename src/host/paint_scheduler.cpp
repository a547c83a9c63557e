#include "paint_scheduler.hpp"

#include "sched/process.hpp"

#include <algorithm>
#include <hostkit/logger.hpp>
#include <limits>

namespace hostkit
{

// ─── DirtyRegion ─────────────────────────────────────────────────────────────

void DirtyRegion::add(const Rect& rect)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bounds_ = bounds_.union_bounding_box(rect);
}

void DirtyRegion::make_all_dirty()
{
    std::lock_guard<std::mutex> lock(mutex_);
    bounds_ = Rect::huge();
}

Rect DirtyRegion::take()
{
    std::lock_guard<std::mutex> lock(mutex_);
    Rect result = bounds_;
    bounds_     = Rect{};
    return result;
}

Rect DirtyRegion::peek() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return bounds_;
}

// ─── Processes ───────────────────────────────────────────────────────────────

// Paints as soon as possible, but no more often than client_painting_delay_s.
class PaintScheduler::PaintProcess : public Process
{
   public:
    PaintProcess(UiScheduler& scheduler, PaintScheduler& owner) : Process(scheduler), owner_(owner) {}

   protected:
    double process(double theoretical_time_s, double actual_time_s) override
    {
        if (!owner_.hooks_.is_showing())
        {
            stop();
            return 0.0;
        }

        const double lateness  = std::max(0.0, actual_time_s - theoretical_time_s);
        const double delay     = owner_.config_.client_painting_delay_s;
        const double tolerance = delay * 0.5;
        const double min_paint = last_paint_s_ + delay;

        if (actual_time_s >= min_paint - tolerance)
        {
            // Stopping before painting, so that a start() from the paint
            // itself schedules a new paint.
            stop();
            last_lateness_s_ = lateness;
            last_paint_s_    = actual_time_s;
            owner_.paint_now();
            return 0.0;
        }

        // Compensating previous lateness, without getting earlier than the
        // tolerance allows.
        return min_paint - std::min(tolerance, last_lateness_s_);
    }

   private:
    PaintScheduler& owner_;
    double          last_paint_s_    = -std::numeric_limits<double>::infinity();
    double          last_lateness_s_ = 0.0;
};

// Paints once per move or resize burst: right away when painting during the
// operation, else once no event came for `delay_s`.
class PaintScheduler::BurstProcess : public Process
{
   public:
    BurstProcess(UiScheduler& scheduler, PaintScheduler& owner, double delay_s, bool paint_during_burst)
        : Process(scheduler), owner_(owner), delay_s_(delay_s), paint_during_burst_(paint_during_burst)
    {
    }

   protected:
    void on_begin() override { first_call_ = true; }

    double process(double, double actual_time_s) override
    {
        const bool first = first_call_;
        first_call_      = false;

        bool run_again = first;
        if (paint_during_burst_)
        {
            if (first)
            {
                owner_.make_all_dirty_and_ensure_pending_painting();
                run_again = false;
            }
        }
        else if (!first)
        {
            owner_.make_all_dirty_and_ensure_pending_painting();
        }

        if (!run_again)
        {
            stop();
            return 0.0;
        }
        return actual_time_s + delay_s_;
    }

   private:
    PaintScheduler& owner_;
    double          delay_s_;
    bool            paint_during_burst_;
    bool            first_call_ = true;
};

// ─── PaintScheduler ──────────────────────────────────────────────────────────

PaintScheduler::PaintScheduler(UiScheduler& scheduler, const HostConfig& config, Hooks hooks)
    : config_(config),
      hooks_(std::move(hooks)),
      paint_process_(std::make_unique<PaintProcess>(scheduler, *this)),
      move_process_(std::make_unique<BurstProcess>(scheduler,
                                                   *this,
                                                   config.host_bounds_check_delay_s,
                                                   config.paint_during_move)),
      resize_process_(std::make_unique<BurstProcess>(scheduler,
                                                     *this,
                                                     config.host_bounds_check_delay_s,
                                                     config.paint_during_resize))
{
}

PaintScheduler::~PaintScheduler() = default;

void PaintScheduler::ensure_pending_painting()
{
    paint_process_->start();
}

void PaintScheduler::make_all_dirty_and_ensure_pending_painting()
{
    make_all_dirty();
    ensure_pending_painting();
}

void PaintScheduler::on_moved()
{
    move_process_->start();
}

void PaintScheduler::on_resized()
{
    move_process_->stop();
    resize_process_->start();
}

void PaintScheduler::stop_all()
{
    paint_process_->stop();
    move_process_->stop();
    resize_process_->stop();
}

bool PaintScheduler::is_paint_pending() const
{
    return paint_process_->is_running();
}

void PaintScheduler::paint_now()
{
    if (!hooks_.can_paint_now())
    {
        HOSTKIT_LOG_TRACE("paint", "Skipping paint, host not showing and deiconified");
        return;
    }

    Rect dirty = dirty_.take();
    if (config_.make_all_dirty_each_paint)
        dirty = Rect::huge();

    ++paint_count_;
    hooks_.paint(dirty);
}

}   // namespace hostkit
