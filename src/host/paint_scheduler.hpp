#pragma once

#include <cstdint>
#include <functional>
#include <hostkit/host_config.hpp>
#include <hostkit/rect.hpp>
#include <hostkit/ui_scheduler.hpp>
#include <memory>
#include <mutex>

namespace hostkit
{

// Bounding box of everything invalidated since the last paint.
// The only host state that may be touched off the UI thread.
class DirtyRegion
{
   public:
    void add(const Rect& rect);
    void make_all_dirty();

    // Returns the accumulated box and clears it, atomically.
    Rect take();

    Rect peek() const;

   private:
    mutable std::mutex mutex_;
    Rect               bounds_;
};

// Turns invalidations and move/resize bursts into throttled paints.
class PaintScheduler
{
   public:
    struct Hooks
    {
        // The paint process stops when this turns false.
        std::function<bool()> is_showing;
        // A paint running while this is false is skipped.
        std::function<bool()> can_paint_now;
        // Paints `dirty`. Failures are the callee's to report.
        std::function<void(const Rect& dirty)> paint;
    };

    PaintScheduler(UiScheduler& scheduler, const HostConfig& config, Hooks hooks);
    ~PaintScheduler();

    PaintScheduler(const PaintScheduler&)            = delete;
    PaintScheduler& operator=(const PaintScheduler&) = delete;

    // Thread-safe.
    void make_dirty(const Rect& rect) { dirty_.add(rect); }
    void make_all_dirty() { dirty_.make_all_dirty(); }

    // Starts the paint process if it is not already pending.
    void ensure_pending_painting();
    void make_all_dirty_and_ensure_pending_painting();

    // Move and resize bursts. A resize supersedes a pending move.
    void on_moved();
    void on_resized();

    void stop_all();

    bool is_paint_pending() const;

    const DirtyRegion& dirty_region() const { return dirty_; }

    uint64_t paint_count() const { return paint_count_; }

   private:
    class PaintProcess;
    class BurstProcess;

    void paint_now();

    const HostConfig&             config_;
    Hooks                         hooks_;
    DirtyRegion                   dirty_;
    std::unique_ptr<PaintProcess> paint_process_;
    std::unique_ptr<BurstProcess> move_process_;
    std::unique_ptr<BurstProcess> resize_process_;
    uint64_t                      paint_count_ = 0;
};

}   // namespace hostkit
